#pragma once

#include "vetted/validator.hpp"

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>

// Domain format checks: email addresses, URLs and credit card numbers.
namespace vetted::domain
{
    enum class CreditCardIssuer
    {
        amex,
        diners_club,
        discover,
        jcb,
        maestro,
        mastercard,
        mir,
        unionpay,
        visa
    };

    std::string_view issuer_name(CreditCardIssuer issuer);

    // Contains an RFC 5322 address. The pattern is lowercase and case-sensitive, so
    // addresses are usually lowercased by a sanitizer first.
    bool is_email(std::string_view text);

    // An absolute URL the WHATWG URL parser accepts without a base. Hosts of special
    // schemes go through IDNA, so "https://bücher.de" is a URL and "http://[:::1]" is not.
    bool is_url(std::string_view text);

    // The issuer of a well-formed card number: digits only, a known issuer prefix, a
    // length that issuer uses, and a valid Luhn checksum. std::nullopt otherwise.
    std::optional<CreditCardIssuer> credit_card_issuer(std::string_view number);

    ValidationNode<std::string> email();
    ValidationNode<std::string> url();
    ValidationNode<std::string> credit_card_number();

    // Rejects malformed numbers, then checks the issuer of well-formed ones.
    ValidationNode<std::string> credit_card_number_then(ValidationNode<CreditCardIssuer> check);
}    // namespace vetted::domain

namespace fmt
{
    template<>
    struct formatter<vetted::domain::CreditCardIssuer> : formatter<string_view>
    {
        template<typename FormatContext>
        auto format(vetted::domain::CreditCardIssuer issuer, FormatContext& ctx) const
        {
            return formatter<string_view>::format(vetted::domain::issuer_name(issuer), ctx);
        }
    };
}    // namespace fmt
