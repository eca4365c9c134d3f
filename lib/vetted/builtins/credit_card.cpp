#include "vetted/builtins/domain.hpp"

#include "vetted/builtins/character.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace vetted::domain
{
    namespace
    {
        struct PrefixRange
        {
            unsigned low;
            unsigned high;
            size_t digits;
        };

        struct IssuerRule
        {
            CreditCardIssuer issuer;
            std::vector<PrefixRange> prefixes;
            size_t min_length;
            size_t max_length;
        };

        // Checked in order; the first rule with a matching prefix decides the issuer.
        const IssuerRule issuer_rules[] = {
            {CreditCardIssuer::visa, {{4, 4, 1}}, 13, 19},
            {CreditCardIssuer::mir, {{2200, 2204, 4}}, 16, 19},
            {CreditCardIssuer::mastercard, {{51, 55, 2}, {2221, 2720, 4}}, 16, 16},
            {CreditCardIssuer::amex, {{34, 34, 2}, {37, 37, 2}}, 15, 15},
            {CreditCardIssuer::diners_club, {{300, 305, 3}, {36, 36, 2}, {38, 39, 2}}, 14, 19},
            {CreditCardIssuer::jcb, {{3528, 3589, 4}}, 16, 19},
            {CreditCardIssuer::discover, {{6011, 6011, 4}, {644, 649, 3}, {65, 65, 2}, {622126, 622925, 6}}, 16, 19},
            {CreditCardIssuer::unionpay, {{62, 62, 2}, {88, 88, 2}}, 16, 19},
            {CreditCardIssuer::maestro, {{50, 50, 2}, {56, 58, 2}, {639, 639, 3}, {67, 67, 2}}, 12, 19},
        };

        bool has_prefix(std::string_view digits, const PrefixRange& range)
        {
            if (digits.size() < range.digits)
            {
                return false;
            }
            unsigned leading = 0;
            for (size_t i = 0; i < range.digits; ++i)
            {
                leading = leading * 10 + static_cast<unsigned>(digits[i] - '0');
            }
            return leading >= range.low && leading <= range.high;
        }

        bool passes_luhn(std::string_view digits)
        {
            int sum        = 0;
            bool double_it = false;
            for (auto it = digits.rbegin(); it != digits.rend(); ++it)
            {
                int digit = *it - '0';
                if (double_it)
                {
                    digit *= 2;
                    if (digit > 9)
                    {
                        digit -= 9;
                    }
                }
                sum += digit;
                double_it = !double_it;
            }
            return sum % 10 == 0;
        }
    }    // namespace

    std::string_view issuer_name(CreditCardIssuer issuer)
    {
        switch (issuer)
        {
            case CreditCardIssuer::amex:
                return "amex";
            case CreditCardIssuer::diners_club:
                return "diners_club";
            case CreditCardIssuer::discover:
                return "discover";
            case CreditCardIssuer::jcb:
                return "jcb";
            case CreditCardIssuer::maestro:
                return "maestro";
            case CreditCardIssuer::mastercard:
                return "mastercard";
            case CreditCardIssuer::mir:
                return "mir";
            case CreditCardIssuer::unionpay:
                return "unionpay";
            case CreditCardIssuer::visa:
                return "visa";
        }
        return "unknown";
    }

    std::optional<CreditCardIssuer> credit_card_issuer(std::string_view number)
    {
        if (number.empty() || !std::all_of(number.begin(), number.end(), character::is_digit))
        {
            return std::nullopt;
        }
        for (const auto& rule : issuer_rules)
        {
            bool prefixed = std::any_of(rule.prefixes.begin(), rule.prefixes.end(),
                                        [number](const PrefixRange& range) { return has_prefix(number, range); });
            if (!prefixed)
            {
                continue;
            }
            if (number.size() < rule.min_length || number.size() > rule.max_length || !passes_luhn(number))
            {
                return std::nullopt;
            }
            return rule.issuer;
        }
        return std::nullopt;
    }

    ValidationNode<std::string> credit_card_number()
    {
        return node::Predicate<std::string>{"credit_card_number", [](const std::string& target) {
                                                return credit_card_issuer(target).has_value();
                                            }};
    }

    ValidationNode<std::string> credit_card_number_then(ValidationNode<CreditCardIssuer> check)
    {
        return project_if<std::string>(
            "credit_card_number_then", [](const std::string& target) { return credit_card_issuer(target); },
            std::move(check), false);
    }
}    // namespace vetted::domain
