#include "vetted/builtins/unicode.hpp"

#include <fmt/format.h>

#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/uidna.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>

#include <cstdint>
#include <memory>
#include <stdexcept>

namespace vetted::unicode
{
    namespace
    {
        struct IdnaCloser
        {
            void operator()(UIDNA* idna) const { uidna_close(idna); }
        };

        const UIDNA* uts46()
        {
            static const std::unique_ptr<UIDNA, IdnaCloser> idna = [] {
                UErrorCode status = U_ZERO_ERROR;
                std::unique_ptr<UIDNA, IdnaCloser> opened(
                    uidna_openUTS46(UIDNA_CHECK_BIDI | UIDNA_CHECK_CONTEXTJ | UIDNA_NONTRANSITIONAL_TO_ASCII, &status));
                if (U_FAILURE(status))
                {
                    throw std::runtime_error(fmt::format("cannot open UTS #46 processing: {}", u_errorName(status)));
                }
                return opened;
            }();
            return idna.get();
        }

        // Reported by ICU but not fatal with CheckHyphens and VerifyDnsLength turned off.
        constexpr uint32_t relaxed_errors = UIDNA_ERROR_EMPTY_LABEL | UIDNA_ERROR_LABEL_TOO_LONG |
                                            UIDNA_ERROR_DOMAIN_NAME_TOO_LONG | UIDNA_ERROR_LEADING_HYPHEN |
                                            UIDNA_ERROR_TRAILING_HYPHEN | UIDNA_ERROR_HYPHEN_3_4;

        icu::UnicodeString decode(std::string_view text)
        {
            return icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
        }
    }    // namespace

    bool is_alphabetic(char32_t c) { return u_isUAlphabetic(static_cast<UChar32>(c)); }

    bool is_numeric(char32_t c)
    {
        auto category = u_charType(static_cast<UChar32>(c));
        return category == U_DECIMAL_DIGIT_NUMBER || category == U_LETTER_NUMBER || category == U_OTHER_NUMBER;
    }

    bool is_alphanumeric(char32_t c) { return is_alphabetic(c) || is_numeric(c); }

    bool is_lowercase(char32_t c) { return u_isULowercase(static_cast<UChar32>(c)); }

    bool is_uppercase(char32_t c) { return u_isUUppercase(static_cast<UChar32>(c)); }

    bool is_whitespace(char32_t c) { return u_isUWhiteSpace(static_cast<UChar32>(c)); }

    bool all_of(std::string_view text, bool (*predicate)(char32_t))
    {
        const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
        auto length       = static_cast<int32_t>(text.size());
        int32_t i         = 0;
        while (i < length)
        {
            UChar32 c;
            U8_NEXT(bytes, i, length, c);
            if (c < 0 || !predicate(static_cast<char32_t>(c)))
            {
                return false;
            }
        }
        return true;
    }

    std::optional<char32_t> single_code_point(std::string_view text)
    {
        const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
        auto length       = static_cast<int32_t>(text.size());
        int32_t i         = 0;
        if (length == 0)
        {
            return std::nullopt;
        }
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0 || i != length)
        {
            return std::nullopt;
        }
        return static_cast<char32_t>(c);
    }

    std::string_view trim_start(std::string_view text)
    {
        const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
        auto length       = static_cast<int32_t>(text.size());
        int32_t begin     = 0;
        while (begin < length)
        {
            int32_t next = begin;
            UChar32 c;
            U8_NEXT(bytes, next, length, c);
            if (c < 0 || !is_whitespace(static_cast<char32_t>(c)))
            {
                break;
            }
            begin = next;
        }
        return text.substr(static_cast<size_t>(begin));
    }

    std::string_view trim_end(std::string_view text)
    {
        const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
        auto end          = static_cast<int32_t>(text.size());
        while (end > 0)
        {
            int32_t previous = end;
            UChar32 c;
            U8_PREV(bytes, 0, previous, c);
            if (c < 0 || !is_whitespace(static_cast<char32_t>(c)))
            {
                break;
            }
            end = previous;
        }
        return text.substr(0, static_cast<size_t>(end));
    }

    std::string to_lowercase(std::string_view text)
    {
        std::string mapped;
        decode(text).toLower(icu::Locale::getRoot()).toUTF8String(mapped);
        return mapped;
    }

    std::string to_uppercase(std::string_view text)
    {
        std::string mapped;
        decode(text).toUpper(icu::Locale::getRoot()).toUTF8String(mapped);
        return mapped;
    }

    std::optional<std::string> domain_to_ascii(std::string_view domain)
    {
        std::string ascii(domain.size() + 64, '\0');
        for (int attempt = 0; attempt < 2; ++attempt)
        {
            UErrorCode status = U_ZERO_ERROR;
            UIDNAInfo info    = UIDNA_INFO_INITIALIZER;
            int32_t written   = uidna_nameToASCII_UTF8(uts46(),
                                                     domain.data(),
                                                     static_cast<int32_t>(domain.size()),
                                                     ascii.data(),
                                                     static_cast<int32_t>(ascii.size()),
                                                     &info,
                                                     &status);
            if (status == U_BUFFER_OVERFLOW_ERROR)
            {
                ascii.resize(static_cast<size_t>(written));
                continue;
            }
            if (U_FAILURE(status) || (info.errors & ~relaxed_errors) != 0)
            {
                return std::nullopt;
            }
            ascii.resize(static_cast<size_t>(written));
            return ascii;
        }
        return std::nullopt;
    }
}    // namespace vetted::unicode
