#include "vetted/builtins/domain.hpp"

#include "vetted/builtins/character.hpp"
#include "vetted/builtins/unicode.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

// Follows the failure points of the WHATWG basic URL parser run without a base URL. Only
// acceptance is decided here; nothing is serialized.
namespace vetted::domain
{
    namespace
    {
        constexpr std::array<std::string_view, 5> special_schemes = {"ftp", "http", "https", "ws", "wss"};

        bool is_hex(char c) { return character::is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }

        int hex_value(char c)
        {
            if (character::is_digit(c))
            {
                return c - '0';
            }
            return (c | 0x20) - 'a' + 10;
        }

        bool is_slash(char c) { return c == '/' || c == '\\'; }

        bool is_forbidden_host(char c)
        {
            switch (c)
            {
                case '\0':
                case '\t':
                case '\n':
                case '\r':
                case ' ':
                case '#':
                case '/':
                case ':':
                case '<':
                case '>':
                case '?':
                case '@':
                case '[':
                case '\\':
                case ']':
                case '^':
                case '|':
                    return true;
                default:
                    return false;
            }
        }

        bool is_forbidden_domain(char c)
        {
            auto byte = static_cast<unsigned char>(c);
            return is_forbidden_host(c) || byte <= 0x1f || byte == 0x7f || c == '%';
        }

        // Strips leading and trailing C0 controls and spaces, then drops every tab and newline.
        std::string preprocess(std::string_view text)
        {
            auto is_control_or_space = [](char c) { return static_cast<unsigned char>(c) <= 0x20; };
            while (!text.empty() && is_control_or_space(text.front()))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && is_control_or_space(text.back()))
            {
                text.remove_suffix(1);
            }
            std::string cleaned;
            std::copy_if(text.begin(), text.end(), std::back_inserter(cleaned), [](char c) {
                return c != '\t' && c != '\n' && c != '\r';
            });
            return cleaned;
        }

        // Decodes valid percent escapes; a '%' without two hex digits stays as it is.
        std::string percent_decode(std::string_view text)
        {
            std::string decoded;
            for (size_t i = 0; i < text.size(); ++i)
            {
                if (text[i] == '%' && i + 2 < text.size() && is_hex(text[i + 1]) && is_hex(text[i + 2]))
                {
                    decoded.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
                    i += 2;
                }
                else
                {
                    decoded.push_back(text[i]);
                }
            }
            return decoded;
        }

        // One dot-separated part of an IPv4 host: decimal, octal after a leading 0, or hex
        // after 0x. Values past 2^32 saturate, which is enough to reject them.
        std::optional<std::uint64_t> parse_ipv4_number(std::string_view part)
        {
            if (part.empty())
            {
                return std::nullopt;
            }
            int radix = 10;
            if (part.size() >= 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X'))
            {
                part.remove_prefix(2);
                radix = 16;
            }
            else if (part.size() >= 2 && part[0] == '0')
            {
                part.remove_prefix(1);
                radix = 8;
            }

            std::uint64_t value = 0;
            for (char c : part)
            {
                int digit = 0;
                if (radix == 16 && is_hex(c))
                {
                    digit = hex_value(c);
                }
                else if (character::is_digit(c) && c - '0' < radix)
                {
                    digit = c - '0';
                }
                else
                {
                    return std::nullopt;
                }
                value = std::min<std::uint64_t>(value * radix + digit, std::uint64_t{1} << 32);
            }
            return value;
        }

        // Whether a domain is meant as an IPv4 address, which then has to parse as one.
        bool ends_in_number(std::string_view domain)
        {
            if (!domain.empty() && domain.back() == '.')
            {
                domain.remove_suffix(1);
            }
            if (domain.empty())
            {
                return false;
            }
            std::string_view last = domain.substr(domain.rfind('.') + 1);
            if (!last.empty() && std::all_of(last.begin(), last.end(), character::is_digit))
            {
                return true;
            }
            return parse_ipv4_number(last).has_value();
        }

        bool is_ipv4(std::string_view domain)
        {
            std::vector<std::string_view> parts;
            size_t begin = 0;
            while (true)
            {
                size_t dot = domain.find('.', begin);
                parts.push_back(domain.substr(begin, dot == std::string_view::npos ? dot : dot - begin));
                if (dot == std::string_view::npos)
                {
                    break;
                }
                begin = dot + 1;
            }
            if (parts.size() > 1 && parts.back().empty())
            {
                parts.pop_back();
            }
            if (parts.size() > 4)
            {
                return false;
            }

            std::uint64_t last = 0;
            for (size_t i = 0; i < parts.size(); ++i)
            {
                auto number = parse_ipv4_number(parts[i]);
                if (!number || (i + 1 < parts.size() && *number > 255))
                {
                    return false;
                }
                last = *number;
            }
            return last < (std::uint64_t{1} << (8 * (5 - parts.size())));
        }

        // The bracketed part of an IPv6 host: up to eight hex pieces, at most one "::", and
        // an optional dotted-decimal tail worth two pieces.
        bool is_ipv6(std::string_view input)
        {
            int piece      = 0;
            bool compress  = false;
            size_t p       = 0;
            auto at_end    = [&] { return p >= input.size(); };
            auto is_digit  = [&] { return !at_end() && character::is_digit(input[p]); };

            if (!at_end() && input[p] == ':')
            {
                if (p + 1 >= input.size() || input[p + 1] != ':')
                {
                    return false;
                }
                p += 2;
                ++piece;
                compress = true;
            }

            while (!at_end())
            {
                if (piece == 8)
                {
                    return false;
                }
                if (input[p] == ':')
                {
                    if (compress)
                    {
                        return false;
                    }
                    ++p;
                    ++piece;
                    compress = true;
                    continue;
                }

                size_t length = 0;
                while (length < 4 && !at_end() && is_hex(input[p]))
                {
                    ++p;
                    ++length;
                }

                if (!at_end() && input[p] == '.')
                {
                    if (length == 0 || piece > 6)
                    {
                        return false;
                    }
                    p -= length;
                    int numbers_seen = 0;
                    while (!at_end())
                    {
                        if (numbers_seen > 0)
                        {
                            if (input[p] != '.' || numbers_seen == 4)
                            {
                                return false;
                            }
                            ++p;
                        }
                        if (!is_digit())
                        {
                            return false;
                        }
                        int value = -1;
                        while (is_digit())
                        {
                            int digit = input[p] - '0';
                            if (value == 0)
                            {
                                return false;
                            }
                            value = value == -1 ? digit : value * 10 + digit;
                            if (value > 255)
                            {
                                return false;
                            }
                            ++p;
                        }
                        ++numbers_seen;
                        if (numbers_seen == 2 || numbers_seen == 4)
                        {
                            ++piece;
                        }
                    }
                    return numbers_seen == 4 && (compress || piece == 8);
                }

                if (!at_end())
                {
                    if (input[p] != ':')
                    {
                        return false;
                    }
                    ++p;
                    if (at_end())
                    {
                        return false;
                    }
                }
                ++piece;
            }
            return compress || piece == 8;
        }

        // Special hosts are domains run through UTS #46 or IPv4 addresses; other schemes
        // take any opaque host without forbidden code points.
        bool is_host(std::string_view host, bool special)
        {
            if (!host.empty() && host.front() == '[')
            {
                return host.size() >= 2 && host.back() == ']' && is_ipv6(host.substr(1, host.size() - 2));
            }
            if (!special)
            {
                return std::none_of(host.begin(), host.end(), is_forbidden_host);
            }

            auto ascii = unicode::domain_to_ascii(percent_decode(host));
            if (!ascii || ascii->empty() || std::any_of(ascii->begin(), ascii->end(), is_forbidden_domain))
            {
                return false;
            }
            return !ends_in_number(*ascii) || is_ipv4(*ascii);
        }

        bool is_port(std::string_view port)
        {
            std::uint32_t value = 0;
            for (char c : port)
            {
                if (!character::is_digit(c))
                {
                    return false;
                }
                value = value * 10 + static_cast<std::uint32_t>(c - '0');
                if (value > 65535)
                {
                    return false;
                }
            }
            return true;
        }

        // `rest` starts right after the slashes that open the authority.
        bool is_authority(std::string_view rest, bool special)
        {
            std::string_view authority = rest.substr(0, rest.find_first_of(special ? "/\\?#" : "/?#"));

            size_t at = authority.rfind('@');
            if (at != std::string_view::npos)
            {
                authority.remove_prefix(at + 1);
                if (authority.empty())
                {
                    return false;
                }
            }

            bool inside_brackets = false;
            size_t colon         = std::string_view::npos;
            for (size_t i = 0; i < authority.size() && colon == std::string_view::npos; ++i)
            {
                if (authority[i] == '[')
                {
                    inside_brackets = true;
                }
                else if (authority[i] == ']')
                {
                    inside_brackets = false;
                }
                else if (authority[i] == ':' && !inside_brackets)
                {
                    colon = i;
                }
            }

            std::string_view host = authority.substr(0, colon);
            if (host.empty())
            {
                return colon == std::string_view::npos && !special;
            }
            if (!is_host(host, special))
            {
                return false;
            }
            return colon == std::string_view::npos || is_port(authority.substr(colon + 1));
        }

        // A file URL only fails on a host that is neither empty nor a drive letter.
        bool is_file_rest(std::string_view rest)
        {
            if (rest.size() < 2 || !is_slash(rest[0]) || !is_slash(rest[1]))
            {
                return true;
            }
            rest.remove_prefix(2);
            std::string_view host = rest.substr(0, rest.find_first_of("/\\?#"));
            if (host.empty())
            {
                return true;
            }
            if (host.size() == 2 && character::is_alpha(host[0]) && (host[1] == ':' || host[1] == '|'))
            {
                return true;
            }
            return is_host(host, true);
        }
    }    // namespace

    bool is_url(std::string_view text)
    {
        std::string input     = preprocess(text);
        std::string_view rest = input;

        if (rest.empty() || !character::is_alpha(rest.front()))
        {
            return false;
        }
        size_t colon = 0;
        while (colon < rest.size() &&
               (character::is_alnum(rest[colon]) || rest[colon] == '+' || rest[colon] == '-' || rest[colon] == '.'))
        {
            ++colon;
        }
        if (colon == rest.size() || rest[colon] != ':')
        {
            return false;
        }

        std::string scheme(rest.substr(0, colon));
        std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](char c) {
            return character::is_upper(c) ? static_cast<char>(c - 'A' + 'a') : c;
        });
        rest.remove_prefix(colon + 1);

        if (scheme == "file")
        {
            return is_file_rest(rest);
        }
        if (std::find(special_schemes.begin(), special_schemes.end(), scheme) != special_schemes.end())
        {
            // Any run of slashes and backslashes may open a special authority, none included.
            size_t start = rest.find_first_not_of("/\\");
            rest.remove_prefix(start == std::string_view::npos ? rest.size() : start);
            return is_authority(rest, true);
        }
        if (rest.substr(0, 2) == "//")
        {
            return is_authority(rest.substr(2), false);
        }
        // A path or an opaque path never fails to parse.
        return true;
    }

    ValidationNode<std::string> url()
    {
        return node::Predicate<std::string>{"url", [](const std::string& target) { return is_url(target); }};
    }
}    // namespace vetted::domain
