#include "register_example.hpp"

#include "vetted/vetted.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <optional>
#include <string>

// ##################################################
// The sign-up API: the request as it arrives, and the request once every field is vetted

namespace api
{
    enum class Status
    {
        waiting,
        accepted,
        rejected
    };

    struct EmailKind
    {
        using Inner = std::string;
        static constexpr std::string_view declaration =
            "upgrades(display, equality, hash), sanitize(trim, lowercase), validate(email)";
    };

    struct UsernameKind
    {
        using Inner = std::string;
        static constexpr std::string_view declaration =
            "upgrades(display), sanitize(trim), validate(alphanumeric, length::chars(within(5..=20)))";
    };

    struct PasswordKind
    {
        using Inner = std::string;
        static constexpr std::string_view declaration = "validate(ascii, length::chars(gt(8)))";
    };

    using Email    = vetted::Newtype<EmailKind>;
    using Username = vetted::Newtype<UsernameKind>;
    using Password = vetted::Newtype<PasswordKind>;

    namespace untrusted
    {
        struct RegisterRequest
        {
            vetted::Untrusted<std::string> email;
            vetted::Untrusted<std::string> username;
            vetted::Untrusted<std::string> password;
        };
    }    // namespace untrusted

    struct RegisterRequest
    {
        Email email;
        Username username;
        Password password;
    };
}    // namespace api

namespace fmt
{
    template<>
    struct formatter<api::Status> : formatter<string_view>
    {
        template<typename FormatContext>
        auto format(api::Status status, FormatContext& ctx) const
        {
            string_view name = "unknown";
            switch (status)
            {
                case api::Status::waiting:
                    name = "waiting";
                    break;
                case api::Status::accepted:
                    name = "accepted";
                    break;
                case api::Status::rejected:
                    name = "rejected";
                    break;
            }
            return formatter<string_view>::format(name, ctx);
        }
    };
}    // namespace fmt

#define RED "\33[0;31m"
#define GREEN "\33[0;32m"
#define COLOR_RESET "\33[0m"

using namespace api;

namespace
{
    std::optional<RegisterRequest> vet(untrusted::RegisterRequest raw)
    {
        auto email    = Email::try_new(std::move(raw.email));
        auto username = Username::try_new(std::move(raw.username));
        auto password = Password::try_new(std::move(raw.password));
        if (!email || !username || !password)
        {
            fmt::print("  email: {}  username: {}  password: {}\n",
                       email ? GREEN "ok" COLOR_RESET : RED "rejected" COLOR_RESET,
                       username ? GREEN "ok" COLOR_RESET : RED "rejected" COLOR_RESET,
                       password ? GREEN "ok" COLOR_RESET : RED "rejected" COLOR_RESET);
            return std::nullopt;
        }
        return RegisterRequest{std::move(*email), std::move(*username), std::move(*password)};
    }

    void handle_register(untrusted::RegisterRequest raw)
    {
        Status status = Status::waiting;
        auto request  = vet(std::move(raw));
        status        = request ? Status::accepted : Status::rejected;
        fmt::print("  Decision: {}\n", status);
        if (request)
        {
            fmt::print("  Welcome {} <{}>\n", request->username, request->email);
        }
    }
}    // namespace

void register_example()
{
    fmt::print("######################\n{}\n\n", __func__);

    fmt::print("Sending a valid request:\n");
    handle_register({"   seventy70@Example.com   ", "Seventy70   ", "p455w0rd70!"});
    fmt::print("\n");

    fmt::print("Sending a password with a non-ASCII character:\n");
    handle_register({"   seventy70@example.com   ", "Seventy70   ", "p455w0rd灰!"});
    fmt::print("\n");

    fmt::print("Sending a username with a symbol:\n");
    handle_register({"seventy70@example.com", "u$ername", "p455w0rd70!"});
    fmt::print("\n");
}
