#include "atlas/server/auth_gate.hpp"

#include <spdlog/spdlog.h>

#include "atlas/encoding/base64.hpp"

namespace atlas::server
{

    std::optional<BasicCredentials> parse_basic_authorization(std::string_view header)
    {
        constexpr std::string_view kScheme = "Basic ";
        if (header.size() < kScheme.size() || !http::iequals(header.substr(0, kScheme.size()), kScheme))
        {
            return std::nullopt;
        }
        const auto decoded = encoding::decode_base64(header.substr(kScheme.size()));
        if (!decoded)
        {
            return std::nullopt;
        }
        const auto colon = decoded->find(':');
        if (colon == std::string::npos)
        {
            return std::nullopt;
        }
        return BasicCredentials{
            .username = decoded->substr(0, colon),
            .password = decoded->substr(colon + 1),
        };
    }

    AuthGate::AuthGate(const CredentialStore &store, std::string realm, http::HandlerPtr next)
        : store_(store), realm_(std::move(realm)), next_(std::move(next))
    {
    }

    void AuthGate::serve(http::ResponseWriter &writer, const http::Request &request)
    {
        const auto header = request.headers.get("Authorization");
        const auto credentials = header ? parse_basic_authorization(*header) : std::nullopt;
        if (!credentials)
        {
            challenge(writer);
            return;
        }

        if (!store_.authenticate(credentials->username, credentials->password))
        {
            spdlog::info("Auth failed for user: {} ({})", credentials->username, request.remote_endpoint);
            challenge(writer);
            return;
        }

        next_->serve(writer, request);
    }

    void AuthGate::challenge(http::ResponseWriter &writer) const
    {
        writer.headers().set("WWW-Authenticate", "Basic realm=\"" + realm_ + "\"");
        http::write_error(writer, http::status::kUnauthorized, "Unauthorized");
    }

    http::Middleware auth_gate(const CredentialStore &store, std::string realm)
    {
        return [&store, realm = std::move(realm)](http::HandlerPtr next) -> http::HandlerPtr
        {
            return std::make_shared<AuthGate>(store, realm, std::move(next));
        };
    }

} // namespace atlas::server
