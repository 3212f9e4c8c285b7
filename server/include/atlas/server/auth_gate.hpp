#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "atlas/http.hpp"
#include "atlas/server/credential_store.hpp"

namespace atlas::server
{

    constexpr std::string_view kDefaultRealm = "Atlas Storage";

    struct BasicCredentials
    {
        std::string username;
        std::string password;
    };

    /// Decodes "Basic <base64(user:password)>". The scheme name is matched
    /// case-insensitively; anything malformed yields std::nullopt.
    std::optional<BasicCredentials> parse_basic_authorization(std::string_view header);

    /// Rejects every request that does not carry valid Basic credentials. The
    /// full password check runs on each request; nothing is cached.
    class AuthGate : public http::Handler
    {
    public:
        AuthGate(const CredentialStore &store, std::string realm, http::HandlerPtr next);

        void serve(http::ResponseWriter &writer, const http::Request &request) override;

    private:
        void challenge(http::ResponseWriter &writer) const;

        const CredentialStore &store_;
        std::string realm_;
        http::HandlerPtr next_;
    };

    http::Middleware auth_gate(const CredentialStore &store, std::string realm = std::string(kDefaultRealm));

} // namespace atlas::server
