#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "atlas/http.hpp"

namespace atlas::server
{

    /// Content type registered for the extension of path (case-insensitive), if any.
    std::optional<std::string> content_type_for(std::string_view path);

    /// Pre-sets Content-Type from the request path's extension. Windows' WebDAV
    /// redirector relies on it when opening files straight from the share.
    class ContentTypeHint : public http::Handler
    {
    public:
        explicit ContentTypeHint(http::HandlerPtr next);

        void serve(http::ResponseWriter &writer, const http::Request &request) override;

    private:
        http::HandlerPtr next_;
    };

    http::Middleware content_type_hint();

} // namespace atlas::server
