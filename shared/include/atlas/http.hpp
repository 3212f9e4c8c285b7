/**
 * Atlas - HTTP message types and the handler/middleware seam.
 *
 * A Handler serves one request by driving a ResponseWriter. Headers stay
 * mutable until the first call to write_header() or write(); after that the
 * transport may already have put them on the wire.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace atlas::http
{

    namespace status
    {
        constexpr int kContinue = 100;
        constexpr int kOk = 200;
        constexpr int kNoContent = 204;
        constexpr int kMultiStatus = 207;
        constexpr int kNotModified = 304;
        constexpr int kBadRequest = 400;
        constexpr int kUnauthorized = 401;
        constexpr int kNotFound = 404;
        constexpr int kPayloadTooLarge = 413;
        constexpr int kHeaderFieldsTooLarge = 431;
        constexpr int kInternalServerError = 500;
        constexpr int kNotImplemented = 501;
        constexpr int kBadGateway = 502;
    } // namespace status

    namespace method
    {
        constexpr std::string_view kGet = "GET";
        constexpr std::string_view kHead = "HEAD";
        constexpr std::string_view kPropfind = "PROPFIND";
    } // namespace method

    std::string_view reason_phrase(int status) noexcept;

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

    /// Ordered header list with case-insensitive lookup. Repeated fields are kept.
    class Headers
    {
    public:
        using Field = std::pair<std::string, std::string>;
        using const_iterator = std::vector<Field>::const_iterator;

        std::optional<std::string> get(std::string_view name) const;
        bool contains(std::string_view name) const;

        /// Replaces every existing field with this name.
        void set(std::string name, std::string value);
        void add(std::string name, std::string value);
        void remove(std::string_view name);

        bool empty() const noexcept { return fields_.empty(); }
        std::size_t size() const noexcept { return fields_.size(); }
        const_iterator begin() const noexcept { return fields_.begin(); }
        const_iterator end() const noexcept { return fields_.end(); }

    private:
        std::vector<Field> fields_;
    };

    struct Request
    {
        std::string method;
        std::string target; // origin-form, still percent-encoded
        std::string path;   // decoded path component of target
        std::string query;
        std::string version{"HTTP/1.1"};
        Headers headers;
        std::string body;
        std::string remote_endpoint;
    };

    class ResponseWriter
    {
    public:
        virtual ~ResponseWriter() = default;

        virtual Headers &headers() = 0;
        virtual void write_header(int status) = 0;
        virtual void write(std::string_view data) = 0;
    };

    class Handler
    {
    public:
        virtual ~Handler() = default;

        virtual void serve(ResponseWriter &writer, const Request &request) = 0;
    };

    using HandlerPtr = std::shared_ptr<Handler>;
    using HandlerFunction = std::function<void(ResponseWriter &, const Request &)>;
    using Middleware = std::function<HandlerPtr(HandlerPtr next)>;

    HandlerPtr make_handler(HandlerFunction function);

    /// Wraps handler so that middleware.front() sees each request first:
    /// chain(h, {a, b}) == a(b(h)).
    HandlerPtr chain(HandlerPtr handler, const std::vector<Middleware> &middleware);

    /// Plain-text error reply: sets Content-Type, drops any Content-Length and
    /// writes message followed by a newline.
    void write_error(ResponseWriter &writer, int status, std::string_view message);

    class HttpError : public std::runtime_error
    {
    public:
        HttpError(int status, std::string message);

        int status() const noexcept { return status_; }

    private:
        int status_;
    };

    /// Decodes %XX escapes; throws HttpError(400) on a malformed escape.
    std::string percent_decode(std::string_view input);

} // namespace atlas::http
