#include "atlas/http.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace atlas::http
{

    namespace
    {

        struct StatusDescription
        {
            int status;
            std::string_view reason;
        };

        constexpr std::array<StatusDescription, 28> kReasons{{
            {100, "Continue"},
            {200, "OK"},
            {201, "Created"},
            {204, "No Content"},
            {206, "Partial Content"},
            {207, "Multi-Status"},
            {301, "Moved Permanently"},
            {302, "Found"},
            {304, "Not Modified"},
            {400, "Bad Request"},
            {401, "Unauthorized"},
            {403, "Forbidden"},
            {404, "Not Found"},
            {405, "Method Not Allowed"},
            {409, "Conflict"},
            {412, "Precondition Failed"},
            {413, "Payload Too Large"},
            {415, "Unsupported Media Type"},
            {416, "Range Not Satisfiable"},
            {423, "Locked"},
            {424, "Failed Dependency"},
            {431, "Request Header Fields Too Large"},
            {500, "Internal Server Error"},
            {501, "Not Implemented"},
            {502, "Bad Gateway"},
            {503, "Service Unavailable"},
            {504, "Gateway Timeout"},
            {507, "Insufficient Storage"},
        }};

        class FunctionHandler : public Handler
        {
        public:
            explicit FunctionHandler(HandlerFunction function) : function_(std::move(function)) {}

            void serve(ResponseWriter &writer, const Request &request) override
            {
                function_(writer, request);
            }

        private:
            HandlerFunction function_;
        };

        int hex_value(char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

    } // namespace

    std::string_view reason_phrase(int status) noexcept
    {
        for (const auto &entry : kReasons)
        {
            if (entry.status == status)
            {
                return entry.reason;
            }
        }
        return "Unknown";
    }

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept
    {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

    std::optional<std::string> Headers::get(std::string_view name) const
    {
        for (const auto &[key, value] : fields_)
        {
            if (iequals(key, name))
            {
                return value;
            }
        }
        return std::nullopt;
    }

    bool Headers::contains(std::string_view name) const
    {
        return get(name).has_value();
    }

    void Headers::set(std::string name, std::string value)
    {
        remove(name);
        fields_.emplace_back(std::move(name), std::move(value));
    }

    void Headers::add(std::string name, std::string value)
    {
        fields_.emplace_back(std::move(name), std::move(value));
    }

    void Headers::remove(std::string_view name)
    {
        std::erase_if(fields_, [name](const Field &field)
                      { return iequals(field.first, name); });
    }

    HandlerPtr make_handler(HandlerFunction function)
    {
        return std::make_shared<FunctionHandler>(std::move(function));
    }

    HandlerPtr chain(HandlerPtr handler, const std::vector<Middleware> &middleware)
    {
        for (auto it = middleware.rbegin(); it != middleware.rend(); ++it)
        {
            handler = (*it)(std::move(handler));
        }
        return handler;
    }

    void write_error(ResponseWriter &writer, int status, std::string_view message)
    {
        auto &headers = writer.headers();
        headers.remove("Content-Length");
        headers.set("Content-Type", "text/plain; charset=utf-8");
        headers.set("X-Content-Type-Options", "nosniff");
        writer.write_header(status);
        std::string body(message);
        body.push_back('\n');
        writer.write(body);
    }

    HttpError::HttpError(int status, std::string message)
        : std::runtime_error(std::move(message)), status_(status) {}

    std::string percent_decode(std::string_view input)
    {
        std::string output;
        output.reserve(input.size());
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            if (input[i] != '%')
            {
                output.push_back(input[i]);
                continue;
            }
            if (i + 2 >= input.size())
            {
                throw HttpError(status::kBadRequest, "Truncated percent escape");
            }
            const int high = hex_value(input[i + 1]);
            const int low = hex_value(input[i + 2]);
            if (high < 0 || low < 0)
            {
                throw HttpError(status::kBadRequest, "Invalid percent escape");
            }
            output.push_back(static_cast<char>((high << 4) | low));
            i += 2;
        }
        return output;
    }

} // namespace atlas::http
