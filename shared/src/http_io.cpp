#include "atlas/http_io.hpp"

#include <charconv>
#include <ctime>
#include <limits>
#include <vector>

namespace atlas::http
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            const auto first = value.find_first_not_of(" \t");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t");
            return value.substr(first, last - first + 1);
        }

        std::vector<std::string_view> split_lines(std::string_view head)
        {
            std::vector<std::string_view> lines;
            std::size_t start = 0;
            while (start < head.size())
            {
                auto end = head.find('\n', start);
                if (end == std::string_view::npos)
                {
                    end = head.size();
                }
                auto line = head.substr(start, end - start);
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }
                lines.push_back(line);
                start = end + 1;
            }
            return lines;
        }

        bool is_token_char(char ch)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (c <= 32 || c >= 127)
            {
                return false;
            }
            return std::string_view("()<>@,;:\\\"/[]?={}").find(ch) == std::string_view::npos;
        }

        // Parses header lines into headers; returns false on a malformed field.
        bool parse_fields(const std::vector<std::string_view> &lines, std::size_t first, Headers &headers)
        {
            for (std::size_t i = first; i < lines.size(); ++i)
            {
                const auto line = lines[i];
                if (line.empty())
                {
                    break;
                }
                const auto colon = line.find(':');
                if (colon == std::string_view::npos || colon == 0)
                {
                    return false;
                }
                const auto name = line.substr(0, colon);
                for (const char ch : name)
                {
                    if (!is_token_char(ch))
                    {
                        return false;
                    }
                }
                headers.add(std::string(name), std::string(trim(line.substr(colon + 1))));
            }
            return true;
        }

        bool parse_decimal(std::string_view text, std::uint64_t &value)
        {
            if (text.empty())
            {
                return false;
            }
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            return ec == std::errc{} && ptr == end;
        }

        bool has_token(std::string_view list, std::string_view token)
        {
            std::size_t start = 0;
            while (start <= list.size())
            {
                auto end = list.find(',', start);
                if (end == std::string_view::npos)
                {
                    end = list.size();
                }
                if (iequals(trim(list.substr(start, end - start)), token))
                {
                    return true;
                }
                start = end + 1;
            }
            return false;
        }

        std::string http_date()
        {
            const auto now = std::time(nullptr);
            std::tm tm{};
            gmtime_r(&now, &tm);
            char buffer[64];
            const auto size = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm);
            return std::string(buffer, size);
        }

        BodyLength framing_from_headers(const Headers &headers, int error_status)
        {
            if (const auto te = headers.get("Transfer-Encoding"))
            {
                if (!iequals(trim(*te), "chunked"))
                {
                    throw HttpError(status::kNotImplemented, "Unsupported transfer coding: " + *te);
                }
                if (headers.contains("Content-Length"))
                {
                    throw HttpError(error_status, "Both Transfer-Encoding and Content-Length present");
                }
                return {BodyFraming::Chunked, 0};
            }
            if (const auto cl = headers.get("Content-Length"))
            {
                std::uint64_t length = 0;
                if (!parse_decimal(trim(*cl), length))
                {
                    throw HttpError(error_status, "Invalid Content-Length: " + *cl);
                }
                return {length == 0 ? BodyFraming::None : BodyFraming::ContentLength, length};
            }
            return {BodyFraming::None, 0};
        }

    } // namespace

    Request parse_request_head(std::string_view head)
    {
        auto lines = split_lines(head);
        std::size_t index = 0;
        // Robust servers ignore empty lines ahead of the request line.
        while (index < lines.size() && lines[index].empty())
        {
            ++index;
        }
        if (index == lines.size())
        {
            throw HttpError(status::kBadRequest, "Missing request line");
        }

        const auto request_line = lines[index];
        const auto first_space = request_line.find(' ');
        const auto last_space = request_line.rfind(' ');
        if (first_space == std::string_view::npos || first_space == last_space)
        {
            throw HttpError(status::kBadRequest, "Malformed request line");
        }

        Request request;
        request.method = std::string(request_line.substr(0, first_space));
        auto target = request_line.substr(first_space + 1, last_space - first_space - 1);
        request.version = std::string(request_line.substr(last_space + 1));
        if (request.method.empty() || target.empty() ||
            (request.version != "HTTP/1.1" && request.version != "HTTP/1.0"))
        {
            throw HttpError(status::kBadRequest, "Malformed request line");
        }
        for (const char ch : request.method)
        {
            if (!is_token_char(ch))
            {
                throw HttpError(status::kBadRequest, "Malformed request method");
            }
        }

        // Absolute-form targets are reduced to origin-form.
        if (target.starts_with("http://") || target.starts_with("https://"))
        {
            const auto authority = target.find("//") + 2;
            const auto path_start = target.find('/', authority);
            target = path_start == std::string_view::npos ? std::string_view("/") : target.substr(path_start);
        }

        request.target = std::string(target);
        const auto question = target.find('?');
        const auto raw_path = target.substr(0, question);
        if (question != std::string_view::npos)
        {
            request.query = std::string(target.substr(question + 1));
        }
        request.path = percent_decode(raw_path);

        if (!parse_fields(lines, index + 1, request.headers))
        {
            throw HttpError(status::kBadRequest, "Malformed header field");
        }
        return request;
    }

    ResponseHead parse_response_head(std::string_view head)
    {
        const auto lines = split_lines(head);
        if (lines.empty())
        {
            throw HttpError(status::kBadGateway, "Empty upstream response");
        }

        const auto status_line = lines.front();
        const auto first_space = status_line.find(' ');
        if (first_space == std::string_view::npos || !status_line.starts_with("HTTP/"))
        {
            throw HttpError(status::kBadGateway, "Malformed upstream status line");
        }

        ResponseHead response;
        response.version = std::string(status_line.substr(0, first_space));
        const auto rest = status_line.substr(first_space + 1);
        const auto code_text = rest.substr(0, rest.find(' '));
        std::uint64_t code = 0;
        if (code_text.size() != 3 || !parse_decimal(code_text, code) || code < 100)
        {
            throw HttpError(status::kBadGateway, "Malformed upstream status code");
        }
        response.status = static_cast<int>(code);
        if (rest.size() > 4)
        {
            response.reason = std::string(rest.substr(4));
        }

        if (!parse_fields(lines, 1, response.headers))
        {
            throw HttpError(status::kBadGateway, "Malformed upstream header field");
        }
        return response;
    }

    BodyLength request_body_length(const Headers &headers)
    {
        return framing_from_headers(headers, status::kBadRequest);
    }

    BodyLength response_body_length(std::string_view request_method, int status, const Headers &headers)
    {
        if (request_method == method::kHead || status / 100 == 1 || status == status::kNoContent ||
            status == status::kNotModified)
        {
            return {BodyFraming::None, 0};
        }
        if (!headers.contains("Transfer-Encoding") && !headers.contains("Content-Length"))
        {
            return {BodyFraming::UntilClose, 0};
        }
        return framing_from_headers(headers, status::kBadGateway);
    }

    bool wants_keep_alive(const Request &request)
    {
        const auto connection = request.headers.get("Connection").value_or("");
        if (request.version == "HTTP/1.0")
        {
            return has_token(connection, "keep-alive");
        }
        return !has_token(connection, "close");
    }

    bool expects_continue(const Request &request)
    {
        const auto expect = request.headers.get("Expect");
        return request.version == "HTTP/1.1" && expect && iequals(trim(*expect), "100-continue");
    }

    std::uint64_t parse_chunk_size(std::string_view line)
    {
        const auto size_text = trim(line.substr(0, line.find(';')));
        std::uint64_t size = 0;
        const auto *end = size_text.data() + size_text.size();
        const auto [ptr, ec] = std::from_chars(size_text.data(), end, size, 16);
        if (size_text.empty() || ec != std::errc{} || ptr != end)
        {
            throw HttpError(status::kBadRequest, "Malformed chunk size");
        }
        return size;
    }

    StreamResponseWriter::StreamResponseWriter(Sink sink, const Request &request)
        : sink_(std::move(sink)),
          head_request_(request.method == method::kHead),
          http11_(request.version == "HTTP/1.1"),
          keep_alive_(wants_keep_alive(request))
    {
    }

    Headers &StreamResponseWriter::headers()
    {
        return headers_;
    }

    void StreamResponseWriter::write_header(int status)
    {
        if (committed_ || status_ != 0)
        {
            return;
        }
        status_ = status;
    }

    void StreamResponseWriter::write(std::string_view data)
    {
        if (!committed_)
        {
            commit(false);
        }
        if (!body_allowed_ || data.empty())
        {
            return;
        }
        if (chunked_)
        {
            char size_line[32];
            const auto [end, ec] = std::to_chars(size_line, size_line + sizeof(size_line) - 2, data.size(), 16);
            std::string chunk(size_line, end);
            chunk.append("\r\n");
            chunk.append(data);
            chunk.append("\r\n");
            sink_(chunk);
            return;
        }
        sink_(data);
    }

    void StreamResponseWriter::finish()
    {
        if (finished_)
        {
            return;
        }
        if (!committed_)
        {
            commit(true);
        }
        if (chunked_)
        {
            sink_("0\r\n\r\n");
        }
        finished_ = true;
    }

    void StreamResponseWriter::commit(bool finishing)
    {
        if (status_ == 0)
        {
            status_ = status::kOk;
        }
        committed_ = true;

        const bool status_has_body = status_ / 100 != 1 && status_ != status::kNoContent &&
                                     status_ != status::kNotModified;
        body_allowed_ = status_has_body && !head_request_;

        if (const auto connection = headers_.get("Connection"); connection && has_token(*connection, "close"))
        {
            keep_alive_ = false;
        }

        if (status_has_body && !headers_.contains("Content-Length"))
        {
            if (finishing)
            {
                headers_.set("Content-Length", "0");
            }
            else if (!head_request_)
            {
                if (http11_)
                {
                    headers_.set("Transfer-Encoding", "chunked");
                    chunked_ = true;
                }
                else
                {
                    keep_alive_ = false;
                }
            }
        }
        if (!status_has_body)
        {
            headers_.remove("Content-Length");
            headers_.remove("Transfer-Encoding");
        }

        if (!headers_.contains("Date"))
        {
            headers_.set("Date", http_date());
        }
        if (!keep_alive_)
        {
            headers_.set("Connection", "close");
        }
        else if (!http11_)
        {
            headers_.set("Connection", "keep-alive");
        }

        std::string head = "HTTP/1.1 " + std::to_string(status_) + " " + std::string(reason_phrase(status_)) + "\r\n";
        for (const auto &[name, value] : headers_)
        {
            head.append(name).append(": ").append(value).append("\r\n");
        }
        head.append("\r\n");
        sink_(head);
    }

} // namespace atlas::http
