/**
 * Atlas - HTTP/1.1 wire helpers: head parsing, body framing and a streaming
 * response writer. The read helpers work on any Asio SyncReadStream.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <asio/buffers_iterator.hpp>
#include <asio/error.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/streambuf.hpp>

#include "atlas/http.hpp"

namespace atlas::http
{

    constexpr std::size_t kMaxHeadSize = 64 * 1024;

    enum class BodyFraming
    {
        None,
        ContentLength,
        Chunked,
        UntilClose
    };

    struct BodyLength
    {
        BodyFraming framing{BodyFraming::None};
        std::uint64_t length{};
    };

    struct ResponseHead
    {
        std::string version;
        int status{};
        std::string reason;
        Headers headers;
    };

    /// Parses a request line and header block (terminating blank line optional).
    /// The returned request has no body. Throws HttpError(400).
    Request parse_request_head(std::string_view head);

    /// Throws HttpError(502) when the upstream sent something unparsable.
    ResponseHead parse_response_head(std::string_view head);

    /// Throws HttpError(400) for conflicting or invalid framing, 501 for an
    /// unsupported transfer coding.
    BodyLength request_body_length(const Headers &headers);

    BodyLength response_body_length(std::string_view request_method, int status, const Headers &headers);

    bool wants_keep_alive(const Request &request);

    bool expects_continue(const Request &request);

    /// Parses the size field of a chunk header line ("1a;ext=1").
    std::uint64_t parse_chunk_size(std::string_view line);

    namespace detail
    {
        template <typename SyncReadStream>
        std::string take_line(SyncReadStream &stream, asio::streambuf &buffer)
        {
            const auto n = asio::read_until(stream, buffer, "\r\n");
            const auto begin = asio::buffers_begin(buffer.data());
            std::string line(begin, begin + static_cast<std::ptrdiff_t>(n - 2));
            buffer.consume(n);
            return line;
        }

        template <typename SyncReadStream, typename Consumer>
        void take_exact(SyncReadStream &stream, asio::streambuf &buffer, std::uint64_t count, Consumer &consume)
        {
            constexpr std::uint64_t kSlice = 64 * 1024;
            while (count > 0)
            {
                if (buffer.size() == 0)
                {
                    asio::read(stream, buffer, asio::transfer_at_least(1));
                }
                const auto available = std::min<std::uint64_t>({buffer.size(), count, kSlice});
                const auto begin = asio::buffers_begin(buffer.data());
                const std::string piece(begin, begin + static_cast<std::ptrdiff_t>(available));
                buffer.consume(static_cast<std::size_t>(available));
                count -= available;
                consume(std::string_view(piece));
            }
        }
    } // namespace detail

    /// Reads one message head. Returns std::nullopt when the peer closed the
    /// connection before sending anything; throws HttpError(431) when the head
    /// outgrows kMaxHeadSize.
    template <typename SyncReadStream>
    std::optional<std::string> read_head(SyncReadStream &stream, asio::streambuf &buffer)
    {
        std::error_code ec;
        const auto n = asio::read_until(stream, buffer, "\r\n\r\n", ec);
        if (ec)
        {
            if (ec == asio::error::eof && buffer.size() == 0)
            {
                return std::nullopt;
            }
            if (ec == asio::error::not_found)
            {
                throw HttpError(status::kHeaderFieldsTooLarge, "Request head too large");
            }
            throw std::system_error(ec);
        }
        const auto begin = asio::buffers_begin(buffer.data());
        std::string head(begin, begin + static_cast<std::ptrdiff_t>(n));
        buffer.consume(n);
        return head;
    }

    /// Streams a message body to consume(std::string_view), throwing
    /// HttpError(413) once more than limit bytes have been seen.
    template <typename SyncReadStream, typename Consumer>
    void read_body(SyncReadStream &stream, asio::streambuf &buffer, const BodyLength &length, std::uint64_t limit,
                   Consumer &&consume)
    {
        std::uint64_t total = 0;
        auto counted = [&](std::string_view piece)
        {
            total += piece.size();
            if (total > limit)
            {
                throw HttpError(status::kPayloadTooLarge, "Message body exceeds limit");
            }
            consume(piece);
        };

        switch (length.framing)
        {
        case BodyFraming::None:
            return;
        case BodyFraming::ContentLength:
            if (length.length > limit)
            {
                throw HttpError(status::kPayloadTooLarge, "Message body exceeds limit");
            }
            detail::take_exact(stream, buffer, length.length, counted);
            return;
        case BodyFraming::Chunked:
            for (;;)
            {
                const auto size = parse_chunk_size(detail::take_line(stream, buffer));
                if (size == 0)
                {
                    // Trailer section ends with an empty line.
                    while (!detail::take_line(stream, buffer).empty())
                    {
                    }
                    return;
                }
                detail::take_exact(stream, buffer, size, counted);
                if (!detail::take_line(stream, buffer).empty())
                {
                    throw HttpError(status::kBadRequest, "Malformed chunk terminator");
                }
            }
        case BodyFraming::UntilClose:
            for (;;)
            {
                if (buffer.size() > 0)
                {
                    detail::take_exact(stream, buffer, buffer.size(), counted);
                }
                std::error_code ec;
                asio::read(stream, buffer, asio::transfer_at_least(1), ec);
                if (ec == asio::error::eof)
                {
                    if (buffer.size() > 0)
                    {
                        detail::take_exact(stream, buffer, buffer.size(), counted);
                    }
                    return;
                }
                if (ec)
                {
                    throw std::system_error(ec);
                }
            }
        }
    }

    /// ResponseWriter that serialises onto a byte sink. The head is committed on
    /// the first body write; without a Content-Length the body is chunked for
    /// HTTP/1.1 peers and close-delimited otherwise.
    class StreamResponseWriter : public ResponseWriter
    {
    public:
        using Sink = std::function<void(std::string_view)>;

        StreamResponseWriter(Sink sink, const Request &request);

        Headers &headers() override;
        void write_header(int status) override;
        void write(std::string_view data) override;

        /// Commits the head if nothing was written and terminates chunked bodies.
        void finish();

        bool committed() const noexcept { return committed_; }
        bool keep_alive() const noexcept { return keep_alive_; }
        int status() const noexcept { return status_; }

    private:
        void commit(bool finishing);

        Sink sink_;
        Headers headers_;
        int status_{0};
        bool head_request_{false};
        bool http11_{true};
        bool keep_alive_{true};
        bool committed_{false};
        bool body_allowed_{true};
        bool chunked_{false};
        bool finished_{false};
    };

} // namespace atlas::http
