#include "atlas/server/quota_reporter.hpp"

#include <spdlog/spdlog.h>

#include "atlas/server/multistatus.hpp"

namespace atlas::server
{

    void ResponseBuffer::write_header(int status)
    {
        if (status_ == 0)
        {
            status_ = status;
        }
    }

    void ResponseBuffer::write(std::string_view data)
    {
        body_.append(data);
    }

    QuotaReporter::QuotaReporter(QuotaOptions options, const UsageProvider &usage, http::HandlerPtr next)
        : options_(std::move(options)), usage_(usage), next_(std::move(next))
    {
    }

    DiskUsage QuotaReporter::measure() const
    {
        if (options_.quota_bytes > 0)
        {
            return clamp_to_quota(options_.quota_bytes, usage_.directory_used_bytes(options_.data_root));
        }
        return usage_.filesystem_usage(std::filesystem::absolute(options_.data_root));
    }

    void QuotaReporter::serve(http::ResponseWriter &writer, const http::Request &request)
    {
        if (request.method != http::method::kPropfind || request.path != "/")
        {
            next_->serve(writer, request);
            return;
        }

        ResponseBuffer buffer(writer);
        next_->serve(buffer, request);

        const auto encoding = writer.headers().get("Content-Encoding");
        const bool encoded = encoding && !http::iequals(*encoding, "identity");
        if (encoded && buffer.status() == http::status::kMultiStatus)
        {
            spdlog::debug("Root listing is {}-encoded; quota not reported", *encoding);
        }
        if (buffer.status() != http::status::kMultiStatus || encoded)
        {
            writer.write_header(buffer.status());
            if (!buffer.body().empty())
            {
                writer.write(buffer.body());
            }
            return;
        }

        auto &body = buffer.body();
        try
        {
            const auto usage = measure();
            if (!inject_quota_properties(body, usage))
            {
                spdlog::debug("No prop element in root listing; quota not reported");
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("WebDAV Warning: failed to get disk usage: {}", ex.what());
        }

        auto &headers = writer.headers();
        headers.set("Content-Length", std::to_string(body.size()));
        if (!headers.contains("Content-Type"))
        {
            headers.set("Content-Type", "text/xml; charset=utf-8");
        }
        writer.write_header(buffer.status());
        writer.write(body);
    }

    http::Middleware quota_reporter(QuotaOptions options, const UsageProvider &usage)
    {
        return [options = std::move(options), &usage](http::HandlerPtr next) -> http::HandlerPtr
        {
            return std::make_shared<QuotaReporter>(options, usage, std::move(next));
        };
    }

} // namespace atlas::server
