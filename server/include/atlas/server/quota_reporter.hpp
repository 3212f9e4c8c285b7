#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "atlas/http.hpp"
#include "atlas/server/usage.hpp"

namespace atlas::server
{

    struct QuotaOptions
    {
        std::filesystem::path data_root;
        std::uint64_t quota_bytes{0}; // 0: report the volume's figures
    };

    /// Captures status and body while leaving header access on the wrapped
    /// writer, so header changes made by the inner handler are not lost.
    class ResponseBuffer : public http::ResponseWriter
    {
    public:
        explicit ResponseBuffer(http::ResponseWriter &target) : target_(target) {}

        http::Headers &headers() override { return target_.headers(); }
        void write_header(int status) override;
        void write(std::string_view data) override;

        int status() const noexcept { return status_ == 0 ? http::status::kOk : status_; }
        std::string &body() noexcept { return body_; }

    private:
        http::ResponseWriter &target_;
        int status_{0};
        std::string body_;
    };

    /// Adds RFC 4331 quota properties to the multistatus answer of PROPFIND /.
    /// Every other exchange is forwarded without buffering.
    class QuotaReporter : public http::Handler
    {
    public:
        QuotaReporter(QuotaOptions options, const UsageProvider &usage, http::HandlerPtr next);

        void serve(http::ResponseWriter &writer, const http::Request &request) override;

        /// Throws whatever the usage provider throws.
        DiskUsage measure() const;

    private:
        QuotaOptions options_;
        const UsageProvider &usage_;
        http::HandlerPtr next_;
    };

    http::Middleware quota_reporter(QuotaOptions options, const UsageProvider &usage);

} // namespace atlas::server
