#pragma once

#include <cstdint>
#include <filesystem>

namespace atlas::server
{

    struct DiskUsage
    {
        std::uint64_t free_bytes{};
        std::uint64_t used_bytes{};

        bool operator==(const DiskUsage &) const = default;
    };

    /// Source of the figures reported as quota properties. Both calls may block
    /// on filesystem I/O and report failure by throwing.
    class UsageProvider
    {
    public:
        virtual ~UsageProvider() = default;

        /// Free and used bytes of the volume holding path.
        virtual DiskUsage filesystem_usage(const std::filesystem::path &path) const = 0;

        /// Sum of regular-file sizes below root.
        virtual std::uint64_t directory_used_bytes(const std::filesystem::path &root) const = 0;
    };

    class SystemUsageProvider : public UsageProvider
    {
    public:
        DiskUsage filesystem_usage(const std::filesystem::path &path) const override;
        std::uint64_t directory_used_bytes(const std::filesystem::path &root) const override;
    };

    /// statvfs() based; on platforms without it reports 100 GiB free, 0 used.
    DiskUsage volume_usage(const std::filesystem::path &path);

    /// Entries that vanish or cannot be read while walking count as zero; only a
    /// root that cannot be opened throws std::filesystem::filesystem_error.
    std::uint64_t directory_used_bytes(const std::filesystem::path &root);

    /// used = min(directory_used, quota), free = quota - used.
    DiskUsage clamp_to_quota(std::uint64_t quota_bytes, std::uint64_t directory_used) noexcept;

} // namespace atlas::server
