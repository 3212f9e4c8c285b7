#include "atlas/server/usage.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/statvfs.h>
#define ATLAS_HAVE_STATVFS 1
#endif

namespace atlas::server
{

    DiskUsage SystemUsageProvider::filesystem_usage(const std::filesystem::path &path) const
    {
        return volume_usage(path);
    }

    std::uint64_t SystemUsageProvider::directory_used_bytes(const std::filesystem::path &root) const
    {
        return server::directory_used_bytes(root);
    }

#ifdef ATLAS_HAVE_STATVFS

    DiskUsage volume_usage(const std::filesystem::path &path)
    {
        struct statvfs stat{};
        if (::statvfs(path.c_str(), &stat) != 0)
        {
            throw std::filesystem::filesystem_error("statvfs failed", path,
                                                    std::error_code(errno, std::generic_category()));
        }
        const auto block_size = static_cast<std::uint64_t>(stat.f_frsize);
        const auto free = static_cast<std::uint64_t>(stat.f_bavail) * block_size;
        const auto total = static_cast<std::uint64_t>(stat.f_blocks) * block_size;
        return DiskUsage{.free_bytes = free, .used_bytes = total > free ? total - free : 0};
    }

#else

    DiskUsage volume_usage(const std::filesystem::path & /*path*/)
    {
        return DiskUsage{.free_bytes = 100ull * 1024 * 1024 * 1024, .used_bytes = 0};
    }

#endif

    std::uint64_t directory_used_bytes(const std::filesystem::path &root)
    {
        // Throws if the root itself cannot be opened.
        std::filesystem::directory_iterator first(root);

        std::uint64_t total = 0;
        std::vector<std::filesystem::directory_iterator> pending;
        pending.push_back(std::move(first));
        const std::filesystem::directory_iterator end;
        while (!pending.empty())
        {
            auto &it = pending.back();
            if (it == end)
            {
                pending.pop_back();
                continue;
            }

            std::error_code ec;
            const auto entry = *it;
            it.increment(ec);
            if (ec)
            {
                // Directory vanished or became unreadable mid-walk.
                pending.pop_back();
            }

            if (entry.is_symlink(ec))
            {
                continue;
            }
            if (entry.is_directory(ec))
            {
                std::filesystem::directory_iterator child(entry.path(), ec);
                if (!ec)
                {
                    pending.push_back(std::move(child));
                }
                continue;
            }
            if (entry.is_regular_file(ec))
            {
                const auto size = entry.file_size(ec);
                if (!ec)
                {
                    total += size;
                }
            }
        }
        return total;
    }

    DiskUsage clamp_to_quota(std::uint64_t quota_bytes, std::uint64_t directory_used) noexcept
    {
        const auto used = std::min(directory_used, quota_bytes);
        return DiskUsage{.free_bytes = quota_bytes - used, .used_bytes = used};
    }

} // namespace atlas::server
