/**
 * Atlas - In-place edits of WebDAV multistatus bodies.
 *
 * The body is never re-serialised: a light scanner walks the markup (skipping
 * comments, CDATA sections, processing instructions and quoted attribute
 * values) so that new elements can be spliced into the original bytes.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "atlas/server/usage.hpp"

namespace atlas::server
{

    constexpr std::string_view kDavNamespace = "DAV:";
    constexpr std::string_view kDefaultDavPrefix = "D";

    /// Prefix of the first xmlns:P="DAV:" declaration, or "D" when none exists.
    std::string detect_dav_prefix(std::string_view body);

    /// Offset of the '<' of the first end tag whose local name is "prop" and
    /// whose prefix resolves to DAV: (or is not bound at all).
    std::optional<std::size_t> find_prop_end_tag(std::string_view body);

    std::string quota_properties_xml(std::string_view prefix, const DiskUsage &usage);

    /// Splices quota-available-bytes and quota-used-bytes in front of the first
    /// closing prop tag. Returns false and leaves body untouched when there is
    /// no such tag.
    bool inject_quota_properties(std::string &body, const DiskUsage &usage);

} // namespace atlas::server
