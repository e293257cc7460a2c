#pragma once

#include <chv/result.hpp>
#include <chv/version.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace chv {

enum class Channel { Stable, Lts, Other };

const char* channel_name(Channel c);

// One published release from the remote catalog
struct ReleaseEntry {
    Version version;
    std::string tag;            // e.g. "v25.12.5.44-stable"
    Channel channel = Channel::Other;
    int64_t published_at = 0;   // Unix seconds, 0 if unknown
};

// Parse a release tag: v<major>.<minor>.<patch>.<build>[-<suffix>]
// Suffix "stable" and "lts" map to their channels, anything else to Other.
Result<std::pair<Version, Channel>> parse_release_tag(const std::string& tag);

// RFC 3339 UTC timestamp ("2025-01-15T10:20:30Z") to Unix seconds.
// Fractional seconds are ignored.
Result<int64_t> parse_timestamp(const std::string& s);

// Version descending, then most recently published first
void sort_newest_first(std::vector<ReleaseEntry>& entries);

} // namespace chv
