#pragma once

#include <chv/result.hpp>
#include <string>

namespace chv {

// Host platform in release-asset naming: os in {linux, macos},
// arch in {x86_64, aarch64}
struct Platform {
    std::string os;
    std::string arch;
};

// Map uname(2) names ("Linux"/"Darwin", "x86_64"/"amd64"/"aarch64"/"arm64")
// to asset names. Any other combination is UnsupportedPlatform.
Result<Platform> platform_from_uname(const std::string& sysname,
                                     const std::string& machine);

Result<Platform> detect_platform();

} // namespace chv
