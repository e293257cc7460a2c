#include <chv/platform.hpp>

#include <cerrno>
#include <cstring>
#include <sys/utsname.h>

namespace chv {

Result<Platform> platform_from_uname(const std::string& sysname,
                                     const std::string& machine) {
    Platform p;

    if (sysname == "Linux") {
        p.os = "linux";
    } else if (sysname == "Darwin") {
        p.os = "macos";
    }

    if (machine == "x86_64" || machine == "amd64") {
        p.arch = "x86_64";
    } else if (machine == "aarch64" || machine == "arm64") {
        p.arch = "aarch64";
    }

    if (p.os.empty() || p.arch.empty()) {
        return ChvError{ChvError::UnsupportedPlatform,
            "unsupported platform: " + sysname + "/" + machine,
            "ClickHouse builds are published for linux and macos on x86_64 and aarch64"};
    }
    return Result<Platform>::ok(std::move(p));
}

Result<Platform> detect_platform() {
    struct utsname info;
    if (uname(&info) != 0) {
        return ChvError{ChvError::IO,
            std::string("uname() failed: ") + std::strerror(errno)};
    }
    return platform_from_uname(info.sysname, info.machine);
}

} // namespace chv
