#include <catch2/catch.hpp>
#include <chv/platform.hpp>

using namespace chv;

TEST_CASE("supported uname combinations", "[platform]") {
    struct Case { const char* sys; const char* mach; const char* os; const char* arch; };
    const Case cases[] = {
        {"Linux", "x86_64", "linux", "x86_64"},
        {"Linux", "aarch64", "linux", "aarch64"},
        {"Linux", "amd64", "linux", "x86_64"},
        {"Darwin", "arm64", "macos", "aarch64"},
        {"Darwin", "x86_64", "macos", "x86_64"},
    };
    for (const auto& c : cases) {
        auto p = platform_from_uname(c.sys, c.mach);
        REQUIRE(p.is_ok());
        CHECK(p.value().os == c.os);
        CHECK(p.value().arch == c.arch);
    }
}

TEST_CASE("unsupported OS or architecture", "[platform]") {
    auto win = platform_from_uname("Windows_NT", "x86_64");
    REQUIRE(win.is_err());
    REQUIRE(win.error().code == ChvError::UnsupportedPlatform);
    REQUIRE(win.error().message.find("Windows_NT/x86_64") != std::string::npos);

    REQUIRE(platform_from_uname("Linux", "riscv64").error().code == ChvError::UnsupportedPlatform);
    REQUIRE(platform_from_uname("FreeBSD", "amd64").error().code == ChvError::UnsupportedPlatform);
}

TEST_CASE("detect_platform agrees with the supported set", "[platform]") {
    auto p = detect_platform();
    if (p.is_err()) {
        REQUIRE(p.error().code == ChvError::UnsupportedPlatform);
        return;
    }
    REQUIRE((p.value().os == "linux" || p.value().os == "macos"));
    REQUIRE((p.value().arch == "x86_64" || p.value().arch == "aarch64"));
}
