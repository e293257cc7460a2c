#include <catch2/catch.hpp>
#include <chv/config.hpp>
#include "test_support.hpp"

#include <map>

using namespace chv;
using chv::test::TempDir;

// ===== Parsing =====

TEST_CASE("empty config keeps defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    const Config& c = r.value();
    REQUIRE(c.log.level == log::Info);
    REQUIRE_FALSE(c.log.color.has_value());
    REQUIRE(c.catalog.url == "https://api.github.com/repos/ClickHouse/ClickHouse/releases");
    REQUIRE(c.catalog.per_page == 100);
    REQUIRE(c.catalog.max_pages == 100);
    REQUIRE(c.download.url_template == "{{ base }}/{{ tag }}/clickhouse-{{ os }}-{{ arch }}");
    REQUIRE(c.network.connect_timeout_seconds == 15);
    REQUIRE(c.install.stale_temp_minutes == 60);
}

TEST_CASE("parse every section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false

[network]
connect-timeout = 5
timeout = 120
user-agent = "chv-test"

[catalog]
url = "https://mirror.example.com/releases"
per-page = 50
max-pages = 2

[download]
base-url = "https://mirror.example.com/download"
url-template = "{{ base }}/{{ version }}/{{ os }}-{{ arch }}/clickhouse"

[install]
stale-temp-minutes = 5
)");
    REQUIRE(r.is_ok());
    const Config& c = r.value();
    REQUIRE(c.log.level == log::Debug);
    REQUIRE(c.log.color == false);
    REQUIRE(c.network.connect_timeout_seconds == 5);
    REQUIRE(c.network.timeout_seconds == 120);
    REQUIRE(c.network.user_agent == "chv-test");
    REQUIRE(c.catalog.url == "https://mirror.example.com/releases");
    REQUIRE(c.catalog.per_page == 50);
    REQUIRE(c.catalog.max_pages == 2);
    REQUIRE(c.download.base_url == "https://mirror.example.com/download");
    REQUIRE(c.install.stale_temp_minutes == 5);
}

TEST_CASE("parse on top of a base keeps unset keys", "[config]") {
    Config base;
    base.catalog.max_pages = 9;
    auto r = Config::parse("[catalog]\nper-page = 10\n", base);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().catalog.per_page == 10);
    REQUIRE(r.value().catalog.max_pages == 9);
}

TEST_CASE("invalid TOML reports origin and line", "[config]") {
    auto r = Config::parse("[log]\nlevel = \n", Config{}, "config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChvError::Parse);
    REQUIRE(r.error().file == "config.toml");
    REQUIRE(r.error().line > 0);
}

TEST_CASE("wrong value types are config errors", "[config]") {
    auto r1 = Config::parse("[catalog]\nper-page = \"many\"\n");
    REQUIRE(r1.is_err());
    REQUIRE(r1.error().code == ChvError::Config);

    auto r2 = Config::parse("[log]\ncolor = \"yes\"\n");
    REQUIRE(r2.is_err());
    REQUIRE(r2.error().code == ChvError::Config);

    auto r3 = Config::parse("[log]\nlevel = \"chatty\"\n");
    REQUIRE(r3.is_err());
    REQUIRE(r3.error().code == ChvError::Config);
}

TEST_CASE("out-of-range numbers are rejected", "[config]") {
    REQUIRE(Config::parse("[catalog]\nper-page = 0\n").is_err());
    REQUIRE(Config::parse("[catalog]\nper-page = 101\n").is_err());
    REQUIRE(Config::parse("[catalog]\nmax-pages = 0\n").is_err());
    REQUIRE(Config::parse("[catalog]\nmax-pages = 1000\n").is_ok());
    REQUIRE(Config::parse("[network]\ntimeout = 0\n").is_err());
    REQUIRE(Config::parse("[install]\nstale-temp-minutes = -1\n").is_err());
    // A zero age would sweep temp files another install is still writing
    REQUIRE(Config::parse("[install]\nstale-temp-minutes = 0\n").is_err());
    REQUIRE(Config::parse("[install]\nstale-temp-minutes = 1\n").is_ok());
}

TEST_CASE("url template may only use known variables", "[config]") {
    auto r = Config::parse("[download]\nurl-template = \"{{ base }}/{{ flavour }}\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChvError::Config);
    REQUIRE(r.error().message.find("flavour") != std::string::npos);
}

// ===== Files =====

TEST_CASE("load missing file gives defaults", "[config]") {
    TempDir td("chv_config");
    auto r = Config::load((td.path / "config.toml").string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().catalog.per_page == 100);
}

TEST_CASE("load reads the file", "[config]") {
    TempDir td("chv_config");
    td.write_file("config.toml", "[install]\nstale-temp-minutes = 15\n");
    auto r = Config::load((td.path / "config.toml").string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().install.stale_temp_minutes == 15);
}

// ===== Environment =====

TEST_CASE("environment overrides file values", "[config]") {
    std::map<std::string, std::string> env = {
        {"CHV_LOG", "error"},
        {"CHV_CATALOG_URL", "http://localhost:8000/releases"},
        {"CHV_DOWNLOAD_BASE", "http://localhost:8000/dl"},
        {"CHV_HTTP_TIMEOUT", "30"},
    };
    auto lookup = [&](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };

    Config c;
    REQUIRE(c.apply_env(lookup).is_ok());
    REQUIRE(c.log.level == log::Error);
    REQUIRE(c.catalog.url == "http://localhost:8000/releases");
    REQUIRE(c.download.base_url == "http://localhost:8000/dl");
    REQUIRE(c.network.timeout_seconds == 30);
}

TEST_CASE("bad environment values are config errors", "[config]") {
    Config c;
    auto timeout = c.apply_env([](const char* name) -> const char* {
        return std::string(name) == "CHV_HTTP_TIMEOUT" ? "soon" : nullptr;
    });
    REQUIRE(timeout.is_err());
    REQUIRE(timeout.error().code == ChvError::Config);

    auto level = c.apply_env([](const char* name) -> const char* {
        return std::string(name) == "CHV_LOG" ? "verbose" : nullptr;
    });
    REQUIRE(level.is_err());
    REQUIRE(level.error().code == ChvError::Config);
    REQUIRE(level.error().message.find("CHV_LOG") != std::string::npos);
}
