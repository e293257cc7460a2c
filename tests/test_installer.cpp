#include <catch2/catch.hpp>
#include <chv/installer.hpp>
#include "test_support.hpp"

#include <stdexcept>

using namespace chv;
using chv::test::FakeRelease;
using chv::test::FakeTransport;
using chv::test::TempDir;
using chv::test::releases_json;
namespace fs = std::filesystem;

static const std::string kCatalogUrl = "https://api.example.com/releases";
static const std::string kDownloadBase = "https://dl.example.com/download/";

static std::string asset_url(const std::string& tag) {
    return "https://dl.example.com/download/" + tag + "/clickhouse-linux-x86_64";
}

// Store, catalog and installer wired to a fake network on a fixed linux/x86_64 host
struct InstallFixture {
    TempDir td{"chv_install"};
    FakeTransport transport;
    VersionStore store{td.path};
    ReleaseCatalog catalog{transport, kCatalogUrl, 100, 5};
    Installer installer{store, catalog, transport, options()};

    static InstallOptions options(const std::string& sysname = "Linux",
                                  const std::string& machine = "x86_64") {
        InstallOptions o;
        o.download_base = kDownloadBase;
        o.host_sysname = sysname;
        o.host_machine = machine;
        return o;
    }

    InstallFixture() {
        transport.pages[catalog.page_url(1)] = releases_json({
            {"v25.13.0.1-testing", "2025-12-28T08:00:00Z"},
            {"v25.12.5.44-stable", "2025-12-20T08:00:00Z"},
            {"v25.12.1.1-stable", "2025-12-01T08:00:00Z"},
            {"v24.8.11.5-lts", "2025-11-01T08:00:00Z"},
        });
        for (const char* tag : {"v25.13.0.1-testing", "v25.12.5.44-stable",
                                "v25.12.1.1-stable", "v24.8.11.5-lts"}) {
            transport.files[asset_url(tag)] = std::string("ELF binary for ") + tag;
        }
    }

    size_t downloads() const {
        return transport.count_requests("https://dl.example.com/");
    }
};

static VersionSpec spec(const char* s) {
    return VersionSpec::parse(s).value();
}

// ===== URL construction =====

TEST_CASE("download url from the default template", "[installer]") {
    ReleaseEntry e;
    e.version = Version::parse("25.12.5.44").value();
    e.tag = "v25.12.5.44-stable";
    InstallOptions defaults;

    auto url = build_download_url(defaults.url_template, defaults.download_base, e,
                                  Platform{"macos", "aarch64"});
    REQUIRE(url.is_ok());
    REQUIRE(url.value() ==
        "https://github.com/ClickHouse/ClickHouse/releases/download/"
        "v25.12.5.44-stable/clickhouse-macos-aarch64");

    auto custom = build_download_url("{{ base }}/{{ version }}/{{ os }}/clickhouse",
                                     "http://mirror//", e, Platform{"linux", "x86_64"});
    REQUIRE(custom.value() == "http://mirror/25.12.5.44/linux/clickhouse");
}

// ===== Install =====

TEST_CASE("install a channel alias", "[installer]") {
    InstallFixture f;
    auto r = f.installer.install(spec("stable"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().version.to_string() == "25.12.5.44");
    REQUIRE(r.value().channel == Channel::Stable);
    REQUIRE(r.value().newly_installed);
    REQUIRE(f.store.is_installed(r.value().version));
    REQUIRE(f.td.read_file("versions/25.12.5.44/clickhouse") ==
            "ELF binary for v25.12.5.44-stable");
    REQUIRE(f.transport.count_requests(asset_url("v25.12.5.44-stable")) == 1);
}

TEST_CASE("install lts and partial specs", "[installer]") {
    InstallFixture f;
    REQUIRE(f.installer.install(spec("lts")).value().version.to_string() == "24.8.11.5");
    REQUIRE(f.installer.install(spec("25.12")).value().version.to_string() == "25.12.5.44");
    REQUIRE(f.installer.install(spec("25")).value().version.to_string() == "25.13.0.1");
}

TEST_CASE("installing an installed exact version touches no network", "[installer]") {
    InstallFixture f;
    auto first = f.installer.install(spec("25.12.5.44"));
    REQUIRE(first.is_ok());
    REQUIRE(first.value().newly_installed);
    size_t requests = f.transport.requests.size();

    auto second = f.installer.install(spec("25.12.5.44"));
    REQUIRE(second.is_ok());
    REQUIRE_FALSE(second.value().newly_installed);
    REQUIRE(second.value().binary == first.value().binary);
    REQUIRE(f.transport.requests.size() == requests);
    REQUIRE(f.store.list_installed().value().size() == 1);
}

TEST_CASE("an alias that resolves to an installed version is not downloaded", "[installer]") {
    InstallFixture f;
    REQUIRE(f.installer.install(spec("stable")).is_ok());
    REQUIRE(f.downloads() == 1);

    auto again = f.installer.install(spec("stable"));
    REQUIRE(again.is_ok());
    REQUIRE_FALSE(again.value().newly_installed);
    REQUIRE(f.downloads() == 1);
}

TEST_CASE("no matching release", "[installer]") {
    InstallFixture f;
    auto r = f.installer.install(spec("23.1"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChvError::NoMatchingVersion);
    REQUIRE(f.downloads() == 0);
}

TEST_CASE("unreachable catalog", "[installer]") {
    InstallFixture f;
    f.transport.offline = true;
    auto r = f.installer.install(spec("stable"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChvError::CatalogUnavailable);
}

TEST_CASE("unsupported host fails before any request", "[installer]") {
    TempDir td("chv_install");
    FakeTransport transport;
    VersionStore store(td.path);
    ReleaseCatalog catalog(transport, kCatalogUrl);
    Installer installer(store, catalog, transport,
                        InstallFixture::options("Windows_NT", "x86_64"));

    auto r = installer.install(spec("stable"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChvError::UnsupportedPlatform);
    REQUIRE(transport.requests.empty());
}

// ===== Failed downloads =====

TEST_CASE("interrupted download installs nothing", "[installer]") {
    InstallFixture f;
    f.transport.fail_after_bytes = 10;

    auto r = f.installer.install(spec("25.12.5.44"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChvError::DownloadFailed);

    auto v = Version::parse("25.12.5.44").value();
    REQUIRE_FALSE(f.store.is_installed(v));
    REQUIRE_FALSE(fs::exists(f.store.binary_path(v)));
    REQUIRE(fs::is_empty(f.store.staging_dir()));

    // Retrying after the network recovers succeeds
    f.transport.fail_after_bytes = 0;
    REQUIRE(f.installer.install(spec("25.12.5.44")).is_ok());
    REQUIRE(f.store.is_installed(v));
}

TEST_CASE("missing asset is a failed download", "[installer]") {
    InstallFixture f;
    f.transport.files.erase(asset_url("v25.12.5.44-stable"));
    auto r = f.installer.install(spec("stable"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChvError::DownloadFailed);
    REQUIRE(r.error().message.find("HTTP 404") != std::string::npos);
}

TEST_CASE("empty asset is a failed download", "[installer]") {
    InstallFixture f;
    f.transport.files[asset_url("v25.12.5.44-stable")] = "";
    auto r = f.installer.install(spec("stable"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChvError::DownloadFailed);
    REQUIRE(fs::is_empty(f.store.staging_dir()));
}

TEST_CASE("not enough free space for the announced size", "[installer]") {
    InstallFixture f;
    f.transport.announced_size = UINT64_C(1) << 62;

    auto r = f.installer.install(spec("stable"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ChvError::InsufficientStorage);
    REQUIRE(f.store.list_installed().value().empty());
    REQUIRE(fs::is_empty(f.store.staging_dir()));
}

TEST_CASE("stale temp files are swept by the next install", "[installer]") {
    InstallFixture f;
    InstallOptions o = InstallFixture::options();
    o.stale_temp_age = std::chrono::minutes(0);
    Installer installer(f.store, f.catalog, f.transport, o);

    REQUIRE(f.store.ensure_dirs().is_ok());
    f.td.write_file("tmp/24.1.1.1.deadbe", "leftover");

    REQUIRE(installer.install(spec("stable")).is_ok());
    REQUIRE(fs::is_empty(f.store.staging_dir()));
}

// ===== Progress =====

TEST_CASE("progress reports bytes and total", "[installer]") {
    InstallFixture f;
    uint64_t last_done = 0, last_total = 0;
    int calls = 0;
    f.installer.set_progress([&](uint64_t done, uint64_t total) {
        last_done = done;
        last_total = total;
        ++calls;
    });

    REQUIRE(f.installer.install(spec("stable")).is_ok());
    const uint64_t size = std::string("ELF binary for v25.12.5.44-stable").size();
    REQUIRE(calls > 1);
    REQUIRE(last_done == size);
    REQUIRE(last_total == size);
}

TEST_CASE("a throwing progress callback does not break the install", "[installer]") {
    InstallFixture f;
    int calls = 0;
    f.installer.set_progress([&](uint64_t, uint64_t) {
        ++calls;
        throw std::runtime_error("terminal went away");
    });

    auto r = f.installer.install(spec("stable"));
    REQUIRE(r.is_ok());
    REQUIRE(calls == 1);
    REQUIRE(f.store.is_installed(r.value().version));
}

// ===== libcurl transport =====

namespace {

struct CollectSink : DownloadSink {
    uint64_t announced = 0;
    bool began = false;
    std::string data;

    Status begin(uint64_t total) override {
        began = true;
        announced = total;
        return ok_status();
    }
    Status write(const char* p, size_t n) override {
        data.append(p, n);
        return ok_status();
    }
};

} // namespace

TEST_CASE("curl transport reads file urls", "[installer][curl]") {
    TempDir td("chv_curl");
    td.write_file("asset.bin", "0123456789");
    CurlTransport transport;

    CollectSink sink;
    auto st = transport.download("file://" + (td.path / "asset.bin").string(), sink);
    REQUIRE(st.is_ok());
    REQUIRE(sink.began);
    REQUIRE(sink.data == "0123456789");

    auto page = transport.get("file://" + (td.path / "asset.bin").string());
    REQUIRE(page.is_ok());
    REQUIRE(page.value().body == "0123456789");

    auto missing = transport.get("file://" + (td.path / "nope.json").string());
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == ChvError::Network);
}
