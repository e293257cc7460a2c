#pragma once

#include <chv/result.hpp>
#include <chv/catalog.hpp>
#include <chv/http.hpp>
#include <chv/platform.hpp>
#include <chv/release.hpp>
#include <chv/store.hpp>
#include <chv/version.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace chv {

// (bytes downloaded, total bytes or 0 if unknown)
using ProgressFn = std::function<void(uint64_t, uint64_t)>;

struct InstallOptions {
    std::string download_base = "https://github.com/ClickHouse/ClickHouse/releases/download";
    std::string url_template = "{{ base }}/{{ tag }}/clickhouse-{{ os }}-{{ arch }}";
    std::chrono::minutes stale_temp_age{60};
    // Host identification as reported by uname(2); empty means detect
    std::string host_sysname;
    std::string host_machine;
};

struct InstalledVersion {
    Version version;
    std::string tag;            // empty when short-circuited before the catalog
    Channel channel = Channel::Other;
    std::filesystem::path binary;
    bool newly_installed = false;
};

// Render the download URL for a release on a platform
Result<std::string> build_download_url(const std::string& url_template,
                                       const std::string& base,
                                       const ReleaseEntry& entry,
                                       const Platform& platform);

// resolve -> download -> verify -> atomically place into the store
class Installer {
public:
    Installer(VersionStore& store, ReleaseCatalog& catalog, Transport& transport,
              InstallOptions options = {});

    // Idempotent: an installed version is returned without downloading, and
    // an installed exact spec without touching the network at all.
    Result<InstalledVersion> install(const VersionSpec& spec);

    // Installs an already-resolved release
    Result<InstalledVersion> install_release(const ReleaseEntry& entry);

    void set_progress(ProgressFn fn) { progress_ = std::move(fn); }

private:
    VersionStore& store_;
    ReleaseCatalog& catalog_;
    Transport& transport_;
    InstallOptions options_;
    ProgressFn progress_;

    Result<Platform> host_platform() const;
    Status download_into_store(const std::string& url, const Version& v);
};

} // namespace chv
