#pragma once

#include <chv/result.hpp>
#include <chv/log.hpp>
#include <chv/http.hpp>
#include <functional>
#include <optional>
#include <string>

namespace chv {

struct LogConfig {
    log::Level level = log::Info;
    std::optional<bool> color;     // unset: follow stderr TTY detection
};

struct CatalogConfig {
    std::string url = "https://api.github.com/repos/ClickHouse/ClickHouse/releases";
    int per_page = 100;
    int max_pages = 100;   // safety cap, not a listing limit
};

struct DownloadConfig {
    std::string base_url = "https://github.com/ClickHouse/ClickHouse/releases/download";
    std::string url_template = "{{ base }}/{{ tag }}/clickhouse-{{ os }}-{{ arch }}";
};

struct InstallConfig {
    int stale_temp_minutes = 60;
};

// Layered configuration: built-in defaults, then <chv-home>/config.toml,
// then CHV_* environment variables.
struct Config {
    LogConfig log;
    TransportOptions network;
    CatalogConfig catalog;
    DownloadConfig download;
    InstallConfig install;

    // Parse TOML on top of base; keys absent from the document keep base's value
    static Result<Config> parse(const std::string& toml_str,
                                const Config& base = Config{},
                                const std::string& origin = "");

    // Load from a file. A missing file yields the defaults.
    static Result<Config> load(const std::string& path);

    // Environment overrides: CHV_LOG, CHV_CATALOG_URL, CHV_DOWNLOAD_BASE,
    // CHV_HTTP_TIMEOUT
    using EnvLookup = std::function<const char*(const char*)>;
    Status apply_env(const EnvLookup& getenv_fn);

    // load(<home>/config.toml) followed by apply_env(std::getenv)
    static Result<Config> effective(const std::string& home);
};

// Root of all global state: $CHV_HOME, else $HOME/.clickhouse
Result<std::string> chv_home();

} // namespace chv
