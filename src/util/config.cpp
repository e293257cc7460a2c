#include <chv/config.hpp>
#include <chv/url_template.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace chv {

namespace {

// Variables the installer supplies when rendering the download URL
const char* const kTemplateVars[] = {"base", "tag", "version", "os", "arch"};

ChvError bad_value(const std::string& key, const std::string& expected,
                   const std::string& origin) {
    return ChvError{ChvError::Config,
        "invalid value for '" + key + "': expected " + expected, "", origin, 0};
}

// Read an optional string key. Present but wrong type is an error.
Status read_string(const toml::table& tbl, const char* section, const char* key,
                   std::string& out, const std::string& origin) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<std::string>();
    if (!v) return bad_value(std::string(section) + "." + key, "a string", origin);
    out = *v;
    return ok_status();
}

template<typename Int>
Status read_int(const toml::table& tbl, const char* section, const char* key,
                Int& out, int64_t min, int64_t max, const std::string& origin) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<int64_t>();
    if (!v || *v < min || *v > max) {
        return bad_value(std::string(section) + "." + key,
            "an integer in [" + std::to_string(min) + ", " + std::to_string(max) + "]",
            origin);
    }
    out = static_cast<Int>(*v);
    return ok_status();
}

Status validate_template(const std::string& tmpl, const std::string& origin) {
    for (const auto& name : template_variables(tmpl)) {
        auto known = std::find(std::begin(kTemplateVars), std::end(kTemplateVars), name);
        if (known == std::end(kTemplateVars)) {
            return ChvError{ChvError::Config,
                "download.url-template uses unknown variable '" + name + "'",
                "available variables: base, tag, version, os, arch", origin, 0};
        }
    }
    return ok_status();
}

} // namespace

Result<Config> Config::parse(const std::string& toml_str, const Config& base,
                             const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return ChvError{ChvError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    Config cfg = base;

    // [log]
    if (auto tbl = doc["log"].as_table()) {
        std::string level;
        CHV_TRY(read_string(*tbl, "log", "level", level, origin));
        if (!level.empty()) {
            auto lvl = log::parse_level(level);
            if (lvl.is_err()) {
                ChvError err = std::move(lvl).error();
                err.file = origin;
                return err;
            }
            cfg.log.level = lvl.value();
        }
        if (const toml::node* color = tbl->get("color")) {
            auto b = color->value<bool>();
            if (!b) return bad_value("log.color", "a boolean", origin);
            cfg.log.color = *b;
        }
    }

    // [network]
    if (auto tbl = doc["network"].as_table()) {
        CHV_TRY(read_int(*tbl, "network", "connect-timeout",
                         cfg.network.connect_timeout_seconds, 1, 3600, origin));
        CHV_TRY(read_int(*tbl, "network", "timeout",
                         cfg.network.timeout_seconds, 1, 86400, origin));
        CHV_TRY(read_string(*tbl, "network", "user-agent",
                            cfg.network.user_agent, origin));
    }

    // [catalog]
    if (auto tbl = doc["catalog"].as_table()) {
        CHV_TRY(read_string(*tbl, "catalog", "url", cfg.catalog.url, origin));
        CHV_TRY(read_int(*tbl, "catalog", "per-page", cfg.catalog.per_page, 1, 100, origin));
        CHV_TRY(read_int(*tbl, "catalog", "max-pages", cfg.catalog.max_pages, 1, 10000, origin));
    }

    // [download]
    if (auto tbl = doc["download"].as_table()) {
        CHV_TRY(read_string(*tbl, "download", "base-url", cfg.download.base_url, origin));
        CHV_TRY(read_string(*tbl, "download", "url-template",
                            cfg.download.url_template, origin));
        CHV_TRY(validate_template(cfg.download.url_template, origin));
    }

    // [install]
    if (auto tbl = doc["install"].as_table()) {
        CHV_TRY(read_int(*tbl, "install", "stale-temp-minutes",
                         cfg.install.stale_temp_minutes, 1, 60 * 24 * 365, origin));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<Config>::ok(Config{});
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return ChvError{ChvError::IO, "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), Config{}, path);
}

Status Config::apply_env(const EnvLookup& getenv_fn) {
    if (const char* v = getenv_fn("CHV_LOG")) {
        auto lvl = log::parse_level(v);
        if (lvl.is_err()) return std::move(lvl).rewrap(ChvError::Config, "CHV_LOG").error();
        log.level = lvl.value();
    }
    if (const char* v = getenv_fn("CHV_CATALOG_URL")) {
        if (*v) catalog.url = v;
    }
    if (const char* v = getenv_fn("CHV_DOWNLOAD_BASE")) {
        if (*v) download.base_url = v;
    }
    if (const char* v = getenv_fn("CHV_HTTP_TIMEOUT")) {
        char* end = nullptr;
        long secs = std::strtol(v, &end, 10);
        if (end == v || *end != '\0' || secs <= 0) {
            return ChvError{ChvError::Config,
                std::string("CHV_HTTP_TIMEOUT must be a positive number of seconds, got '") +
                v + "'"};
        }
        network.timeout_seconds = secs;
    }
    return ok_status();
}

Result<Config> Config::effective(const std::string& home) {
    auto cfg = Config::load(home + "/config.toml");
    if (cfg.is_err()) return cfg;
    CHV_TRY(cfg.value().apply_env([](const char* name) { return std::getenv(name); }));
    return cfg;
}

Result<std::string> chv_home() {
    if (const char* custom = std::getenv("CHV_HOME")) {
        if (*custom) return Result<std::string>::ok(custom);
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return ChvError{ChvError::IO, "cannot determine home directory",
            "set HOME or CHV_HOME"};
    }
    return Result<std::string>::ok(std::string(home) + "/.clickhouse");
}

} // namespace chv
