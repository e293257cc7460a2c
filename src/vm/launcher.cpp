#include <chv/launcher.hpp>
#include <chv/log.hpp>

#include <unistd.h>

namespace chv {

namespace fs = std::filesystem;

const char* run_mode_name(RunMode m) {
    switch (m) {
        case RunMode::Local:  return "local";
        case RunMode::Client: return "client";
        case RunMode::Server: return "server";
    }
    return "local";
}

bool has_config_arg(const std::vector<std::string>& args) {
    for (const auto& a : args) {
        if (a.rfind("--config-file", 0) == 0 || a.rfind("-C", 0) == 0) return true;
    }
    return false;
}

Launcher::Launcher(const VersionStore& store, ProjectDir& project)
    : store_(store), project_(project) {}

Result<Version> Launcher::resolve_version(const std::optional<Version>& version) const {
    if (version) {
        if (!store_.is_installed(*version)) {
            return ChvError{ChvError::NotInstalled,
                "version " + version->to_string() + " is not installed",
                "run `chv install " + version->to_string() + "`"};
        }
        return Result<Version>::ok(*version);
    }

    auto def = store_.get_default();
    if (def.is_err()) return std::move(def).error();
    if (!def.value()) {
        return ChvError{ChvError::NoDefaultSet, "no default version set",
            "run `chv use <version>`, e.g. `chv use stable`"};
    }
    return Result<Version>::ok(*def.value());
}

Result<fs::path> Launcher::resolve_binary(const std::optional<Version>& version) const {
    auto v = resolve_version(version);
    if (v.is_err()) return std::move(v).error();

    fs::path binary = store_.binary_path(v.value());
    if (::access(binary.c_str(), X_OK) != 0) {
        return ChvError{ChvError::NotInstalled,
            "binary for " + v.value().to_string() + " is missing or not executable: " +
            binary.string(),
            "reinstall with `chv remove " + v.value().to_string() +
            " --force && chv install " + v.value().to_string() + "`"};
    }
    return Result<fs::path>::ok(binary);
}

Result<std::optional<fs::path>> Launcher::resolve_data_dir(const Version& v, RunMode mode) {
    switch (mode) {
    case RunMode::Local:
    case RunMode::Client:
        return Result<std::optional<fs::path>>::ok(std::nullopt);
    case RunMode::Server: {
        auto dir = project_.ensure_version_dir(v);
        if (dir.is_err()) return std::move(dir).error();
        return Result<std::optional<fs::path>>::ok(dir.value());
    }
    }
    return Result<std::optional<fs::path>>::ok(std::nullopt);
}

Result<LaunchPlan> Launcher::plan(RunMode mode,
                                  const std::optional<Version>& version,
                                  const std::vector<std::string>& args) {
    auto v = resolve_version(version);
    if (v.is_err()) return std::move(v).error();
    auto binary = resolve_binary(v.value());
    if (binary.is_err()) return std::move(binary).error();

    LaunchPlan lp;
    lp.version = v.value();
    lp.binary = binary.value();
    lp.argv = {lp.binary.string(), run_mode_name(mode)};
    lp.argv.insert(lp.argv.end(), args.begin(), args.end());

    if (mode == RunMode::Server && !has_config_arg(args)) {
        auto dir = resolve_data_dir(lp.version, mode);
        if (dir.is_err()) return std::move(dir).error();
        lp.working_dir = *dir.value();
        lp.argv.push_back("--");
        lp.argv.push_back("--path=" + lp.working_dir.string() + "/");
        log::debug("server data directory: %s", lp.working_dir.c_str());
    }

    return Result<LaunchPlan>::ok(std::move(lp));
}

Result<LaunchPlan> Launcher::plan_query(const std::optional<Version>& version,
                                        const std::string& sql) {
    return plan(RunMode::Local, version, {"--query", sql});
}

} // namespace chv
