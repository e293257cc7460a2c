#pragma once

#include <chv/result.hpp>
#include <chv/project.hpp>
#include <chv/store.hpp>
#include <chv/version.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chv {

enum class RunMode { Local, Client, Server };

const char* run_mode_name(RunMode m);

// Everything needed to replace the current process with a ClickHouse binary
struct LaunchPlan {
    Version version;
    std::filesystem::path binary;
    std::vector<std::string> argv;          // argv[0] is the binary
    std::filesystem::path working_dir;      // empty: inherit
};

// Hands paths to the exec layer. Opens no files and holds no locks on the
// binary, so the caller is free to exec it.
class Launcher {
public:
    Launcher(const VersionStore& store, ProjectDir& project);

    // Explicit version: must be installed (NotInstalled).
    // No version: the default (NoDefaultSet, CorruptDefault).
    // The result is an existing executable file.
    Result<std::filesystem::path> resolve_binary(const std::optional<Version>& version) const;

    // Version the binary above belongs to
    Result<Version> resolve_version(const std::optional<Version>& version) const;

    // Local and client runs are stateless (nullopt); a server gets its
    // version-scoped project directory, created on demand.
    Result<std::optional<std::filesystem::path>> resolve_data_dir(const Version& v,
                                                                  RunMode mode);

    // Build the full invocation. For a server without a user-supplied
    // --config-file/-C the data path is pinned to the project directory.
    Result<LaunchPlan> plan(RunMode mode,
                            const std::optional<Version>& version,
                            const std::vector<std::string>& args);

    // `--sql QUERY`: a one-shot clickhouse-local query
    Result<LaunchPlan> plan_query(const std::optional<Version>& version,
                                  const std::string& sql);

private:
    const VersionStore& store_;
    ProjectDir& project_;
};

// True when args already point the server at a config file
bool has_config_arg(const std::vector<std::string>& args);

} // namespace chv
