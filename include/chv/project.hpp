#pragma once

#include <chv/result.hpp>
#include <chv/version.hpp>
#include <filesystem>

namespace chv {

// Project-local runtime data, scoped per version so that servers of
// different versions never share a data directory:
//
//   <project>/.clickhouse/.gitignore
//   <project>/.clickhouse/<version>/
class ProjectDir {
public:
    explicit ProjectDir(std::filesystem::path project_root);

    // <project>/.clickhouse
    std::filesystem::path local_root() const;
    std::filesystem::path version_dir(const Version& v) const;

    bool is_initialized() const;

    // Create the local root and its .gitignore if missing. Returns the root.
    // An existing .gitignore is never rewritten.
    Result<std::filesystem::path> init();

    // init() plus <version>/. Same path on every call.
    Result<std::filesystem::path> ensure_version_dir(const Version& v);

private:
    std::filesystem::path project_root_;
};

} // namespace chv
