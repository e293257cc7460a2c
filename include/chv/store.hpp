#pragma once

#include <chv/result.hpp>
#include <chv/version.hpp>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chv {

// A temporary file in the store's staging area. Closes and unlinks itself
// on destruction unless it has been committed into the store.
class StagingFile {
public:
    StagingFile(std::filesystem::path path, int fd);
    ~StagingFile();

    StagingFile(StagingFile&& other) noexcept;
    StagingFile& operator=(StagingFile&&) = delete;
    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    // ENOSPC/EDQUOT map to InsufficientStorage, other failures to IO
    Status write(const char* data, size_t len);

    // Flush to disk, mark executable and close. No writes after this.
    Status finish();

    const std::filesystem::path& path() const { return path_; }
    uint64_t bytes_written() const { return written_; }

private:
    friend class VersionStore;

    std::filesystem::path path_;
    int fd_ = -1;
    uint64_t written_ = 0;
    bool committed_ = false;
};

// Global store of installed binaries and the default pointer.
//
// Layout:
//   <root>/versions/<version>/clickhouse   installed binary
//   <root>/default                         exact version string
//   <root>/tmp/                            staging, same filesystem as versions/
//
// Nothing is cached: every query reads the filesystem.
class VersionStore {
public:
    explicit VersionStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path versions_dir() const;
    std::filesystem::path staging_dir() const;
    std::filesystem::path default_file() const;
    std::filesystem::path version_dir(const Version& v) const;

    // Where the binary for v lives, whether or not it is installed
    std::filesystem::path binary_path(const Version& v) const;

    Status ensure_dirs() const;

    bool is_installed(const Version& v) const;

    // Newest first. Directories without a binary, or not named as an exact
    // version, are ignored.
    Result<std::vector<Version>> list_installed() const;

    // NotInstalled if v is absent; the previous pointer is then untouched.
    // The pointer is replaced by rename, never rewritten in place.
    Status set_default(const Version& v);

    // nullopt when no pointer exists. CorruptDefault when the pointer is
    // unreadable or names a version that is no longer installed.
    Result<std::optional<Version>> get_default() const;

    // NotInstalled if v has no binary. InUseAsDefault if v is the default, unless
    // force is set; a forced removal leaves the pointer dangling on purpose
    // so the next get_default() reports CorruptDefault.
    Status remove(const Version& v, bool force = false);

    // Exclusive temp file for downloading v
    Result<StagingFile> create_staging_file(const Version& v) const;

    // Atomically move a finished staging file to binary_path(v). Replaces an
    // existing binary in one step.
    Status commit_staging(StagingFile& staged, const Version& v) const;

    // Remove staging entries older than max_age; returns how many. Younger
    // entries may belong to an install running in another process.
    Result<size_t> sweep_stale_staging(std::chrono::minutes max_age) const;

private:
    std::filesystem::path root_;

    Result<std::optional<std::string>> read_pointer() const;
};

} // namespace chv
