#include <chv/store.hpp>
#include <chv/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chv {

namespace fs = std::filesystem;

static const char* const kBinaryName = "clickhouse";

static ChvError io_error(const std::string& what, const std::error_code& ec) {
    return ChvError{ChvError::IO, what + ": " + ec.message()};
}

static ChvError errno_error(const std::string& what, int err) {
    if (err == ENOSPC || err == EDQUOT) {
        return ChvError{ChvError::InsufficientStorage,
            what + ": " + std::strerror(err),
            "free some disk space or remove unused versions with `chv remove`"};
    }
    return ChvError{ChvError::IO, what + ": " + std::strerror(err)};
}

// ---------------------------------------------------------------------------
// StagingFile
// ---------------------------------------------------------------------------

StagingFile::StagingFile(fs::path path, int fd)
    : path_(std::move(path)), fd_(fd) {}

StagingFile::StagingFile(StagingFile&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_),
      written_(other.written_), committed_(other.committed_) {
    other.fd_ = -1;
    other.committed_ = true;  // moved-from object owns nothing
}

StagingFile::~StagingFile() {
    if (fd_ >= 0) ::close(fd_);
    if (!committed_ && !path_.empty()) {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            log::warn("could not remove temp file %s: %s",
                      path_.c_str(), ec.message().c_str());
        }
    }
}

Status StagingFile::write(const char* data, size_t len) {
    if (fd_ < 0) {
        return ChvError{ChvError::IO, "write to closed staging file " + path_.string()};
    }
    while (len > 0) {
        ssize_t n = ::write(fd_, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_error("writing " + path_.string(), errno);
        }
        data += n;
        len -= static_cast<size_t>(n);
        written_ += static_cast<uint64_t>(n);
    }
    return ok_status();
}

Status StagingFile::finish() {
    if (fd_ < 0) {
        return ChvError{ChvError::IO, "staging file already closed: " + path_.string()};
    }
    int fd = fd_;
    fd_ = -1;

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return errno_error("flushing " + path_.string(), err);
    }
    if (::fchmod(fd, 0755) != 0) {
        int err = errno;
        ::close(fd);
        return errno_error("marking " + path_.string() + " executable", err);
    }
    if (::close(fd) != 0) {
        return errno_error("closing " + path_.string(), errno);
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Write content next to target and rename over it
static Status write_file_atomic(const fs::path& target, const std::string& content) {
    fs::path tmp = target;
    tmp += "." + std::to_string(::getpid()) + ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) return errno_error("creating " + tmp.string(), errno);

    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            return errno_error("writing " + tmp.string(), err);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return errno_error("flushing " + tmp.string(), err);
    }

    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        return errno_error("replacing " + target.string(), err);
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// VersionStore
// ---------------------------------------------------------------------------

VersionStore::VersionStore(fs::path root)
    : root_(std::move(root)) {}

fs::path VersionStore::versions_dir() const { return root_ / "versions"; }
fs::path VersionStore::staging_dir() const { return root_ / "tmp"; }
fs::path VersionStore::default_file() const { return root_ / "default"; }

fs::path VersionStore::version_dir(const Version& v) const {
    return versions_dir() / v.to_string();
}

fs::path VersionStore::binary_path(const Version& v) const {
    return version_dir(v) / kBinaryName;
}

Status VersionStore::ensure_dirs() const {
    std::error_code ec;
    fs::create_directories(versions_dir(), ec);
    if (ec) return io_error("cannot create " + versions_dir().string(), ec);
    fs::create_directories(staging_dir(), ec);
    if (ec) return io_error("cannot create " + staging_dir().string(), ec);
    return ok_status();
}

bool VersionStore::is_installed(const Version& v) const {
    std::error_code ec;
    return fs::is_regular_file(binary_path(v), ec);
}

Result<std::vector<Version>> VersionStore::list_installed() const {
    std::vector<Version> versions;
    std::error_code ec;

    if (!fs::exists(versions_dir(), ec)) {
        return Result<std::vector<Version>>::ok(std::move(versions));
    }

    fs::directory_iterator it(versions_dir(), ec);
    if (ec) return io_error("cannot read " + versions_dir().string(), ec);

    for (const auto& entry : it) {
        if (!entry.is_directory(ec)) continue;
        auto v = Version::parse(entry.path().filename().string());
        if (v.is_err()) {
            log::trace("ignoring %s", entry.path().c_str());
            continue;
        }
        if (is_installed(v.value())) versions.push_back(v.value());
    }

    std::sort(versions.begin(), versions.end(),
              [](const Version& a, const Version& b) { return a > b; });
    return Result<std::vector<Version>>::ok(std::move(versions));
}

Result<std::optional<std::string>> VersionStore::read_pointer() const {
    std::error_code ec;
    if (!fs::exists(default_file(), ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    std::ifstream file(default_file());
    if (!file.is_open()) {
        return ChvError{ChvError::IO, "cannot read " + default_file().string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    std::string text = ss.str();

    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return Result<std::optional<std::string>>::ok(std::string());
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return Result<std::optional<std::string>>::ok(text.substr(begin, end - begin + 1));
}

Status VersionStore::set_default(const Version& v) {
    if (!is_installed(v)) {
        return ChvError{ChvError::NotInstalled,
            "version " + v.to_string() + " is not installed",
            "run `chv install " + v.to_string() + "` first"};
    }

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) return io_error("cannot create " + root_.string(), ec);

    CHV_TRY(write_file_atomic(default_file(), v.to_string() + "\n"));
    log::debug("default pointer -> %s", v.to_string().c_str());
    return ok_status();
}

Result<std::optional<Version>> VersionStore::get_default() const {
    auto raw = read_pointer();
    if (raw.is_err()) return std::move(raw).error();
    if (!raw.value()) {
        return Result<std::optional<Version>>::ok(std::nullopt);
    }

    const std::string& text = *raw.value();
    auto v = Version::parse(text);
    if (v.is_err()) {
        return ChvError{ChvError::CorruptDefault,
            "default pointer " + default_file().string() +
            " does not hold an exact version ('" + text + "')",
            "run `chv use <version>` to set a new default"};
    }

    if (!is_installed(v.value())) {
        return ChvError{ChvError::CorruptDefault,
            "default version " + v.value().to_string() + " is no longer installed",
            "run `chv install " + v.value().to_string() +
            "` or `chv use <version>` to pick another"};
    }

    return Result<std::optional<Version>>::ok(v.value());
}

Status VersionStore::remove(const Version& v, bool force) {
    std::error_code ec;
    fs::path dir = version_dir(v);
    if (!is_installed(v)) {
        return ChvError{ChvError::NotInstalled,
            "version " + v.to_string() + " is not installed",
            "run `chv list` to see installed versions"};
    }

    auto raw = read_pointer();
    if (raw.is_err()) return std::move(raw).error();
    // Compare parsed versions: get_default() accepts "v25.12.5.44" too
    bool is_default = false;
    if (raw.value()) {
        auto pointed = Version::parse(*raw.value());
        is_default = pointed.is_ok() && pointed.value() == v;
    }

    if (is_default && !force) {
        return ChvError{ChvError::InUseAsDefault,
            "version " + v.to_string() + " is the current default",
            "pass --force to remove it anyway, or `chv use` another version first"};
    }
    if (is_default) {
        log::warn("removing the default version %s; the default pointer now dangles",
                  v.to_string().c_str());
    }

    // Take the directory out of versions/ in one step, then delete at leisure
    CHV_TRY(ensure_dirs());
    fs::path trash = staging_dir() /
        ("removing-" + v.to_string() + "." + std::to_string(::getpid()));
    fs::rename(dir, trash, ec);
    if (ec) return io_error("cannot remove " + dir.string(), ec);

    fs::remove_all(trash, ec);
    if (ec) {
        log::warn("version %s removed, but cleanup of %s failed: %s",
                  v.to_string().c_str(), trash.c_str(), ec.message().c_str());
    }
    return ok_status();
}

Result<StagingFile> VersionStore::create_staging_file(const Version& v) const {
    CHV_TRY(ensure_dirs());

    std::string pattern = (staging_dir() / (v.to_string() + ".XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) return errno_error("cannot create temp file in " + staging_dir().string(), errno);

    log::trace("staging %s", buf.data());
    return Result<StagingFile>::ok(StagingFile(fs::path(buf.data()), fd));
}

Status VersionStore::commit_staging(StagingFile& staged, const Version& v) const {
    if (staged.fd_ >= 0) {
        return ChvError{ChvError::IO,
            "staging file " + staged.path().string() + " was not finished"};
    }

    std::error_code ec;
    fs::path dir = version_dir(v);
    bool created_dir = fs::create_directories(dir, ec);
    if (ec) return io_error("cannot create " + dir.string(), ec);

    fs::rename(staged.path(), binary_path(v), ec);
    if (ec) {
        if (created_dir) {
            std::error_code rm_ec;
            fs::remove(dir, rm_ec);
        }
        return io_error("cannot move " + staged.path().string() + " into place", ec);
    }

    staged.committed_ = true;
    return ok_status();
}

Result<size_t> VersionStore::sweep_stale_staging(std::chrono::minutes max_age) const {
    std::error_code ec;
    if (!fs::exists(staging_dir(), ec)) return Result<size_t>::ok(0);

    fs::directory_iterator it(staging_dir(), ec);
    if (ec) return io_error("cannot read " + staging_dir().string(), ec);

    auto cutoff = fs::file_time_type::clock::now() - max_age;
    size_t removed = 0;

    for (const auto& entry : it) {
        auto mtime = entry.last_write_time(ec);
        if (ec || mtime > cutoff) continue;

        fs::remove_all(entry.path(), ec);
        if (ec) {
            log::warn("could not remove stale temp entry %s: %s",
                      entry.path().c_str(), ec.message().c_str());
            continue;
        }
        log::debug("removed stale temp entry %s", entry.path().c_str());
        ++removed;
    }

    return Result<size_t>::ok(removed);
}

} // namespace chv
