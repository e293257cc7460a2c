#include <chv/project.hpp>
#include <chv/log.hpp>

#include <fstream>

namespace chv {

namespace fs = std::filesystem;

static const char* const kLocalDirName = ".clickhouse";

ProjectDir::ProjectDir(fs::path project_root)
    : project_root_(std::move(project_root)) {}

fs::path ProjectDir::local_root() const {
    return project_root_ / kLocalDirName;
}

fs::path ProjectDir::version_dir(const Version& v) const {
    return local_root() / v.to_string();
}

bool ProjectDir::is_initialized() const {
    std::error_code ec;
    return fs::is_directory(local_root(), ec);
}

Result<fs::path> ProjectDir::init() {
    fs::path root = local_root();
    std::error_code ec;

    fs::create_directories(root, ec);
    if (ec) {
        return ChvError{ChvError::IO,
            "cannot create " + root.string() + ": " + ec.message()};
    }

    fs::path ignore = root / ".gitignore";
    if (!fs::exists(ignore, ec)) {
        std::ofstream f(ignore);
        if (!f) {
            return ChvError{ChvError::IO, "cannot write " + ignore.string()};
        }
        // Everything under .clickhouse/ is machine-local
        f << "*\n";
        if (!f.flush()) {
            return ChvError{ChvError::IO, "cannot write " + ignore.string()};
        }
        log::debug("created %s", ignore.c_str());
    }

    return Result<fs::path>::ok(root);
}

Result<fs::path> ProjectDir::ensure_version_dir(const Version& v) {
    auto root = init();
    if (root.is_err()) return root;

    fs::path dir = version_dir(v);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return ChvError{ChvError::IO,
            "cannot create " + dir.string() + ": " + ec.message()};
    }
    return Result<fs::path>::ok(dir);
}

} // namespace chv
