#include <chv/installer.hpp>
#include <chv/log.hpp>
#include <chv/resolver.hpp>
#include <chv/url_template.hpp>

#include <exception>

namespace chv {

namespace fs = std::filesystem;

namespace {

// Streams the response into a staging file, checking free space up front
// when the size is announced and forwarding progress.
class StagingSink : public DownloadSink {
public:
    StagingSink(StagingFile& file, const fs::path& dir, const ProgressFn& progress)
        : file_(file), dir_(dir), progress_(progress) {}

    Status begin(uint64_t total_bytes) override {
        total_ = total_bytes;
        if (total_ == 0) return ok_status();

        std::error_code ec;
        auto info = fs::space(dir_, ec);
        if (ec) {
            log::debug("cannot query free space on %s: %s",
                       dir_.c_str(), ec.message().c_str());
            return ok_status();
        }
        if (info.available < total_) {
            return ChvError{ChvError::InsufficientStorage,
                "download needs " + std::to_string(total_) + " bytes but only " +
                std::to_string(info.available) + " are free on " + dir_.string(),
                "free some disk space or remove unused versions with `chv remove`"};
        }
        return ok_status();
    }

    Status write(const char* data, size_t len) override {
        CHV_TRY(file_.write(data, len));
        report();
        return ok_status();
    }

private:
    StagingFile& file_;
    fs::path dir_;
    const ProgressFn& progress_;
    uint64_t total_ = 0;
    bool progress_broken_ = false;

    // Progress is cosmetic; a failing reporter is logged once and dropped
    void report() {
        if (!progress_ || progress_broken_) return;
        try {
            progress_(file_.bytes_written(), total_);
        } catch (const std::exception& e) {
            progress_broken_ = true;
            log::warn("progress reporting failed: %s", e.what());
        }
    }
};

} // namespace

Result<std::string> build_download_url(const std::string& url_template,
                                       const std::string& base,
                                       const ReleaseEntry& entry,
                                       const Platform& platform) {
    std::string trimmed_base = base;
    while (!trimmed_base.empty() && trimmed_base.back() == '/') trimmed_base.pop_back();

    TemplateVars vars = {
        {"base", trimmed_base},
        {"tag", entry.tag},
        {"version", entry.version.to_string()},
        {"os", platform.os},
        {"arch", platform.arch},
    };
    return render_template(url_template, vars);
}

Installer::Installer(VersionStore& store, ReleaseCatalog& catalog,
                     Transport& transport, InstallOptions options)
    : store_(store), catalog_(catalog), transport_(transport),
      options_(std::move(options)) {}

Result<Platform> Installer::host_platform() const {
    if (options_.host_sysname.empty()) return detect_platform();
    return platform_from_uname(options_.host_sysname, options_.host_machine);
}

Result<InstalledVersion> Installer::install(const VersionSpec& spec) {
    // Checked first: must fail before any network traffic
    auto platform = host_platform();
    if (platform.is_err()) return std::move(platform).error();

    if (spec.is_exact() && store_.is_installed(spec.exact)) {
        log::info("ClickHouse %s is already installed", spec.exact.to_string().c_str());
        InstalledVersion out;
        out.version = spec.exact;
        out.binary = store_.binary_path(spec.exact);
        return Result<InstalledVersion>::ok(std::move(out));
    }

    log::info("resolving '%s'", spec.to_string().c_str());
    auto releases = catalog_.list_releases();
    if (releases.is_err()) return std::move(releases).error();

    auto entry = resolve(spec, releases.value());
    if (entry.is_err()) return std::move(entry).error();

    log::info("resolved to %s (%s)", entry.value().version.to_string().c_str(),
              channel_name(entry.value().channel));
    return install_release(entry.value());
}

Result<InstalledVersion> Installer::install_release(const ReleaseEntry& entry) {
    auto platform = host_platform();
    if (platform.is_err()) return std::move(platform).error();

    InstalledVersion out;
    out.version = entry.version;
    out.tag = entry.tag;
    out.channel = entry.channel;
    out.binary = store_.binary_path(entry.version);

    if (store_.is_installed(entry.version)) {
        log::info("ClickHouse %s is already installed", entry.version.to_string().c_str());
        return Result<InstalledVersion>::ok(std::move(out));
    }

    auto url = build_download_url(options_.url_template, options_.download_base,
                                  entry, platform.value());
    if (url.is_err()) return std::move(url).error();

    auto swept = store_.sweep_stale_staging(options_.stale_temp_age);
    if (swept.is_err()) {
        log::warn("%s", swept.error().message.c_str());
    }

    log::info("downloading ClickHouse %s", entry.version.to_string().c_str());
    CHV_TRY(download_into_store(url.value(), entry.version));

    log::info("installed ClickHouse %s", entry.version.to_string().c_str());
    out.newly_installed = true;
    return Result<InstalledVersion>::ok(std::move(out));
}

Status Installer::download_into_store(const std::string& url, const Version& v) {
    auto staged = store_.create_staging_file(v);
    if (staged.is_err()) return std::move(staged).error();
    StagingFile file = std::move(staged).value();

    StagingSink sink(file, store_.staging_dir(), progress_);
    auto st = transport_.download(url, sink);
    if (st.is_err()) {
        ChvError err = std::move(st).error();
        // Local failures keep their own code; anything else is a failed transfer
        if (err.code == ChvError::InsufficientStorage || err.code == ChvError::IO) {
            return err;
        }
        return ChvError{ChvError::DownloadFailed,
            "download of ClickHouse " + v.to_string() + " failed: " + err.message,
            "check your connection and retry; nothing was installed"};
    }

    if (file.bytes_written() == 0) {
        return ChvError{ChvError::DownloadFailed,
            "download of ClickHouse " + v.to_string() + " from " + url + " was empty"};
    }

    CHV_TRY(file.finish());
    return store_.commit_staging(file, v);
}

} // namespace chv
