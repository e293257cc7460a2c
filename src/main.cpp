// chv: install, select and run ClickHouse versions.
//
//     chv install <stable|lts|25.12|25.12.5.44>
//     chv list [--remote]
//     chv use <spec>
//     chv which
//     chv remove <version> [--force]
//     chv init
//     chv run [--sql QUERY] [server|client|local] [ARGS...]

#include <chv/catalog.hpp>
#include <chv/config.hpp>
#include <chv/http.hpp>
#include <chv/installer.hpp>
#include <chv/launcher.hpp>
#include <chv/log.hpp>
#include <chv/progress.hpp>
#include <chv/project.hpp>
#include <chv/result.hpp>
#include <chv/store.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace chv;

namespace {

constexpr size_t kRemoteListLimit = 20;

const char* const kUsage =
    "usage: chv [-v|-q] [--no-color] <command> [args]\n"
    "\n"
    "commands:\n"
    "  install <spec>              install a version (stable, lts, 25.12, 25.12.5.44)\n"
    "  list [--remote]             show installed, or downloadable, versions\n"
    "  use <spec>                  set the default version, installing it if needed\n"
    "  which                       show the default version and its binary\n"
    "  remove <version> [--force]  delete an installed version\n"
    "  init                        create .clickhouse/ in the current directory\n"
    "  run [--sql QUERY] [server|client|local] [ARGS...]\n"
    "                              run the default version\n";

struct Args {
    std::string command;
    std::vector<std::string> rest;
    std::optional<log::Level> level;
    bool no_color = false;
};

ChvError usage_error(const std::string& msg) {
    return ChvError{ChvError::InvalidArg, msg, "run `chv help` for usage"};
}

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    int i = 1;
    for (; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") {
            args.level = log::Debug;
        } else if (a == "-q" || a == "--quiet") {
            args.level = log::Warn;
        } else if (a == "--no-color") {
            args.no_color = true;
        } else if (a == "-h" || a == "--help") {
            args.command = "help";
            return Result<Args>::ok(std::move(args));
        } else if (!a.empty() && a[0] == '-') {
            return usage_error("unknown option '" + a + "'");
        } else {
            break;
        }
    }
    if (i >= argc) return usage_error("no command given");

    args.command = argv[i++];
    for (; i < argc; ++i) args.rest.emplace_back(argv[i]);
    return Result<Args>::ok(std::move(args));
}

// Renders download progress on a TTY; silent otherwise
class ProgressPrinter {
public:
    ProgressPrinter() : enabled_(isatty(fileno(stderr)) && log::get_level() <= log::Info) {}

    ~ProgressPrinter() {
        if (drawn_) std::fputc('\n', stderr);
    }

    void update(uint64_t done, uint64_t total) {
        if (!enabled_) return;
        double mib = static_cast<double>(done) / (1024.0 * 1024.0);

        if (total == 0) {
            int step = static_cast<int>(mib);
            if (drawn_ && step == last_step_) return;
            last_step_ = step;
            std::fprintf(stderr, "\r  %.1f MiB", mib);
        } else {
            int pct = progress_percent(done, total);
            if (drawn_ && pct == last_step_) return;
            last_step_ = pct;
            std::string bar = progress_bar(pct, 40);
            std::fprintf(stderr, "\r  [%s] %3d%% %.1f/%.1f MiB", bar.c_str(), pct, mib,
                         static_cast<double>(total) / (1024.0 * 1024.0));
        }
        std::fflush(stderr);
        drawn_ = true;
    }

private:
    bool enabled_;
    bool drawn_ = false;
    int last_step_ = -1;
};

// Everything a command needs, built once from the effective config
struct Context {
    Config config;
    VersionStore store;
    CurlTransport transport;
    ReleaseCatalog catalog;

    Context(Config cfg, const std::string& home)
        : config(std::move(cfg)),
          store(home),
          transport(config.network),
          catalog(transport, config.catalog.url,
                  config.catalog.per_page, config.catalog.max_pages) {}

    Installer make_installer() {
        InstallOptions opts;
        opts.download_base = config.download.base_url;
        opts.url_template = config.download.url_template;
        opts.stale_temp_age = std::chrono::minutes(config.install.stale_temp_minutes);
        return Installer(store, catalog, transport, opts);
    }

    void sweep() {
        auto swept = store.sweep_stale_staging(
            std::chrono::minutes(config.install.stale_temp_minutes));
        if (swept.is_err()) log::warn("%s", swept.error().message.c_str());
    }
};

Result<InstalledVersion> install_spec(Context& ctx, const std::string& text) {
    auto spec = VersionSpec::parse(text);
    if (spec.is_err()) return std::move(spec).error();

    Installer installer = ctx.make_installer();
    ProgressPrinter printer;
    installer.set_progress([&printer](uint64_t done, uint64_t total) {
        printer.update(done, total);
    });
    return installer.install(spec.value());
}

Status cmd_install(Context& ctx, const std::vector<std::string>& rest) {
    if (rest.size() != 1) return usage_error("install takes exactly one version spec");

    auto installed = install_spec(ctx, rest[0]);
    if (installed.is_err()) return std::move(installed).error();

    const auto& iv = installed.value();
    std::printf("%s %s\n", iv.version.to_string().c_str(),
                iv.newly_installed ? "installed" : "already installed");
    return ok_status();
}

Status cmd_list(Context& ctx, const std::vector<std::string>& rest) {
    bool remote = false;
    for (const auto& a : rest) {
        if (a == "--remote" || a == "--available") {
            remote = true;
        } else {
            return usage_error("unknown argument to list: '" + a + "'");
        }
    }

    ctx.sweep();
    auto installed = ctx.store.list_installed();
    if (installed.is_err()) return std::move(installed).error();

    if (remote) {
        auto releases = ctx.catalog.list_releases();
        if (releases.is_err()) return std::move(releases).error();
        auto entries = std::move(releases).value();
        sort_newest_first(entries);

        if (entries.empty()) {
            std::printf("No versions available\n");
            return ok_status();
        }

        std::set<std::string> have;
        for (const auto& v : installed.value()) have.insert(v.to_string());

        std::printf("Available versions:\n");
        size_t shown = std::min(entries.size(), kRemoteListLimit);
        for (size_t i = 0; i < shown; ++i) {
            const auto& e = entries[i];
            std::string v = e.version.to_string();
            std::printf("  %-14s [%s]%s\n", v.c_str(), channel_name(e.channel),
                        have.count(v) ? " (installed)" : "");
        }
        if (entries.size() > shown) {
            std::printf("  ... and %zu more\n", entries.size() - shown);
        }
        return ok_status();
    }

    if (installed.value().empty()) {
        std::printf("No versions installed\nRun: chv install stable\n");
        return ok_status();
    }

    std::optional<Version> def;
    auto d = ctx.store.get_default();
    if (d.is_ok()) {
        def = d.value();
    } else {
        log::warn("%s", d.error().format().c_str());
    }

    std::printf("Installed versions:\n");
    for (const auto& v : installed.value()) {
        std::printf("  %s%s\n", v.to_string().c_str(),
                    def && *def == v ? " (default)" : "");
    }
    return ok_status();
}

Status cmd_use(Context& ctx, const std::vector<std::string>& rest) {
    if (rest.size() != 1) return usage_error("use takes exactly one version spec");

    auto installed = install_spec(ctx, rest[0]);
    if (installed.is_err()) return std::move(installed).error();

    const Version& v = installed.value().version;
    CHV_TRY(ctx.store.set_default(v));
    std::printf("Default version set to %s\n", v.to_string().c_str());
    return ok_status();
}

Status cmd_which(Context& ctx, const std::vector<std::string>& rest) {
    if (!rest.empty()) return usage_error("which takes no arguments");

    ProjectDir project(fs::current_path());
    Launcher launcher(ctx.store, project);
    auto v = launcher.resolve_version(std::nullopt);
    if (v.is_err()) return std::move(v).error();
    auto binary = launcher.resolve_binary(v.value());
    if (binary.is_err()) return std::move(binary).error();

    std::printf("%s (%s)\n", v.value().to_string().c_str(), binary.value().c_str());
    return ok_status();
}

Status cmd_remove(Context& ctx, const std::vector<std::string>& rest) {
    std::string target;
    bool force = false;
    for (const auto& a : rest) {
        if (a == "--force" || a == "-f") {
            force = true;
        } else if (target.empty()) {
            target = a;
        } else {
            return usage_error("remove takes exactly one version");
        }
    }
    if (target.empty()) return usage_error("remove takes exactly one version");

    auto v = Version::parse(target);
    if (v.is_err()) {
        return ChvError{ChvError::InvalidArg,
            "remove needs an exact installed version, not '" + target + "'",
            "run `chv list` to see installed versions"};
    }

    CHV_TRY(ctx.store.remove(v.value(), force));
    std::printf("Removed version %s\n", v.value().to_string().c_str());
    return ok_status();
}

Status cmd_init(const std::vector<std::string>& rest) {
    if (!rest.empty()) return usage_error("init takes no arguments");

    ProjectDir project(fs::current_path());
    bool existed = project.is_initialized();
    auto root = project.init();
    if (root.is_err()) return std::move(root).error();

    std::printf("%s %s\n", existed ? "Already initialized at" : "Initialized ClickHouse project in",
                root.value().c_str());
    return ok_status();
}

Status exec_plan(const LaunchPlan& lp) {
    if (!lp.working_dir.empty() && ::chdir(lp.working_dir.c_str()) != 0) {
        return ChvError{ChvError::Exec,
            "cannot enter " + lp.working_dir.string() + ": " + std::strerror(errno)};
    }

    std::vector<char*> cargs;
    cargs.reserve(lp.argv.size() + 1);
    for (const auto& a : lp.argv) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);

    std::fflush(stdout);
    std::fflush(stderr);
    ::execv(lp.binary.c_str(), cargs.data());
    return ChvError{ChvError::Exec,
        "cannot execute " + lp.binary.string() + ": " + std::strerror(errno)};
}

Status cmd_run(Context& ctx, const std::vector<std::string>& rest) {
    ProjectDir project(fs::current_path());
    Launcher launcher(ctx.store, project);

    size_t i = 0;
    if (i < rest.size() && (rest[i] == "--sql" || rest[i] == "-s")) {
        if (i + 1 >= rest.size()) return usage_error("--sql needs a query");
        auto lp = launcher.plan_query(std::nullopt, rest[i + 1]);
        if (lp.is_err()) return std::move(lp).error();
        return exec_plan(lp.value());
    }

    if (i >= rest.size()) {
        return usage_error("run needs --sql QUERY or one of: server, client, local");
    }

    RunMode mode;
    const std::string& sub = rest[i++];
    if (sub == "server") {
        mode = RunMode::Server;
    } else if (sub == "client") {
        mode = RunMode::Client;
    } else if (sub == "local") {
        mode = RunMode::Local;
    } else {
        return usage_error("unknown run mode '" + sub + "'");
    }

    if (i < rest.size() && rest[i] == "--") ++i;
    std::vector<std::string> passthrough(rest.begin() + static_cast<std::ptrdiff_t>(i),
                                         rest.end());

    auto lp = launcher.plan(mode, std::nullopt, passthrough);
    if (lp.is_err()) return std::move(lp).error();
    return exec_plan(lp.value());
}

Status dispatch(Context& ctx, const Args& args) {
    const auto& c = args.command;
    if (c == "install") return cmd_install(ctx, args.rest);
    if (c == "list" || c == "ls") return cmd_list(ctx, args.rest);
    if (c == "use") return cmd_use(ctx, args.rest);
    if (c == "which") return cmd_which(ctx, args.rest);
    if (c == "remove" || c == "rm") return cmd_remove(ctx, args.rest);
    if (c == "init") return cmd_init(args.rest);
    if (c == "run") return cmd_run(ctx, args.rest);
    return usage_error("unknown command '" + c + "'");
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        log::error("%s", args.error().format().c_str());
        return 1;
    }
    if (args.value().command == "help") {
        std::fputs(kUsage, stdout);
        return 0;
    }

    // Without a home directory nothing can work
    auto home = chv_home();
    if (home.is_err()) {
        log::error("%s", home.error().format().c_str());
        return 2;
    }

    auto cfg = Config::effective(home.value());
    if (cfg.is_err()) {
        log::error("%s", cfg.error().format().c_str());
        return 1;
    }

    log::set_level(args.value().level.value_or(cfg.value().log.level));
    if (args.value().no_color) {
        log::set_color_enabled(false);
    } else if (cfg.value().log.color) {
        log::set_color_enabled(*cfg.value().log.color);
    }

    Context ctx(std::move(cfg).value(), home.value());
    auto st = ctx.store.ensure_dirs();
    if (st.is_err()) {
        log::error("%s", st.error().format().c_str());
        return 2;
    }

    st = dispatch(ctx, args.value());
    if (st.is_err()) {
        log::error("%s", st.error().format().c_str());
        return 1;
    }
    return 0;
}
