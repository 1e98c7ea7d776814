#include "core/updater.hpp"
#include "core/downloader.hpp"
#include "core/errors.hpp"
#include "core/install_locator.hpp"
#include "core/installer.hpp"
#include "core/progress.hpp"
#include "core/temp_dir.hpp"
#include "core/version_resolver.hpp"

#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════════

const char* to_string(UpdatePlan plan) {
    switch (plan) {
        case UpdatePlan::NoOp:         return "up to date";
        case UpdatePlan::InstallFresh: return "fresh install";
        case UpdatePlan::Upgrade:      return "upgrade";
    }
    return "unknown";
}

UpdatePlan plan_update(const Version& current, const Version& latest, bool install_fresh) {
    if (latest <= current) return UpdatePlan::NoOp;
    return install_fresh ? UpdatePlan::InstallFresh : UpdatePlan::Upgrade;
}

/// Run one pipeline step, prefixing any UpdateError with what was being done
template <typename Fn>
static auto step(const std::string& what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const UpdateError& e) {
        throw UpdateError(e.kind(), what + ": " + e.what());
    } catch (const fs::filesystem_error& e) {
        throw UpdateError(ErrorKind::Io, what + ": " + e.what());
    }
}

static HttpOptions http_options(const AppConfig& config) {
    HttpOptions options;
    options.connect_timeout_sec = config.connect_timeout_sec;
    options.read_timeout_sec = config.read_timeout_sec;
    return options;
}

// ════════════════════════════════════════════════════════════════
// Updater
// ════════════════════════════════════════════════════════════════

Updater::Updater(AppConfig config, Steps steps, ProgressSink& sink)
    : config_(std::move(config)), steps_(std::move(steps)), sink_(sink) {}

Updater::Steps Updater::default_steps(const AppConfig& config, ProgressSink& sink) {
    Steps steps;

    auto chain = std::make_shared<LocatorChain>(
        [&sink](const InstallLocator& locator, const std::string& reason) {
            sink.log("Failed to locate Discord via " + locator.name() + " (" + reason +
                     "). Will use the default path");
        });
    chain->add(std::make_unique<ShellLookupLocator>(config.home_dir, config.locate_script));
    chain->add(std::make_unique<FixedDefaultLocator>(config.default_install_path));
    steps.locate_install = [chain]() { return chain->locate(); };

    auto resolver = std::make_shared<VersionResolver>(config.version_url, http_options(config));
    steps.fetch_latest = [resolver]() { return resolver->fetch_latest(); };
    steps.read_installed = &VersionResolver::read_installed;

    Downloader downloader(http_options(config));
    steps.download = [downloader](const std::string& url, const std::string& dest, ProgressSink& s) {
        downloader.download(url, dest, s);
    };

    steps.install = &Installer::install;

    std::string home = config.home_dir;
    steps.create_symlink = [home](const std::string& target) {
        Installer::create_symlink(home, target);
    };
    return steps;
}

std::string Updater::archive_name(const Version& version) {
    return "discord-" + version.to_string() + ".tar.gz";
}

std::string Updater::download_url(const std::string& base, const Version& version) {
    return base + "/" + version.to_string() + "/" + archive_name(version);
}

std::string Updater::resolve_install_path() const {
    try {
        return steps_.locate_install();
    } catch (const UpdateError& e) {
        if (e.kind() != ErrorKind::NotFound) throw;
        sink_.log("Failed to locate Discord. Will use the default path");
        return config_.default_install_path;
    }
}

UpdateInfo Updater::resolve() const {
    UpdateInfo info;

    // ── Locating ────────────────────────────────────────────────
    info.install_path = resolve_install_path();
    sink_.log("Found discord install at " + info.install_path);

    // ── Resolving versions ──────────────────────────────────────
    info.latest = step("Failed to fetch latest version", [&] { return steps_.fetch_latest(); });

    std::error_code ec;
    bool exists = fs::exists(info.install_path, ec);
    if (ec) {
        throw UpdateError(ErrorKind::Io, "Failed to inspect " + info.install_path + ": " + ec.message());
    }

    if (exists) {
        info.current = step("Failed to read installed version",
                            [&] { return steps_.read_installed(info.install_path); });
    } else {
        info.install_fresh = true;
        info.current = Version(0, 0, 0);
    }

    sink_.log("Latest version: " + info.latest.to_string());
    sink_.log("Current version: " + info.current.to_string());

    info.plan = plan_update(info.current, info.latest, info.install_fresh);
    return info;
}

void Updater::apply(const UpdateInfo& info) const {
    // Removed on every exit path, including exceptions
    TempDir temp_dir = step("Failed to create temp directory",
                            [&] { return TempDir(config_.temp_root); });

    std::string url = download_url(config_.download_base, info.latest);
    std::string archive = (temp_dir.path() / archive_name(info.latest)).string();

    sink_.status("Downloading " + url);
    step("Failed to download " + url, [&] { steps_.download(url, archive, sink_); });

    // Assumes that at this point the install path is valid
    sink_.status("Extracting Discord to " + info.install_path);
    step("Failed to install to " + info.install_path,
         [&] { steps_.install(archive, info.install_path); });
    sink_.status("");
    sink_.log("Discord extracted");
}

UpdateResult Updater::check() const {
    UpdateResult result;
    try {
        result.info = resolve();
        result.success = true;
        if (result.info.plan == UpdatePlan::NoOp) {
            result.message = "Discord " + result.info.current.to_string() + " is up to date";
        } else {
            result.message = "Update available: " + result.info.current.to_string() +
                             " -> " + result.info.latest.to_string();
        }
    } catch (const UpdateError& e) {
        result.message = std::string(e.what()) + " (" + ::to_string(e.kind()) + ")";
    }
    return result;
}

UpdateResult Updater::run() const {
    UpdateResult result;
    try {
        result.info = resolve();

        if (result.info.plan == UpdatePlan::NoOp) {
            sink_.log("No update available");
        } else {
            sink_.log("Update available");
            apply(result.info);
        }

        // If we installed it fresh, link it from ~/bin
        if (result.info.install_fresh) {
            step("Failed to create symlink", [&] {
                steps_.create_symlink(config_.default_install_path);
            });
        }

        result.success = true;
        if (result.info.plan == UpdatePlan::NoOp) {
            result.message = "Discord " + result.info.current.to_string() + " is up to date";
        } else {
            result.message = "Discord updated to " + result.info.latest.to_string();
        }
    } catch (const UpdateError& e) {
        result.message = std::string(e.what()) + " (" + ::to_string(e.kind()) + ")";
    } catch (const std::exception& e) {
        result.message = std::string("Update failed: ") + e.what();
    }
    return result;
}
