#pragma once

#include "core/config.hpp"
#include "core/version.hpp"

#include <functional>
#include <string>

class ProgressSink;

enum class UpdatePlan {
    NoOp,          // latest <= current
    InstallFresh,  // nothing on disk yet
    Upgrade        // latest > installed
};

const char* to_string(UpdatePlan plan);

UpdatePlan plan_update(const Version& current, const Version& latest, bool install_fresh);

struct UpdateInfo {
    std::string install_path;
    bool install_fresh = false;
    Version current;
    Version latest;
    UpdatePlan plan = UpdatePlan::NoOp;
};

struct UpdateResult {
    bool success = false;
    std::string message;
    UpdateInfo info;
};

/// Locate -> resolve versions -> compare -> download + extract -> symlink.
class Updater {
public:
    /// Each step may throw UpdateError. Tests swap these out.
    struct Steps {
        std::function<std::string()> locate_install;
        std::function<Version()> fetch_latest;
        std::function<Version(const std::string& install_path)> read_installed;
        std::function<void(const std::string& url, const std::string& dest, ProgressSink& sink)> download;
        std::function<void(const std::string& archive, const std::string& install_path)> install;
        std::function<void(const std::string& target)> create_symlink;
    };

    Updater(AppConfig config, Steps steps, ProgressSink& sink);

    /// Steps backed by the real locator chain, HTTP, tar and filesystem
    static Steps default_steps(const AppConfig& config, ProgressSink& sink);

    /// Resolve and compare versions only
    UpdateResult check() const;

    /// Full pipeline. Never throws; failures come back in the result.
    UpdateResult run() const;

    static std::string archive_name(const Version& version);
    static std::string download_url(const std::string& base, const Version& version);

private:
    AppConfig config_;
    Steps steps_;
    ProgressSink& sink_;

    std::string resolve_install_path() const;
    UpdateInfo resolve() const;
    void apply(const UpdateInfo& info) const;
};
