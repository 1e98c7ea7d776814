#include "core/installer.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/process.hpp"

#include <filesystem>

namespace fs = std::filesystem;

std::vector<std::string> Installer::extract_command(const std::string& archive_path,
                                                    const std::string& dest_dir) {
    return {"tar", "-xvf", archive_path, "-C", dest_dir, "--strip-components=1"};
}

void Installer::install(const std::string& archive_path, const std::string& install_path) {
    std::error_code ec;
    fs::create_directories(install_path, ec);
    if (ec) {
        throw UpdateError(ErrorKind::Io, "cannot create " + install_path + ": " + ec.message());
    }

    ProcessOutput out = run_process(extract_command(archive_path, install_path));
    if (!out.success()) {
        std::string diag = out.stderr_text;
        while (!diag.empty() && (diag.back() == '\n' || diag.back() == '\r')) {
            diag.pop_back();
        }
        if (out.exit_code == 127 && diag.empty()) {
            diag = "could not execute tar";
        }
        throw UpdateError(ErrorKind::Extraction, "tar -xvf failed: " + diag);
    }
}

void Installer::create_symlink(const std::string& home_dir, const std::string& target) {
    fs::path link = Config::symlink_path(home_dir);

    std::error_code ec;
    fs::create_directories(link.parent_path(), ec);
    if (ec) {
        throw UpdateError(ErrorKind::Io, "cannot create " + link.parent_path().string() + ": " + ec.message());
    }

    // symlink_status so a dangling link still counts as existing
    if (fs::exists(fs::symlink_status(link, ec))) {
        throw UpdateError(ErrorKind::Io, link.string() + " already exists");
    }

    fs::create_symlink(target, link, ec);
    if (ec) {
        throw UpdateError(ErrorKind::Io, "cannot create symlink " + link.string() + ": " + ec.message());
    }
}
