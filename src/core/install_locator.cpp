#include "core/install_locator.hpp"
#include "core/errors.hpp"
#include "core/process.hpp"

#include <filesystem>

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════════
// ShellLookupLocator
// ════════════════════════════════════════════════════════════════

ShellLookupLocator::ShellLookupLocator(std::string home_dir, std::string script)
    : home_dir_(std::move(home_dir)), script_(std::move(script)) {}

std::string ShellLookupLocator::install_dir_from_output(const std::string& output) {
    std::string line = output.substr(0, output.find('\n'));
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    auto first = line.find_first_not_of(" \t");
    if (first == std::string::npos) {
        throw UpdateError(ErrorKind::NotFound, "lookup printed no path");
    }
    line = line.substr(first);

    std::error_code ec;
    fs::path binary = fs::canonical(line, ec);
    if (ec) {
        throw UpdateError(ErrorKind::NotFound, "cannot resolve " + line + ": " + ec.message());
    }
    fs::path parent = binary.parent_path();
    if (parent.empty()) {
        throw UpdateError(ErrorKind::NotFound, "bad install path " + binary.string());
    }
    return parent.string();
}

std::string ShellLookupLocator::locate() const {
    ProcessOutput out;
    try {
        out = run_process({"/bin/bash", "-c", script_}, {{"HOME", home_dir_}});
    } catch (const UpdateError& e) {
        throw UpdateError(ErrorKind::NotFound, std::string("lookup could not run: ") + e.what());
    }

    if (!out.success()) {
        throw UpdateError(ErrorKind::NotFound,
                          "lookup script failed (exit " + std::to_string(out.exit_code) + ")");
    }
    return install_dir_from_output(out.stdout_text);
}

// ════════════════════════════════════════════════════════════════
// FixedDefaultLocator
// ════════════════════════════════════════════════════════════════

FixedDefaultLocator::FixedDefaultLocator(std::string path) : path_(std::move(path)) {}

std::string FixedDefaultLocator::locate() const {
    if (path_.empty()) {
        throw UpdateError(ErrorKind::NotFound, "no default path configured");
    }
    return path_;
}

// ════════════════════════════════════════════════════════════════
// LocatorChain
// ════════════════════════════════════════════════════════════════

LocatorChain::LocatorChain(FailureHandler on_failure) : on_failure_(std::move(on_failure)) {}

void LocatorChain::add(std::unique_ptr<InstallLocator> locator) {
    locators_.push_back(std::move(locator));
}

std::string LocatorChain::locate() const {
    for (const auto& locator : locators_) {
        try {
            return locator->locate();
        } catch (const UpdateError& e) {
            if (e.kind() != ErrorKind::NotFound) throw;
            if (on_failure_) on_failure_(*locator, e.what());
        }
    }
    throw UpdateError(ErrorKind::NotFound, "no install found");
}
