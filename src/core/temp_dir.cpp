#include "core/temp_dir.hpp"
#include "core/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace fs = std::filesystem;

TempDir::TempDir(const std::string& root, const std::string& prefix) {
    std::error_code ec;
    fs::path base = root.empty() ? fs::temp_directory_path(ec) : fs::path(root);
    if (ec) {
        throw UpdateError(ErrorKind::Io, "cannot determine temp directory: " + ec.message());
    }
    fs::create_directories(base, ec);
    if (ec) {
        throw UpdateError(ErrorKind::Io, "cannot create " + base.string() + ": " + ec.message());
    }

    std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    if (!mkdtemp(buf.data())) {
        throw UpdateError(ErrorKind::Io, "mkdtemp(" + pattern + ") failed: " + std::strerror(errno));
    }
    path_ = buf.data();
}

TempDir::~TempDir() {
    cleanup();
}

TempDir::TempDir(TempDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDir& TempDir::operator=(TempDir&& other) noexcept {
    if (this != &other) {
        cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempDir::cleanup() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    path_.clear();
}
