#pragma once

#include <filesystem>
#include <string>

/// Scoped temporary directory. Created on construction, removed with all of
/// its contents when the object goes out of scope.
class TempDir {
public:
    /// Create "<root>/<prefix>XXXXXX". Empty root = system temp directory.
    /// Throws UpdateError(ErrorKind::Io) on failure.
    explicit TempDir(const std::string& root = "", const std::string& prefix = "discord-updater-");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&& other) noexcept;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;

    void cleanup() noexcept;
};
