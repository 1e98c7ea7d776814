#pragma once

#include <string>
#include <vector>

class Installer {
public:
    /// Create install_path (with parents) and extract the archive into it,
    /// dropping the archive's top-level directory.
    /// Throws UpdateError: Io if the directory or process cannot be created,
    /// Extraction (with tar's stderr) if tar exits non-zero.
    static void install(const std::string& archive_path, const std::string& install_path);

    /// Create <home>/bin/discord -> target, creating <home>/bin if needed.
    /// Never replaces an existing entry. Throws UpdateError(ErrorKind::Io).
    static void create_symlink(const std::string& home_dir, const std::string& target);

    /// tar command line used by install()
    static std::vector<std::string> extract_command(const std::string& archive_path,
                                                    const std::string& dest_dir);
};
