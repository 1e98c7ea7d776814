#pragma once

#include <string>

struct AppConfig {
    // Resolved once from $HOME in main() and passed down explicitly
    std::string home_dir;

    // Endpoints
    std::string version_url = "https://discord.com/api/updates/stable?platform=linux";
    std::string download_base = "https://dl.discordapp.net/apps/linux";

    // Install
    std::string default_install_path;  // "<home>/bin/discord_bin/Discord/Discord" unless overridden
    std::string locate_script = "source ~/.profile ~/.bashrc ~/.zshrc; which discord";

    // Network (0 = library default)
    int connect_timeout_sec = 15;
    int read_timeout_sec = 120;

    // Display
    bool show_progress = true;

    // Where scoped temp dirs are created; empty = system temp directory
    std::string temp_root;
};

class Config {
public:
    explicit Config(const std::string& home_dir);
    ~Config();

    /// Load config.yaml. Returns false if the file is missing or unparsable
    /// (defaults stay in effect).
    bool load();
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    std::string config_dir() const;
    std::string config_path() const;

    /// Expand a leading '~' against the configured home dir
    std::string expand_home(const std::string& path) const;

    /// The only place $HOME is read. Returns empty string if unset.
    static std::string home_from_env();

    static std::string default_install_path(const std::string& home_dir);
    static std::string symlink_path(const std::string& home_dir);

private:
    AppConfig config_;
};
