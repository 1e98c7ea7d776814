#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

std::string Config::home_from_env() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return home;
}

std::string Config::default_install_path(const std::string& home_dir) {
    return (fs::path(home_dir) / "bin/discord_bin/Discord/Discord").string();
}

std::string Config::symlink_path(const std::string& home_dir) {
    return (fs::path(home_dir) / "bin/discord").string();
}

std::string Config::expand_home(const std::string& path) const {
    if (!path.empty() && path[0] == '~') {
        return config_.home_dir + path.substr(1);
    }
    return path;
}

Config::Config(const std::string& home_dir) {
    config_.home_dir = home_dir;
    config_.default_install_path = default_install_path(home_dir);
}

Config::~Config() = default;

std::string Config::config_dir() const {
    if (config_.home_dir.empty()) return "";
    return config_.home_dir + "/.config/discord-updater";
}

std::string Config::config_path() const {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    // Parse into a copy so a half-read file leaves the defaults untouched
    AppConfig loaded = config_;
    try {
        YAML::Node root = YAML::LoadFile(path);

        // Endpoints section
        if (auto endpoints = root["endpoints"]) {
            loaded.version_url = endpoints["version_url"].as<std::string>(loaded.version_url);
            loaded.download_base = endpoints["download_base"].as<std::string>(loaded.download_base);
        }

        // Install section
        if (auto install = root["install"]) {
            loaded.default_install_path = install["default_path"].as<std::string>(loaded.default_install_path);
            loaded.locate_script = install["locate_script"].as<std::string>(loaded.locate_script);
        }

        // Network section
        if (auto network = root["network"]) {
            loaded.connect_timeout_sec = network["connect_timeout_sec"].as<int>(loaded.connect_timeout_sec);
            loaded.read_timeout_sec = network["read_timeout_sec"].as<int>(loaded.read_timeout_sec);
        }

        // Display section
        if (auto display = root["display"]) {
            loaded.show_progress = display["progress"].as<bool>(loaded.show_progress);
        }
    } catch (const YAML::Exception&) {
        return false;
    }

    loaded.default_install_path = expand_home(loaded.default_install_path);
    while (!loaded.download_base.empty() && loaded.download_base.back() == '/') {
        loaded.download_base.pop_back();
    }
    config_ = std::move(loaded);
    return true;
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    try {
        fs::create_directories(dir);

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Endpoints section
        out << YAML::Key << "endpoints" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "version_url" << YAML::Value << config_.version_url;
        out << YAML::Key << "download_base" << YAML::Value << config_.download_base;
        out << YAML::EndMap;

        // Install section
        out << YAML::Key << "install" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "default_path" << YAML::Value << config_.default_install_path;
        out << YAML::Key << "locate_script" << YAML::Value << config_.locate_script;
        out << YAML::EndMap;

        // Network section
        out << YAML::Key << "network" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "connect_timeout_sec" << YAML::Value << config_.connect_timeout_sec;
        out << YAML::Key << "read_timeout_sec" << YAML::Value << config_.read_timeout_sec;
        out << YAML::EndMap;

        // Display section
        out << YAML::Key << "display" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "progress" << YAML::Value << config_.show_progress;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str() << "\n";
        return fout.good();
    } catch (const std::exception&) {
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
