#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/progress.hpp"
#include "core/updater.hpp"
#include "ui/progress_display.hpp"

#include <cstring>
#include <iostream>
#include <memory>
#include <unistd.h>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Helpers ─────────────────────────────────────────────────

static bool load_config(Config& config, ProgressSink& sink) {
    bool had_file = access(config.config_path().c_str(), F_OK) == 0;
    if (!config.load() && had_file) {
        sink.error("Warning: could not parse " + config.config_path() + ", using defaults");
        return false;
    }
    return true;
}

/// Spinner + gauge on a terminal, plain lines otherwise
static std::unique_ptr<ProgressSink> make_sink(const AppConfig& cfg, const CLI::Options& opts) {
    bool interactive = cfg.show_progress && !opts.no_progress && !opts.quiet &&
                       isatty(STDOUT_FILENO);
    if (interactive) {
        auto display = std::make_unique<ProgressDisplay>(opts.quiet);
        display->start_ticker();
        return display;
    }
    return std::make_unique<ConsoleSink>(opts.quiet);
}

// ── Argument parsing ────────────────────────────────────────

CLI::Options CLI::parse_args(int argc, char* argv[]) {
    Options opts;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--no-progress") == 0) {
            opts.no_progress = true;
        } else if (std::strcmp(arg, "--quiet") == 0 || std::strcmp(arg, "-q") == 0) {
            opts.quiet = true;
        } else if (!have_command) {
            opts.command = arg;
            have_command = true;
        } else {
            opts.args.push_back(arg);
        }
    }
    return opts;
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[], const std::string& home_dir) {
    Options opts = parse_args(argc, argv);
    const std::string& cmd = opts.command;

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        return cmd_help();
    }
    if (cmd == "version" || cmd == "--version" || cmd == "-v") {
        return cmd_version();
    }

    if (home_dir.empty()) {
        std::cerr << "Error: HOME is not set\n";
        return 1;
    }

    if (cmd == "update") {
        return cmd_update(opts, home_dir);
    }
    if (cmd == "check") {
        return cmd_check(opts, home_dir);
    }
    if (cmd == "config") {
        return cmd_config(opts, home_dir);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'discord-updater help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "discord-updater - install or update Discord from the official tarball\n"
        "\n"
        "Usage:\n"
        "  discord-updater              Install or update Discord (default)\n"
        "  discord-updater update       Same as above\n"
        "  discord-updater check        Show installed and latest versions only\n"
        "  discord-updater config init  Write ~/.config/discord-updater/config.yaml\n"
        "  discord-updater version      Show version\n"
        "  discord-updater help         Show this help\n"
        "\n"
        "Flags:\n"
        "  --no-progress   Plain output, no spinner or progress bar\n"
        "  -q, --quiet     Only print errors\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "discord-updater " << APP_VERSION << "\n";
    return 0;
}

// ── update ──────────────────────────────────────────────────

int CLI::cmd_update(const Options& opts, const std::string& home_dir) {
    Config config(home_dir);
    ConsoleSink startup_sink(opts.quiet);
    load_config(config, startup_sink);

    auto sink = make_sink(config.data(), opts);
    Updater updater(config.data(), Updater::default_steps(config.data(), *sink), *sink);

    UpdateResult result = updater.run();
    if (!result.success) {
        sink->error("Error: " + result.message);
        return 1;
    }
    sink->log(result.message);
    return 0;
}

// ── check ───────────────────────────────────────────────────

int CLI::cmd_check(const Options& opts, const std::string& home_dir) {
    Config config(home_dir);
    ConsoleSink sink(opts.quiet);
    load_config(config, sink);

    Updater updater(config.data(), Updater::default_steps(config.data(), sink), sink);

    UpdateResult result = updater.check();
    if (!result.success) {
        sink.error("Error: " + result.message);
        return 1;
    }
    std::cout << "Install path: " << result.info.install_path
              << (result.info.install_fresh ? " (not installed)" : "") << "\n";
    std::cout << "Plan:         " << to_string(result.info.plan) << "\n";
    std::cout << result.message << "\n";
    return 0;
}

// ── config ──────────────────────────────────────────────────

int CLI::cmd_config(const Options& opts, const std::string& home_dir) {
    if (opts.args.empty() || opts.args[0] != "init") {
        std::cerr << "Usage: discord-updater config init\n";
        return 1;
    }

    Config config(home_dir);
    ConsoleSink sink(opts.quiet);
    if (!load_config(config, sink)) {
        // Don't overwrite a file the user may want to fix by hand
        return 1;
    }

    if (!config.save()) {
        std::cerr << "Error: failed to write " << config.config_path() << "\n";
        return 1;
    }
    sink.log("Wrote " + config.config_path());
    return 0;
}
