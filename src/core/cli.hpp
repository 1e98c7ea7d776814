#pragma once

#include <string>
#include <vector>

class CLI {
public:
    /// Parse argv and dispatch to subcommand. Returns the process exit code.
    /// `home_dir` is the value of $HOME read by main().
    static int run(int argc, char* argv[], const std::string& home_dir);

    struct Options {
        std::string command = "update";
        std::vector<std::string> args;  // positional arguments after the command
        bool no_progress = false;
        bool quiet = false;
    };

    /// Split flags from positionals. Unknown flags are left in `args`.
    static Options parse_args(int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_update(const Options& opts, const std::string& home_dir);
    static int cmd_check(const Options& opts, const std::string& home_dir);
    static int cmd_config(const Options& opts, const std::string& home_dir);
};
