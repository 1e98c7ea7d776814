#pragma once

#include <map>
#include <string>
#include <vector>

struct ProcessOutput {
    int exit_code = -1;      // -1 if killed by a signal
    std::string stdout_text;
    std::string stderr_text;

    bool success() const { return exit_code == 0; }
};

/// Run argv[0] (PATH lookup) with the given arguments, wait for it and
/// capture stdout/stderr. `env` entries are set in the child only.
/// Throws UpdateError(ErrorKind::Io) if the child cannot be spawned.
ProcessOutput run_process(const std::vector<std::string>& argv,
                          const std::map<std::string, std::string>& env = {});
