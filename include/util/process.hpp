#pragma once

#include <string>
#include <vector>

namespace usync::util {

struct ProcessResult {
    int exitCode{-1};
    std::string out, err;

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

// Exit code of a child whose execvp failed
constexpr int EXEC_FAILED = 127;

// fork/execvp argv[0] from PATH and wait, capturing stdout and stderr.
// Throws std::runtime_error only when the child cannot be started at all.
ProcessResult runProcess(const std::vector<std::string>& argv);

// Single-quoted for a POSIX shell on the far side of ssh
std::string shellQuote(const std::string& arg);

// argv joined for log lines
std::string joinArgs(const std::vector<std::string>& argv);

}
