#pragma once

#include <string>
#include <vector>

namespace faceswap {

struct ProcessResult {
    int exitCode = -1;
    std::string output;   // stdout and stderr interleaved

    bool ok() const { return exitCode == 0; }
};

// Runs a shell command through popen and collects its output.
ProcessResult runCommand(const std::string& command);

// Single-quotes an argument for /bin/sh.
std::string shellQuote(const std::string& arg);

// First candidate that resolves to an executable file, either as a path or
// through $PATH. Empty when none does.
std::string findExecutable(const std::vector<std::string>& candidates);

} // namespace faceswap
