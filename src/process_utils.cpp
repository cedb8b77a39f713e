#include "process_utils.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace faceswap {

ProcessResult runCommand(const std::string& command) {
    ProcessResult result;

    std::string full = command + " 2>&1";
    FILE* raw = popen(full.c_str(), "r");
    if (!raw) {
        result.output = "popen failed";
        return result;
    }

    std::unique_ptr<FILE, int (*)(FILE*)> pipe(raw, pclose);
    std::array<char, 256> buffer;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe.release());
    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

static bool isExecutable(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

std::string findExecutable(const std::vector<std::string>& candidates) {
    const char* pathEnv = std::getenv("PATH");
    std::string searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";

    for (const auto& candidate : candidates) {
        if (candidate.find('/') != std::string::npos) {
            if (isExecutable(candidate)) return candidate;
            continue;
        }

        std::stringstream ss(searchPath);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (dir.empty()) continue;
            fs::path full = fs::path(dir) / candidate;
            if (isExecutable(full)) return full.string();
        }
    }
    return "";
}

} // namespace faceswap
