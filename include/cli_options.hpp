#pragma once

#include "pipeline_config.hpp"
#include "reference_selector.hpp"
#include <string>
#include <vector>

namespace faceswap {

enum class CliMode {
    HELP,
    LIST_FACES,   // <video> [frame] [preview.jpg]
    IMAGE,        // <source> <target> <output>
    VIDEO         // <source> <video> <output>
};

struct CommandLine {
    CliMode mode = CliMode::HELP;
    std::vector<std::string> positional;
    PipelineConfig config;
    SelectionRequest selection;
    std::vector<std::string> warnings;
};

// Parses argv for every mode. Engine options (--providers, --models, ...)
// apply to all of them; --reference, --frame and --faces only to VIDEO.
// Throws std::invalid_argument on unknown options, missing values, bad
// numbers or a wrong count of positional arguments.
CommandLine parseCommandLine(int argc, const char* const argv[]);

std::vector<int> parseIndices(const std::string& commaSeparated);

// Points every model path at `dir`, keeping the default file names.
void useModelDirectory(ModelPaths& models, const std::string& dir);

} // namespace faceswap
