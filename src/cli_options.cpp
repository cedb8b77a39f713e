#include "cli_options.hpp"
#include <sstream>
#include <stdexcept>

namespace faceswap {

std::vector<int> parseIndices(const std::string& commaSeparated) {
    std::vector<int> indices;
    std::stringstream ss(commaSeparated);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        try {
            indices.push_back(std::stoi(item));
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Bad face index '" + item + "'");
        }
    }
    return indices;
}

void useModelDirectory(ModelPaths& models, const std::string& dir) {
    ModelPaths defaults;
    std::string base = dir;
    while (base.size() > 1 && base.back() == '/') base.pop_back();
    auto relocate = [&](const std::string& path) {
        return base + "/" + path.substr(path.find_last_of('/') + 1);
    };
    models.detector = relocate(defaults.detector);
    models.embedder = relocate(defaults.embedder);
    models.swapper = relocate(defaults.swapper);
    models.swapperEmap = relocate(defaults.swapperEmap);
}

template <typename T, typename Fn>
static T parseNumber(const std::string& option, const std::string& text, Fn convert) {
    size_t used = 0;
    T value{};
    try {
        value = convert(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (text.empty() || used != text.size()) {
        throw std::invalid_argument("Bad value '" + text + "' for " + option);
    }
    return value;
}

static int toInt(const std::string& s, size_t* used) { return std::stoi(s, used); }
static long toLong(const std::string& s, size_t* used) { return std::stol(s, used); }
static double toDouble(const std::string& s, size_t* used) { return std::stod(s, used); }

CommandLine parseCommandLine(int argc, const char* const argv[]) {
    CommandLine cli;
    if (argc < 2) return cli;

    std::string first = argv[1];
    int start = 1;
    if (first == "--help" || first == "-h") {
        return cli;
    } else if (first == "--list-faces" || first == "-l") {
        cli.mode = CliMode::LIST_FACES;
        start = 2;
    } else if (first == "--image" || first == "-i") {
        cli.mode = CliMode::IMAGE;
        start = 2;
    } else {
        cli.mode = CliMode::VIDEO;
    }

    bool facesGiven = false;
    bool selectionGiven = false;
    for (int i = start; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
            return argv[++i];
        };

        if (arg.size() < 2 || arg[0] != '-') {
            cli.positional.push_back(arg);
        } else if (arg == "--reference") {
            cli.selection.mode = SelectionMode::REFERENCE_IMAGE;
            cli.selection.referenceImagePath = next();
            selectionGiven = true;
        } else if (arg == "--frame") {
            cli.selection.mode = SelectionMode::FRAME_FACES;
            cli.selection.referenceFrameIndex = parseNumber<long>(arg, next(), toLong);
            selectionGiven = true;
        } else if (arg == "--faces") {
            cli.selection.faceIndices = parseIndices(next());
            facesGiven = true;
            selectionGiven = true;
        } else if (arg == "--strategy") {
            cli.config.assignment = parseAssignmentStrategy(next());
        } else if (arg == "--providers") {
            cli.config.providers = parseProviderList(next());
        } else if (arg == "--threshold") {
            cli.config.matchThreshold = parseNumber<double>(arg, next(), toDouble);
        } else if (arg == "--memory-limit") {
            cli.config.memoryLimitPercent = parseNumber<double>(arg, next(), toDouble);
        } else if (arg == "--max-gpu-errors") {
            cli.config.maxGpuErrors = parseNumber<int>(arg, next(), toInt);
        } else if (arg == "--no-fallback") {
            cli.config.autoFallbackEnabled = false;
        } else if (arg == "--models") {
            useModelDirectory(cli.config.models, next());
        } else if (arg == "--verbose" || arg == "-v") {
            cli.config.verbose = true;
        } else {
            throw std::invalid_argument("Unknown option " + arg);
        }
    }

    switch (cli.mode) {
        case CliMode::LIST_FACES:
            if (cli.positional.empty() || cli.positional.size() > 3) {
                throw std::invalid_argument("--list-faces takes <video> [frame] [preview.jpg]");
            }
            if (cli.positional.size() > 1) {
                parseNumber<long>("frame", cli.positional[1], toLong);
            }
            break;
        case CliMode::IMAGE:
            if (cli.positional.size() != 3) {
                throw std::invalid_argument("--image takes <source> <target> <output>");
            }
            break;
        case CliMode::VIDEO:
            if (cli.positional.size() != 3) {
                throw std::invalid_argument("Video mode takes <source> <video> <output>");
            }
            break;
        case CliMode::HELP:
            break;
    }

    if (selectionGiven && cli.mode != CliMode::VIDEO) {
        throw std::invalid_argument("--reference, --frame and --faces only apply to video mode");
    }
    if (cli.selection.mode == SelectionMode::FRAME_FACES && !facesGiven) {
        cli.selection.faceIndices = {0};
    }
    if (facesGiven && cli.selection.mode != SelectionMode::FRAME_FACES) {
        cli.warnings.push_back("--faces is ignored without --frame");
    }
    return cli;
}

} // namespace faceswap
