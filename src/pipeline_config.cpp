#include "pipeline_config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace faceswap {

static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

Provider parseProvider(const std::string& text) {
    std::string key = toLower(trim(text));

    if (key == "cuda" || key == "cudaexecutionprovider") return Provider::CUDA;
    if (key == "directml" || key == "dml" || key == "dmlexecutionprovider") return Provider::DIRECTML;
    if (key == "cpu" || key == "cpuexecutionprovider") return Provider::CPU;

    throw std::invalid_argument("Unknown inference provider: '" + text + "'");
}

std::vector<Provider> parseProviderList(const std::string& commaSeparated) {
    std::vector<Provider> providers;
    std::stringstream ss(commaSeparated);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (trim(item).empty()) continue;
        Provider p = parseProvider(item);
        if (std::find(providers.begin(), providers.end(), p) == providers.end()) {
            providers.push_back(p);
        }
    }
    if (providers.empty()) {
        throw std::invalid_argument("Provider list is empty");
    }
    return providers;
}

const char* providerName(Provider provider) {
    switch (provider) {
        case Provider::CUDA:     return "cuda";
        case Provider::DIRECTML: return "directml";
        case Provider::CPU:      return "cpu";
    }
    return "unknown";
}

AssignmentStrategy parseAssignmentStrategy(const std::string& text) {
    std::string key = toLower(trim(text));
    if (key == "first-come" || key == "first_come" || key == "independent") {
        return AssignmentStrategy::FIRST_COME;
    }
    if (key == "greedy" || key == "greedy-exclusive" || key == "greedy_exclusive" || key == "exclusive") {
        return AssignmentStrategy::GREEDY_EXCLUSIVE;
    }
    throw std::invalid_argument("Unknown assignment strategy: '" + text + "'");
}

const char* assignmentStrategyName(AssignmentStrategy strategy) {
    switch (strategy) {
        case AssignmentStrategy::FIRST_COME:       return "first-come";
        case AssignmentStrategy::GREEDY_EXCLUSIVE: return "greedy-exclusive";
    }
    return "unknown";
}

const char* causeName(InferenceError::Cause cause) {
    switch (cause) {
        case InferenceError::Cause::MEMORY: return "memory";
        case InferenceError::Cause::DRIVER: return "driver";
        case InferenceError::Cause::OTHER:  return "other";
    }
    return "unknown";
}

} // namespace faceswap
