#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace faceswap {

enum class Provider {
    CUDA,
    DIRECTML,
    CPU
};

// Accepts canonical names and the ONNX Runtime style provider names.
// Throws std::invalid_argument for anything else.
Provider parseProvider(const std::string& text);
std::vector<Provider> parseProviderList(const std::string& commaSeparated);
const char* providerName(Provider provider);

enum class AssignmentStrategy {
    FIRST_COME,
    GREEDY_EXCLUSIVE
};

AssignmentStrategy parseAssignmentStrategy(const std::string& text);
const char* assignmentStrategyName(AssignmentStrategy strategy);

struct ModelPaths {
    std::string detector = "models/face_detection_yunet_2023mar.onnx";
    std::string embedder = "models/w600k_r50.onnx";
    std::string swapper = "models/inswapper_128.onnx";
    std::string swapperEmap = "models/inswapper_128_emap.yml";
};

struct PipelineConfig {
    std::vector<Provider> providers = {Provider::CUDA, Provider::CPU};
    ModelPaths models;

    // Identity matching
    double matchThreshold = 0.4;
    AssignmentStrategy assignment = AssignmentStrategy::FIRST_COME;

    // Provider health
    bool autoFallbackEnabled = true;
    int memoryCheckInterval = 10;
    double memoryLimitPercent = 90.0;
    double memoryWarningMargin = 10.0;
    int maxGpuErrors = 5;

    // Detection
    float detectionConfidence = 0.5f;
    float nmsThreshold = 0.3f;

    // Finalization
    int outputVerifyRetries = 5;
    std::chrono::milliseconds outputVerifyDelay{500};

    // Reporting
    int logInterval = 30;
    int previewInterval = 1;
    bool verbose = false;
};

} // namespace faceswap
