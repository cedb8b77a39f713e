#include "gpu_memory_probe.hpp"
#include "process_utils.hpp"

#include <sstream>

#ifdef FACESWAP_USE_CUDA
#include <opencv2/core/cuda.hpp>
#endif

namespace faceswap {

NvidiaSmiMemoryProbe::NvidiaSmiMemoryProbe(std::string executable)
    : m_executable(std::move(executable)) {}

std::optional<GpuMemoryUsage> NvidiaSmiMemoryProbe::parse(const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        size_t comma = line.find(',');
        if (comma == std::string::npos) continue;
        try {
            GpuMemoryUsage usage;
            usage.usedMb = std::stod(line.substr(0, comma));
            usage.totalMb = std::stod(line.substr(comma + 1));
            if (usage.totalMb <= 0.0) return std::nullopt;
            return usage;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<GpuMemoryUsage> NvidiaSmiMemoryProbe::usage() {
    ProcessResult result = runCommand(shellQuote(m_executable) +
        " --query-gpu=memory.used,memory.total --format=csv,noheader,nounits");
    if (!result.ok()) return std::nullopt;
    return parse(result.output);
}

#ifdef FACESWAP_USE_CUDA
std::optional<GpuMemoryUsage> CudaMemoryProbe::usage() {
    try {
        if (cv::cuda::getCudaEnabledDeviceCount() <= 0) return std::nullopt;
        cv::cuda::DeviceInfo info(cv::cuda::getDevice());
        GpuMemoryUsage usage;
        usage.totalMb = static_cast<double>(info.totalMemory()) / (1024.0 * 1024.0);
        usage.usedMb = usage.totalMb - static_cast<double>(info.freeMemory()) / (1024.0 * 1024.0);
        if (usage.totalMb <= 0.0) return std::nullopt;
        return usage;
    } catch (const cv::Exception&) {
        return std::nullopt;
    }
}
#endif

std::unique_ptr<GpuMemoryProbe> makeDefaultMemoryProbe() {
#ifdef FACESWAP_USE_CUDA
    return std::make_unique<CudaMemoryProbe>();
#else
    if (!findExecutable({"nvidia-smi"}).empty()) {
        return std::make_unique<NvidiaSmiMemoryProbe>();
    }
    return std::make_unique<NullMemoryProbe>();
#endif
}

} // namespace faceswap
