#pragma once

#include <memory>
#include <optional>
#include <string>

namespace faceswap {

struct GpuMemoryUsage {
    double usedMb = 0.0;
    double totalMb = 0.0;

    double percent() const { return totalMb > 0.0 ? usedMb / totalMb * 100.0 : 0.0; }
};

class GpuMemoryProbe {
public:
    virtual ~GpuMemoryProbe() = default;
    // Empty when the usage cannot be determined.
    virtual std::optional<GpuMemoryUsage> usage() = 0;
};

// Reports nothing; used when no GPU tooling is present.
class NullMemoryProbe : public GpuMemoryProbe {
public:
    std::optional<GpuMemoryUsage> usage() override { return std::nullopt; }
};

// Queries the first GPU through `nvidia-smi`.
class NvidiaSmiMemoryProbe : public GpuMemoryProbe {
public:
    explicit NvidiaSmiMemoryProbe(std::string executable = "nvidia-smi");
    std::optional<GpuMemoryUsage> usage() override;

    // Parses one "used, total" CSV line as printed with --format=csv,noheader,nounits.
    static std::optional<GpuMemoryUsage> parse(const std::string& output);

private:
    std::string m_executable;
};

#ifdef FACESWAP_USE_CUDA
// Device memory of the current CUDA device via cv::cuda::DeviceInfo.
class CudaMemoryProbe : public GpuMemoryProbe {
public:
    std::optional<GpuMemoryUsage> usage() override;
};
#endif

std::unique_ptr<GpuMemoryProbe> makeDefaultMemoryProbe();

} // namespace faceswap
