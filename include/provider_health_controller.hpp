#pragma once

#include "errors.hpp"
#include "gpu_memory_probe.hpp"
#include "inference_provider_manager.hpp"
#include "pipeline_config.hpp"
#include <memory>

namespace faceswap {

enum class ProviderStatus {
    GPU_ACTIVE,
    GPU_DEGRADED_WARNING,
    CPU_FALLBACK_TEMPORARY,
    CPU_FALLBACK_PERMANENT
};

const char* providerStatusName(ProviderStatus status);

struct ProviderState {
    ProviderStatus status = ProviderStatus::GPU_ACTIVE;
    int consecutiveErrorCount = 0;
    long lastCheckedFrame = -1;
};

// Decides, frame by frame, which engine set serves inference.
//
//  - every `memoryCheckInterval` frames the GPU memory usage is probed; above
//    the limit the frame is served by a CPU engine set, within the warning
//    margin the state only changes to GPU_DEGRADED_WARNING
//  - a temporary CPU frame never outlives the frame it was granted for
//  - memory/driver errors, or `maxGpuErrors` consecutive errors, move the job
//    to CPU_FALLBACK_PERMANENT and the CPU set becomes the primary on the next
//    frame; nothing leaves that state. If no CPU set can be loaded the old
//    primary keeps serving.
//  - an unavailable probe means "keep using the GPU"
//
// At most two engine sets exist: the primary and a CPU set built on the first
// temporary fallback and reused afterwards.
class ProviderHealthController {
public:
    ProviderHealthController(const PipelineConfig& config,
                             std::shared_ptr<EngineFactory> factory,
                             std::shared_ptr<GpuMemoryProbe> probe);

    // Loads the primary engines. Throws InitializationError.
    void initialize();

    // Called once per frame before any inference.
    InferenceProviderManager& checkBeforeFrame(long frameIndex);

    void reportSuccess();
    void reportError(const InferenceError& error);

    const ProviderState& state() const { return m_state; }
    InferenceProviderManager& primary() { return *m_primary; }
    bool servingGpu() const { return m_servingGpu; }
    int temporaryFallbackFrames() const { return m_temporaryFallbackFrames; }

private:
    bool ensureCpuPool();
    void enterPermanentFallback(const std::string& reason);
    void rebuildOnCpu();
    InferenceProviderManager& serve(InferenceProviderManager& engine);

    PipelineConfig m_config;
    std::shared_ptr<EngineFactory> m_factory;
    std::shared_ptr<GpuMemoryProbe> m_probe;

    std::unique_ptr<InferenceProviderManager> m_primary;
    std::unique_ptr<InferenceProviderManager> m_cpuPool;
    bool m_cpuPoolFailed = false;

    ProviderState m_state;
    bool m_rebuildPending = false;
    bool m_servingGpu = false;
    int m_temporaryFallbackFrames = 0;
};

} // namespace faceswap
