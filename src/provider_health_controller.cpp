#include "provider_health_controller.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace faceswap {

static std::string formatPercent(double percent) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << percent;
    return out.str();
}

const char* providerStatusName(ProviderStatus status) {
    switch (status) {
        case ProviderStatus::GPU_ACTIVE:             return "GPU_ACTIVE";
        case ProviderStatus::GPU_DEGRADED_WARNING:   return "GPU_DEGRADED_WARNING";
        case ProviderStatus::CPU_FALLBACK_TEMPORARY: return "CPU_FALLBACK_TEMPORARY";
        case ProviderStatus::CPU_FALLBACK_PERMANENT: return "CPU_FALLBACK_PERMANENT";
    }
    return "UNKNOWN";
}

ProviderHealthController::ProviderHealthController(const PipelineConfig& config,
                                                   std::shared_ptr<EngineFactory> factory,
                                                   std::shared_ptr<GpuMemoryProbe> probe)
    : m_config(config),
      m_factory(std::move(factory)),
      m_probe(std::move(probe)) {
    m_primary = std::make_unique<InferenceProviderManager>(m_factory);
}

void ProviderHealthController::initialize() {
    m_primary->initialize(m_config.providers);
    m_state = ProviderState();

    if (!m_primary->isGpu()) {
        // Nothing to fall back from
        m_state.status = ProviderStatus::CPU_FALLBACK_PERMANENT;
        std::cout << "[ProviderHealth] no GPU provider available, running on "
                  << providerName(m_primary->activeProvider()) << std::endl;
    }
}

InferenceProviderManager& ProviderHealthController::serve(InferenceProviderManager& engine) {
    m_servingGpu = engine.isGpu();
    return engine;
}

InferenceProviderManager& ProviderHealthController::checkBeforeFrame(long frameIndex) {
    m_state.lastCheckedFrame = frameIndex;

    if (m_rebuildPending) {
        rebuildOnCpu();
    }

    if (m_state.status == ProviderStatus::CPU_FALLBACK_PERMANENT || !m_config.autoFallbackEnabled) {
        return serve(*m_primary);
    }

    if (m_state.status == ProviderStatus::CPU_FALLBACK_TEMPORARY) {
        m_state.status = ProviderStatus::GPU_ACTIVE;
    }

    int interval = std::max(1, m_config.memoryCheckInterval);
    if (frameIndex % interval != 0 || !m_probe) {
        return serve(*m_primary);
    }

    auto usage = m_probe->usage();
    if (!usage) {
        return serve(*m_primary);
    }

    double percent = usage->percent();
    if (percent > m_config.memoryLimitPercent) {
        if (ensureCpuPool()) {
            m_state.status = ProviderStatus::CPU_FALLBACK_TEMPORARY;
            ++m_temporaryFallbackFrames;
            std::cerr << "[ProviderHealth] frame " << frameIndex << ": GPU memory "
                      << formatPercent(percent) << "% over limit "
                      << m_config.memoryLimitPercent << "%, using CPU for this frame" << std::endl;
            return serve(*m_cpuPool);
        }
    } else if (percent > m_config.memoryLimitPercent - m_config.memoryWarningMargin) {
        if (m_state.status != ProviderStatus::GPU_DEGRADED_WARNING) {
            std::cout << "[ProviderHealth] frame " << frameIndex << ": GPU memory "
                      << formatPercent(percent)
                      << "% is close to the limit" << std::endl;
        }
        m_state.status = ProviderStatus::GPU_DEGRADED_WARNING;
    } else {
        m_state.status = ProviderStatus::GPU_ACTIVE;
    }

    return serve(*m_primary);
}

void ProviderHealthController::reportSuccess() {
    if (m_servingGpu && m_state.status != ProviderStatus::CPU_FALLBACK_PERMANENT) {
        m_state.consecutiveErrorCount = 0;
    }
}

void ProviderHealthController::reportError(const InferenceError& error) {
    if (m_state.status == ProviderStatus::CPU_FALLBACK_PERMANENT) {
        return;
    }
    if (!m_servingGpu) {
        // CPU engines do not count against the GPU
        return;
    }

    ++m_state.consecutiveErrorCount;
    if (!m_config.autoFallbackEnabled) {
        return;
    }

    if (error.isResourceFailure()) {
        enterPermanentFallback(std::string("GPU ") + causeName(error.cause()) + " error: " + error.what());
    } else if (m_state.consecutiveErrorCount >= m_config.maxGpuErrors) {
        enterPermanentFallback(std::to_string(m_state.consecutiveErrorCount) +
                               " consecutive GPU errors, last: " + error.what());
    }
}

void ProviderHealthController::enterPermanentFallback(const std::string& reason) {
    m_state.status = ProviderStatus::CPU_FALLBACK_PERMANENT;
    m_rebuildPending = true;
    std::cerr << "[ProviderHealth] switching to CPU for the rest of the job (" << reason << ")" << std::endl;
}

void ProviderHealthController::rebuildOnCpu() {
    m_rebuildPending = false;

    if (ensureCpuPool()) {
        // The GPU engines are released only once the CPU set is loaded
        m_primary = std::move(m_cpuPool);
        std::cout << "[ProviderHealth] primary engines now on "
                  << providerName(m_primary->activeProvider()) << std::endl;
        return;
    }
    std::cerr << "[ProviderHealth] CPU rebuild failed, keeping "
              << providerName(m_primary->activeProvider()) << " engines" << std::endl;
}

bool ProviderHealthController::ensureCpuPool() {
    if (m_cpuPool) return true;
    if (m_cpuPoolFailed) return false;

    auto pool = std::make_unique<InferenceProviderManager>(m_factory);
    try {
        pool->initialize({Provider::CPU});
    } catch (const InitializationError& e) {
        std::cerr << "[ProviderHealth] CPU engines unavailable, staying on GPU: " << e.what() << std::endl;
        m_cpuPoolFailed = true;
        return false;
    }
    m_cpuPool = std::move(pool);
    return true;
}

} // namespace faceswap
