#include "inference_provider_manager.hpp"
#include "face_detector.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <new>

namespace faceswap {

static bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

InferenceProviderManager::InferenceProviderManager(std::shared_ptr<EngineFactory> factory)
    : m_factory(std::move(factory)) {
    if (!m_factory) {
        throw std::invalid_argument("InferenceProviderManager needs an engine factory");
    }
}

void InferenceProviderManager::initialize(const std::vector<Provider>& providers) {
    if (providers.empty()) {
        throw InitializationError("No inference providers given");
    }

    std::string tried;
    for (Provider provider : providers) {
        auto backend = makeBackend(provider);
        if (!tried.empty()) tried += ", ";
        tried += backend->name();

        if (!m_factory->supports(*backend)) {
            std::cout << "[InferenceProviderManager] provider " << backend->name()
                      << " not available, skipping" << std::endl;
            continue;
        }

        std::unique_ptr<FaceDetector> detector;
        std::unique_ptr<FaceSwapModel> swapper;
        try {
            detector = m_factory->createDetector(*backend);
            swapper = m_factory->createSwapper(*backend);
        } catch (const std::exception& e) {
            std::cerr << "[InferenceProviderManager] " << backend->name()
                      << " failed to load models: " << e.what() << std::endl;
            continue;
        }
        if (!detector || !swapper) {
            std::cerr << "[InferenceProviderManager] " << backend->name()
                      << " returned no engine" << std::endl;
            continue;
        }

        std::unique_ptr<FaceEmbedder> embedder;
        try {
            embedder = m_factory->createEmbedder(*backend);
        } catch (const std::exception& e) {
            std::cerr << "[InferenceProviderManager] Warning: no embedder on " << backend->name()
                      << " (" << e.what() << "), matching falls back to position and size" << std::endl;
        }

        m_detector = std::move(detector);
        m_swapper = std::move(swapper);
        m_embedder = std::move(embedder);
        m_backend = std::move(backend);

        std::cout << "[InferenceProviderManager] using provider " << m_backend->name() << std::endl;
        return;
    }

    throw InitializationError("Swap models could not be loaded on any provider (tried: " + tried + ")");
}

void InferenceProviderManager::reinitialize(const std::vector<Provider>& providers) {
    std::cout << "[InferenceProviderManager] reinitializing engines" << std::endl;
    release();
    initialize(providers);
}

void InferenceProviderManager::release() {
    m_swapper.reset();
    m_embedder.reset();
    m_detector.reset();
    m_backend.reset();
}

Provider InferenceProviderManager::activeProvider() const {
    if (!m_backend) {
        throw std::logic_error("InferenceProviderManager is not initialized");
    }
    return m_backend->provider();
}

InferenceError InferenceProviderManager::classify(const cv::Exception& e, const std::string& operation) {
    std::string message = e.what();
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string what = operation + " failed: " + message;

    if (e.code == cv::Error::StsNoMem || contains(lower, "out of memory") ||
        contains(lower, "alloc_failed") || contains(lower, "memoryallocation")) {
        return InferenceError(what, InferenceError::Severity::TRANSIENT, InferenceError::Cause::MEMORY);
    }
    if (e.code == cv::Error::GpuApiCallError || e.code == cv::Error::GpuNotSupported ||
        e.code == cv::Error::OpenCLApiCallError || contains(lower, "cuda") ||
        contains(lower, "cudnn") || contains(lower, "opencl")) {
        return InferenceError(what, InferenceError::Severity::TRANSIENT, InferenceError::Cause::DRIVER);
    }
    if (e.code == cv::Error::StsNotImplemented) {
        return InferenceError(what, InferenceError::Severity::FATAL);
    }
    return InferenceError(what, InferenceError::Severity::TRANSIENT);
}

template <typename Fn>
auto InferenceProviderManager::guarded(const std::string& operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const FaceSwapError&) {
        throw;
    } catch (const std::bad_alloc& e) {
        throw InferenceError(operation + " failed: " + e.what(),
                             InferenceError::Severity::TRANSIENT, InferenceError::Cause::MEMORY);
    } catch (const cv::Exception& e) {
        throw classify(e, operation);
    } catch (const std::exception& e) {
        throw InferenceError(operation + " failed: " + e.what(), InferenceError::Severity::TRANSIENT);
    }
}

void InferenceProviderManager::requireInitialized(const std::string& operation) const {
    if (!m_backend) {
        throw InferenceError(operation + " called without initialized engines",
                             InferenceError::Severity::FATAL);
    }
}

std::vector<FaceObservation> InferenceProviderManager::detect(const cv::Mat& frame, long frameIndex) {
    requireInitialized("detect");
    if (frame.empty() || frame.type() != CV_8UC3) {
        throw DetectionError("Frame " + std::to_string(frameIndex) + " is empty or not 8-bit BGR");
    }

    auto faces = guarded("detect", [&] { return m_detector->detect(frame); });
    for (auto& face : faces) {
        face.frameIndex = frameIndex;
    }
    sortByAreaDescending(faces);
    return faces;
}

std::vector<float> InferenceProviderManager::embed(const cv::Mat& frame, const FaceObservation& face) {
    requireInitialized("embed");
    if (!m_embedder) return {};
    return guarded("embed", [&] { return m_embedder->embed(frame, face); });
}

cv::Mat InferenceProviderManager::swap(const FaceObservation& sourceFace, const cv::Mat& targetFrame,
                                       const FaceObservation& targetFace) {
    requireInitialized("swap");
    cv::Mat result = guarded("swap", [&] { return m_swapper->swap(targetFrame, targetFace, sourceFace); });
    if (result.empty() || result.size() != targetFrame.size() || result.type() != targetFrame.type()) {
        throw InferenceError("swap returned an image that does not match the frame",
                             InferenceError::Severity::TRANSIENT);
    }
    return result;
}

} // namespace faceswap
