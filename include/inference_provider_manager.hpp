#pragma once

#include "errors.hpp"
#include "face_engines.hpp"
#include "inference_backend.hpp"
#include <memory>
#include <string>
#include <vector>

namespace faceswap {

// Owns the detector, embedder and swapper bound to one provider backend and
// normalizes every backend failure into InferenceError.
//
// Engine handles are not safe for concurrent use: a manager belongs to one
// worker and must never be shared across threads. Give each worker its own.
class InferenceProviderManager {
public:
    explicit InferenceProviderManager(std::shared_ptr<EngineFactory> factory);
    ~InferenceProviderManager() = default;

    InferenceProviderManager(const InferenceProviderManager&) = delete;
    InferenceProviderManager& operator=(const InferenceProviderManager&) = delete;

    // Loads engines on the first provider of the list that can host the
    // detector and the swap model. Throws InitializationError otherwise.
    void initialize(const std::vector<Provider>& providers);
    // Drops the current engines and initializes again with a new list.
    void reinitialize(const std::vector<Provider>& providers);
    void release();

    bool isInitialized() const { return m_backend != nullptr; }
    Provider activeProvider() const;
    bool isGpu() const { return m_backend && m_backend->isGpu(); }
    bool hasEmbedder() const { return m_embedder != nullptr; }

    std::vector<FaceObservation> detect(const cv::Mat& frame, long frameIndex = -1);
    // Empty when no embedder could be loaded.
    std::vector<float> embed(const cv::Mat& frame, const FaceObservation& face);
    cv::Mat swap(const FaceObservation& sourceFace, const cv::Mat& targetFrame,
                 const FaceObservation& targetFace);

    static InferenceError classify(const cv::Exception& e, const std::string& operation);

private:
    template <typename Fn>
    auto guarded(const std::string& operation, Fn&& fn) -> decltype(fn());

    void requireInitialized(const std::string& operation) const;

    std::shared_ptr<EngineFactory> m_factory;
    std::unique_ptr<InferenceBackend> m_backend;
    std::unique_ptr<FaceDetector> m_detector;
    std::unique_ptr<FaceEmbedder> m_embedder;
    std::unique_ptr<FaceSwapModel> m_swapper;
};

} // namespace faceswap
