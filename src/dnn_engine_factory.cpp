#include "dnn_engine_factory.hpp"
#include "face_detector.hpp"
#include "face_embedder.hpp"
#include "face_swap_model.hpp"

namespace faceswap {

DnnEngineFactory::DnnEngineFactory(const PipelineConfig& config)
    : m_models(config.models),
      m_confThreshold(config.detectionConfidence),
      m_nmsThreshold(config.nmsThreshold) {}

std::unique_ptr<FaceDetector> DnnEngineFactory::createDetector(const InferenceBackend& backend) {
    return std::make_unique<YuNetFaceDetector>(m_models.detector, backend,
                                               m_confThreshold, m_nmsThreshold);
}

std::unique_ptr<FaceEmbedder> DnnEngineFactory::createEmbedder(const InferenceBackend& backend) {
    return std::make_unique<ArcFaceEmbedder>(m_models.embedder, backend);
}

std::unique_ptr<FaceSwapModel> DnnEngineFactory::createSwapper(const InferenceBackend& backend) {
    return std::make_unique<InSwapperModel>(m_models.swapper, m_models.swapperEmap, backend);
}

} // namespace faceswap
