#pragma once

#include "face_engines.hpp"
#include "pipeline_config.hpp"

namespace faceswap {

// Builds the OpenCV DNN engines (YuNet, ArcFace, inswapper) from model files.
class DnnEngineFactory : public EngineFactory {
public:
    explicit DnnEngineFactory(const PipelineConfig& config);

    std::unique_ptr<FaceDetector> createDetector(const InferenceBackend& backend) override;
    std::unique_ptr<FaceEmbedder> createEmbedder(const InferenceBackend& backend) override;
    std::unique_ptr<FaceSwapModel> createSwapper(const InferenceBackend& backend) override;

private:
    ModelPaths m_models;
    float m_confThreshold;
    float m_nmsThreshold;
};

} // namespace faceswap
