#pragma once

#include "face_types.hpp"
#include "inference_backend.hpp"
#include <memory>
#include <vector>

namespace faceswap {

class FaceDetector {
public:
    virtual ~FaceDetector() = default;
    virtual std::vector<FaceObservation> detect(const cv::Mat& frame) = 0;
};

class FaceEmbedder {
public:
    virtual ~FaceEmbedder() = default;
    virtual std::vector<float> embed(const cv::Mat& frame, const FaceObservation& face) = 0;
};

class FaceSwapModel {
public:
    virtual ~FaceSwapModel() = default;
    // Returns a new image; neither input is modified.
    virtual cv::Mat swap(const cv::Mat& targetFrame, const FaceObservation& targetFace,
                         const FaceObservation& sourceFace) = 0;
};

// Builds engines bound to one backend. create* throws when a model cannot be
// loaded for that backend.
class EngineFactory {
public:
    virtual ~EngineFactory() = default;

    virtual bool supports(const InferenceBackend& backend) const { return backend.isAvailable(); }

    virtual std::unique_ptr<FaceDetector> createDetector(const InferenceBackend& backend) = 0;
    virtual std::unique_ptr<FaceEmbedder> createEmbedder(const InferenceBackend& backend) = 0;
    virtual std::unique_ptr<FaceSwapModel> createSwapper(const InferenceBackend& backend) = 0;
};

} // namespace faceswap
