#pragma once

#include "face_engines.hpp"
#include <opencv2/dnn.hpp>
#include <string>

namespace faceswap {

// inswapper_128: swaps the identity of an aligned 128x128 target crop to the
// source embedding, then blends the crop back into a copy of the frame.
//
// The network expects the source embedding projected through its `emap`
// matrix. OpenCV cannot read ONNX initializers directly, so `emap` is loaded
// from a FileStorage file (node "emap", NxN CV_32F).
class InSwapperModel : public FaceSwapModel {
public:
    InSwapperModel(const std::string& modelPath, const std::string& emapPath,
                   const InferenceBackend& backend);

    cv::Mat swap(const cv::Mat& targetFrame, const FaceObservation& targetFace,
                 const FaceObservation& sourceFace) override;

private:
    cv::Mat sourceLatent(const std::vector<float>& embedding) const;
    cv::Mat pasteBack(const cv::Mat& frame, const cv::Mat& swapped, const cv::Mat& transform,
                      const FaceObservation& targetFace) const;

    cv::dnn::Net m_net;
    cv::Mat m_emap;
    int m_inputSize = 128;
};

} // namespace faceswap
