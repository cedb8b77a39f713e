#pragma once

#include "face_engines.hpp"
#include <opencv2/dnn.hpp>
#include <string>

namespace faceswap {

// ArcFace recognition network (e.g. buffalo_l w600k_r50). Produces the raw
// 512-d identity vector of an aligned 112x112 crop.
class ArcFaceEmbedder : public FaceEmbedder {
public:
    ArcFaceEmbedder(const std::string& modelPath, const InferenceBackend& backend);

    std::vector<float> embed(const cv::Mat& frame, const FaceObservation& face) override;

private:
    cv::dnn::Net m_net;
    int m_inputSize = 112;
};

} // namespace faceswap
