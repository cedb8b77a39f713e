#pragma once

#include "face_engines.hpp"
#include <opencv2/objdetect.hpp>
#include <string>

namespace faceswap {

// YuNet face detector (cv::FaceDetectorYN). Results carry five landmarks and
// are sorted by descending box area.
class YuNetFaceDetector : public FaceDetector {
public:
    YuNetFaceDetector(const std::string& modelPath, const InferenceBackend& backend,
                      float confThreshold = 0.5f, float nmsThreshold = 0.3f);
    ~YuNetFaceDetector() override = default;

    std::vector<FaceObservation> detect(const cv::Mat& image) override;

private:
    cv::Ptr<cv::FaceDetectorYN> m_net;
    cv::Size m_inputSize{320, 320};
    float m_confThreshold;
};

// Stable sort by area, largest first.
void sortByAreaDescending(std::vector<FaceObservation>& faces);

} // namespace faceswap
