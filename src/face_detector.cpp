#include "face_detector.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace faceswap {

void sortByAreaDescending(std::vector<FaceObservation>& faces) {
    std::stable_sort(faces.begin(), faces.end(),
        [](const FaceObservation& a, const FaceObservation& b) { return a.area() > b.area(); });
}

YuNetFaceDetector::YuNetFaceDetector(const std::string& modelPath, const InferenceBackend& backend,
                                     float confThreshold, float nmsThreshold)
    : m_confThreshold(confThreshold) {
    m_net = cv::FaceDetectorYN::create(modelPath, "", m_inputSize, confThreshold, nmsThreshold,
                                       5000, backend.dnnBackend(), backend.dnnTarget());
    if (m_net.empty()) {
        throw std::runtime_error("Failed to load face detector: " + modelPath);
    }
    std::cout << "[YuNetFaceDetector] loaded " << modelPath << " on " << backend.name() << std::endl;
}

std::vector<FaceObservation> YuNetFaceDetector::detect(const cv::Mat& image) {
    std::vector<FaceObservation> faces;

    if (image.size() != m_inputSize) {
        m_inputSize = image.size();
        m_net->setInputSize(m_inputSize);
    }

    cv::Mat detections;
    m_net->detect(image, detections);

    // Row layout: x, y, w, h, 5 landmark (x, y) pairs, score
    for (int i = 0; i < detections.rows; i++) {
        float confidence = detections.at<float>(i, 14);
        if (confidence < m_confThreshold) continue;

        cv::Rect box(static_cast<int>(detections.at<float>(i, 0)),
                     static_cast<int>(detections.at<float>(i, 1)),
                     static_cast<int>(detections.at<float>(i, 2)),
                     static_cast<int>(detections.at<float>(i, 3)));

        FaceObservation face = makeObservation(box, image.size(), confidence);
        if (face.area() <= 0) continue;

        for (int k = 0; k < 5; k++) {
            face.landmarks.emplace_back(detections.at<float>(i, 4 + 2 * k),
                                        detections.at<float>(i, 5 + 2 * k));
        }
        faces.push_back(std::move(face));
    }

    sortByAreaDescending(faces);
    return faces;
}

} // namespace faceswap
