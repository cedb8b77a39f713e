#include "face_embedder.hpp"
#include "face_alignment.hpp"
#include <iostream>
#include <stdexcept>

namespace faceswap {

ArcFaceEmbedder::ArcFaceEmbedder(const std::string& modelPath, const InferenceBackend& backend) {
    m_net = cv::dnn::readNetFromONNX(modelPath);
    if (m_net.empty()) {
        throw std::runtime_error("Failed to load embedding model: " + modelPath);
    }
    backend.configure(m_net);
    std::cout << "[ArcFaceEmbedder] loaded " << modelPath << " on " << backend.name() << std::endl;
}

std::vector<float> ArcFaceEmbedder::embed(const cv::Mat& frame, const FaceObservation& face) {
    if (face.area() <= 0) {
        return {};
    }

    cv::Mat aligned = alignFace(frame, face, m_inputSize);

    // (x - 127.5) / 127.5, RGB
    cv::Mat blob = cv::dnn::blobFromImage(aligned, 1.0 / 127.5, cv::Size(m_inputSize, m_inputSize),
                                          cv::Scalar(127.5, 127.5, 127.5), true, false);
    m_net.setInput(blob);
    cv::Mat output = m_net.forward();

    cv::Mat flat = output.reshape(1, 1);
    std::vector<float> embedding;
    flat.copyTo(embedding);
    return embedding;
}

} // namespace faceswap
