#include "face_swap_model.hpp"
#include "face_alignment.hpp"
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <stdexcept>

namespace faceswap {

InSwapperModel::InSwapperModel(const std::string& modelPath, const std::string& emapPath,
                               const InferenceBackend& backend) {
    m_net = cv::dnn::readNetFromONNX(modelPath);
    if (m_net.empty()) {
        throw std::runtime_error("Failed to load swap model: " + modelPath);
    }
    backend.configure(m_net);

    cv::FileStorage fs(emapPath, cv::FileStorage::READ);
    if (!fs.isOpened()) {
        throw std::runtime_error("Failed to open swap model emap: " + emapPath);
    }
    fs["emap"] >> m_emap;
    if (m_emap.empty() || m_emap.rows != m_emap.cols) {
        throw std::runtime_error("Invalid emap matrix in " + emapPath);
    }
    m_emap.convertTo(m_emap, CV_32F);

    std::cout << "[InSwapperModel] loaded " << modelPath << " on " << backend.name() << std::endl;
}

cv::Mat InSwapperModel::sourceLatent(const std::vector<float>& embedding) const {
    if (static_cast<int>(embedding.size()) != m_emap.rows) {
        throw std::invalid_argument("Source embedding has " + std::to_string(embedding.size()) +
                                    " values, swap model expects " + std::to_string(m_emap.rows));
    }

    cv::Mat emb = cv::Mat(1, m_emap.rows, CV_32F, const_cast<float*>(embedding.data())).clone();
    double norm = cv::norm(emb);
    if (norm > 1e-6) emb /= norm;

    cv::Mat latent = emb * m_emap;
    norm = cv::norm(latent);
    if (norm > 1e-6) latent /= norm;
    return latent;
}

cv::Mat InSwapperModel::swap(const cv::Mat& targetFrame, const FaceObservation& targetFace,
                             const FaceObservation& sourceFace) {
    if (!sourceFace.hasEmbedding()) {
        throw std::invalid_argument("Source face has no embedding");
    }

    cv::Mat transform;
    cv::Mat aligned = alignFace(targetFrame, targetFace, m_inputSize, &transform);

    cv::Mat targetBlob = cv::dnn::blobFromImage(aligned, 1.0 / 255.0,
                                                cv::Size(m_inputSize, m_inputSize),
                                                cv::Scalar(0, 0, 0), true, false);

    m_net.setInput(targetBlob, "target");
    m_net.setInput(sourceLatent(sourceFace.embedding), "source");
    cv::Mat output = m_net.forward();

    // 1x3xHxW, RGB in [0, 1]
    std::vector<cv::Mat> images;
    cv::dnn::imagesFromBlob(output, images);
    if (images.empty()) {
        throw std::runtime_error("Swap model returned no image");
    }

    cv::Mat swapped;
    images[0].convertTo(swapped, CV_8UC3, 255.0);
    cv::cvtColor(swapped, swapped, cv::COLOR_RGB2BGR);

    return pasteBack(targetFrame, swapped, transform, targetFace);
}

cv::Mat InSwapperModel::pasteBack(const cv::Mat& frame, const cv::Mat& swapped,
                                  const cv::Mat& transform, const FaceObservation& targetFace) const {
    cv::Mat result = frame.clone();

    cv::Mat inverse;
    cv::invertAffineTransform(transform, inverse);

    cv::Mat warped;
    cv::warpAffine(swapped, warped, inverse, frame.size(), cv::INTER_LINEAR,
                   cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));

    cv::Mat mask(swapped.size(), CV_8UC1, cv::Scalar(255));
    cv::Mat warpedMask;
    cv::warpAffine(mask, warpedMask, inverse, frame.size(), cv::INTER_NEAREST,
                   cv::BORDER_CONSTANT, cv::Scalar(0));

    cv::Rect region = clampRect(cv::boundingRect(warpedMask), frame.size());
    if (region.width <= 0 || region.height <= 0) return result;

    // Pull the edge in before feathering so the crop border never shows
    int radius = std::max(2, targetFace.width() / 10);
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(radius, radius));
    cv::erode(warpedMask, warpedMask, kernel);
    warpedMask = featherMask(warpedMask, radius);

    cv::Mat targetROI = result(region);
    cv::Mat srcROI = warped(region);
    cv::Mat maskROI = warpedMask(region);

    for (int y = 0; y < targetROI.rows; y++) {
        for (int x = 0; x < targetROI.cols; x++) {
            float alpha = maskROI.at<uchar>(y, x) / 255.0f;
            if (alpha > 0.01f) {
                cv::Vec3b& dst = targetROI.at<cv::Vec3b>(y, x);
                cv::Vec3b src = srcROI.at<cv::Vec3b>(y, x);
                dst[0] = static_cast<uchar>(src[0] * alpha + dst[0] * (1 - alpha));
                dst[1] = static_cast<uchar>(src[1] * alpha + dst[1] * (1 - alpha));
                dst[2] = static_cast<uchar>(src[2] * alpha + dst[2] * (1 - alpha));
            }
        }
    }

    return result;
}

} // namespace faceswap
