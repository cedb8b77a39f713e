#include "face_alignment.hpp"
#include <opencv2/calib3d.hpp>

namespace faceswap {

// ArcFace reference landmarks for a 112x112 crop
static const cv::Point2f kArcFaceTemplate[5] = {
    {38.2946f, 51.6963f},
    {73.5318f, 51.5014f},
    {56.0252f, 71.7366f},
    {41.5493f, 92.3655f},
    {70.7299f, 92.2041f}
};

cv::Mat estimateAlignment(const FaceObservation& face, int outputSize) {
    float scale = outputSize / 112.0f;

    if (face.landmarks.size() == 5) {
        std::vector<cv::Point2f> dst(5);
        for (int i = 0; i < 5; i++) {
            dst[i] = kArcFaceTemplate[i] * scale;
        }
        cv::Mat m = cv::estimateAffinePartial2D(face.landmarks, dst);
        if (!m.empty()) return m;
    }

    // No usable landmarks: stretch the box onto the crop
    cv::Point2f srcPts[3], dstPts[3];
    srcPts[0] = cv::Point2f(face.x1, face.y1);
    srcPts[1] = cv::Point2f(face.x2, face.y1);
    srcPts[2] = cv::Point2f(face.x1, face.y2);

    dstPts[0] = cv::Point2f(0, 0);
    dstPts[1] = cv::Point2f(outputSize, 0);
    dstPts[2] = cv::Point2f(0, outputSize);

    return cv::getAffineTransform(srcPts, dstPts);
}

cv::Mat alignFace(const cv::Mat& image, const FaceObservation& face, int outputSize,
                  cv::Mat* transform) {
    cv::Mat m = estimateAlignment(face, outputSize);
    cv::Mat aligned;
    cv::warpAffine(image, aligned, m, cv::Size(outputSize, outputSize), cv::INTER_LINEAR,
                   cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));
    if (transform) *transform = m;
    return aligned;
}

cv::Mat featherMask(const cv::Mat& mask, int radius) {
    if (radius <= 0) return mask.clone();

    cv::Mat result;
    int kernelSize = radius * 2 + 1;
    cv::GaussianBlur(mask, result, cv::Size(kernelSize, kernelSize), radius / 2.0);

    return result;
}

} // namespace faceswap
