#pragma once

#include "face_types.hpp"
#include <opencv2/imgproc.hpp>

namespace faceswap {

// Similarity transform mapping the face onto the ArcFace 112x112 template,
// scaled to `outputSize`. Falls back to a plain box fit without landmarks.
cv::Mat estimateAlignment(const FaceObservation& face, int outputSize);

cv::Mat alignFace(const cv::Mat& image, const FaceObservation& face, int outputSize,
                  cv::Mat* transform = nullptr);

// Soft-edged mask used when pasting an aligned crop back into a frame.
cv::Mat featherMask(const cv::Mat& mask, int radius);

} // namespace faceswap
