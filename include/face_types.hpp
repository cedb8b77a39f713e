#pragma once

#include <opencv2/core.hpp>
#include <algorithm>
#include <optional>
#include <vector>

namespace faceswap {

// One detected face in one frame. Box corners are inclusive-exclusive pixel
// coordinates already clamped to the frame.
struct FaceObservation {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;
    float confidence = 0.0f;
    std::vector<cv::Point2f> landmarks;   // eyes, nose, mouth corners (image left first)
    std::vector<float> embedding;         // empty when not computed
    long frameIndex = -1;

    int width() const { return std::max(0, x2 - x1); }
    int height() const { return std::max(0, y2 - y1); }
    long area() const { return static_cast<long>(width()) * height(); }
    cv::Point2d center() const { return cv::Point2d((x1 + x2) / 2.0, (y1 + y2) / 2.0); }
    cv::Rect rect() const { return cv::Rect(x1, y1, width(), height()); }
    bool hasEmbedding() const { return !embedding.empty(); }
};

struct MatchResult {
    int candidateIndex = -1;
    double score = 0.0;
};

struct CandidateScore {
    double embedding = 0.0;
    double position = 0.0;
    double size = 0.0;
    double composite = 0.0;
    bool embeddingAvailable = false;
};

struct MatchDiagnostic {
    long frameIndex = -1;
    int referenceIndex = 0;
    std::vector<CandidateScore> scores;
    std::optional<int> chosen;
};

inline cv::Rect clampRect(const cv::Rect& rect, const cv::Size& size) {
    int x = std::max(0, rect.x);
    int y = std::max(0, rect.y);
    int w = std::min(rect.x + rect.width, size.width) - x;
    int h = std::min(rect.y + rect.height, size.height) - y;
    return cv::Rect(x, y, std::max(0, w), std::max(0, h));
}

// Builds an observation from a (possibly out-of-frame) rectangle.
inline FaceObservation makeObservation(const cv::Rect& box, const cv::Size& frameSize,
                                       float confidence, long frameIndex = -1) {
    cv::Rect r = clampRect(box, frameSize);
    FaceObservation face;
    face.x1 = r.x;
    face.y1 = r.y;
    face.x2 = r.x + r.width;
    face.y2 = r.y + r.height;
    face.confidence = std::clamp(confidence, 0.0f, 1.0f);
    face.frameIndex = frameIndex;
    return face;
}

} // namespace faceswap
