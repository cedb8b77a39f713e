#pragma once

#include "face_types.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace faceswap {

// Re-locates a tracked reference face among the detections of a frame.
//
// Each candidate gets an embedding, a position and a size score. With an
// embedding score available the composite is 0.8/0.15/0.05 weighted, without
// one it falls back to 0.7 position + 0.3 size. The best composite wins if it
// clears the threshold; ties keep the earlier candidate.
class IdentityMatcher {
public:
    using DiagnosticObserver = std::function<void(const MatchDiagnostic&)>;

    static constexpr double kEmbeddingWeight = 0.8;
    static constexpr double kPositionWeight = 0.15;
    static constexpr double kSizeWeight = 0.05;
    static constexpr double kDegradedPositionWeight = 0.7;
    static constexpr double kDegradedSizeWeight = 0.3;

    explicit IdentityMatcher(double threshold = 0.4);

    std::optional<int> match(const FaceObservation& reference,
                             const std::vector<FaceObservation>& candidates,
                             const cv::Size& frameSize,
                             long frameIndex = -1,
                             int referenceIndex = 0) const;

    // Same scores as match() without selecting or reporting.
    std::vector<CandidateScore> score(const FaceObservation& reference,
                                      const std::vector<FaceObservation>& candidates,
                                      const cv::Size& frameSize) const;

    // Index of the best candidate clearing the threshold, skipping excluded ones.
    std::optional<MatchResult> select(const std::vector<CandidateScore>& scores,
                                      const std::vector<bool>& excluded = {}) const;

    void report(const MatchDiagnostic& diagnostic) const;

    void setObserver(DiagnosticObserver observer) { m_observer = std::move(observer); }
    double threshold() const { return m_threshold; }

    static CandidateScore scorePair(const FaceObservation& reference,
                                    const FaceObservation& candidate,
                                    const cv::Size& frameSize);
    // Cosine similarity remapped to [0, 1]; empty when either side is unusable.
    static std::optional<double> embeddingSimilarity(const std::vector<float>& a,
                                                     const std::vector<float>& b);

private:
    double m_threshold;
    DiagnosticObserver m_observer;
};

} // namespace faceswap
