#include "identity_matcher.hpp"
#include <cmath>

namespace faceswap {

IdentityMatcher::IdentityMatcher(double threshold) : m_threshold(threshold) {}

std::optional<double> IdentityMatcher::embeddingSimilarity(const std::vector<float>& a,
                                                           const std::vector<float>& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) {
        return std::nullopt;
    }

    double dot = 0.0, normA = 0.0, normB = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return std::nullopt;
    }

    double cosine = dot / (std::sqrt(normA) * std::sqrt(normB));
    cosine = std::max(-1.0, std::min(1.0, cosine));
    return (cosine + 1.0) / 2.0;
}

CandidateScore IdentityMatcher::scorePair(const FaceObservation& reference,
                                          const FaceObservation& candidate,
                                          const cv::Size& frameSize) {
    CandidateScore s;

    auto emb = embeddingSimilarity(reference.embedding, candidate.embedding);
    if (emb) {
        s.embedding = *emb;
        s.embeddingAvailable = true;
    }

    cv::Point2d rc = reference.center();
    cv::Point2d cc = candidate.center();
    double distance = std::hypot(rc.x - cc.x, rc.y - cc.y);
    double halfDiagonal = std::hypot(frameSize.width, frameSize.height) / 2.0;
    s.position = halfDiagonal > 0.0 ? std::max(0.0, 1.0 - distance / halfDiagonal) : 0.0;

    long refArea = reference.area();
    long candArea = candidate.area();
    long maxArea = std::max(refArea, candArea);
    s.size = maxArea > 0 ? static_cast<double>(std::min(refArea, candArea)) / maxArea : 0.0;

    if (s.embeddingAvailable) {
        s.composite = kEmbeddingWeight * s.embedding + kPositionWeight * s.position +
                      kSizeWeight * s.size;
    } else {
        s.composite = kDegradedPositionWeight * s.position + kDegradedSizeWeight * s.size;
    }
    return s;
}

std::vector<CandidateScore> IdentityMatcher::score(const FaceObservation& reference,
                                                   const std::vector<FaceObservation>& candidates,
                                                   const cv::Size& frameSize) const {
    std::vector<CandidateScore> scores;
    scores.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        scores.push_back(scorePair(reference, candidate, frameSize));
    }
    return scores;
}

std::optional<MatchResult> IdentityMatcher::select(const std::vector<CandidateScore>& scores,
                                                   const std::vector<bool>& excluded) const {
    std::optional<MatchResult> best;
    for (size_t i = 0; i < scores.size(); i++) {
        if (i < excluded.size() && excluded[i]) continue;
        double composite = scores[i].composite;
        if (composite < m_threshold) continue;
        // strict comparison keeps the first of equal scores
        if (!best || composite > best->score) {
            best = MatchResult{static_cast<int>(i), composite};
        }
    }
    return best;
}

std::optional<int> IdentityMatcher::match(const FaceObservation& reference,
                                          const std::vector<FaceObservation>& candidates,
                                          const cv::Size& frameSize,
                                          long frameIndex,
                                          int referenceIndex) const {
    MatchDiagnostic diagnostic;
    diagnostic.frameIndex = frameIndex;
    diagnostic.referenceIndex = referenceIndex;
    diagnostic.scores = score(reference, candidates, frameSize);

    auto best = select(diagnostic.scores);
    if (best) diagnostic.chosen = best->candidateIndex;

    report(diagnostic);
    return diagnostic.chosen;
}

void IdentityMatcher::report(const MatchDiagnostic& diagnostic) const {
    if (m_observer) m_observer(diagnostic);
}

} // namespace faceswap
