#pragma once

#include "identity_matcher.hpp"
#include "inference_provider_manager.hpp"
#include "pipeline_config.hpp"
#include "video_io.hpp"
#include <optional>
#include <string>
#include <vector>

namespace faceswap {

enum class SelectionMode {
    AUTO,              // largest face of every frame, no continuity
    REFERENCE_IMAGE,   // largest face of a separate image
    FRAME_FACES        // chosen faces of one frame of the target video
};

struct SelectionRequest {
    SelectionMode mode = SelectionMode::AUTO;
    std::string referenceImagePath;
    long referenceFrameIndex = 0;
    std::vector<int> faceIndices;
};

struct ReferenceSelection {
    SelectionMode mode = SelectionMode::AUTO;
    std::vector<FaceObservation> references;

    bool isAuto() const { return mode == SelectionMode::AUTO; }
};

class ReferenceSelector {
public:
    ReferenceSelector(MediaFactory& media, InferenceProviderManager& engine);

    // Throws IOError when the reference media cannot be read and
    // InitializationError when no reference face is found.
    ReferenceSelection resolve(const SelectionRequest& request, const std::string& targetVideoPath);

    // Detects the faces of one frame of a video, with embeddings when available.
    std::vector<FaceObservation> facesInFrame(const std::string& videoPath, long frameIndex,
                                              cv::Mat* frameOut = nullptr);

private:
    void attachEmbedding(const cv::Mat& image, FaceObservation& face);

    MediaFactory& m_media;
    InferenceProviderManager& m_engine;
};

// Picks, for every reference, the candidate it is swapped onto.
//
// FIRST_COME matches each reference on its own, so two references may land
// on the same candidate. GREEDY_EXCLUSIVE repeatedly lets the best remaining
// (reference, candidate) pair claim its candidate.
std::vector<std::optional<int>> assignReferences(const IdentityMatcher& matcher,
                                                 AssignmentStrategy strategy,
                                                 const std::vector<FaceObservation>& references,
                                                 const std::vector<FaceObservation>& candidates,
                                                 const cv::Size& frameSize,
                                                 long frameIndex);

} // namespace faceswap
