#include "reference_selector.hpp"
#include <iostream>

namespace faceswap {

ReferenceSelector::ReferenceSelector(MediaFactory& media, InferenceProviderManager& engine)
    : m_media(media), m_engine(engine) {}

void ReferenceSelector::attachEmbedding(const cv::Mat& image, FaceObservation& face) {
    try {
        face.embedding = m_engine.embed(image, face);
    } catch (const InferenceError& e) {
        if (e.isFatal()) throw;
        std::cerr << "[ReferenceSelector] Warning: no embedding for reference face: " << e.what() << std::endl;
        face.embedding.clear();
    }
}

std::vector<FaceObservation> ReferenceSelector::facesInFrame(const std::string& videoPath, long frameIndex,
                                                             cv::Mat* frameOut) {
    auto source = m_media.openSource(videoPath);

    cv::Mat frame;
    long index = -1;
    while (index < frameIndex) {
        if (!source->read(frame)) {
            throw IOError("Frame " + std::to_string(frameIndex) + " not found in " + videoPath);
        }
        index++;
    }

    auto faces = m_engine.detect(frame, frameIndex);
    for (auto& face : faces) {
        attachEmbedding(frame, face);
    }
    if (frameOut) *frameOut = frame;
    return faces;
}

ReferenceSelection ReferenceSelector::resolve(const SelectionRequest& request,
                                              const std::string& targetVideoPath) {
    ReferenceSelection selection;
    selection.mode = request.mode;

    switch (request.mode) {
        case SelectionMode::AUTO:
            std::cout << "[ReferenceSelector] Auto mode: largest face of every frame" << std::endl;
            return selection;

        case SelectionMode::REFERENCE_IMAGE: {
            cv::Mat image = m_media.readImage(request.referenceImagePath);
            auto faces = m_engine.detect(image);
            if (faces.empty()) {
                throw InitializationError("No face found in reference image " + request.referenceImagePath);
            }
            FaceObservation reference = faces.front();
            attachEmbedding(image, reference);
            std::cout << "[ReferenceSelector] Reference face: center (" << reference.center().x << ", "
                      << reference.center().y << "), area " << reference.area() << std::endl;
            selection.references.push_back(std::move(reference));
            break;
        }

        case SelectionMode::FRAME_FACES: {
            auto faces = facesInFrame(targetVideoPath, request.referenceFrameIndex);
            for (int faceIdx : request.faceIndices) {
                if (faceIdx < 0 || faceIdx >= static_cast<int>(faces.size())) {
                    std::cerr << "[ReferenceSelector] Warning: face " << faceIdx << " not in frame "
                              << request.referenceFrameIndex << " (" << faces.size()
                              << " faces), skipped" << std::endl;
                    continue;
                }
                const FaceObservation& face = faces[faceIdx];
                std::cout << "[ReferenceSelector] Reference face " << faceIdx << ": center ("
                          << face.center().x << ", " << face.center().y << "), area " << face.area() << std::endl;
                selection.references.push_back(face);
            }
            if (selection.references.empty()) {
                throw InitializationError("None of the selected faces exist in frame " +
                                          std::to_string(request.referenceFrameIndex));
            }
            break;
        }
    }

    return selection;
}

std::vector<std::optional<int>> assignReferences(const IdentityMatcher& matcher,
                                                 AssignmentStrategy strategy,
                                                 const std::vector<FaceObservation>& references,
                                                 const std::vector<FaceObservation>& candidates,
                                                 const cv::Size& frameSize,
                                                 long frameIndex) {
    std::vector<std::optional<int>> assignment(references.size());

    if (strategy == AssignmentStrategy::FIRST_COME) {
        for (size_t r = 0; r < references.size(); r++) {
            assignment[r] = matcher.match(references[r], candidates, frameSize, frameIndex,
                                          static_cast<int>(r));
        }
        return assignment;
    }

    std::vector<std::vector<CandidateScore>> scores;
    scores.reserve(references.size());
    for (const auto& reference : references) {
        scores.push_back(matcher.score(reference, candidates, frameSize));
    }

    std::vector<bool> claimed(candidates.size(), false);
    std::vector<bool> done(references.size(), false);

    while (true) {
        int bestRef = -1;
        MatchResult best;
        for (size_t r = 0; r < references.size(); r++) {
            if (done[r]) continue;
            auto m = matcher.select(scores[r], claimed);
            if (m && (bestRef < 0 || m->score > best.score)) {
                bestRef = static_cast<int>(r);
                best = *m;
            }
        }
        if (bestRef < 0) break;

        assignment[bestRef] = best.candidateIndex;
        claimed[best.candidateIndex] = true;
        done[bestRef] = true;
    }

    for (size_t r = 0; r < references.size(); r++) {
        MatchDiagnostic diagnostic;
        diagnostic.frameIndex = frameIndex;
        diagnostic.referenceIndex = static_cast<int>(r);
        diagnostic.scores = scores[r];
        diagnostic.chosen = assignment[r];
        matcher.report(diagnostic);
    }
    return assignment;
}

} // namespace faceswap
