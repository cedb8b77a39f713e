#include "frame_pipeline.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace faceswap {

const char* jobStateName(JobState state) {
    switch (state) {
        case JobState::INIT:      return "INIT";
        case JobState::READY:     return "READY";
        case JobState::RUNNING:   return "RUNNING";
        case JobState::COMPLETED: return "COMPLETED";
        case JobState::CANCELLED: return "CANCELLED";
        case JobState::FAILED:    return "FAILED";
    }
    return "UNKNOWN";
}

cv::Mat annotateFaces(const cv::Mat& frame, const std::vector<FaceObservation>& faces) {
    static const std::vector<cv::Scalar> colors = {
        cv::Scalar(0, 255, 0),    // Green
        cv::Scalar(255, 0, 0),    // Blue
        cv::Scalar(0, 0, 255),    // Red
        cv::Scalar(255, 255, 0),  // Cyan
        cv::Scalar(255, 0, 255),  // Magenta
        cv::Scalar(0, 255, 255),  // Yellow
    };

    cv::Mat result = frame.clone();
    for (size_t i = 0; i < faces.size(); i++) {
        const cv::Scalar& color = colors[i % colors.size()];
        cv::Rect box = faces[i].rect();

        cv::rectangle(result, box, color, 3);

        std::string label = "#" + std::to_string(i);
        int baseline = 0;
        cv::Size textSize = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 1.0, 2, &baseline);
        int top = std::max(0, box.y - textSize.height - 10);
        cv::rectangle(result,
                      cv::Point(box.x, top),
                      cv::Point(box.x + textSize.width + 10, top + textSize.height + 10),
                      color, -1);
        cv::putText(result, label, cv::Point(box.x + 5, top + textSize.height + 5),
                    cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(255, 255, 255), 2);

        for (const auto& pt : faces[i].landmarks) {
            cv::circle(result, pt, 2, color, -1);
        }
    }
    return result;
}

FramePipeline::FramePipeline(const PipelineConfig& config,
                             std::shared_ptr<EngineFactory> factory,
                             std::shared_ptr<GpuMemoryProbe> probe,
                             std::shared_ptr<MediaFactory> media,
                             std::shared_ptr<AudioRemuxer> remuxer)
    : m_config(config),
      m_factory(std::move(factory)),
      m_probe(std::move(probe)),
      m_media(std::move(media)),
      m_remuxer(std::move(remuxer)) {
    if (!m_factory || !m_media) {
        throw std::invalid_argument("FramePipeline needs an engine factory and a media factory");
    }
}

std::unique_ptr<ProviderHealthController> FramePipeline::makeController() const {
    auto controller = std::make_unique<ProviderHealthController>(m_config, m_factory, m_probe);
    controller->initialize();
    return controller;
}

FaceObservation FramePipeline::prepareSourceFace(InferenceProviderManager& engine, const cv::Mat& image,
                                                 const std::string& path) const {
    auto faces = engine.detect(image);
    if (faces.empty()) {
        throw InitializationError("No face found in source image " + path);
    }

    FaceObservation sourceFace = faces.front();
    sourceFace.embedding = engine.embed(image, sourceFace);
    if (!sourceFace.hasEmbedding()) {
        throw InitializationError("Source face has no embedding; the recognition model is required");
    }

    std::cout << "[FramePipeline] Source face: " << sourceFace.width() << "x" << sourceFace.height()
              << " (" << faces.size() << " face(s) in image)" << std::endl;
    return sourceFace;
}

FramePipeline::FrameOutcome FramePipeline::processFrame(ProviderHealthController& controller,
                                                        const IdentityMatcher& matcher,
                                                        const FaceObservation& sourceFace,
                                                        const ReferenceSelection& selection,
                                                        const cv::Mat& frame,
                                                        long frameIndex) const {
    FrameOutcome outcome;
    outcome.result = frame;

    InferenceProviderManager& engine = controller.checkBeforeFrame(frameIndex);

    // One inference error ends the frame's inference; the rest of it is passthrough
    auto fail = [&](const InferenceError& e) {
        if (e.isFatal()) throw e;
        std::cerr << "[FramePipeline] frame " << frameIndex << ": " << e.what()
                  << " (" << causeName(e.cause()) << ")" << std::endl;
        controller.reportError(e);
        outcome.degraded = true;
    };

    std::vector<FaceObservation> candidates;
    try {
        candidates = engine.detect(frame, frameIndex);
    } catch (const DetectionError& e) {
        std::cerr << "[FramePipeline] frame " << frameIndex << ": detection failed: " << e.what() << std::endl;
        outcome.degraded = true;
        return outcome;
    } catch (const InferenceError& e) {
        fail(e);
        return outcome;
    }

    if (candidates.empty()) {
        controller.reportSuccess();
        return outcome;
    }

    std::vector<int> targets;
    if (selection.isAuto()) {
        targets.push_back(0);
    } else {
        bool wantEmbeddings = std::any_of(selection.references.begin(), selection.references.end(),
                                          [](const FaceObservation& f) { return f.hasEmbedding(); });
        if (wantEmbeddings && engine.hasEmbedder()) {
            try {
                for (auto& candidate : candidates) {
                    candidate.embedding = engine.embed(frame, candidate);
                }
            } catch (const InferenceError& e) {
                fail(e);
                return outcome;
            }
        }

        auto assignment = assignReferences(matcher, m_config.assignment, selection.references,
                                           candidates, frame.size(), frameIndex);
        for (const auto& chosen : assignment) {
            if (chosen) targets.push_back(*chosen);
        }
    }

    cv::Mat working = frame;
    for (int idx : targets) {
        try {
            working = engine.swap(sourceFace, working, candidates[idx]);
            outcome.swapped = true;
        } catch (const InferenceError& e) {
            fail(e);
            break;
        }
    }
    outcome.result = working;

    if (!outcome.degraded) {
        controller.reportSuccess();
    }
    return outcome;
}

bool FramePipeline::verifyOutput(const std::string& path) const {
    int attempts = std::max(1, m_config.outputVerifyRetries);
    for (int attempt = 1; attempt <= attempts; attempt++) {
        std::error_code ec;
        if (fs::exists(path, ec) && fs::file_size(path, ec) > 0 && !ec) {
            return true;
        }
        if (attempt < attempts) {
            std::this_thread::sleep_for(m_config.outputVerifyDelay);
        }
    }
    return false;
}

void FramePipeline::finalize(VideoSink& sink, const PipelineJob& job, JobReport& report) const {
    sink.close();

    if (report.state == JobState::FAILED) return;

    if (!verifyOutput(sink.path())) {
        report.state = JobState::FAILED;
        report.error = "Output video " + sink.path() + " is missing or empty";
        return;
    }

    if (!m_remuxer) return;

    try {
        if (m_remuxer->hasAudioTrack(job.targetVideoPath)) {
            report.outputPath = m_remuxer->remux(job.targetVideoPath, sink.path());
            report.audioRemuxed = true;
        } else {
            std::cout << "[FramePipeline] Target has no audio track" << std::endl;
        }
    } catch (const RemuxError& e) {
        std::cerr << "[FramePipeline] Warning: audio not merged, keeping video-only output: "
                  << e.what() << std::endl;
    }
}

JobReport FramePipeline::run(const PipelineJob& job) const {
    JobReport report;
    report.outputPath = job.outputPath;

    std::unique_ptr<ProviderHealthController> controller;
    std::unique_ptr<VideoSource> source;
    std::unique_ptr<VideoSink> sink;
    FaceObservation sourceFace;
    ReferenceSelection selection;
    cv::Mat firstFrame;
    bool haveFirstFrame = false;

    IdentityMatcher matcher(m_config.matchThreshold);
    if (m_config.verbose) {
        matcher.setObserver([](const MatchDiagnostic& d) {
            std::ostringstream line;
            line << std::fixed << std::setprecision(3);
            line << "[IdentityMatcher] frame " << d.frameIndex << " ref " << d.referenceIndex << ":";
            for (size_t i = 0; i < d.scores.size(); i++) {
                const auto& s = d.scores[i];
                line << " #" << i << "=" << s.composite;
                if (s.embeddingAvailable) line << "(emb " << s.embedding << ")";
            }
            line << " -> " << (d.chosen ? "#" + std::to_string(*d.chosen) : std::string("none"));
            std::cout << line.str() << std::endl;
        });
    }

    try {
        controller = makeController();
        source = m_media->openSource(job.targetVideoPath);

        cv::Mat sourceImage = m_media->readImage(job.sourceFacePath);
        sourceFace = prepareSourceFace(controller->primary(), sourceImage, job.sourceFacePath);

        ReferenceSelector selector(*m_media, controller->primary());
        selection = selector.resolve(job.selection, job.targetVideoPath);

        // The writer takes the decoded size; container metadata can disagree with it
        haveFirstFrame = source->read(firstFrame);
        const VideoInfo& info = source->info();
        cv::Size frameSize = haveFirstFrame ? firstFrame.size() : cv::Size(info.width, info.height);
        if (haveFirstFrame && frameSize != cv::Size(info.width, info.height)) {
            std::cout << "[FramePipeline] Container reports " << info.width << "x" << info.height
                      << ", decoded frames are " << frameSize.width << "x" << frameSize.height << std::endl;
        }
        sink = m_media->openSink(job.outputPath, info.fps, frameSize);
    } catch (const FaceSwapError& e) {
        report.state = JobState::FAILED;
        report.error = e.what();
        std::cerr << "[FramePipeline] Job failed to start: " << e.what() << std::endl;
        return report;
    }

    report.state = JobState::READY;
    const VideoInfo& info = source->info();
    const long totalFrames = info.frameCount;
    std::cout << "[FramePipeline] Video: " << info.width << "x" << info.height << " @ " << info.fps
              << " FPS, " << totalFrames << " frames, provider "
              << providerName(controller->primary().activeProvider()) << ", "
              << (selection.isAuto() ? std::string("auto") :
                  std::to_string(selection.references.size()) + " reference face(s)")
              << std::endl;

    report.state = JobState::RUNNING;
    auto startTime = std::chrono::steady_clock::now();
    int previewInterval = std::max(1, m_config.previewInterval);
    int logInterval = std::max(1, m_config.logInterval);

    long frameIndex = 0;
    bool cancelled = false;

    try {
        while (true) {
            if (job.shouldStop && job.shouldStop()) {
                cancelled = true;
                std::cout << "[FramePipeline] Stop requested at frame " << frameIndex << std::endl;
                break;
            }

            // Fresh buffer per frame: previews handed to the observer must stay valid
            cv::Mat frame;
            if (frameIndex == 0) {
                if (!haveFirstFrame) break;
                frame = firstFrame;
                firstFrame.release();
            } else {
                try {
                    if (!source->read(frame)) break;
                } catch (const IOError& e) {
                    std::cerr << "[FramePipeline] Read failed at frame " << frameIndex << ", ending early: "
                              << e.what() << std::endl;
                    break;
                }
            }
            report.framesRead++;

            FrameOutcome outcome = processFrame(*controller, matcher, sourceFace, selection, frame, frameIndex);

            sink->write(outcome.result);
            report.framesWritten++;
            if (outcome.swapped) {
                report.swappedFrames++;
            } else {
                report.passthroughFrames++;
            }
            if (outcome.degraded) report.degradedFrames++;

            if (job.onProgress) {
                double fraction = totalFrames > 0
                    ? std::min(1.0, static_cast<double>(frameIndex + 1) / totalFrames) : 0.0;
                std::string message = "Frame " + std::to_string(frameIndex + 1) + "/" +
                                      std::to_string(totalFrames);
                bool withPreview = frameIndex % previewInterval == 0;
                try {
                    job.onProgress(fraction, frameIndex, totalFrames, message,
                                   withPreview ? frame : cv::Mat(),
                                   withPreview ? outcome.result : cv::Mat());
                } catch (const std::exception& e) {
                    std::cerr << "[FramePipeline] Progress observer failed at frame " << frameIndex << ": "
                              << e.what() << std::endl;
                }
            }

            frameIndex++;
            if (frameIndex % logInterval == 0) {
                int percent = totalFrames > 0 ? static_cast<int>(100.0 * frameIndex / totalFrames) : 0;
                std::cout << "[FramePipeline] Progress: " << frameIndex << "/" << totalFrames
                          << " (" << percent << "%), swapped " << report.swappedFrames
                          << ", provider " << providerStatusName(controller->state().status) << std::endl;
            }
        }
    } catch (const FaceSwapError& e) {
        report.state = JobState::FAILED;
        report.error = e.what();
        std::cerr << "[FramePipeline] Aborting at frame " << frameIndex << ": " << e.what() << std::endl;
    }

    if (report.state != JobState::FAILED) {
        report.state = cancelled ? JobState::CANCELLED : JobState::COMPLETED;
    }

    finalize(*sink, job, report);

    report.temporaryCpuFrames = controller->temporaryFallbackFrames();
    report.finalProviderStatus = controller->state().status;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    std::cout << "[FramePipeline] " << jobStateName(report.state) << ": " << report.framesWritten
              << " frames in " << elapsed.count() / 1000.0 << "s, swapped " << report.swappedFrames
              << ", passthrough " << report.passthroughFrames << ", degraded " << report.degradedFrames
              << ", temporary CPU " << report.temporaryCpuFrames << ", provider "
              << providerStatusName(report.finalProviderStatus)
              << (report.audioRemuxed ? ", audio merged" : "") << " -> " << report.outputPath << std::endl;
    if (!report.error.empty()) {
        std::cerr << "[FramePipeline] Error: " << report.error << std::endl;
    }
    return report;
}

std::future<JobReport> FramePipeline::runAsync(PipelineJob job) const {
    return std::async(std::launch::async, [pipeline = *this, job = std::move(job)]() {
        return pipeline.run(job);
    });
}

void FramePipeline::processImage(const std::string& source, const std::string& target,
                                 const std::string& output) const {
    auto controller = makeController();
    InferenceProviderManager& engine = controller->primary();

    cv::Mat sourceImage = m_media->readImage(source);
    cv::Mat targetImage = m_media->readImage(target);
    FaceObservation sourceFace = prepareSourceFace(engine, sourceImage, source);

    auto faces = engine.detect(targetImage);
    if (faces.empty()) {
        throw DetectionError("No face found in target image " + target);
    }

    cv::Mat result = engine.swap(sourceFace, targetImage, faces.front());
    m_media->writeImage(output, result);
    std::cout << "[FramePipeline] Image saved: " << output << std::endl;
}

std::vector<FaceObservation> FramePipeline::listFaces(const std::string& videoPath, long frameIndex,
                                                      const std::string& previewPath) const {
    auto controller = makeController();
    ReferenceSelector selector(*m_media, controller->primary());

    cv::Mat frame;
    auto faces = selector.facesInFrame(videoPath, frameIndex, &frame);

    std::cout << "[FramePipeline] Frame " << frameIndex << ": " << faces.size() << " face(s)" << std::endl;
    for (size_t i = 0; i < faces.size(); i++) {
        const auto& face = faces[i];
        std::ostringstream confidence;
        confidence << std::fixed << std::setprecision(2) << face.confidence;
        std::cout << "  #" << i << ": box (" << face.x1 << ", " << face.y1 << ") - (" << face.x2 << ", "
                  << face.y2 << "), confidence " << confidence.str() << ", area " << face.area() << std::endl;
    }

    if (!previewPath.empty()) {
        m_media->writeImage(previewPath, annotateFaces(frame, faces));
        std::cout << "[FramePipeline] Preview saved: " << previewPath << std::endl;
    }
    return faces;
}

} // namespace faceswap
