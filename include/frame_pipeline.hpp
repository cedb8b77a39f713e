#pragma once

#include "audio_remuxer.hpp"
#include "gpu_memory_probe.hpp"
#include "identity_matcher.hpp"
#include "pipeline_config.hpp"
#include "provider_health_controller.hpp"
#include "reference_selector.hpp"
#include "video_io.hpp"
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace faceswap {

enum class JobState {
    INIT,
    READY,
    RUNNING,
    COMPLETED,
    CANCELLED,
    FAILED
};

const char* jobStateName(JobState state);

// Invoked synchronously from the worker after every written frame. The
// preview pair is only filled every `previewInterval` frames.
using ProgressObserver = std::function<void(double fraction, long frameIndex, long totalFrames,
                                            const std::string& message,
                                            const cv::Mat& previewOriginal,
                                            const cv::Mat& previewResult)>;

struct PipelineJob {
    std::string sourceFacePath;
    std::string targetVideoPath;
    std::string outputPath;
    SelectionRequest selection;
    std::function<bool()> shouldStop;   // polled once per frame
    ProgressObserver onProgress;
};

struct JobReport {
    JobState state = JobState::INIT;
    long framesRead = 0;
    long framesWritten = 0;
    long swappedFrames = 0;
    long passthroughFrames = 0;
    long degradedFrames = 0;      // an error forced passthrough of a region or the frame
    int temporaryCpuFrames = 0;
    ProviderStatus finalProviderStatus = ProviderStatus::GPU_ACTIVE;
    bool audioRemuxed = false;
    std::string outputPath;
    std::string error;            // set for FAILED jobs
};

class FramePipeline {
public:
    FramePipeline(const PipelineConfig& config,
                  std::shared_ptr<EngineFactory> factory,
                  std::shared_ptr<GpuMemoryProbe> probe,
                  std::shared_ptr<MediaFactory> media,
                  std::shared_ptr<AudioRemuxer> remuxer);

    // Runs one video job to completion on the calling thread. Never throws for
    // job-level failures; they end up in the report as FAILED.
    JobReport run(const PipelineJob& job) const;

    // Runs the job on a dedicated worker thread.
    std::future<JobReport> runAsync(PipelineJob job) const;

    // Swaps the largest face of `target` with the largest face of `source`.
    // Throws FaceSwapError.
    void processImage(const std::string& source, const std::string& target,
                      const std::string& output) const;

    // Faces of one frame of a video, largest first. When `previewPath` is not
    // empty an annotated copy of the frame is written there.
    std::vector<FaceObservation> listFaces(const std::string& videoPath, long frameIndex,
                                           const std::string& previewPath = "") const;

    const PipelineConfig& config() const { return m_config; }

private:
    struct FrameOutcome {
        cv::Mat result;
        bool swapped = false;
        bool degraded = false;
    };

    std::unique_ptr<ProviderHealthController> makeController() const;
    FaceObservation prepareSourceFace(InferenceProviderManager& engine, const cv::Mat& image,
                                      const std::string& path) const;
    FrameOutcome processFrame(ProviderHealthController& controller, const IdentityMatcher& matcher,
                              const FaceObservation& sourceFace, const ReferenceSelection& selection,
                              const cv::Mat& frame, long frameIndex) const;
    bool verifyOutput(const std::string& path) const;
    void finalize(VideoSink& sink, const PipelineJob& job, JobReport& report) const;

    PipelineConfig m_config;
    std::shared_ptr<EngineFactory> m_factory;
    std::shared_ptr<GpuMemoryProbe> m_probe;
    std::shared_ptr<MediaFactory> m_media;
    std::shared_ptr<AudioRemuxer> m_remuxer;
};

// Draws "#i" labelled boxes onto a copy of the frame.
cv::Mat annotateFaces(const cv::Mat& frame, const std::vector<FaceObservation>& faces);

} // namespace faceswap
