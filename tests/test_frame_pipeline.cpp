#include "frame_pipeline.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>

namespace faceswap {
namespace testing {

namespace {
    const std::vector<float> kAlice = {1.0f, 0.0f, 0.0f};
    const std::vector<float> kBob = {0.0f, 1.0f, 0.0f};

    bool sameImage(const cv::Mat& a, const cv::Mat& b) {
        return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
    }
}

class FramePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory = std::make_shared<FakeEngineFactory>();
        probe = std::make_shared<FakeMemoryProbe>();
        media = std::make_shared<FakeMediaFactory>();
        remuxer = std::make_shared<FakeRemuxer>();

        factory->state->facesByFrame[kSourceImageIndex] = {makeFace(20, 20, 80, 80)};
        factory->state->defaultFaces = {targetFace};

        media->images["source.jpg"] = makeFrame(kSourceImageIndex);
        media->videos["target.mp4"] = 30;

        config.outputVerifyDelay = std::chrono::milliseconds(1);

        job.sourceFacePath = "source.jpg";
        job.targetVideoPath = "target.mp4";
        job.outputPath = dir.file("out.mp4");
    }

    FramePipeline pipeline() const {
        return FramePipeline(config, factory, probe, media, remuxer);
    }

    const FaceObservation targetFace = makeFace(100, 60, 160, 120);

    TempDir dir;
    PipelineConfig config;
    PipelineJob job;
    std::shared_ptr<FakeEngineFactory> factory;
    std::shared_ptr<FakeMemoryProbe> probe;
    std::shared_ptr<FakeMediaFactory> media;
    std::shared_ptr<FakeRemuxer> remuxer;
};

TEST_F(FramePipelineTest, WritesEveryFrameInOrder) {
    JobReport report = pipeline().run(job);

    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(report.framesRead, 30);
    EXPECT_EQ(report.framesWritten, 30);
    EXPECT_EQ(report.swappedFrames, 30);
    EXPECT_EQ(report.degradedFrames, 0);
    ASSERT_TRUE(media->sink);
    ASSERT_EQ(media->sink->frameIndices.size(), 30u);
    for (long i = 0; i < 30; i++) {
        EXPECT_EQ(media->sink->frameIndices[i], i);
        EXPECT_TRUE(isSwappedAt(media->sink->frames[i], targetFace));
    }
    EXPECT_TRUE(media->sink->closed);
}

TEST_F(FramePipelineTest, FramesWithoutFacesPassThrough) {
    factory->state->defaultFaces.clear();
    media->videos["target.mp4"] = 12;

    JobReport report = pipeline().run(job);

    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(report.swappedFrames, 0);
    EXPECT_EQ(report.passthroughFrames, 12);
    EXPECT_EQ(report.degradedFrames, 0);
    ASSERT_EQ(media->sink->frames.size(), 12u);
    for (long i = 0; i < 12; i++) {
        EXPECT_TRUE(sameImage(media->sink->frames[i], makeFrame(i))) << "frame " << i;
    }
}

TEST_F(FramePipelineTest, CancellationKeepsWrittenPrefixAndStillRemuxes) {
    media->videos["target.mp4"] = 100;
    job.shouldStop = [this]() { return media->sink && media->sink->frameIndices.size() >= 50; };

    JobReport report = pipeline().run(job);

    EXPECT_EQ(report.state, JobState::CANCELLED);
    EXPECT_EQ(report.framesWritten, 50);
    ASSERT_EQ(media->sink->frameIndices.size(), 50u);
    EXPECT_EQ(media->sink->frameIndices.front(), 0);
    EXPECT_EQ(media->sink->frameIndices.back(), 49);
    EXPECT_EQ(remuxer->remuxCalls, 1);
    EXPECT_EQ(remuxer->lastOriginal, "target.mp4");
    EXPECT_EQ(remuxer->lastProcessed, job.outputPath);
    EXPECT_TRUE(report.audioRemuxed);
}

TEST_F(FramePipelineTest, ReportsProgressForEveryFrame) {
    config.previewInterval = 5;
    media->videos["target.mp4"] = 10;

    std::vector<long> indices;
    std::vector<double> fractions;
    int previews = 0;
    job.onProgress = [&](double fraction, long frameIndex, long total, const std::string& message,
                         const cv::Mat& original, const cv::Mat& result) {
        EXPECT_EQ(total, 10);
        EXPECT_FALSE(message.empty());
        indices.push_back(frameIndex);
        fractions.push_back(fraction);
        if (!original.empty()) {
            previews++;
            EXPECT_FALSE(result.empty());
            EXPECT_EQ(frameIndexOf(original), frameIndex);
        }
    };

    pipeline().run(job);

    ASSERT_EQ(indices.size(), 10u);
    for (long i = 0; i < 10; i++) EXPECT_EQ(indices[i], i);
    EXPECT_DOUBLE_EQ(fractions.back(), 1.0);
    EXPECT_TRUE(std::is_sorted(fractions.begin(), fractions.end()));
    EXPECT_EQ(previews, 2);
}

TEST_F(FramePipelineTest, PreviewsStayValidAfterLaterReads) {
    // Passthrough frames hand the decoded buffer itself to the observer
    factory->state->defaultFaces.clear();
    media->reuseReadBuffer = true;
    media->videos["target.mp4"] = 6;

    std::vector<cv::Mat> originals;
    std::vector<cv::Mat> results;
    job.onProgress = [&](double, long, long, const std::string&, const cv::Mat& original,
                         const cv::Mat& result) {
        originals.push_back(original);
        results.push_back(result);
    };

    JobReport report = pipeline().run(job);

    EXPECT_EQ(report.state, JobState::COMPLETED);
    ASSERT_EQ(originals.size(), 6u);
    for (long i = 0; i < 6; i++) {
        EXPECT_EQ(frameIndexOf(originals[i]), i);
        EXPECT_EQ(frameIndexOf(results[i]), i);
    }
}

TEST_F(FramePipelineTest, ThrowingObserverDoesNotStopTheJob) {
    int calls = 0;
    job.onProgress = [&](double, long, long, const std::string&, const cv::Mat&, const cv::Mat&) {
        calls++;
        throw std::runtime_error("preview window closed");
    };

    JobReport report;
    EXPECT_NO_THROW(report = pipeline().run(job));

    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(report.framesWritten, 30);
    EXPECT_EQ(calls, 30);
    EXPECT_TRUE(media->sink->closed);
    EXPECT_EQ(remuxer->remuxCalls, 1);
}

TEST_F(FramePipelineTest, OutputUsesDecodedFrameSize) {
    // Portrait clip whose container header still says landscape
    const cv::Size portrait(kFrameHeight, kFrameWidth);
    media->decodedSize = portrait;
    media->videos["target.mp4"] = 8;

    JobReport report = pipeline().run(job);

    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(report.framesRead, 8);
    ASSERT_TRUE(media->sink);
    EXPECT_EQ(media->sink->frameSize, portrait);
    ASSERT_EQ(media->sink->frames.size(), 8u);
    for (long i = 0; i < 8; i++) {
        EXPECT_EQ(media->sink->frameIndices[i], i);
        EXPECT_EQ(media->sink->frames[i].size(), portrait);
    }
}

TEST_F(FramePipelineTest, EmptyOutputFailsAfterRetries) {
    media->emptyOutput = true;
    config.outputVerifyRetries = 4;
    config.outputVerifyDelay = std::chrono::milliseconds(20);

    auto start = std::chrono::steady_clock::now();
    JobReport report = pipeline().run(job);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(report.state, JobState::FAILED);
    EXPECT_FALSE(report.error.empty());
    EXPECT_EQ(report.framesWritten, 30);
    EXPECT_TRUE(media->sink->closed);
    EXPECT_EQ(remuxer->remuxCalls, 0);
    EXPECT_FALSE(report.audioRemuxed);
    // Four checks leave three waits between them
    EXPECT_GE(elapsed, std::chrono::milliseconds(60));
}

TEST_F(FramePipelineTest, StartFailuresEndFailedWithoutOutput) {
    PipelineJob missingImage = job;
    missingImage.sourceFacePath = "nobody.jpg";
    JobReport report = pipeline().run(missingImage);
    EXPECT_EQ(report.state, JobState::FAILED);
    EXPECT_FALSE(report.error.empty());
    EXPECT_FALSE(media->sink);

    PipelineJob missingVideo = job;
    missingVideo.targetVideoPath = "missing.mp4";
    EXPECT_EQ(pipeline().run(missingVideo).state, JobState::FAILED);

    factory->state->facesByFrame[kSourceImageIndex].clear();
    EXPECT_EQ(pipeline().run(job).state, JobState::FAILED);

    EXPECT_FALSE(media->sink);
    EXPECT_EQ(remuxer->remuxCalls, 0);
}

TEST_F(FramePipelineTest, SourceFaceNeedsAnEmbedding) {
    factory->state->embedderAvailable = false;
    JobReport report = pipeline().run(job);
    EXPECT_EQ(report.state, JobState::FAILED);
}

TEST_F(FramePipelineTest, NoUsableProviderFails) {
    factory->state->loadFailures = {Provider::CUDA, Provider::CPU};
    EXPECT_EQ(pipeline().run(job).state, JobState::FAILED);
}

TEST_F(FramePipelineTest, UnwritableOutputFails) {
    media->failSink = true;
    JobReport report = pipeline().run(job);
    EXPECT_EQ(report.state, JobState::FAILED);
    EXPECT_EQ(report.framesRead, 0);
}

TEST_F(FramePipelineTest, UnresolvableReferencesFail) {
    job.selection.mode = SelectionMode::FRAME_FACES;
    job.selection.referenceFrameIndex = 0;
    job.selection.faceIndices = {4};
    EXPECT_EQ(pipeline().run(job).state, JobState::FAILED);
}

TEST_F(FramePipelineTest, ReadFailureEndsJobEarly) {
    media->failReadAt = 7;
    JobReport report = pipeline().run(job);
    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(report.framesWritten, 7);
}

TEST_F(FramePipelineTest, RepeatedGpuErrorsPassThroughThenMoveToCpu) {
    media->videos["target.mp4"] = 12;
    factory->state->onCall = [](const EngineCall& call) {
        if (call.operation == "swap" && call.provider == Provider::CUDA && call.frame >= 3) {
            throw std::runtime_error("onnx tensor mismatch");
        }
    };

    JobReport report = pipeline().run(job);

    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(report.framesWritten, 12);
    EXPECT_EQ(report.degradedFrames, 5);
    EXPECT_EQ(report.swappedFrames, 7);
    EXPECT_EQ(report.finalProviderStatus, ProviderStatus::CPU_FALLBACK_PERMANENT);

    for (long i = 3; i <= 7; i++) {
        EXPECT_TRUE(sameImage(media->sink->frames[i], makeFrame(i))) << "frame " << i;
    }
    for (long i = 8; i < 12; i++) {
        EXPECT_EQ(factory->state->providerFor("swap", i), std::optional<Provider>(Provider::CPU));
        EXPECT_TRUE(isSwappedAt(media->sink->frames[i], targetFace));
    }
}

TEST_F(FramePipelineTest, FatalErrorFailsAfterClosingOutput) {
    factory->state->onCall = [](const EngineCall& call) {
        if (call.operation == "detect" && call.frame == 4) {
            throw cv::Exception(cv::Error::StsNotImplemented, "unsupported layer", "forward", "net.cpp", 1);
        }
    };

    JobReport report = pipeline().run(job);

    EXPECT_EQ(report.state, JobState::FAILED);
    EXPECT_EQ(report.framesWritten, 4);
    EXPECT_FALSE(report.error.empty());
    EXPECT_TRUE(media->sink->closed);
    EXPECT_EQ(remuxer->remuxCalls, 0);
}

TEST_F(FramePipelineTest, RemuxFailureKeepsVideoOnlyOutput) {
    remuxer->fail = true;
    JobReport report = pipeline().run(job);
    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_FALSE(report.audioRemuxed);
    EXPECT_EQ(report.outputPath, job.outputPath);
    EXPECT_EQ(remuxer->remuxCalls, 1);
}

TEST_F(FramePipelineTest, SilentSourceSkipsRemux) {
    remuxer->hasAudio = false;
    JobReport report = pipeline().run(job);
    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(remuxer->remuxCalls, 0);
}

TEST_F(FramePipelineTest, OverLimitFrameIsServedByCpu) {
    probe->script = {FakeMemoryProbe::percent(95.0), FakeMemoryProbe::percent(50.0)};

    JobReport report = pipeline().run(job);

    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(report.temporaryCpuFrames, 1);
    EXPECT_EQ(factory->state->providerFor("swap", 0), std::optional<Provider>(Provider::CPU));
    EXPECT_EQ(factory->state->providerFor("swap", 1), std::optional<Provider>(Provider::CUDA));
    EXPECT_EQ(factory->state->providerFor("swap", 10), std::optional<Provider>(Provider::CUDA));
    EXPECT_EQ(report.swappedFrames, 30);
}

TEST_F(FramePipelineTest, TracksChosenFaceWhenPeopleSwapPlaces) {
    // Alice is 60x60, Bob 50x50; identity follows the box size
    factory->state->embedFn = [](const FaceObservation& face) {
        return face.area() == 3600 ? kAlice : kBob;
    };
    const FaceObservation aliceLeft = makeFace(40, 60, 100, 120);
    const FaceObservation bobRight = makeFace(200, 60, 250, 110);
    const FaceObservation aliceRight = makeFace(200, 60, 260, 120);
    const FaceObservation bobLeft = makeFace(40, 60, 90, 110);

    media->videos["target.mp4"] = 20;
    for (long i = 0; i < 20; i++) {
        factory->state->facesByFrame[i] = i < 10 ? std::vector<FaceObservation>{aliceLeft, bobRight}
                                                 : std::vector<FaceObservation>{bobLeft, aliceRight};
    }

    job.selection.mode = SelectionMode::FRAME_FACES;
    job.selection.referenceFrameIndex = 0;
    job.selection.faceIndices = {1};   // Bob

    JobReport report = pipeline().run(job);
    ASSERT_EQ(report.state, JobState::COMPLETED);
    ASSERT_EQ(media->sink->frames.size(), 20u);

    for (long i = 0; i < 20; i++) {
        const cv::Mat& out = media->sink->frames[i];
        const FaceObservation& bob = i < 10 ? bobRight : bobLeft;
        const FaceObservation& alice = i < 10 ? aliceLeft : aliceRight;
        EXPECT_TRUE(isSwappedAt(out, bob)) << "frame " << i;
        EXPECT_FALSE(isSwappedAt(out, alice)) << "frame " << i;
    }
}

TEST_F(FramePipelineTest, UnmatchedReferenceLeavesFrameUntouched) {
    factory->state->embedFn = [](const FaceObservation& face) {
        return face.x1 < 50 ? kAlice : std::vector<float>{-1.0f, 0.0f, 0.0f};
    };
    media->images["ref.jpg"] = makeFrame(kReferenceImageIndex);
    factory->state->facesByFrame[kReferenceImageIndex] = {makeFace(20, 20, 60, 60)};   // Alice
    factory->state->defaultFaces = {makeFace(250, 170, 310, 230)};                     // Bob, far away
    media->videos["target.mp4"] = 5;

    job.selection.mode = SelectionMode::REFERENCE_IMAGE;
    job.selection.referenceImagePath = "ref.jpg";

    JobReport report = pipeline().run(job);
    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(report.swappedFrames, 0);
    EXPECT_EQ(report.passthroughFrames, 5);
}

TEST_F(FramePipelineTest, GreedyStrategySwapsEachFaceOnce) {
    config.assignment = AssignmentStrategy::GREEDY_EXCLUSIVE;
    factory->state->embedFn = [](const FaceObservation&) { return kAlice; };
    const FaceObservation left = makeFace(40, 60, 100, 120);
    const FaceObservation right = makeFace(180, 60, 240, 120);
    factory->state->defaultFaces = {left, right};
    media->videos["target.mp4"] = 3;

    job.selection.mode = SelectionMode::FRAME_FACES;
    job.selection.faceIndices = {0, 0};

    JobReport report = pipeline().run(job);
    ASSERT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(factory->state->count("swap", Provider::CUDA), 6);
    for (const auto& out : media->sink->frames) {
        EXPECT_TRUE(isSwappedAt(out, left));
        EXPECT_TRUE(isSwappedAt(out, right));
    }
}

TEST_F(FramePipelineTest, RunAsyncCompletesOnWorker) {
    FramePipeline worker = pipeline();
    auto future = worker.runAsync(job);
    JobReport report = future.get();
    EXPECT_EQ(report.state, JobState::COMPLETED);
    EXPECT_EQ(report.framesWritten, 30);
}

TEST_F(FramePipelineTest, ProcessImageSwapsLargestFace) {
    media->images["target.jpg"] = makeFrame(500);
    const FaceObservation small = makeFace(10, 10, 40, 40);
    const FaceObservation large = makeFace(120, 60, 200, 140);
    factory->state->facesByFrame[500] = {small, large};

    pipeline().processImage("source.jpg", "target.jpg", "out.jpg");

    ASSERT_EQ(media->written.count("out.jpg"), 1u);
    EXPECT_TRUE(isSwappedAt(media->written["out.jpg"], large));
    EXPECT_FALSE(isSwappedAt(media->written["out.jpg"], small));

    factory->state->facesByFrame[500].clear();
    EXPECT_THROW(pipeline().processImage("source.jpg", "target.jpg", "out.jpg"), DetectionError);
}

TEST_F(FramePipelineTest, ListFacesWritesAnnotatedPreview) {
    factory->state->facesByFrame[3] = {makeFace(10, 40, 40, 70), makeFace(120, 60, 200, 140)};

    auto faces = pipeline().listFaces("target.mp4", 3, "faces.jpg");

    ASSERT_EQ(faces.size(), 2u);
    EXPECT_EQ(faces[0].x1, 120);
    EXPECT_TRUE(faces[0].hasEmbedding());
    ASSERT_EQ(media->written.count("faces.jpg"), 1u);
    EXPECT_FALSE(sameImage(media->written["faces.jpg"], makeFrame(3)));
}

} // namespace testing
} // namespace faceswap
