#include "inference_provider_manager.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

namespace faceswap {
namespace testing {

class InferenceProviderManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory = std::make_shared<FakeEngineFactory>();
        factory->state->defaultFaces = {
            makeFace(20, 20, 60, 60),      // 1600
            makeFace(100, 40, 200, 140),   // 10000
            makeFace(220, 30, 280, 90),    // 3600
        };
    }

    std::shared_ptr<FakeEngineFactory> factory;
};

TEST_F(InferenceProviderManagerTest, UsesFirstWorkingProvider) {
    InferenceProviderManager manager(factory);
    EXPECT_FALSE(manager.isInitialized());

    manager.initialize({Provider::CUDA, Provider::CPU});
    EXPECT_TRUE(manager.isInitialized());
    EXPECT_EQ(manager.activeProvider(), Provider::CUDA);
    EXPECT_TRUE(manager.isGpu());
    EXPECT_TRUE(manager.hasEmbedder());
}

TEST_F(InferenceProviderManagerTest, SkipsUnsupportedAndFailingProviders) {
    factory->state->unsupported = {Provider::CUDA};
    factory->state->loadFailures = {Provider::DIRECTML};

    InferenceProviderManager manager(factory);
    manager.initialize({Provider::CUDA, Provider::DIRECTML, Provider::CPU});
    EXPECT_EQ(manager.activeProvider(), Provider::CPU);
    EXPECT_FALSE(manager.isGpu());
}

TEST_F(InferenceProviderManagerTest, FailsWhenNoProviderWorks) {
    factory->state->loadFailures = {Provider::CUDA, Provider::CPU};

    InferenceProviderManager manager(factory);
    EXPECT_THROW(manager.initialize({Provider::CUDA, Provider::CPU}), InitializationError);
    EXPECT_FALSE(manager.isInitialized());
    EXPECT_THROW(manager.initialize({}), InitializationError);
}

TEST_F(InferenceProviderManagerTest, MissingEmbedderIsNotFatal) {
    factory->state->embedderAvailable = false;

    InferenceProviderManager manager(factory);
    manager.initialize({Provider::CPU});
    EXPECT_FALSE(manager.hasEmbedder());
    EXPECT_TRUE(manager.embed(makeFrame(0), makeFace(20, 20, 60, 60)).empty());
}

TEST_F(InferenceProviderManagerTest, ReinitializeSwitchesProvider) {
    InferenceProviderManager manager(factory);
    manager.initialize({Provider::CUDA});
    manager.reinitialize({Provider::CPU});

    EXPECT_EQ(manager.activeProvider(), Provider::CPU);
    manager.detect(makeFrame(3), 3);
    EXPECT_EQ(factory->state->providerFor("detect", 3), std::optional<Provider>(Provider::CPU));
}

TEST_F(InferenceProviderManagerTest, DetectSortsByAreaAndStampsFrameIndex) {
    InferenceProviderManager manager(factory);
    manager.initialize({Provider::CPU});

    auto faces = manager.detect(makeFrame(7), 7);
    ASSERT_EQ(faces.size(), 3u);
    EXPECT_EQ(faces[0].area(), 10000);
    EXPECT_EQ(faces[1].area(), 3600);
    EXPECT_EQ(faces[2].area(), 1600);
    for (const auto& face : faces) {
        EXPECT_EQ(face.frameIndex, 7);
    }
}

TEST_F(InferenceProviderManagerTest, RejectsUnusableFrames) {
    InferenceProviderManager manager(factory);
    manager.initialize({Provider::CPU});

    EXPECT_THROW(manager.detect(cv::Mat(), 0), DetectionError);
    EXPECT_THROW(manager.detect(cv::Mat(10, 10, CV_8UC1, cv::Scalar(0)), 0), DetectionError);
}

TEST_F(InferenceProviderManagerTest, CallsBeforeInitializeAreFatal) {
    InferenceProviderManager manager(factory);
    try {
        manager.detect(makeFrame(0));
        FAIL() << "expected InferenceError";
    } catch (const InferenceError& e) {
        EXPECT_TRUE(e.isFatal());
    }
    EXPECT_THROW(manager.activeProvider(), std::logic_error);
}

TEST_F(InferenceProviderManagerTest, BackendExceptionsBecomeInferenceErrors) {
    InferenceProviderManager manager(factory);
    manager.initialize({Provider::CUDA});

    factory->state->onCall = [](const EngineCall& call) {
        if (call.frame == 1) throw cv::Exception(cv::Error::StsNoMem, "alloc", "forward", "net.cpp", 1);
        if (call.frame == 2) throw cv::Exception(cv::Error::GpuApiCallError, "cudnn failure", "forward", "net.cpp", 1);
        if (call.frame == 3) throw cv::Exception(cv::Error::StsNotImplemented, "layer", "forward", "net.cpp", 1);
        if (call.frame == 4) throw cv::Exception(cv::Error::StsError, "blob mismatch", "forward", "net.cpp", 1);
        if (call.frame == 5) throw std::bad_alloc();
        if (call.frame == 6) throw std::runtime_error("shape");
    };

    auto errorFor = [&](long frame) -> InferenceError {
        try {
            manager.detect(makeFrame(frame), frame);
        } catch (const InferenceError& e) {
            return e;
        }
        ADD_FAILURE() << "frame " << frame << " did not throw";
        return InferenceError("none", InferenceError::Severity::TRANSIENT);
    };

    InferenceError noMem = errorFor(1);
    EXPECT_EQ(noMem.cause(), InferenceError::Cause::MEMORY);
    EXPECT_FALSE(noMem.isFatal());

    InferenceError driver = errorFor(2);
    EXPECT_EQ(driver.cause(), InferenceError::Cause::DRIVER);
    EXPECT_TRUE(driver.isResourceFailure());

    EXPECT_TRUE(errorFor(3).isFatal());

    InferenceError other = errorFor(4);
    EXPECT_EQ(other.cause(), InferenceError::Cause::OTHER);
    EXPECT_FALSE(other.isFatal());

    EXPECT_EQ(errorFor(5).cause(), InferenceError::Cause::MEMORY);
    EXPECT_EQ(errorFor(6).cause(), InferenceError::Cause::OTHER);
}

TEST_F(InferenceProviderManagerTest, ClassifiesOutOfMemoryMessages) {
    cv::Exception e(cv::Error::StsError, "CUDA error: out of memory", "forward", "cuda4dnn.cpp", 10);
    EXPECT_EQ(InferenceProviderManager::classify(e, "swap").cause(), InferenceError::Cause::MEMORY);
}

TEST_F(InferenceProviderManagerTest, SwapLeavesInputsUntouched) {
    InferenceProviderManager manager(factory);
    manager.initialize({Provider::CPU});

    cv::Mat frame = makeFrame(11);
    cv::Mat before = frame.clone();
    FaceObservation source = makeFace(10, 10, 50, 50, {1.0f, 0.0f, 0.0f});
    FaceObservation target = makeFace(100, 40, 200, 140);

    cv::Mat result = manager.swap(source, frame, target);
    EXPECT_EQ(cv::norm(frame, before, cv::NORM_INF), 0.0);
    EXPECT_TRUE(isSwappedAt(result, target));
    EXPECT_EQ(result.size(), frame.size());
    EXPECT_EQ(frameIndexOf(result), 11);
}

} // namespace testing
} // namespace faceswap
