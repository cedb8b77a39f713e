#pragma once

#include "pipeline_config.hpp"
#include <opencv2/dnn.hpp>
#include <memory>

namespace faceswap {

// Capability interface of one inference provider variant.
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    virtual Provider provider() const = 0;
    virtual bool isGpu() const = 0;
    virtual bool isAvailable() const = 0;
    virtual int dnnBackend() const = 0;
    virtual int dnnTarget() const = 0;

    void configure(cv::dnn::Net& net) const {
        net.setPreferableBackend(dnnBackend());
        net.setPreferableTarget(dnnTarget());
    }

    const char* name() const { return providerName(provider()); }
};

class CudaBackend : public InferenceBackend {
public:
    Provider provider() const override { return Provider::CUDA; }
    bool isGpu() const override { return true; }
    bool isAvailable() const override;
    int dnnBackend() const override { return cv::dnn::DNN_BACKEND_CUDA; }
    int dnnTarget() const override { return cv::dnn::DNN_TARGET_CUDA; }
};

// OpenCV has no DirectML backend; the OpenCL target is the closest GPU path.
class DirectMlBackend : public InferenceBackend {
public:
    Provider provider() const override { return Provider::DIRECTML; }
    bool isGpu() const override { return true; }
    bool isAvailable() const override;
    int dnnBackend() const override { return cv::dnn::DNN_BACKEND_OPENCV; }
    int dnnTarget() const override { return cv::dnn::DNN_TARGET_OPENCL; }
};

class CpuBackend : public InferenceBackend {
public:
    Provider provider() const override { return Provider::CPU; }
    bool isGpu() const override { return false; }
    bool isAvailable() const override { return true; }
    int dnnBackend() const override { return cv::dnn::DNN_BACKEND_OPENCV; }
    int dnnTarget() const override { return cv::dnn::DNN_TARGET_CPU; }
};

std::unique_ptr<InferenceBackend> makeBackend(Provider provider);

} // namespace faceswap
