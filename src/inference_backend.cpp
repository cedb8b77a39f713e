#include "inference_backend.hpp"
#include <opencv2/core/ocl.hpp>
#include <algorithm>

namespace faceswap {

static bool hasTarget(cv::dnn::Backend backend, cv::dnn::Target target) {
    try {
        auto targets = cv::dnn::getAvailableTargets(backend);
        return std::find(targets.begin(), targets.end(), target) != targets.end();
    } catch (const cv::Exception&) {
        return false;
    }
}

bool CudaBackend::isAvailable() const {
    return hasTarget(cv::dnn::DNN_BACKEND_CUDA, cv::dnn::DNN_TARGET_CUDA);
}

bool DirectMlBackend::isAvailable() const {
    return cv::ocl::haveOpenCL() &&
           hasTarget(cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_OPENCL);
}

std::unique_ptr<InferenceBackend> makeBackend(Provider provider) {
    switch (provider) {
        case Provider::CUDA:     return std::make_unique<CudaBackend>();
        case Provider::DIRECTML: return std::make_unique<DirectMlBackend>();
        case Provider::CPU:      return std::make_unique<CpuBackend>();
    }
    return std::make_unique<CpuBackend>();
}

} // namespace faceswap
