#pragma once

#include <stdexcept>
#include <string>

namespace faceswap {

class FaceSwapError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A frame could not be analysed; the frame is written unchanged.
class DetectionError : public FaceSwapError {
public:
    using FaceSwapError::FaceSwapError;
};

class InferenceError : public FaceSwapError {
public:
    enum class Severity { TRANSIENT, FATAL };
    enum class Cause { MEMORY, DRIVER, OTHER };

    InferenceError(const std::string& what, Severity severity, Cause cause = Cause::OTHER)
        : FaceSwapError(what), m_severity(severity), m_cause(cause) {}

    Severity severity() const { return m_severity; }
    Cause cause() const { return m_cause; }
    bool isFatal() const { return m_severity == Severity::FATAL; }
    // Memory exhaustion or driver failures poison the GPU for the rest of a job.
    bool isResourceFailure() const { return m_cause != Cause::OTHER; }

private:
    Severity m_severity;
    Cause m_cause;
};

class InitializationError : public FaceSwapError {
public:
    using FaceSwapError::FaceSwapError;
};

class IOError : public FaceSwapError {
public:
    using FaceSwapError::FaceSwapError;
};

class RemuxError : public FaceSwapError {
public:
    using FaceSwapError::FaceSwapError;
};

const char* causeName(InferenceError::Cause cause);

} // namespace faceswap
