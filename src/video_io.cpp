#include "video_io.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace faceswap {

static void ensureParentDirectory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw IOError("Cannot create output directory " + parent.string() + ": " + ec.message());
    }
}

OpenCvVideoSource::OpenCvVideoSource(const std::string& path) : m_path(path) {
    if (!m_cap.open(path) || !m_cap.isOpened()) {
        throw IOError("Cannot open video " + path);
    }

    m_info.width = static_cast<int>(m_cap.get(cv::CAP_PROP_FRAME_WIDTH));
    m_info.height = static_cast<int>(m_cap.get(cv::CAP_PROP_FRAME_HEIGHT));
    m_info.fps = m_cap.get(cv::CAP_PROP_FPS);
    m_info.frameCount = static_cast<long>(m_cap.get(cv::CAP_PROP_FRAME_COUNT));

    if (m_info.fps <= 0.0) m_info.fps = 25.0;
}

bool OpenCvVideoSource::read(cv::Mat& frame) {
    try {
        if (!m_cap.read(frame)) return false;
    } catch (const cv::Exception& e) {
        throw IOError("Reading " + m_path + " failed: " + e.what());
    }
    if (frame.empty()) return false;

    // Some containers report a different size than the decoded frames
    if (frame.cols != m_info.width || frame.rows != m_info.height) {
        m_info.width = frame.cols;
        m_info.height = frame.rows;
    }
    return true;
}

OpenCvVideoSink::OpenCvVideoSink(const std::string& path, double fps, const cv::Size& frameSize)
    : m_path(path), m_frameSize(frameSize) {
    ensureParentDirectory(path);

    int fourcc = cv::VideoWriter::fourcc('m', 'p', '4', 'v');
    if (!m_writer.open(path, fourcc, fps, frameSize) || !m_writer.isOpened()) {
        throw IOError("Cannot create output video " + path);
    }
}

OpenCvVideoSink::~OpenCvVideoSink() {
    close();
}

void OpenCvVideoSink::write(const cv::Mat& frame) {
    if (!m_writer.isOpened()) {
        throw IOError("Writing to closed video " + m_path);
    }
    if (frame.size() != m_frameSize) {
        cv::Mat resized;
        cv::resize(frame, resized, m_frameSize);
        m_writer.write(resized);
        return;
    }
    m_writer.write(frame);
}

void OpenCvVideoSink::close() {
    if (m_writer.isOpened()) {
        m_writer.release();
    }
}

std::unique_ptr<VideoSource> OpenCvMediaFactory::openSource(const std::string& path) {
    return std::make_unique<OpenCvVideoSource>(path);
}

std::unique_ptr<VideoSink> OpenCvMediaFactory::openSink(const std::string& path, double fps,
                                                        const cv::Size& frameSize) {
    return std::make_unique<OpenCvVideoSink>(path, fps, frameSize);
}

cv::Mat OpenCvMediaFactory::readImage(const std::string& path) {
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw IOError("Cannot load image " + path);
    }
    return image;
}

void OpenCvMediaFactory::writeImage(const std::string& path, const cv::Mat& image) {
    ensureParentDirectory(path);
    bool written = false;
    try {
        written = cv::imwrite(path, image);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write image " + path + ": " + e.what());
    }
    if (!written) {
        throw IOError("Cannot write image " + path);
    }
}

} // namespace faceswap
