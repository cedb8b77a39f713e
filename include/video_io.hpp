#pragma once

#include "errors.hpp"
#include <opencv2/videoio.hpp>
#include <memory>
#include <string>

namespace faceswap {

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    long frameCount = 0;   // container estimate, may be 0
};

// Sequential frame iterator.
class VideoSource {
public:
    virtual ~VideoSource() = default;
    virtual const VideoInfo& info() const = 0;
    // False at end of stream. Throws IOError on a read failure.
    virtual bool read(cv::Mat& frame) = 0;
};

class VideoSink {
public:
    virtual ~VideoSink() = default;
    virtual void write(const cv::Mat& frame) = 0;
    virtual void close() = 0;
    virtual const std::string& path() const = 0;
};

class MediaFactory {
public:
    virtual ~MediaFactory() = default;
    // All of these throw IOError when the file cannot be opened.
    virtual std::unique_ptr<VideoSource> openSource(const std::string& path) = 0;
    virtual std::unique_ptr<VideoSink> openSink(const std::string& path, double fps,
                                                const cv::Size& frameSize) = 0;
    virtual cv::Mat readImage(const std::string& path) = 0;
    virtual void writeImage(const std::string& path, const cv::Mat& image) = 0;
};

class OpenCvVideoSource : public VideoSource {
public:
    explicit OpenCvVideoSource(const std::string& path);

    const VideoInfo& info() const override { return m_info; }
    bool read(cv::Mat& frame) override;

private:
    cv::VideoCapture m_cap;
    VideoInfo m_info;
    std::string m_path;
};

// mp4v writer; creates the parent directory when missing.
class OpenCvVideoSink : public VideoSink {
public:
    OpenCvVideoSink(const std::string& path, double fps, const cv::Size& frameSize);
    ~OpenCvVideoSink() override;

    void write(const cv::Mat& frame) override;
    void close() override;
    const std::string& path() const override { return m_path; }

private:
    cv::VideoWriter m_writer;
    std::string m_path;
    cv::Size m_frameSize;
};

class OpenCvMediaFactory : public MediaFactory {
public:
    std::unique_ptr<VideoSource> openSource(const std::string& path) override;
    std::unique_ptr<VideoSink> openSink(const std::string& path, double fps,
                                        const cv::Size& frameSize) override;
    cv::Mat readImage(const std::string& path) override;
    void writeImage(const std::string& path, const cv::Mat& image) override;
};

} // namespace faceswap
