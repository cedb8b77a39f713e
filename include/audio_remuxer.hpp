#pragma once

#include "errors.hpp"
#include <string>

namespace faceswap {

// Puts the audio track of the original video back onto a processed one.
class AudioRemuxer {
public:
    virtual ~AudioRemuxer() = default;
    virtual bool hasAudioTrack(const std::string& videoPath) = 0;
    // Returns the path of the muxed file. Throws RemuxError.
    virtual std::string remux(const std::string& originalVideo, const std::string& processedVideo) = 0;
};

// Shells out to ffprobe/ffmpeg. The video stream is copied, audio re-encoded
// to AAC, and the result replaces the processed file in place.
class FfmpegRemuxer : public AudioRemuxer {
public:
    FfmpegRemuxer();
    FfmpegRemuxer(std::string ffmpeg, std::string ffprobe);

    bool hasAudioTrack(const std::string& videoPath) override;
    std::string remux(const std::string& originalVideo, const std::string& processedVideo) override;

    bool available() const { return !m_ffmpeg.empty(); }

private:
    std::string m_ffmpeg;
    std::string m_ffprobe;
};

} // namespace faceswap
