#include "audio_remuxer.hpp"
#include "process_utils.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace faceswap {

static std::string lastLines(const std::string& text, size_t maxChars = 400) {
    if (text.size() <= maxChars) return text;
    return "..." + text.substr(text.size() - maxChars);
}

FfmpegRemuxer::FfmpegRemuxer()
    : m_ffmpeg(findExecutable({"ffmpeg", "./ffmpeg", "ffmpeg/bin/ffmpeg", "/usr/local/bin/ffmpeg",
                               "/usr/bin/ffmpeg", "/opt/homebrew/bin/ffmpeg"})),
      m_ffprobe(findExecutable({"ffprobe", "./ffprobe", "ffmpeg/bin/ffprobe", "/usr/local/bin/ffprobe",
                                "/usr/bin/ffprobe", "/opt/homebrew/bin/ffprobe"})) {
    if (m_ffmpeg.empty()) {
        std::cerr << "[FfmpegRemuxer] Warning: ffmpeg not found, output will have no audio" << std::endl;
    }
}

FfmpegRemuxer::FfmpegRemuxer(std::string ffmpeg, std::string ffprobe)
    : m_ffmpeg(std::move(ffmpeg)), m_ffprobe(std::move(ffprobe)) {}

bool FfmpegRemuxer::hasAudioTrack(const std::string& videoPath) {
    // Without ffprobe we cannot tell; let the mux step decide
    if (m_ffprobe.empty()) return true;

    std::string cmd = shellQuote(m_ffprobe) +
        " -v quiet -select_streams a:0 -show_entries stream=codec_type -of csv=p=0 " +
        shellQuote(videoPath);
    ProcessResult result = runCommand(cmd);
    if (!result.ok()) {
        std::cerr << "[FfmpegRemuxer] Could not probe audio of " << videoPath
                  << ", trying to mux anyway" << std::endl;
        return true;
    }
    return result.output.find("audio") != std::string::npos;
}

std::string FfmpegRemuxer::remux(const std::string& originalVideo, const std::string& processedVideo) {
    if (m_ffmpeg.empty()) {
        throw RemuxError("ffmpeg not found");
    }

    fs::path processed(processedVideo);
    fs::path temp = processed.parent_path() /
                    (processed.stem().string() + "_temp" + processed.extension().string());

    std::string cmd = shellQuote(m_ffmpeg) +
        " -y -loglevel error" +
        " -i " + shellQuote(processedVideo) +
        " -i " + shellQuote(originalVideo) +
        " -c:v copy -c:a aac -map 0:v:0 -map 1:a:0? -shortest " +
        shellQuote(temp.string());

    std::cout << "[FfmpegRemuxer] Merging audio track..." << std::endl;
    ProcessResult result = runCommand(cmd);

    std::error_code ec;
    if (!result.ok()) {
        fs::remove(temp, ec);
        throw RemuxError("ffmpeg exited with " + std::to_string(result.exitCode) + ": " +
                         lastLines(result.output));
    }

    fs::rename(temp, processed, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp, ec);
        throw RemuxError("Cannot replace " + processedVideo + " with muxed file: " + reason);
    }

    std::cout << "[FfmpegRemuxer] Audio track merged" << std::endl;
    return processedVideo;
}

} // namespace faceswap
