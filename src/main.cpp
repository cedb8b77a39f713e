/**
 * Face Swapper - video face swap with identity tracking
 *
 * List faces (pick indices for --faces):
 *   ./face_swapper --list-faces video.mp4 [frame] [preview.jpg]
 *
 * Swap a still image:
 *   ./face_swapper --image source.jpg target.jpg output.jpg
 *
 * Swap a video:
 *   ./face_swapper source.jpg video.mp4 output.mp4 [options]
 */

#include "audio_remuxer.hpp"
#include "cli_options.hpp"
#include "dnn_engine_factory.hpp"
#include "frame_pipeline.hpp"
#include "gpu_memory_probe.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> g_stopRequested{false};

void onSignal(int) {
    g_stopRequested = true;
}

void printUsage(const char* programName) {
    std::cout << "Face Swapper\n\n";
    std::cout << "=== LIST FACES (choose indices for --faces) ===\n";
    std::cout << "  " << programName << " --list-faces <video> [frame] [preview.jpg]\n\n";
    std::cout << "=== IMAGE ===\n";
    std::cout << "  " << programName << " --image <source.jpg> <target.jpg> <output.jpg>\n\n";
    std::cout << "=== VIDEO ===\n";
    std::cout << "  " << programName << " <source.jpg> <video> <output_video> [options]\n\n";
    std::cout << "Options (engine options also apply to --list-faces and --image):\n";
    std::cout << "  --reference <image>     Track the face shown in this image\n";
    std::cout << "  --frame <n>             Track faces picked from frame n of the video\n";
    std::cout << "  --faces <i,j,...>       Face indices in that frame (default: 0)\n";
    std::cout << "  --strategy <name>       first-come (default) or greedy-exclusive\n";
    std::cout << "  --providers <list>      e.g. cuda,cpu (default) or cpu\n";
    std::cout << "  --threshold <t>         Match threshold (default: 0.4)\n";
    std::cout << "  --memory-limit <pct>    GPU memory limit (default: 90)\n";
    std::cout << "  --max-gpu-errors <n>    Errors before permanent CPU fallback (default: 5)\n";
    std::cout << "  --no-fallback           Never fall back to CPU mid-job\n";
    std::cout << "  --models <dir>          Directory holding the model files\n";
    std::cout << "  --verbose               Log match scores for every frame\n\n";
    std::cout << "Without --reference or --frame the largest face of every frame is swapped.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " --list-faces video.mp4 0 faces.jpg\n";
    std::cout << "  " << programName << " selfie.jpg video.mp4 output.mp4 --frame 0 --faces 1\n";
}

faceswap::FramePipeline makePipeline(const faceswap::PipelineConfig& config) {
    return faceswap::FramePipeline(config,
                                   std::make_shared<faceswap::DnnEngineFactory>(config),
                                   faceswap::makeDefaultMemoryProbe(),
                                   std::make_shared<faceswap::OpenCvMediaFactory>(),
                                   std::make_shared<faceswap::FfmpegRemuxer>());
}

int listFaces(const faceswap::CommandLine& cli) {
    const std::string& videoPath = cli.positional[0];
    long frameIndex = (cli.positional.size() > 1) ? std::stol(cli.positional[1]) : 0;
    std::string previewPath = (cli.positional.size() > 2) ? cli.positional[2] : "";

    auto faces = makePipeline(cli.config).listFaces(videoPath, frameIndex, previewPath);
    if (faces.empty()) {
        std::cout << "\nNo faces in frame " << frameIndex << ", try another frame." << std::endl;
        return 0;
    }
    std::cout << "\nNext step: run with --frame " << frameIndex << " --faces <#>" << std::endl;
    return 0;
}

int processImage(const faceswap::CommandLine& cli) {
    makePipeline(cli.config).processImage(cli.positional[0], cli.positional[1], cli.positional[2]);
    return 0;
}

int processVideo(const faceswap::CommandLine& cli) {
    faceswap::PipelineJob job;
    job.sourceFacePath = cli.positional[0];
    job.targetVideoPath = cli.positional[1];
    job.outputPath = cli.positional[2];
    job.selection = cli.selection;

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    job.shouldStop = []() { return g_stopRequested.load(); };

    std::cout << "\n=== FACE SWAP ===" << std::endl;
    std::cout << "Source: " << job.sourceFacePath << std::endl;
    std::cout << "Target: " << job.targetVideoPath << std::endl;
    std::cout << "Strategy: " << faceswap::assignmentStrategyName(cli.config.assignment) << "\n" << std::endl;

    faceswap::JobReport report = makePipeline(cli.config).run(job);

    std::cout << "\nOutput: " << report.outputPath << std::endl;
    switch (report.state) {
        case faceswap::JobState::COMPLETED: return 0;
        case faceswap::JobState::CANCELLED: return 130;
        default:                            return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    faceswap::CommandLine cli;
    try {
        cli = faceswap::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << std::endl;
        printUsage(argv[0]);
        return 1;
    }
    if (cli.mode == faceswap::CliMode::HELP) {
        printUsage(argv[0]);
        return 1;
    }
    for (const auto& warning : cli.warnings) {
        std::cerr << "Warning: " << warning << std::endl;
    }

    try {
        switch (cli.mode) {
            case faceswap::CliMode::LIST_FACES: return listFaces(cli);
            case faceswap::CliMode::IMAGE:      return processImage(cli);
            default:                            return processVideo(cli);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
