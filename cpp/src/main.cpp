/**
 * Lyric Video Renderer - Main Entry Point
 *
 * CLI tool that turns a background image, an audio track and an SRT
 * document into an MP4 with burned-in captions.
 *
 * Usage:
 *   ./lyricvid_render --image <path> --audio <path> --subtitles <path> --output <path> [options]
 *
 * Options:
 *   --position      Caption position, percent from top (0-100, default: 50)
 *   --config        key=value render configuration file
 *   --font          Caption font file
 *   --preset        Encoder preset (default: ultrafast)
 *   --gpu, --no-gpu Try NVENC before libx264 (default: off)
 *   --export-ass    Write the subtitles as an .ass script and exit
 *   --normalize     Write the subtitles with repaired timing lines and exit
 *   --help, -h      Show help message
 */

#include <iostream>
#include <string>
#include <cstdlib>
#include <filesystem>
#include <exception>
#include <algorithm>
#include <cctype>
#include <vector>

#include "config/render_config.hpp"
#include "pipeline/ffmpeg_encoder.hpp"
#include "pipeline/video_assembler.hpp"
#include "subtitles/ass_export.hpp"
#include "subtitles/subtitle_track.hpp"
#include "utils/cancel_flag.hpp"
#include "utils/file_io.hpp"
#include "utils/pipeline_error.hpp"

namespace fs = std::filesystem;

void print_usage(const char* prog_name) {
    std::cout << "\nLyric Video Renderer\n";
    std::cout << "====================\n\n";
    std::cout << "Usage: " << prog_name
              << " --image <path> --audio <path> --subtitles <path> --output <path> [options]\n\n";
    std::cout << "Required:\n";
    std::cout << "  --image, -i     Background image (JPEG, PNG, WebP, BMP, GIF)\n";
    std::cout << "  --audio, -a     Audio track\n";
    std::cout << "  --subtitles, -s SRT subtitle file\n";
    std::cout << "  --output, -o    Output MP4 file\n\n";
    std::cout << "Options:\n";
    std::cout << "  --position      Caption position, percent from top (0-100, default: 50)\n";
    std::cout << "  --config        Render configuration file (key=value)\n";
    std::cout << "  --font          Caption font file (TTF/OTF/TTC)\n";
    std::cout << "  --preset        Encoder preset (default: ultrafast)\n";
    std::cout << "  --gpu           Try NVENC before libx264\n";
    std::cout << "  --no-gpu        Encode with libx264 only (default)\n";
    std::cout << "  --export-ass    Write subtitles as an .ass script to <path> and exit\n";
    std::cout << "  --normalize     Write subtitles with repaired timing lines to <path> and exit\n";
    std::cout << "  --help, -h      Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << prog_name << " -i cover.jpg -a song.mp3 -s song.srt -o song.mp4\n";
    std::cout << "  " << prog_name << " -i cover.png -a song.wav -s song.srt -o out.mp4 --position 80\n";
    std::cout << "  " << prog_name << " -s song.srt --export-ass song.ass\n\n";
}

std::string guess_mime_type(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".png") return "image/png";
    if (ext == ".webp") return "image/webp";
    if (ext == ".bmp") return "image/bmp";
    if (ext == ".gif") return "image/gif";
    return "";
}

void print_progress(double ratio) {
    double progress = 100.0 * ratio;
    int bar_width = 40;
    int filled = static_cast<int>(ratio * bar_width);

    std::cout << "\r[";
    for (int i = 0; i < bar_width; i++) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << static_cast<int>(progress) << "%   " << std::flush;
}

int main(int argc, char* argv[]) {
    lyricvid::utils::install_signal_handlers();

    // Parse arguments
    std::string image_path;
    std::string audio_path;
    std::string subtitles_path;
    std::string output_path;
    std::string config_path;
    std::string font_path;
    std::string preset;
    std::string export_ass_path;
    std::string normalize_path;
    int position = -1;
    int use_gpu = -1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--image" || arg == "-i") {
            if (i + 1 < argc) image_path = argv[++i];
        }
        else if (arg == "--audio" || arg == "-a") {
            if (i + 1 < argc) audio_path = argv[++i];
        }
        else if (arg == "--subtitles" || arg == "-s") {
            if (i + 1 < argc) subtitles_path = argv[++i];
        }
        else if (arg == "--output" || arg == "-o") {
            if (i + 1 < argc) output_path = argv[++i];
        }
        else if (arg == "--position") {
            if (i + 1 < argc) position = std::atoi(argv[++i]);
        }
        else if (arg == "--config") {
            if (i + 1 < argc) config_path = argv[++i];
        }
        else if (arg == "--font") {
            if (i + 1 < argc) font_path = argv[++i];
        }
        else if (arg == "--preset") {
            if (i + 1 < argc) preset = argv[++i];
        }
        else if (arg == "--gpu") {
            use_gpu = 1;
        }
        else if (arg == "--no-gpu") {
            use_gpu = 0;
        }
        else if (arg == "--export-ass") {
            if (i + 1 < argc) export_ass_path = argv[++i];
        }
        else if (arg == "--normalize") {
            if (i + 1 < argc) normalize_path = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (subtitles_path.empty()) {
        std::cerr << "Error: --subtitles is required\n";
        print_usage(argv[0]);
        return 1;
    }

    std::string srt;
    if (!lyricvid::utils::read_text_file(subtitles_path, srt)) {
        std::cerr << "Error: cannot read subtitles: " << subtitles_path << "\n";
        return 1;
    }

    // Subtitle-only modes
    if (!export_ass_path.empty() || !normalize_path.empty()) {
        if (!normalize_path.empty()) {
            if (!lyricvid::utils::write_text_file(normalize_path,
                                                  lyricvid::subtitles::normalize_timing_lines(srt))) {
                std::cerr << "Error: cannot write " << normalize_path << "\n";
                return 1;
            }
            std::cout << "[Subtitles] Normalized timing written to " << normalize_path << "\n";
        }
        if (!export_ass_path.empty()) {
            auto events = lyricvid::subtitles::export_dialogue_events(srt);
            if (!lyricvid::utils::write_text_file(export_ass_path,
                                                  lyricvid::subtitles::build_ass_document(events))) {
                std::cerr << "Error: cannot write " << export_ass_path << "\n";
                return 1;
            }
            std::cout << "[Subtitles] " << events.size() << " events written to " << export_ass_path << "\n";
        }
        return 0;
    }

    // Validate required arguments
    if (image_path.empty() || audio_path.empty() || output_path.empty()) {
        std::cerr << "Error: --image, --audio and --output are required\n";
        print_usage(argv[0]);
        return 1;
    }

    lyricvid::config::RenderConfig config;
    if (!config_path.empty() && !config.load_from_file(config_path)) {
        std::cerr << "Error: invalid configuration file: " << config_path << "\n";
        return 1;
    }

    // Flags override the file
    if (position >= 0) config.caption_position = position;
    if (!font_path.empty()) config.font_path = font_path;
    if (!preset.empty()) config.preset = preset;
    if (use_gpu >= 0) config.use_hw_accel = (use_gpu == 1);

    // Clamp position
    if (config.caption_position < 0) config.caption_position = 0;
    if (config.caption_position > 100) config.caption_position = 100;

    lyricvid::pipeline::AssemblyRequest request;
    request.subtitles = srt;
    request.caption_position = config.caption_position;
    request.image.mime_type = guess_mime_type(image_path);
    request.audio.extension = fs::path(audio_path).extension().string();

    if (!lyricvid::utils::read_file_bytes(image_path, request.image.bytes)) {
        std::cerr << "Error: cannot read image: " << image_path << "\n";
        return 1;
    }
    if (!lyricvid::utils::read_file_bytes(audio_path, request.audio.bytes)) {
        std::cerr << "Error: cannot read audio: " << audio_path << "\n";
        return 1;
    }

    std::cout << "\n=== Lyric Video Renderer ===\n\n";
    std::cout << "[Config] Output: " << config.width << "x" << config.height
              << " @ " << config.fps << " fps\n";
    std::cout << "[Config] Caption position: " << config.caption_position << "%\n";
    std::cout << "[Config] Preset: " << config.preset << "\n";
    std::cout << "[Config] GPU: " << (config.use_hw_accel ? "enabled" : "disabled") << "\n\n";

    lyricvid::pipeline::FFmpegEncoder encoder;
    lyricvid::pipeline::VideoAssembler assembler(config, encoder);
    assembler.set_progress_callback(print_progress);
    assembler.set_status_callback([](const std::string& line) {
        if (line.compare(0, 6, "frame=") == 0) return;
        std::cout << "\n[Engine] " << line << std::flush;
    });

    try {
        std::vector<uint8_t> video = assembler.assemble(request);
        if (!lyricvid::utils::write_file_bytes(output_path, video)) {
            std::cerr << "\n\n[Error] Cannot write output: " << output_path << "\n";
            return 1;
        }
    } catch (const lyricvid::PipelineError& ex) {
        if (ex.code() == lyricvid::ErrorCode::Cancelled) {
            int signum = lyricvid::utils::cancel_signal();
            std::cerr << "\n\n[Cancel] Rendering cancelled by user";
            if (signum != 0) std::cerr << " (signal " << signum << ")";
            std::cerr << "\n";
            lyricvid::utils::reset_cancel();
            return 130;
        }
        std::cerr << "\n\n[Error] " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "\n\n[Error] Caught exception: " << ex.what() << "\n";
        return 1;
    }

    const auto& stats = assembler.last_stats();
    std::cout << "\n\n[Done] " << output_path << ": " << stats.frames_written << " frames, "
              << stats.compositor_renders << " renders, " << stats.duration << "s"
              << (stats.duration_probed ? "" : " (fallback duration)") << "\n";
    return 0;
}
