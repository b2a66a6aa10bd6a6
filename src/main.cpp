#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cctype>
#include <cstdio>
#include <cerrno>
#include <climits>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <sys/wait.h>
#include <unistd.h>
#include "universe.h"
#include "engine.h"
#include "patterns.h"
#include "renderer.h"

namespace fs = std::filesystem;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS]\n"
              << "\n"
              << "Universe:\n"
              << "  --width N          Grid width in cells (default: 64)\n"
              << "  --height N         Grid height in cells (default: 64)\n"
              << "  -n, --iterations N Run N generations (default: 10)\n"
              << "  --engine ENGINE    Step engine: wrapped (default), modulo\n"
              << "  --random           Start from a random generation\n"
              << "  --seed N           Seed for --random (default: nondeterministic)\n"
              << "\n"
              << "Patterns (repeatable, applied in order, coordinates wrap):\n"
              << "  --glider R,C       Insert a glider with its box at row R, column C\n"
              << "  --pulsar R,C       Insert a pulsar with its box at row R, column C\n"
              << "  --toggle R,C       Flip the cell at row R, column C\n"
              << "  -f, --file FILE    Insert a Life 1.06 pattern (.life or .lif)\n"
              << "  --at R,C           Position for the next --file pattern (default: 0,0)\n"
              << "\n"
              << "PNG Output:\n"
              << "  --png DIR          Save each frame as PNG to DIR\n"
              << "  --cell-size N      Pixels per cell (default: 5)\n"
              << "  --grid             Draw grid lines between cells\n"
              << "\n"
              << "Video Output (requires ffmpeg):\n"
              << "  --video FILE       Generate video file (MP4 or GIF)\n"
              << "  --fps N            Frames per second (default: 30)\n"
              << "  --keep-frames      Keep PNG frames after video generation\n"
              << "\n"
              << "  --stats            Print run statistics to stderr\n"
              << "  -h, --help         Show this help message\n"
              << "\n"
              << "The final generation is written to stdout in Life 1.06 format.\n";
}

// Strict integer parsing - rejects trailing garbage, overflow, negative values
bool parse_positive_int(const char* str, int& result) {
    if (str == nullptr || *str == '\0') return false;

    char* end;
    errno = 0;
    long val = std::strtol(str, &end, 10);

    if (*end != '\0') return false;
    if (errno == ERANGE || val < 0 || val > INT_MAX) return false;

    result = static_cast<int>(val);
    return true;
}

bool parse_seed(const char* str, uint64_t& result) {
    if (str == nullptr || *str == '\0' || *str == '-') return false;

    char* end;
    errno = 0;
    unsigned long long val = std::strtoull(str, &end, 10);
    if (*end != '\0' || errno == ERANGE) return false;

    result = static_cast<uint64_t>(val);
    return true;
}

// "R,C" with optional sign on each part
bool parse_position(const char* str, int64_t& row, int64_t& col) {
    if (str == nullptr || *str == '\0') return false;

    char* end;
    errno = 0;
    long long r = std::strtoll(str, &end, 10);
    if (end == str || *end != ',' || errno == ERANGE) return false;

    const char* second = end + 1;
    long long c = std::strtoll(second, &end, 10);
    if (end == second || *end != '\0' || errno == ERANGE) return false;

    row = r;
    col = c;
    return true;
}

std::string get_temp_dir() {
    // mkdtemp modifies the template in place
    char tmpl[] = "/tmp/torus_life_frames_XXXXXX";
    char* result = mkdtemp(tmpl);
    if (!result) {
        throw std::runtime_error("Failed to create temp directory");
    }
    return std::string(result);
}

bool generate_video(const std::string& frame_dir, const std::string& output_path, int fps) {
    std::string ext = fs::path(output_path).extension().string();
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    std::vector<std::string> args = {
        "ffmpeg", "-y", "-framerate", std::to_string(fps),
        "-i", frame_dir + "/frame_%05d.png"
    };
    const std::vector<std::string> codec_args = ext == ".gif"
        ? std::vector<std::string>{"-vf", "split[s0][s1];[s0]palettegen[p];[s1][p]paletteuse"}
        // Default to MP4; x264 needs even dimensions
        : std::vector<std::string>{"-vf", "pad=ceil(iw/2)*2:ceil(ih/2)*2",
                                   "-c:v", "libx264", "-pix_fmt", "yuv420p", "-crf", "18"};
    args.insert(args.end(), codec_args.begin(), codec_args.end());
    args.push_back(output_path);

    // Fork and exec ffmpeg directly (no shell interpretation)
    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "Error: Failed to fork for ffmpeg\n";
        return false;
    }

    if (pid == 0) {
        if (!freopen("/dev/null", "w", stdout) || !freopen("/dev/null", "w", stderr)) {
            _exit(126);
        }
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        execvp("ffmpeg", argv.data());
        _exit(127);
    }

    int status;
    if (waitpid(pid, &status, 0) < 0) {
        return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

// Removes a temporary frame directory on every exit path
class TempDirGuard {
public:
    TempDirGuard() = default;
    TempDirGuard(const TempDirGuard&) = delete;
    TempDirGuard& operator=(const TempDirGuard&) = delete;

    ~TempDirGuard() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
    }

    void track(const std::string& path) { path_ = path; }

private:
    std::string path_;
};

struct Stamp {
    enum class Kind { Glider, Pulsar, Toggle, File };
    Kind kind;
    int64_t row;
    int64_t col;
    std::string path;
};

int main(int argc, char* argv[]) {
    int width = Universe::kDefaultWidth;
    int height = Universe::kDefaultHeight;
    int iterations = 10;
    EngineType engine_type = EngineType::Wrapped;
    bool random_start = false;
    bool has_seed = false;
    uint64_t seed = 0;
    bool show_stats = false;

    std::vector<Stamp> stamps;
    int64_t file_row = 0, file_col = 0;

    // PNG options
    bool render_png = false;
    RenderConfig render_config;

    // Video options
    bool generate_video_output = false;
    std::string video_output_path;
    int video_fps = 30;
    bool keep_frames = false;
    bool using_temp_dir = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--width" || arg == "--height" || arg == "-n" || arg == "--iterations" ||
                   arg == "--cell-size" || arg == "--fps") {
            if (!has_value) {
                std::cerr << "Error: " << arg << " requires a number argument\n";
                return 1;
            }
            int value = 0;
            if (!parse_positive_int(argv[++i], value)) {
                std::cerr << "Error: Invalid value for " << arg << " (must be a non-negative integer)\n";
                return 1;
            }
            if (arg != "-n" && arg != "--iterations" && value < 1) {
                std::cerr << "Error: " << arg << " must be a positive integer\n";
                return 1;
            }
            if (arg == "--width") width = value;
            else if (arg == "--height") height = value;
            else if (arg == "--cell-size") render_config.cell_size = value;
            else if (arg == "--fps") video_fps = value;
            else iterations = value;
        } else if (arg == "--engine") {
            if (!has_value) {
                std::cerr << "Error: " << arg << " requires an engine name argument\n";
                return 1;
            }
            try {
                engine_type = parse_engine_type(argv[++i]);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        } else if (arg == "--random") {
            random_start = true;
        } else if (arg == "--seed") {
            if (!has_value || !parse_seed(argv[++i], seed)) {
                std::cerr << "Error: --seed requires a non-negative integer\n";
                return 1;
            }
            has_seed = true;
        } else if (arg == "--glider" || arg == "--pulsar" || arg == "--toggle" || arg == "--at") {
            int64_t row = 0, col = 0;
            if (!has_value || !parse_position(argv[++i], row, col)) {
                std::cerr << "Error: " << arg << " requires a position argument R,C\n";
                return 1;
            }
            if (arg == "--at") {
                file_row = row;
                file_col = col;
            } else {
                Stamp::Kind kind = arg == "--glider" ? Stamp::Kind::Glider
                                 : arg == "--pulsar" ? Stamp::Kind::Pulsar
                                 : Stamp::Kind::Toggle;
                stamps.push_back({kind, row, col, {}});
            }
        } else if (arg == "-f" || arg == "--file") {
            if (!has_value) {
                std::cerr << "Error: " << arg << " requires a filename argument\n";
                return 1;
            }
            std::string path = argv[++i];
            if (!has_valid_life_extension(path)) {
                std::cerr << "Error: File must have .life or .lif extension\n";
                return 1;
            }
            stamps.push_back({Stamp::Kind::File, file_row, file_col, path});
        } else if (arg == "--png") {
            if (!has_value) {
                std::cerr << "Error: " << arg << " requires a directory argument\n";
                return 1;
            }
            render_config.output_dir = argv[++i];
            render_png = true;
        } else if (arg == "--grid") {
            render_config.show_grid = true;
        } else if (arg == "--video") {
            if (!has_value) {
                std::cerr << "Error: " << arg << " requires a filename argument\n";
                return 1;
            }
            video_output_path = argv[++i];
            generate_video_output = true;
        } else if (arg == "--keep-frames") {
            keep_frames = true;
        } else if (arg == "--stats") {
            show_stats = true;
        } else {
            std::cerr << "Error: Unknown argument '" << arg << "'\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Video needs frames; render them to a temp directory unless --png was given
    TempDirGuard temp_frames;
    if (generate_video_output && !render_png) {
        try {
            render_config.output_dir = get_temp_dir();
        } catch (const std::runtime_error& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        render_png = true;
        using_temp_dir = true;
        if (!keep_frames) {
            temp_frames.track(render_config.output_dir);
        }
    }

    if (render_png && !fs::is_directory(render_config.output_dir)) {
        std::error_code ec;
        if (!fs::create_directory(render_config.output_dir, ec) && ec) {
            std::cerr << "Error: Cannot create PNG output directory '" << render_config.output_dir << "'\n";
            return 1;
        }
    }

    try {
        auto total_start = std::chrono::high_resolution_clock::now();

        Universe universe(width, height, InitialState::Dead, engine_type);
        if (has_seed) {
            universe.seed(seed);
        }
        if (random_start) {
            universe.randomize();
        }

        for (const auto& stamp : stamps) {
            switch (stamp.kind) {
                case Stamp::Kind::Glider:
                    universe.insert_glider(stamp.row, stamp.col);
                    break;
                case Stamp::Kind::Pulsar:
                    universe.insert_pulsar(stamp.row, stamp.col);
                    break;
                case Stamp::Kind::Toggle:
                    universe.toggle_cell(stamp.row, stamp.col);
                    break;
                case Stamp::Kind::File: {
                    std::ifstream file(stamp.path);
                    if (!file) {
                        std::cerr << "Error: Cannot open file '" << stamp.path << "'\n";
                        return 1;
                    }
                    universe.insert_pattern(parse_life106(file), stamp.row, stamp.col);
                    break;
                }
            }
        }

        const size_t initial_cells = universe.living();

        if (show_stats) {
            std::cerr << "🧬 Game of Life on a " << width << " x " << height << " torus\n";
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
            std::cerr << "📥 Input:      " << initial_cells << " live cells\n";
            std::cerr << "⚙️  Engine:     " << engine_name(engine_type) << "\n";
            std::cerr << "🔄 Iterations: " << iterations << "\n";
            if (render_png && !using_temp_dir) {
                std::cerr << "🖼️  PNG:        " << render_config.output_dir << "/\n";
            }
            if (generate_video_output) {
                std::cerr << "🎬 Video:      " << video_output_path << " @ " << video_fps << " fps\n";
            }
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
        }

        // Full draw once, then patch only changed cells after each tick
        std::unique_ptr<FrameRenderer> renderer;
        if (render_png) {
            renderer = std::make_unique<FrameRenderer>(width, height, render_config);
            renderer->redraw(universe);
            if (!renderer->write_png(0)) {
                std::cerr << "Warning: Failed to render frame 0\n";
            }
        }

        size_t total_changes = 0;
        auto sim_start = std::chrono::high_resolution_clock::now();

        for (int i = 0; i < iterations; i++) {
            universe.tick();
            total_changes += universe.diff_size();

            if (renderer) {
                renderer->apply_diff(universe);
                if (!renderer->write_png(i + 1)) {
                    std::cerr << "Warning: Failed to render frame " << (i + 1) << "\n";
                }
                if (show_stats && iterations >= 10 && (i + 1) % (iterations / 10) == 0) {
                    std::cerr << "   📸 Rendered frame " << (i + 1) << "/" << iterations << "\n";
                }
            }
        }

        auto sim_end = std::chrono::high_resolution_clock::now();

        bool video_success = false;
        if (generate_video_output) {
            if (show_stats) {
                std::cerr << "   🎬 Encoding video...\n";
            }
            video_success = generate_video(render_config.output_dir, video_output_path, video_fps);
            if (!video_success) {
                std::cerr << "Warning: Video generation failed. Is ffmpeg installed?\n";
            }
        }

        universe.write(std::cout);

        auto total_end = std::chrono::high_resolution_clock::now();

        if (show_stats) {
            auto sim_ms = std::chrono::duration_cast<std::chrono::microseconds>(sim_end - sim_start).count() / 1000.0;
            auto total_ms = std::chrono::duration_cast<std::chrono::microseconds>(total_end - total_start).count() / 1000.0;

            std::cerr << "📊 Results\n";
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
            std::cerr << "📤 Output:     " << universe.living() << " live cells (generation "
                      << universe.generation() << ")\n";
            std::cerr << "🔁 Changes:    " << total_changes << " cell flips\n";
            if (render_png && !using_temp_dir) {
                std::cerr << "🖼️  Frames:     " << (iterations + 1) << " PNG files\n";
            }
            if (generate_video_output && video_success) {
                std::cerr << "🎬 Video:      " << video_output_path << "\n";
            }
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
            std::cerr << "   Simulate:   " << sim_ms << " ms";
            if (render_png) {
                std::cerr << " (includes rendering)";
            }
            std::cerr << "\n";
            std::cerr << "   Total:      " << total_ms << " ms\n";
            if (iterations > 0 && sim_ms > 0) {
                double ticks_per_sec = iterations / (sim_ms / 1000.0);
                std::cerr << "🚀 Speed:      " << static_cast<int>(ticks_per_sec) << " ticks/sec\n";
            }
            std::cerr << "✅ Done!\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
