#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
#include "renderer.h"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>

FrameRenderer::FrameRenderer(int width_cells, int height_cells, const RenderConfig& config)
    : width_cells_(width_cells),
      height_cells_(height_cells),
      config_(config),
      pitch_(0),
      border_(config.show_grid ? 1 : 0),
      img_width_(0),
      img_height_(0) {
    if (width_cells <= 0 || height_cells <= 0) {
        throw std::invalid_argument("Renderer grid dimensions must be positive");
    }
    if (config.cell_size < 1) {
        throw std::invalid_argument("Cell size must be at least 1 pixel");
    }
    // Everything in 64 bits before narrowing: grid line + pitch per cell
    constexpr int64_t kMaxSide = std::numeric_limits<int>::max();
    const int64_t pitch = static_cast<int64_t>(config.cell_size) + border_;
    if (pitch > config.max_pixels || pitch > kMaxSide) {
        throw std::invalid_argument(
            "Cell size of " + std::to_string(config.cell_size) +
            " pixels exceeds the configured maximum");
    }
    pitch_ = static_cast<int>(pitch);

    const int64_t w = pitch * width_cells + border_;
    const int64_t h = pitch * height_cells + border_;
    if (w <= 0 || h <= 0 || w > kMaxSide || h > kMaxSide || w > config.max_pixels / h) {
        throw std::invalid_argument(
            "Image of " + std::to_string(w) + " x " + std::to_string(h) +
            " pixels exceeds the configured maximum");
    }

    img_width_ = static_cast<int>(w);
    img_height_ = static_cast<int>(h);
    pixels_.assign(static_cast<size_t>(w * h), config.dead_color);
    if (config.show_grid) {
        draw_grid();
    }
}

void FrameRenderer::check_dimensions(const Universe& universe) const {
    if (universe.width() != width_cells_ || universe.height() != height_cells_) {
        throw std::invalid_argument(
            "Universe is " + std::to_string(universe.width()) + " x " +
            std::to_string(universe.height()) + ", renderer expects " +
            std::to_string(width_cells_) + " x " + std::to_string(height_cells_));
    }
}

void FrameRenderer::draw_grid() {
    // Vertical lines
    for (int cx = 0; cx <= width_cells_; cx++) {
        const int x = cx * pitch_;
        for (int y = 0; y < img_height_; y++) {
            pixels_[static_cast<size_t>(y) * img_width_ + x] = config_.grid_color;
        }
    }
    // Horizontal lines
    for (int cy = 0; cy <= height_cells_; cy++) {
        const int y = cy * pitch_;
        std::fill_n(pixels_.begin() + static_cast<std::ptrdiff_t>(y) * img_width_,
                    img_width_, config_.grid_color);
    }
}

void FrameRenderer::paint_cell(size_t index, CellState state) {
    const int row = static_cast<int>(index / static_cast<size_t>(width_cells_));
    const int col = static_cast<int>(index % static_cast<size_t>(width_cells_));
    const uint32_t color = state == CellState::Alive ? config_.alive_color : config_.dead_color;

    const int px = col * pitch_ + border_;
    const int py = row * pitch_ + border_;
    for (int dy = 0; dy < config_.cell_size; dy++) {
        std::fill_n(pixels_.begin() + static_cast<std::ptrdiff_t>(py + dy) * img_width_ + px,
                    config_.cell_size, color);
    }
}

void FrameRenderer::redraw(const Universe& universe) {
    check_dimensions(universe);
    const CellBuffer& cells = universe.cells();
    for (size_t i = 0; i < cells.size(); i++) {
        paint_cell(i, cells[i]);
    }
}

size_t FrameRenderer::apply_diff(const Universe& universe) {
    check_dimensions(universe);
    const CellBuffer& cells = universe.cells();
    const int32_t* diff = universe.diff_data();

    size_t painted = 0;
    for (; diff[painted] != kDiffSentinel; painted++) {
        const size_t idx = static_cast<size_t>(diff[painted]);
        paint_cell(idx, cells[idx]);
    }
    return painted;
}

uint32_t FrameRenderer::cell_color(int row, int col) const {
    if (row < 0 || row >= height_cells_ || col < 0 || col >= width_cells_) {
        throw std::out_of_range("Cell outside the rendered grid");
    }
    const int px = col * pitch_ + border_;
    const int py = row * pitch_ + border_;
    return pixels_[static_cast<size_t>(py) * img_width_ + px];
}

bool FrameRenderer::write_png(const std::string& path) const {
    // RGBA = 4 channels
    int result = stbi_write_png(path.c_str(), img_width_, img_height_, 4,
                                pixels_.data(), img_width_ * 4);
    return result != 0;
}

bool FrameRenderer::write_png(int frame_number) const {
    return write_png(frame_path(config_, frame_number));
}

std::string frame_path(const RenderConfig& config, int frame_number) {
    char frame_str[16];
    snprintf(frame_str, sizeof(frame_str), "%05d", frame_number);
    return config.output_dir + "/frame_" + frame_str + ".png";
}

bool render_frame(const Universe& universe, const RenderConfig& config, int frame_number) {
    try {
        FrameRenderer renderer(universe.width(), universe.height(), config);
        renderer.redraw(universe);
        return renderer.write_png(frame_number);
    } catch (const std::invalid_argument&) {
        return false;
    }
}
