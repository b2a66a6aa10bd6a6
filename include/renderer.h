#ifndef TORUS_RENDERER_H
#define TORUS_RENDERER_H

#include "universe.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Configuration for rendering universe frames to PNG images.
 * Colors are packed as 0xAABBGGRR (bytes R, G, B, A in memory).
 */
struct RenderConfig {
    std::string output_dir = ".";   // Directory to save PNG files
    int cell_size = 5;              // Pixels per cell
    uint32_t alive_color = 0xFF000000;  // black
    uint32_t dead_color = 0xFFFFFFFF;   // white
    uint32_t grid_color = 0xFFCCCCCC;   // light gray
    bool show_grid = false;         // 1px grid line around every cell
    int64_t max_pixels = 16 * 1024 * 1024;  // Maximum total pixels (16 megapixels)
};

/**
 * Keeps an RGBA image of a universe up to date.
 *
 * redraw() paints every cell from Universe::cells(). After a tick(),
 * apply_diff() repaints only the cells listed in Universe::diff(). After
 * any other mutation the caller must use redraw() again.
 */
class FrameRenderer {
public:
    /**
     * @throws std::invalid_argument if the grid is not positive, cell_size < 1,
     *         or the image would exceed config.max_pixels
     */
    FrameRenderer(int width_cells, int height_cells, const RenderConfig& config);

    /** @throws std::invalid_argument if the universe dimensions do not match */
    void redraw(const Universe& universe);

    /**
     * Repaint cells changed by the universe's last tick().
     * @return number of cells repainted
     * @throws std::invalid_argument if the universe dimensions do not match
     */
    size_t apply_diff(const Universe& universe);

    /**
     * Write the image to <output_dir>/frame_NNNNN.png.
     * @return true if successful, false on error
     */
    [[nodiscard]] bool write_png(int frame_number) const;

    /** Write the image to an explicit path. */
    [[nodiscard]] bool write_png(const std::string& path) const;

    int image_width() const noexcept { return img_width_; }
    int image_height() const noexcept { return img_height_; }
    const std::vector<uint32_t>& pixels() const noexcept { return pixels_; }

    /** Color of the pixel at the top-left of the cell's fill area. */
    uint32_t cell_color(int row, int col) const;

private:
    int width_cells_;
    int height_cells_;
    RenderConfig config_;
    int pitch_;     // cell_size plus grid line, if any
    int border_;    // offset of the first cell in pixels
    int img_width_;
    int img_height_;
    std::vector<uint32_t> pixels_;

    void check_dimensions(const Universe& universe) const;
    void draw_grid();
    void paint_cell(size_t index, CellState state);
};

/** Path of a numbered frame inside config.output_dir. */
[[nodiscard]] std::string frame_path(const RenderConfig& config, int frame_number);

/**
 * Render a universe to a PNG file in one go.
 *
 * @param universe Current universe state
 * @param config Rendering configuration
 * @param frame_number Frame number (used for filename)
 * @return true if successful, false on error
 */
[[nodiscard]] bool render_frame(const Universe& universe, const RenderConfig& config, int frame_number);

#endif // TORUS_RENDERER_H
