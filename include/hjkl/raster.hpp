#pragma once

#include <hjkl/game.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace hjkl {

/*
 * Row-major occupancy grid derived from a game snapshot.
 */
class Raster {
public:
    Raster(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    // std::nullopt outside the grid
    std::optional<bool> get(int x, int y) const;

    // Writes outside the grid are dropped
    void set(int x, int y, bool on);

private:
    std::optional<size_t> index(int x, int y) const;

    int width_;
    int height_;
    std::vector<bool> cells_;
};

/*
 * Mark every snake segment and food cell of the game.
 */
Raster rasterize(GameState const& state);

/*
 * One braille glyph (U+2800 block, UTF-8) per 2x4 block of cells,
 * one line per four rows.
 *
 * Throws DimensionMismatch unless the width is even and the height
 * a multiple of four.
 */
std::string pack_to_glyphs(Raster const& raster);

/*
 * One character per cell: '8' set, '.' clear.
 */
std::string to_ascii(Raster const& raster);

std::ostream & operator<<(std::ostream & out, Raster const& raster);

} // namespace hjkl
