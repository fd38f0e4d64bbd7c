#include <hjkl/raster.hpp>
#include <hjkl/errors.hpp>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace hjkl {

namespace {

constexpr int GLYPH_WIDTH = 2;
constexpr int GLYPH_HEIGHT = 4;
constexpr char32_t BRAILLE_BLANK = 0x2800;

// dot bit of each (row, column) within a glyph cell
constexpr std::uint8_t DOT_BITS[GLYPH_HEIGHT][GLYPH_WIDTH] = {
    {1 << 0, 1 << 3},
    {1 << 1, 1 << 4},
    {1 << 2, 1 << 5},
    {1 << 6, 1 << 7},
};

std::uint8_t dot_bit(int row, int col)
{
    if (row < 0 || row >= GLYPH_HEIGHT || col < 0 || col >= GLYPH_WIDTH) {
        throw std::logic_error(
            "no braille dot at sub-position (" + std::to_string(row) + ", " + std::to_string(col) + ")"
        );
    }
    return DOT_BITS[row][col];
}

// the braille block is U+2800..U+28FF, always three bytes
void append_utf8(std::string & out, char32_t cp)
{
    out += (char)(0xE0 | (cp >> 12));
    out += (char)(0x80 | ((cp >> 6) & 0x3F));
    out += (char)(0x80 | (cp & 0x3F));
}

}

Raster::Raster(int width, int height)
: width_(std::max(width, 0))
, height_(std::max(height, 0))
, cells_((size_t)width_ * (size_t)height_, false)
{ }

std::optional<size_t> Raster::index(int x, int y) const
{
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return std::nullopt;
    }
    return (size_t)y * (size_t)width_ + (size_t)x;
}

std::optional<bool> Raster::get(int x, int y) const
{
    auto idx = index(x, y);
    if (!idx) {
        return std::nullopt;
    }
    return cells_[*idx];
}

void Raster::set(int x, int y, bool on)
{
    if (auto idx = index(x, y)) {
        cells_[*idx] = on;
    }
}

Raster rasterize(GameState const& state)
{
    Raster raster(state.config().width, state.config().height);
    for (auto & p : state.snake_segments()) {
        raster.set(p.x, p.y, true);
    }
    for (auto & p : state.food_positions()) {
        raster.set(p.x, p.y, true);
    }
    return raster;
}

std::string pack_to_glyphs(Raster const& raster)
{
    if (raster.width() % GLYPH_WIDTH != 0) {
        throw DimensionMismatch(
            "cannot pack a raster " + std::to_string(raster.width()) + " wide: width must be a multiple of two"
        );
    }
    if (raster.height() % GLYPH_HEIGHT != 0) {
        throw DimensionMismatch(
            "cannot pack a raster " + std::to_string(raster.height()) + " high: height must be a multiple of four"
        );
    }

    int cols = raster.width() / GLYPH_WIDTH;
    int rows = raster.height() / GLYPH_HEIGHT;
    std::vector<std::uint8_t> dots((size_t)cols * (size_t)rows, 0);

    for (int y = 0; y < raster.height(); ++ y) {
        for (int x = 0; x < raster.width(); ++ x) {
            if (raster.get(x, y).value_or(false)) {
                dots[(size_t)(y / GLYPH_HEIGHT) * (size_t)cols + (size_t)(x / GLYPH_WIDTH)]
                    |= dot_bit(y % GLYPH_HEIGHT, x % GLYPH_WIDTH);
            }
        }
    }

    std::string packed;
    packed.reserve((size_t)rows * ((size_t)cols * 3 + 1));
    for (int row = 0; row < rows; ++ row) {
        if (row > 0) {
            packed += '\n';
        }
        for (int col = 0; col < cols; ++ col) {
            append_utf8(packed, BRAILLE_BLANK + dots[(size_t)row * (size_t)cols + (size_t)col]);
        }
    }
    return packed;
}

std::string to_ascii(Raster const& raster)
{
    std::string ascii;
    ascii.reserve((size_t)raster.height() * ((size_t)raster.width() + 1));
    for (int y = 0; y < raster.height(); ++ y) {
        if (y > 0) {
            ascii += '\n';
        }
        for (int x = 0; x < raster.width(); ++ x) {
            ascii += raster.get(x, y).value_or(false) ? '8' : '.';
        }
    }
    return ascii;
}

std::ostream & operator<<(std::ostream & out, Raster const& raster)
{
    return out << to_ascii(raster);
}

} // namespace hjkl
