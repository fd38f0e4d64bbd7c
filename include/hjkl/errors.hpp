#pragma once

#include <stdexcept>

namespace hjkl {

/*
 * A board configuration or starting layout that cannot be played.
 */
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/*
 * A raster whose size is not a whole number of glyph cells.
 */
class DimensionMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace hjkl
