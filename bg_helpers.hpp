#ifndef BG_HELPERS_H
#define BG_HELPERS_H

#include "geometry.hpp"

namespace bg_helpers {

// Number of segments used to approximate a full circle by the round joins.
constexpr unsigned int points_per_circle = 32;

// bg::buffer with round joins.  Unlike bg::buffer, a distance of 0 returns
// the input unchanged.  A negative distance shrinks the input.
multi_polygon_type_fp buffer(const multi_polygon_type_fp& geometry_in, coordinate_type_fp distance);
multi_polygon_type_fp buffer(const polygon_type_fp& geometry_in, coordinate_type_fp distance);

// Same with mitered corners.
multi_polygon_type_fp buffer_miter(const multi_polygon_type_fp& geometry_in, coordinate_type_fp distance);
multi_polygon_type_fp buffer_miter(const polygon_type_fp& geometry_in, coordinate_type_fp distance);

} // namespace bg_helpers

#endif //BG_HELPERS_H
