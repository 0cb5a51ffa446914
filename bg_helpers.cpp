#include "bg_helpers.hpp"

namespace bg_helpers {

multi_polygon_type_fp buffer(const multi_polygon_type_fp& geometry_in, coordinate_type_fp distance) {
  if (distance == 0 || geometry_in.empty()) {
    return geometry_in;
  }
  multi_polygon_type_fp geometry_out;
  bg::buffer(geometry_in, geometry_out,
             bg::strategy::buffer::distance_symmetric<coordinate_type_fp>(distance),
             bg::strategy::buffer::side_straight(),
             bg::strategy::buffer::join_round(points_per_circle),
             bg::strategy::buffer::end_round(points_per_circle),
             bg::strategy::buffer::point_circle(points_per_circle));
  return geometry_out;
}

multi_polygon_type_fp buffer(const polygon_type_fp& geometry_in, coordinate_type_fp distance) {
  return buffer(multi_polygon_type_fp{geometry_in}, distance);
}

multi_polygon_type_fp buffer_miter(const multi_polygon_type_fp& geometry_in, coordinate_type_fp distance) {
  if (distance == 0 || geometry_in.empty()) {
    return geometry_in;
  }
  multi_polygon_type_fp geometry_out;
  bg::buffer(geometry_in, geometry_out,
             bg::strategy::buffer::distance_symmetric<coordinate_type_fp>(distance),
             bg::strategy::buffer::side_straight(),
             bg::strategy::buffer::join_miter(),
             bg::strategy::buffer::end_flat(),
             bg::strategy::buffer::point_square());
  return geometry_out;
}

multi_polygon_type_fp buffer_miter(const polygon_type_fp& geometry_in, coordinate_type_fp distance) {
  return buffer_miter(multi_polygon_type_fp{geometry_in}, distance);
}

} // namespace bg_helpers
