#include "coordinate_transform.hpp"
#include "geometry_primitives.hpp"

namespace coordinate_transform {

point_type_fp to_machine(const point_type_fp& design, const Placement& placement) {
  return point_type_fp(design.y() + placement.y_offset,
                       design.x() + placement.x_offset);
}

box_type_fp placed_bounds(const std::vector<Stroke>& strokes, const Placement& placement) {
  box_type_fp box = geometry_primitives::bounding_box(strokes);
  if (strokes.empty() || box.min_corner().x() > box.max_corner().x()) {
    return box;
  }
  bg::set<bg::min_corner, 0>(box, box.min_corner().x() + placement.x_offset);
  bg::set<bg::max_corner, 0>(box, box.max_corner().x() + placement.x_offset);
  bg::set<bg::min_corner, 1>(box, box.min_corner().y() + placement.y_offset);
  bg::set<bg::max_corner, 1>(box, box.max_corner().y() + placement.y_offset);
  return box;
}

bool fits_bed(const box_type_fp& bounds, double width, double height) {
  return bounds.min_corner().x() >= -geometry_primitives::epsilon &&
      bounds.min_corner().y() >= -geometry_primitives::epsilon &&
      bounds.max_corner().x() <= width + geometry_primitives::epsilon &&
      bounds.max_corner().y() <= height + geometry_primitives::epsilon;
}

} // namespace coordinate_transform
