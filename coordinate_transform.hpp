#ifndef COORDINATE_TRANSFORM_HPP
#define COORDINATE_TRANSFORM_HPP

#include <vector>

#include "geometry.hpp"

// Where a drawing goes on the plot bed.  Offsets are in design space.
struct Placement {
  Placement() :
      x_offset(0),
      y_offset(0),
      material_height(0) {}
  Placement(double x_offset, double y_offset, double material_height = 0) :
      x_offset(x_offset),
      y_offset(y_offset),
      material_height(material_height) {}

  double x_offset;
  double y_offset;
  // Added to the pen heights.
  double material_height;
};

namespace coordinate_transform {

// The machine's X axis runs along the design's Y axis and the other way
// around.
point_type_fp to_machine(const point_type_fp& design, const Placement& placement);

// Bounding box of the strokes after placement, in design space (before the
// axes are swapped).
box_type_fp placed_bounds(const std::vector<Stroke>& strokes, const Placement& placement);

// True if the box lies within [0, width] x [0, height].
bool fits_bed(const box_type_fp& bounds, double width, double height);

} // namespace coordinate_transform

#endif // COORDINATE_TRANSFORM_HPP
