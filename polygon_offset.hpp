#ifndef POLYGON_OFFSET_HPP
#define POLYGON_OFFSET_HPP

#include <iostream>
#include <iterator>
#include <string>

#include <boost/program_options.hpp>

#include "geometry.hpp"

namespace JoinStyle {
enum JoinStyle {
  MITER,
  ROUND
};

inline std::istream& operator>>(std::istream& in, JoinStyle& join_style) {
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (token == "miter") {
    join_style = MITER;
  } else if (token == "round") {
    join_style = ROUND;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}
}; // namespace JoinStyle

namespace WallMode {
enum WallMode {
  CENTER,
  INSIDE,
  OUTSIDE
};

inline std::istream& operator>>(std::istream& in, WallMode& wall_mode) {
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (token == "center") {
    wall_mode = CENTER;
  } else if (token == "inside") {
    wall_mode = INSIDE;
  } else if (token == "outside") {
    wall_mode = OUTSIDE;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const WallMode& wall_mode) {
  switch (wall_mode) {
    case CENTER:
      out << "center";
      break;
    case INSIDE:
      out << "inside";
      break;
    case OUTSIDE:
      out << "outside";
      break;
  }
  return out;
}
}; // namespace WallMode

namespace polygon_offset {

// Upper bound of the per-vertex corner scale 1/sin(angle/2).  Sharper
// corners than about 11.5 degrees are not pushed out any further.
constexpr double max_corner_scale = 10;

// Grows (distance > 0) or shrinks (distance < 0) a closed ring.  The result
// may be empty when the ring shrinks away or may hold several polygons when
// a concave shape splits.
multi_polygon_type_fp offset(const ring_type_fp& ring, double distance,
                             JoinStyle::JoinStyle join_style = JoinStyle::MITER);

// Same for a polygon with holes.  The holes move the opposite way.
multi_polygon_type_fp offset(const polygon_type_fp& polygon, double distance,
                             JoinStyle::JoinStyle join_style = JoinStyle::MITER);

// The rings to draw for a contour with wall compensation: the ring itself
// for CENTER, otherwise the ring moved inside or outside by distance.
std::vector<ring_type_fp> wall_rings(const ring_type_fp& ring, WallMode::WallMode mode, double distance);

} // namespace polygon_offset

#endif //POLYGON_OFFSET_HPP
