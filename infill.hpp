#ifndef INFILL_HPP
#define INFILL_HPP

#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "geometry.hpp"

namespace InfillPattern {
enum InfillPattern {
  LINES,
  GRID,
  CROSSHATCH,
  ZIGZAG,
  HONEYCOMB,
  CONCENTRIC,
  SPIRAL,
  HILBERT
};

inline std::istream& operator>>(std::istream& in, InfillPattern& pattern) {
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (token == "lines") {
    pattern = LINES;
  } else if (token == "grid") {
    pattern = GRID;
  } else if (token == "crosshatch") {
    pattern = CROSSHATCH;
  } else if (token == "zigzag") {
    pattern = ZIGZAG;
  } else if (token == "honeycomb") {
    pattern = HONEYCOMB;
  } else if (token == "concentric") {
    pattern = CONCENTRIC;
  } else if (token == "spiral") {
    pattern = SPIRAL;
  } else if (token == "hilbert") {
    pattern = HILBERT;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const InfillPattern& pattern) {
  switch (pattern) {
    case LINES:
      out << "lines";
      break;
    case GRID:
      out << "grid";
      break;
    case CROSSHATCH:
      out << "crosshatch";
      break;
    case ZIGZAG:
      out << "zigzag";
      break;
    case HONEYCOMB:
      out << "honeycomb";
      break;
    case CONCENTRIC:
      out << "concentric";
      break;
    case SPIRAL:
      out << "spiral";
      break;
    case HILBERT:
      out << "hilbert";
      break;
  }
  return out;
}
}; // namespace InfillPattern

struct InfillSpec {
  InfillSpec() :
      pattern(InfillPattern::LINES),
      density(2),
      angle(45),
      outline_offset(0.5) {}

  InfillPattern::InfillPattern pattern;
  double density;        // mm between neighbouring lines
  double angle;          // degrees, 0 to 180
  double outline_offset; // mm kept clear of the region's boundary

  bool operator==(const InfillSpec& other) const {
    return pattern == other.pattern &&
        density == other.density &&
        angle == other.angle &&
        outline_offset == other.outline_offset;
  }
  bool operator!=(const InfillSpec& other) const {
    return !(*this == other);
  }
};

struct DensityRange {
  double min;
  double max;
};

namespace infill {

// The useful density range of each pattern.  Densities outside of it are
// allowed but produce either very dense or very sparse fills.
DensityRange density_range(InfillPattern::InfillPattern pattern);

// Scanlines at angle degrees, spaced by density, centered on the region
// along the scan direction.  Each entry holds the interior segments of one
// scanline, ordered along the line's direction.  Inner rings of the region
// are boundaries like the outer ring.
std::vector<std::vector<segment_type_fp>> scan_segments(const polygon_type_fp& region,
                                                        double density, double angle);

// Fills the region according to spec.  The strokes carry no color and no
// tool yet.  A region too small for the pattern gives no strokes.
std::vector<Stroke> generate_infill(const polygon_type_fp& region, const InfillSpec& spec);

} // namespace infill

#endif //INFILL_HPP
