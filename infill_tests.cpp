#define BOOST_TEST_MODULE infill tests
#include <boost/test/included/unit_test.hpp>

#include <algorithm>
#include <sstream>

#include "infill.hpp"

using std::vector;

BOOST_AUTO_TEST_SUITE(infill_tests)

static polygon_type_fp square(double x, double y, double size) {
  polygon_type_fp poly;
  poly.outer() = ring_type_fp{{x, y}, {x, y + size}, {x + size, y + size}, {x + size, y}, {x, y}};
  bg::correct(poly);
  return poly;
}

static InfillSpec spec(InfillPattern::InfillPattern pattern, double density, double angle,
                       double outline_offset = 0) {
  InfillSpec ret;
  ret.pattern = pattern;
  ret.density = density;
  ret.angle = angle;
  ret.outline_offset = outline_offset;
  return ret;
}

// Every point of every stroke lies in the region, allowing for rounding.
static bool inside(const vector<Stroke>& strokes, const polygon_type_fp& region) {
  for (const auto& stroke : strokes) {
    for (const auto& point : stroke.points) {
      if (bg::distance(point, region) > 1e-6) {
        return false;
      }
    }
  }
  return true;
}

BOOST_AUTO_TEST_CASE(horizontal_lines) {
  const auto strokes = infill::generate_infill(square(0, 0, 10), spec(InfillPattern::LINES, 2, 0));
  BOOST_REQUIRE_EQUAL(strokes.size(), 5);
  for (size_t i = 0; i < strokes.size(); i++) {
    const auto& points = strokes[i].points;
    BOOST_REQUIRE_EQUAL(points.size(), 2);
    BOOST_CHECK_CLOSE(points[0].y(), 1 + 2 * i, 1e-9);
    BOOST_CHECK_CLOSE(points[1].y(), 1 + 2 * i, 1e-9);
    BOOST_CHECK_SMALL(points[0].x(), 1e-9);
    BOOST_CHECK_CLOSE(points[1].x(), 10, 1e-9);
    BOOST_CHECK(!strokes[i].ring);
    BOOST_CHECK_EQUAL(strokes[i].color, "");
    BOOST_CHECK_EQUAL(strokes[i].tool, 0);
  }
}

BOOST_AUTO_TEST_CASE(outline_offset_shrinks_first) {
  const auto strokes = infill::generate_infill(square(0, 0, 10), spec(InfillPattern::LINES, 2, 0, 0.5));
  BOOST_REQUIRE_EQUAL(strokes.size(), 4);
  BOOST_CHECK_CLOSE(strokes.front().points[0].y(), 2, 1e-6);
  BOOST_CHECK_CLOSE(strokes.back().points[0].y(), 8, 1e-6);
  for (const auto& stroke : strokes) {
    BOOST_CHECK_CLOSE(std::min(stroke.points[0].x(), stroke.points[1].x()), 0.5, 1e-6);
    BOOST_CHECK_CLOSE(std::max(stroke.points[0].x(), stroke.points[1].x()), 9.5, 1e-6);
  }
}

BOOST_AUTO_TEST_CASE(scanlines_skip_holes) {
  polygon_type_fp region = square(0, 0, 10);
  region.inners().push_back(ring_type_fp{{4, 4}, {6, 4}, {6, 6}, {4, 6}, {4, 4}});
  bg::correct(region);
  const auto scanlines = infill::scan_segments(region, 2, 0);
  BOOST_REQUIRE_EQUAL(scanlines.size(), 5);
  BOOST_CHECK_EQUAL(scanlines[0].size(), 1);
  BOOST_REQUIRE_EQUAL(scanlines[2].size(), 2);
  BOOST_CHECK_CLOSE(scanlines[2][0].second.x(), 4, 1e-9);
  BOOST_CHECK_CLOSE(scanlines[2][1].first.x(), 6, 1e-9);
}

BOOST_AUTO_TEST_CASE(too_small_for_density) {
  BOOST_CHECK(infill::generate_infill(square(0, 0, 1), spec(InfillPattern::LINES, 2, 0)).empty());
  BOOST_CHECK(infill::generate_infill(square(0, 0, 10), spec(InfillPattern::LINES, 0, 0)).empty());
  BOOST_CHECK(infill::generate_infill(square(0, 0, 10), spec(InfillPattern::LINES, -1, 0)).empty());
}

BOOST_AUTO_TEST_CASE(grid_and_crosshatch) {
  const auto region = square(0, 0, 10);
  const auto grid = infill::generate_infill(region, spec(InfillPattern::GRID, 2, 0));
  BOOST_CHECK_EQUAL(grid.size(), 10);
  BOOST_CHECK(inside(grid, region));

  const auto crosshatch = infill::generate_infill(region, spec(InfillPattern::CROSSHATCH, 2, 45));
  // One direction is at 0 degrees, the other at 90 degrees.
  BOOST_CHECK_EQUAL(crosshatch.size(), 10);
  BOOST_CHECK(inside(crosshatch, region));
}

BOOST_AUTO_TEST_CASE(rotated_lines_stay_inside) {
  const auto region = square(0, 0, 10);
  const auto strokes = infill::generate_infill(region, spec(InfillPattern::LINES, 1, 30));
  BOOST_CHECK_GT(strokes.size(), 5);
  BOOST_CHECK(inside(strokes, region));
}

BOOST_AUTO_TEST_CASE(zigzag_is_one_stroke) {
  const auto strokes = infill::generate_infill(square(0, 0, 10), spec(InfillPattern::ZIGZAG, 2, 0));
  BOOST_REQUIRE_EQUAL(strokes.size(), 1);
  const auto& points = strokes.front().points;
  BOOST_REQUIRE_EQUAL(points.size(), 10);
  // The second scanline runs the other way.
  BOOST_CHECK_CLOSE(points[1].x(), 10, 1e-9);
  BOOST_CHECK_CLOSE(points[2].x(), 10, 1e-9);
  BOOST_CHECK_SMALL(points[3].x(), 1e-9);
}

BOOST_AUTO_TEST_CASE(zigzag_breaks_around_notch) {
  // A U shape: the connector between the arms would leave the region.
  polygon_type_fp region;
  region.outer() = ring_type_fp{{0, 0}, {10, 0}, {10, 10}, {7, 10}, {7, 3}, {3, 3}, {3, 10}, {0, 10}, {0, 0}};
  bg::correct(region);
  const auto strokes = infill::generate_infill(region, spec(InfillPattern::ZIGZAG, 1, 0));
  BOOST_CHECK_GT(strokes.size(), 1);
  BOOST_CHECK(inside(strokes, region));
}

BOOST_AUTO_TEST_CASE(concentric_rings) {
  const auto strokes = infill::generate_infill(square(0, 0, 10), spec(InfillPattern::CONCENTRIC, 2, 0));
  BOOST_REQUIRE_EQUAL(strokes.size(), 3);
  for (const auto& stroke : strokes) {
    BOOST_CHECK(stroke.ring);
    BOOST_CHECK(bg::equals(stroke.points.front(), stroke.points.back()));
  }
  BOOST_CHECK_CLOSE(bg::length(strokes[0].points), 40, 1e-6);
  BOOST_CHECK_CLOSE(bg::length(strokes[1].points), 24, 1e-6);
  BOOST_CHECK_CLOSE(bg::length(strokes[2].points), 8, 1e-6);
}

BOOST_AUTO_TEST_CASE(concentric_reaches_center) {
  const auto strokes = infill::generate_infill(square(0, 0, 300), spec(InfillPattern::CONCENTRIC, 0.5, 0));
  BOOST_CHECK_GE(strokes.size(), 299);
  double smallest = 300;
  for (const auto& stroke : strokes) {
    const auto box = bg::return_envelope<box_type_fp>(stroke.points);
    smallest = std::min(smallest, box.max_corner().x() - box.min_corner().x());
  }
  BOOST_CHECK_LT(smallest, 2);
}

BOOST_AUTO_TEST_CASE(spiral_joins_rings) {
  const auto region = square(0, 0, 10);
  const auto strokes = infill::generate_infill(region, spec(InfillPattern::SPIRAL, 2, 0));
  BOOST_REQUIRE_EQUAL(strokes.size(), 1);
  BOOST_CHECK(!strokes.front().ring);
  BOOST_CHECK_GT(bg::length(strokes.front().points), 40 + 24 + 8);
  BOOST_CHECK(inside(strokes, region));
}

BOOST_AUTO_TEST_CASE(honeycomb_inside_region) {
  const auto region = square(0, 0, 20);
  const auto strokes = infill::generate_infill(region, spec(InfillPattern::HONEYCOMB, 3, 0));
  BOOST_CHECK(!strokes.empty());
  BOOST_CHECK(inside(strokes, region));
  double length = 0;
  for (const auto& stroke : strokes) {
    length += bg::length(stroke.points);
  }
  // About 3 edges of length 3 per hexagon of area 23.4.
  BOOST_CHECK_GT(length, 100);
}

BOOST_AUTO_TEST_CASE(hilbert_inside_region) {
  const auto region = square(0, 0, 16);
  const auto strokes = infill::generate_infill(region, spec(InfillPattern::HILBERT, 2, 0));
  BOOST_REQUIRE_EQUAL(strokes.size(), 1);
  // An 8 by 8 curve.
  BOOST_CHECK_GE(strokes.front().points.size(), 64);
  BOOST_CHECK(inside(strokes, region));
}

BOOST_AUTO_TEST_CASE(density_ranges) {
  const auto lines = infill::density_range(InfillPattern::LINES);
  BOOST_CHECK_EQUAL(lines.min, 0.5);
  BOOST_CHECK_EQUAL(lines.max, 10);
  const auto honeycomb = infill::density_range(InfillPattern::HONEYCOMB);
  BOOST_CHECK_EQUAL(honeycomb.min, 1);
  BOOST_CHECK_EQUAL(honeycomb.max, 50);
}

BOOST_AUTO_TEST_CASE(pattern_names) {
  InfillPattern::InfillPattern pattern;
  std::istringstream("honeycomb") >> pattern;
  BOOST_CHECK_EQUAL(pattern, InfillPattern::HONEYCOMB);
  std::istringstream bad("dots");
  BOOST_CHECK_THROW(bad >> pattern, boost::program_options::invalid_option_value);
  std::ostringstream out;
  out << InfillPattern::CROSSHATCH;
  BOOST_CHECK_EQUAL(out.str(), "crosshatch");
}

BOOST_AUTO_TEST_SUITE_END()
