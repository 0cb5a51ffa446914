#include <algorithm>
#include <cmath>

#include "bg_helpers.hpp"
#include "bg_operators.hpp"
#include "geometry_primitives.hpp"
#include "polygon_offset.hpp"

using std::vector;

namespace polygon_offset {

namespace {

// Pieces smaller than this are dropped from the results.
constexpr double min_piece_area = 1e-6;

point_type_fp unit(const point_type_fp& v) {
  const double length = std::hypot(v.x(), v.y());
  return v / length;
}

double dot(const point_type_fp& a, const point_type_fp& b) {
  return a.x() * b.x() + a.y() * b.y();
}

// Outward normal of the edge a->b of a counter-clockwise ring.
point_type_fp outward_normal(const point_type_fp& a, const point_type_fp& b) {
  const point_type_fp d = unit(b - a);
  return point_type_fp(d.y(), -d.x());
}

multi_polygon_type_fp without_slivers(const multi_polygon_type_fp& mpoly) {
  multi_polygon_type_fp ret;
  for (const auto& poly : mpoly) {
    if (bg::area(poly) > min_piece_area) {
      ret.push_back(poly);
    }
  }
  return ret;
}

// Moves every vertex along the bisector of its two edge normals, scaled so
// that the offset edges stay parallel to the originals at the same distance.
// Returns boost::none if the result isn't a clean offset of the input, which
// happens when edges vanish or the shape splits.
boost::optional<polygon_type_fp> miter_vertices(const ring_type_fp& ring, double distance) {
  vector<point_type_fp> points(ring.begin(), ring.end());
  if (points.size() > 1 && points.front() == points.back()) {
    points.pop_back();
  }
  if (geometry_primitives::signed_area(ring) < 0) {
    std::reverse(points.begin(), points.end());
  }
  const size_t n = points.size();

  vector<point_type_fp> moved;
  moved.reserve(n);
  for (size_t i = 0; i < n; i++) {
    const auto& previous = points[(i + n - 1) % n];
    const auto& current = points[i];
    const auto& next = points[(i + 1) % n];
    const point_type_fp n1 = outward_normal(previous, current);
    const point_type_fp n2 = outward_normal(current, next);
    const point_type_fp sum = n1 + n2;
    point_type_fp bisector;
    double scale;
    if (std::hypot(sum.x(), sum.y()) < geometry_primitives::epsilon) {
      // The path doubles back on itself.
      bisector = unit(current - previous);
      scale = max_corner_scale;
    } else {
      bisector = unit(sum);
      scale = std::min(1 / dot(bisector, n1), max_corner_scale);
    }
    moved.push_back(current + bisector * (distance * scale));
  }

  // Every edge must keep its direction, otherwise it has been inverted.
  for (size_t i = 0; i < n; i++) {
    const point_type_fp before = points[(i + 1) % n] - points[i];
    const point_type_fp after = moved[(i + 1) % n] - moved[i];
    if (dot(before, after) <= 0) {
      return boost::none;
    }
  }

  polygon_type_fp result;
  result.outer().assign(moved.begin(), moved.end());
  result.outer().push_back(moved.front());
  if (geometry_primitives::signed_area(result.outer()) <= 0) {
    return boost::none;
  }
  bg::correct(result);
  if (!bg::is_valid(result)) {
    return boost::none;
  }
  return result;
}

} // namespace

multi_polygon_type_fp offset(const ring_type_fp& ring, double distance,
                             JoinStyle::JoinStyle join_style) {
  polygon_type_fp input;
  input.outer() = ring;
  bg::correct(input);
  if (input.outer().size() < 4) {
    return {};
  }
  if (distance == 0) {
    return {input};
  }
  if (join_style == JoinStyle::ROUND) {
    return without_slivers(bg_helpers::buffer(input, distance));
  }
  const auto mitered = miter_vertices(input.outer(), distance);
  if (mitered) {
    return {*mitered};
  }
  return without_slivers(bg_helpers::buffer_miter(input, distance));
}

multi_polygon_type_fp offset(const polygon_type_fp& polygon, double distance,
                             JoinStyle::JoinStyle join_style) {
  const auto outer = offset(polygon.outer(), distance, join_style);
  if (polygon.inners().empty() || outer.empty()) {
    return outer;
  }
  vector<multi_polygon_type_fp> holes;
  for (const auto& inner : polygon.inners()) {
    // Shrinking the region grows its holes.
    holes.push_back(offset(inner, -distance, join_style));
  }
  return without_slivers(outer - sum(holes));
}

vector<ring_type_fp> wall_rings(const ring_type_fp& ring, WallMode::WallMode mode, double distance) {
  if (mode == WallMode::CENTER || distance == 0) {
    return {ring};
  }
  const double signed_distance = mode == WallMode::INSIDE ? -std::abs(distance) : std::abs(distance);
  vector<ring_type_fp> rings;
  for (const auto& poly : offset(ring, signed_distance)) {
    rings.push_back(poly.outer());
    rings.insert(rings.end(), poly.inners().cbegin(), poly.inners().cend());
  }
  return rings;
}

} // namespace polygon_offset
