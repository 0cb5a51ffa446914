#include <cmath>
#include <limits>

#include "bg_operators.hpp"
#include "geometry_primitives.hpp"

namespace geometry_primitives {

static bool same_point(const point_type_fp& a, const point_type_fp& b) {
  return std::abs(a.x() - b.x()) < epsilon && std::abs(a.y() - b.y()) < epsilon;
}

boost::optional<ring_type_fp> normalize_ring(const linestring_type_fp& points) {
  ring_type_fp ring;
  for (const auto& point : points) {
    if (ring.empty() || !same_point(ring.back(), point)) {
      ring.push_back(point);
    }
  }
  while (ring.size() > 1 && same_point(ring.front(), ring.back())) {
    ring.pop_back();
  }
  if (ring.size() < 3) {
    return boost::none;
  }
  ring.push_back(ring.front());
  bg::correct(ring);
  if (std::abs(signed_area(ring)) < epsilon) {
    // All points on one line.
    return boost::none;
  }
  return ring;
}

bool is_closed(const linestring_type_fp& path) {
  return path.size() > 2 && same_point(path.front(), path.back());
}

double signed_area(const ring_type_fp& ring) {
  double area = 0;
  for (size_t i = 0; i + 1 < ring.size(); i++) {
    area += ring[i].x() * ring[i+1].y() - ring[i+1].x() * ring[i].y();
  }
  if (ring.size() > 1 && ring.front() != ring.back()) {
    area += ring.back().x() * ring.front().y() - ring.front().x() * ring.back().y();
  }
  return area / 2;
}

bool point_in_polygon(const point_type_fp& point, const ring_type_fp& ring) {
  bool inside = false;
  const size_t n = ring.size();
  if (n < 3) {
    return false;
  }
  for (size_t i = 0, j = n - 1; i < n; j = i++) {
    const auto& a = ring[i];
    const auto& b = ring[j];
    if ((a.y() > point.y()) != (b.y() > point.y())) {
      const double x_cross = (b.x() - a.x()) * (point.y() - a.y()) / (b.y() - a.y()) + a.x();
      if (point.x() < x_cross) {
        inside = !inside;
      }
    }
  }
  return inside;
}

boost::optional<point_type_fp> segment_intersection(const point_type_fp& a0, const point_type_fp& a1,
                                                     const point_type_fp& b0, const point_type_fp& b1) {
  const point_type_fp r = a1 - a0;
  const point_type_fp s = b1 - b0;
  const double denominator = r.x() * s.y() - r.y() * s.x();
  if (std::abs(denominator) < epsilon) {
    return boost::none;
  }
  const point_type_fp q = b0 - a0;
  const double t = (q.x() * s.y() - q.y() * s.x()) / denominator;
  const double u = (q.x() * r.y() - q.y() * r.x()) / denominator;
  if (t < 0 || t > 1 || u < 0 || u > 1) {
    return boost::none;
  }
  return a0 + r * t;
}

box_type_fp bounding_box(const ring_type_fp& ring) {
  return bg::return_envelope<box_type_fp>(ring);
}

box_type_fp bounding_box(const std::vector<Stroke>& strokes) {
  box_type_fp box;
  bg::assign_inverse(box);
  for (const auto& stroke : strokes) {
    for (const auto& point : stroke.points) {
      bg::expand(box, point);
    }
  }
  return box;
}

double path_length(const linestring_type_fp& path) {
  return bg::length(path);
}

linestring_type_fp rotate_ring(const linestring_type_fp& ring, size_t start) {
  if (ring.size() < 2) {
    return ring;
  }
  // Without the closing point.
  const size_t count = is_closed(ring) ? ring.size() - 1 : ring.size();
  linestring_type_fp ret;
  for (size_t i = 0; i < count; i++) {
    ret.push_back(ring[(start + i) % count]);
  }
  ret.push_back(ret.front());
  return ret;
}

size_t nearest_vertex(const linestring_type_fp& path, const point_type_fp& point) {
  const size_t count = is_closed(path) ? path.size() - 1 : path.size();
  size_t best = 0;
  double best_distance = std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < count; i++) {
    const double distance = bg::comparable_distance(path[i], point);
    if (distance < best_distance) {
      best = i;
      best_distance = distance;
    }
  }
  return best;
}

} // namespace geometry_primitives
