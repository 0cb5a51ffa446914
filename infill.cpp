#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <utility>

#include "bg_operators.hpp"
#include "eulerian_paths.hpp"
#include "geometry_primitives.hpp"
#include "polygon_offset.hpp"
#include "infill.hpp"

using std::vector;
using std::pair;

namespace infill {

namespace {

// Number of points checked along a zigzag or spiral connector.
constexpr unsigned int connector_samples = 10;

// Lattice points closer than this are merged.
constexpr double lattice_resolution = 1e-6;

// More hexagons than this is a mistake in the density.
constexpr double max_cells = 4e6;

double dot(const point_type_fp& a, const point_type_fp& b) {
  return a.x() * b.x() + a.y() * b.y();
}

double to_radians(double degrees) {
  return degrees * bg::math::pi<double>() / 180;
}

point_type_fp rotate(const point_type_fp& p, double radians) {
  const double c = std::cos(radians);
  const double s = std::sin(radians);
  return point_type_fp(p.x() * c - p.y() * s, p.x() * s + p.y() * c);
}

// Bounding box of the region's outer ring in a frame rotated by -radians.
box_type_fp rotated_envelope(const polygon_type_fp& region, double radians) {
  box_type_fp box;
  bg::assign_inverse(box);
  for (const auto& p : region.outer()) {
    bg::expand(box, rotate(p, -radians));
  }
  return box;
}

// True if the straight move from a to b stays inside the region.
bool valid_connector(const point_type_fp& a, const point_type_fp& b, const polygon_type_fp& region) {
  for (unsigned int i = 0; i <= connector_samples; i++) {
    const point_type_fp sample = a + (b - a) * (double(i) / connector_samples);
    if (!bg::covered_by(sample, region)) {
      return false;
    }
  }
  return true;
}

Stroke open_stroke(const linestring_type_fp& points) {
  return Stroke(points, "", 0, false);
}

vector<Stroke> lines(const polygon_type_fp& region, double density, double angle) {
  vector<Stroke> ret;
  for (const auto& scanline : scan_segments(region, density, angle)) {
    for (const auto& segment : scanline) {
      ret.push_back(open_stroke(linestring_type_fp{segment.first, segment.second}));
    }
  }
  return ret;
}

vector<Stroke> zigzag(const polygon_type_fp& region, double density, double angle) {
  auto scanlines = scan_segments(region, density, angle);
  vector<Stroke> ret;
  linestring_type_fp current;
  for (size_t i = 0; i < scanlines.size(); i++) {
    auto& scanline = scanlines[i];
    if (i % 2 == 1) {
      std::reverse(scanline.begin(), scanline.end());
      for (auto& segment : scanline) {
        std::swap(segment.first, segment.second);
      }
    }
    if (scanline.empty() && !current.empty()) {
      ret.push_back(open_stroke(current));
      current.clear();
    }
    for (size_t j = 0; j < scanline.size(); j++) {
      const auto& segment = scanline[j];
      // Only the first segment of a scanline can continue the previous one.
      if (j == 0 && !current.empty() && valid_connector(current.back(), segment.first, region)) {
        current.push_back(segment.first);
        current.push_back(segment.second);
      } else {
        if (!current.empty()) {
          ret.push_back(open_stroke(current));
        }
        current = linestring_type_fp{segment.first, segment.second};
      }
    }
  }
  if (!current.empty()) {
    ret.push_back(open_stroke(current));
  }
  return ret;
}

// Flat-topped hexagons with a circumradius of density.  The lattice is
// built in the frame rotated by angle and clipped to the region.
vector<Stroke> honeycomb(const polygon_type_fp& region, double density, double angle) {
  vector<Stroke> ret;
  const double radians = to_radians(angle);
  const box_type_fp box = rotated_envelope(region, radians);
  const double size = density;
  const double height = std::sqrt(3.0) * size;
  const double column_step = 1.5 * size;
  const long first_column = std::floor(box.min_corner().x() / column_step) - 1;
  const long last_column = std::ceil(box.max_corner().x() / column_step) + 1;
  const long first_row = std::floor(box.min_corner().y() / height) - 1;
  const long last_row = std::ceil(box.max_corner().y() / height) + 1;
  if (double(last_column - first_column) * double(last_row - first_row) > max_cells) {
    std::cerr << "Warning: honeycomb density " << density << " is too small for the region, no fill generated." << std::endl;
    return ret;
  }

  typedef pair<long long, long long> vertex_key;
  std::map<vertex_key, point_type_fp> vertices;
  std::set<pair<vertex_key, vertex_key>> seen_edges;
  vector<linestring_type_fp> edges;

  auto key_of = [](double x, double y) {
    return vertex_key(std::llround(x / lattice_resolution), std::llround(y / lattice_resolution));
  };
  auto vertex = [&](const vertex_key& key, double x, double y) {
    auto found = vertices.find(key);
    if (found == vertices.end()) {
      found = vertices.emplace(key, rotate(point_type_fp(x, y), radians)).first;
    }
    return found->second;
  };

  for (long column = first_column; column <= last_column; column++) {
    for (long row = first_row; row <= last_row; row++) {
      const double cx = column * column_step;
      const double cy = row * height + (column % 2 != 0 ? height / 2 : 0);
      double xs[6];
      double ys[6];
      for (int k = 0; k < 6; k++) {
        xs[k] = cx + size * std::cos(to_radians(60 * k));
        ys[k] = cy + size * std::sin(to_radians(60 * k));
      }
      for (int k = 0; k < 6; k++) {
        const int next = (k + 1) % 6;
        auto a = key_of(xs[k], ys[k]);
        auto b = key_of(xs[next], ys[next]);
        auto edge_key = a < b ? std::make_pair(a, b) : std::make_pair(b, a);
        if (!seen_edges.insert(edge_key).second) {
          continue;
        }
        edges.push_back(linestring_type_fp{vertex(a, xs[k], ys[k]), vertex(b, xs[next], ys[next])});
      }
    }
  }

  vector<linestring_type_fp> clipped;
  for (const auto& edge : edges) {
    if (!bg::intersects(bg::return_envelope<box_type_fp>(edge), bg::return_envelope<box_type_fp>(region))) {
      continue;
    }
    for (const auto& piece : edge & region) {
      if (piece.size() >= 2 && bg::length(piece) > geometry_primitives::epsilon) {
        clipped.push_back(piece);
      }
    }
  }
  for (const auto& path : eulerian_paths::join_edges(clipped)) {
    ret.push_back(open_stroke(path));
  }
  return ret;
}

// The region's rings and those of its successive inward offsets, outermost
// first, until the offset leaves nothing.
vector<ring_type_fp> concentric_rings(const polygon_type_fp& region, double density) {
  vector<ring_type_fp> rings;
  // Every step moves the boundary in by density, so the region is gone
  // after half its largest extent.
  const box_type_fp box = bg::return_envelope<box_type_fp>(region);
  const double extent = std::max(box.max_corner().x() - box.min_corner().x(),
                                 box.max_corner().y() - box.min_corner().y());
  const unsigned int max_steps = std::ceil(extent / 2 / density) + 2;
  multi_polygon_type_fp current;
  current.push_back(region);
  unsigned int step = 0;
  for (; !current.empty() && step < max_steps; step++) {
    multi_polygon_type_fp next;
    for (const auto& poly : current) {
      rings.push_back(poly.outer());
      for (const auto& inner : poly.inners()) {
        rings.push_back(inner);
      }
      const auto shrunk = polygon_offset::offset(poly, -density);
      next.insert(next.end(), shrunk.cbegin(), shrunk.cend());
    }
    current = next;
  }
  if (!current.empty()) {
    std::cerr << "Warning: concentric fill stopped after " << step
              << " rings, the center of the region is left unfilled." << std::endl;
  }
  return rings;
}

vector<Stroke> concentric(const polygon_type_fp& region, double density) {
  vector<Stroke> ret;
  for (const auto& ring : concentric_rings(region, density)) {
    ret.push_back(Stroke(linestring_type_fp(ring.cbegin(), ring.cend()), "", 0, true));
  }
  return ret;
}

vector<Stroke> spiral(const polygon_type_fp& region, double density) {
  vector<Stroke> ret;
  linestring_type_fp current;
  for (const auto& ring : concentric_rings(region, density)) {
    linestring_type_fp path(ring.cbegin(), ring.cend());
    if (!current.empty()) {
      path = geometry_primitives::rotate_ring(path, geometry_primitives::nearest_vertex(path, current.back()));
    }
    if (!current.empty() && valid_connector(current.back(), path.front(), region)) {
      current.insert(current.end(), path.cbegin(), path.cend());
    } else {
      if (!current.empty()) {
        ret.push_back(open_stroke(current));
      }
      current = path;
    }
  }
  if (!current.empty()) {
    ret.push_back(open_stroke(current));
  }
  return ret;
}

// Position of the d-th cell of a Hilbert curve over an n by n grid, n a
// power of two.
void hilbert_cell(unsigned int n, unsigned int d, unsigned int& x, unsigned int& y) {
  x = 0;
  y = 0;
  for (unsigned int s = 1; s < n; s *= 2) {
    const unsigned int rx = 1 & (d / 2);
    const unsigned int ry = 1 & (d ^ rx);
    if (ry == 0) {
      if (rx == 1) {
        x = s - 1 - x;
        y = s - 1 - y;
      }
      std::swap(x, y);
    }
    x += s * rx;
    y += s * ry;
    d /= 4;
  }
}

vector<Stroke> hilbert(const polygon_type_fp& region, double density, double angle) {
  vector<Stroke> ret;
  const double radians = to_radians(angle);
  const box_type_fp box = rotated_envelope(region, radians);
  const double size = std::max(box.max_corner().x() - box.min_corner().x(),
                               box.max_corner().y() - box.min_corner().y());
  if (!(size > 0)) {
    return ret;
  }
  const long rounded_order = std::lround(std::log2(size / density));
  const unsigned int order = std::min(6L, std::max(1L, rounded_order));
  const unsigned int n = 1u << order;
  const double cell = size / n;
  linestring_type_fp curve;
  for (unsigned int d = 0; d < n * n; d++) {
    unsigned int x, y;
    hilbert_cell(n, d, x, y);
    curve.push_back(rotate(point_type_fp(box.min_corner().x() + (x + 0.5) * cell,
                                         box.min_corner().y() + (y + 0.5) * cell),
                           radians));
  }
  for (const auto& piece : curve & region) {
    if (piece.size() >= 2 && bg::length(piece) > geometry_primitives::epsilon) {
      ret.push_back(open_stroke(piece));
    }
  }
  return ret;
}

template <typename T>
void append(vector<T>& to, const vector<T>& from) {
  to.insert(to.end(), from.cbegin(), from.cend());
}

} // namespace

DensityRange density_range(InfillPattern::InfillPattern pattern) {
  switch (pattern) {
    case InfillPattern::LINES:      return {0.5, 10};
    case InfillPattern::GRID:       return {1, 20};
    case InfillPattern::CROSSHATCH: return {0.5, 10};
    case InfillPattern::ZIGZAG:     return {0.5, 15};
    case InfillPattern::HONEYCOMB:  return {1, 50};
    case InfillPattern::CONCENTRIC: return {0.5, 10};
    case InfillPattern::SPIRAL:     return {1, 20};
    case InfillPattern::HILBERT:    return {1, 10};
  }
  return {0.5, 10};
}

vector<vector<segment_type_fp>> scan_segments(const polygon_type_fp& region, double density, double angle) {
  vector<vector<segment_type_fp>> ret;
  if (!(density > 0) || region.outer().size() < 4) {
    return ret;
  }
  const double radians = to_radians(angle);
  const point_type_fp direction(std::cos(radians), std::sin(radians));
  const point_type_fp normal(-direction.y(), direction.x());

  double low = std::numeric_limits<double>::infinity();
  double high = -std::numeric_limits<double>::infinity();
  for (const auto& p : region.outer()) {
    low = std::min(low, dot(p, normal));
    high = std::max(high, dot(p, normal));
  }
  const double range = high - low;
  const size_t count = std::floor(range / density + geometry_primitives::epsilon);
  if (count == 0) {
    return ret;
  }
  const double first = low + (range - (count - 1) * density) / 2;

  vector<const ring_type_fp*> rings{&region.outer()};
  for (const auto& inner : region.inners()) {
    rings.push_back(&inner);
  }

  for (size_t i = 0; i < count; i++) {
    const double p = first + i * density;
    vector<double> crossings;
    for (const auto* ring : rings) {
      for (size_t j = 1; j < ring->size(); j++) {
        const auto& a = (*ring)[j-1];
        const auto& b = (*ring)[j];
        const double pa = dot(a, normal);
        const double pb = dot(b, normal);
        if ((pa > p) != (pb > p)) {
          const point_type_fp crossing = a + (b - a) * ((p - pa) / (pb - pa));
          crossings.push_back(dot(crossing, direction));
        }
      }
    }
    std::sort(crossings.begin(), crossings.end());
    vector<segment_type_fp> scanline;
    for (size_t k = 0; k + 1 < crossings.size(); k += 2) {
      if (crossings[k+1] - crossings[k] < geometry_primitives::epsilon) {
        continue;
      }
      scanline.push_back(segment_type_fp(normal * p + direction * crossings[k],
                                         normal * p + direction * crossings[k+1]));
    }
    ret.push_back(scanline);
  }
  return ret;
}

vector<Stroke> generate_infill(const polygon_type_fp& region, const InfillSpec& spec) {
  vector<Stroke> ret;
  if (!(spec.density > 0)) {
    return ret;
  }
  multi_polygon_type_fp targets;
  if (spec.outline_offset > 0) {
    targets = polygon_offset::offset(region, -spec.outline_offset);
  } else {
    targets.push_back(region);
  }
  for (const auto& target : targets) {
    if (std::abs(bg::area(target)) < geometry_primitives::epsilon) {
      continue;
    }
    switch (spec.pattern) {
      case InfillPattern::LINES:
        append(ret, lines(target, spec.density, spec.angle));
        break;
      case InfillPattern::GRID:
        append(ret, lines(target, spec.density, spec.angle));
        append(ret, lines(target, spec.density, spec.angle + 90));
        break;
      case InfillPattern::CROSSHATCH:
        append(ret, lines(target, spec.density, spec.angle + 45));
        append(ret, lines(target, spec.density, spec.angle - 45));
        break;
      case InfillPattern::ZIGZAG:
        append(ret, zigzag(target, spec.density, spec.angle));
        break;
      case InfillPattern::HONEYCOMB:
        append(ret, honeycomb(target, spec.density, spec.angle));
        break;
      case InfillPattern::CONCENTRIC:
        append(ret, concentric(target, spec.density));
        break;
      case InfillPattern::SPIRAL:
        append(ret, spiral(target, spec.density));
        break;
      case InfillPattern::HILBERT:
        append(ret, hilbert(target, spec.density, spec.angle));
        break;
    }
  }
  return ret;
}

} // namespace infill
