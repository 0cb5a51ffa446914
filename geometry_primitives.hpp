#ifndef GEOMETRY_PRIMITIVES_HPP
#define GEOMETRY_PRIMITIVES_HPP

#include <boost/optional.hpp>

#include "geometry.hpp"

namespace geometry_primitives {

// Points closer than this are considered the same point.
constexpr double epsilon = 1e-9;

// Removes repeated consecutive points and the closing duplicate, then
// returns the path as a closed ring with bg's clockwise orientation.
// Returns boost::none if fewer than 3 distinct points remain.
boost::optional<ring_type_fp> normalize_ring(const linestring_type_fp& points);

// True if the ends of the path meet.
bool is_closed(const linestring_type_fp& path);

// Shoelace area, positive for counter-clockwise rings.
double signed_area(const ring_type_fp& ring);

// Even-odd rule.  Points exactly on the boundary may go either way.
bool point_in_polygon(const point_type_fp& point, const ring_type_fp& ring);

// Intersection point of the segments a0-a1 and b0-b1, if they cross or
// touch.  Parallel segments never intersect.
boost::optional<point_type_fp> segment_intersection(const point_type_fp& a0, const point_type_fp& a1,
                                                     const point_type_fp& b0, const point_type_fp& b1);

box_type_fp bounding_box(const ring_type_fp& ring);
box_type_fp bounding_box(const std::vector<Stroke>& strokes);

double path_length(const linestring_type_fp& path);

// Rotates a closed path so that it starts and ends at the vertex with index
// start.  The result is closed again.
linestring_type_fp rotate_ring(const linestring_type_fp& ring, size_t start);

// The index of the vertex of path closest to point.  The closing point of a
// closed path is never returned.
size_t nearest_vertex(const linestring_type_fp& path, const point_type_fp& point);

} // namespace geometry_primitives

#endif //GEOMETRY_PRIMITIVES_HPP
