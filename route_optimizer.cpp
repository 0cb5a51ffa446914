/*
 * This file is part of plot2gcode.
 *
 * Copyright (C) 2026 The plot2gcode developers
 *
 * plot2gcode is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * plot2gcode is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with plot2gcode.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <algorithm>
#include <limits>
#include <list>
#include <memory>

#include "geometry_primitives.hpp"
#include "route_optimizer.hpp"

using std::vector;
using std::pair;
using boost::optional;

namespace {

enum class Side { FRONT, BACK };

inline point_type_fp get(const Stroke& stroke, Side side) {
  if (side == Side::FRONT) {
    return stroke.points.front();
  } else {
    return stroke.points.back();
  }
}

// A ring starts and ends at the same point so reversing it would change
// nothing but the drawing direction.  Rings are left alone.
inline void reverse(Stroke& stroke) {
  if (!stroke.ring) {
    std::reverse(stroke.points.begin(), stroke.points.end());
  }
}

inline double distance(const point_type_fp& p0, const point_type_fp& p1) {
  return bg::distance(p0, p1);
}

vector<Stroke> without_empty(const vector<Stroke>& strokes, vector<Stroke>& empty) {
  vector<Stroke> ret;
  for (const auto& stroke : strokes) {
    if (stroke.points.empty()) {
      empty.push_back(stroke);
    } else {
      ret.push_back(stroke);
    }
  }
  return ret;
}

// Each step goes to the closest free end of any stroke left, reversing the
// stroke if its back is closer.  A ring is entered at its closest vertex.  The original order is kept if it is
// already better.
void nearest_neighbour(vector<Stroke>& path, const optional<point_type_fp>& starting_point) {
  if (path.empty()) {
    return;
  }
  std::list<Stroke> temp_path(path.begin(), path.end());
  vector<Stroke> newpath;
  newpath.reserve(path.size());

  // Without a starting point the first stroke's front is used, so both
  // lengths include the travel to the first stroke.
  point_type_fp current_point = starting_point ? *starting_point : get(path.front(), Side::FRONT);
  const double original_length = route_optimizer::travel_length(path, current_point);
  double new_length = 0;

  while (temp_path.size() > 0) {
    auto nearest = temp_path.begin();
    bool reversed = false;
    size_t ring_start = 0;
    double min_distance = std::numeric_limits<double>::infinity();
    for (auto i = temp_path.begin(); i != temp_path.end(); i++) {
      if (i->ring) {
        // A ring can be entered at any of its vertices.
        const size_t vertex = geometry_primitives::nearest_vertex(i->points, current_point);
        const double vertex_distance = distance(current_point, i->points[vertex]);
        if (vertex_distance < min_distance) {
          min_distance = vertex_distance;
          nearest = i;
          reversed = false;
          ring_start = vertex;
        }
        continue;
      }
      const double front_distance = distance(current_point, get(*i, Side::FRONT));
      if (front_distance < min_distance) {
        min_distance = front_distance;
        nearest = i;
        reversed = false;
      }
      const double back_distance = distance(current_point, get(*i, Side::BACK));
      if (back_distance < min_distance) {
        min_distance = back_distance;
        nearest = i;
        reversed = true;
      }
    }
    new_length += min_distance;
    newpath.push_back(*nearest);
    if (reversed) {
      reverse(newpath.back());
    }
    if (newpath.back().ring && ring_start != 0) {
      newpath.back().points = geometry_primitives::rotate_ring(newpath.back().points, ring_start);
    }
    current_point = get(newpath.back(), Side::BACK);
    temp_path.erase(nearest);
  }
  if (new_length < original_length) {
    path = newpath;
  }
}

// Reverses runs of strokes while that shortens the travel.  Returns false
// if the budget ran out before no improvement was left.
bool two_opt(vector<Stroke>& path, const optional<point_type_fp>& starting_point, Budget& budget) {
  bool found_one = true;
  while (found_one) {
    found_one = false;
    for (size_t i = 0; i < path.size(); i++) {
      if (budget.expired()) {
        return false;
      }
      for (size_t j = i; j < path.size(); j++) {
        // Potentially reverse path elements i through j inclusive.
        const auto b = get(path[i], Side::FRONT);
        const auto a = (i == 0 ? starting_point :
                        boost::make_optional(get(path[i-1], Side::BACK)));
        const auto c = get(path[j], Side::BACK);
        const auto d = j + 1 == path.size() ? boost::none : boost::make_optional(get(path[j+1], Side::FRONT));
        const double old_gap = (a ? distance(*a, b) : 0) +
                               (d ? distance(c, *d) : 0);
        const double new_gap = (a ? distance(*a, c) : 0) +
                               (d ? distance(b, *d) : 0);
        if (new_gap + geometry_primitives::epsilon < old_gap) {
          const auto reverse_start = path.begin() + i;
          const auto reverse_end = path.begin() + j + 1;
          for (auto to_reverse = reverse_start; to_reverse != reverse_end; to_reverse++) {
            reverse(*to_reverse);
          }
          std::reverse(reverse_start, reverse_end);
          found_one = true;
        }
      }
    }
  }
  return true;
}

} // namespace

pair<vector<Stroke>, RouteMethod::RouteMethod> GreedyRoute::optimize(
    const vector<Stroke>& strokes, Budget&) const {
  vector<Stroke> empty;
  vector<Stroke> path = without_empty(strokes, empty);
  nearest_neighbour(path, start);
  path.insert(path.end(), empty.cbegin(), empty.cend());
  return std::make_pair(path, RouteMethod::GREEDY);
}

pair<vector<Stroke>, RouteMethod::RouteMethod> TwoOptRoute::optimize(
    const vector<Stroke>& strokes, Budget& budget) const {
  vector<Stroke> empty;
  vector<Stroke> greedy = without_empty(strokes, empty);
  nearest_neighbour(greedy, start);
  vector<Stroke> path = greedy;
  RouteMethod::RouteMethod method = RouteMethod::TWO_OPT;
  if (!two_opt(path, start, budget)) {
    path = greedy;
    method = RouteMethod::GREEDY_FALLBACK;
  }
  path.insert(path.end(), empty.cbegin(), empty.cend());
  return std::make_pair(path, method);
}

namespace route_optimizer {

double travel_length(const vector<Stroke>& strokes, const optional<point_type_fp>& start) {
  double length = 0;
  optional<point_type_fp> current = start;
  for (const auto& stroke : strokes) {
    if (stroke.points.empty()) {
      continue;
    }
    if (current) {
      length += distance(*current, get(stroke, Side::FRONT));
    }
    current = get(stroke, Side::BACK);
  }
  return length;
}

RouteStats compute_stats(const vector<Stroke>& strokes, RouteMethod::RouteMethod method) {
  RouteStats stats;
  for (const auto& stroke : strokes) {
    stats.drawn_length += geometry_primitives::path_length(stroke.points);
  }
  stats.travel_length = travel_length(strokes);
  stats.segment_count = strokes.size();
  stats.pen_lifts = strokes.empty() ? 0 : strokes.size() - 1;
  stats.method = method;
  stats.optimized = method != RouteMethod::NONE;
  return stats;
}

void rotate_rings(vector<Stroke>& strokes, const optional<point_type_fp>& start) {
  for (size_t i = 0; i < strokes.size(); i++) {
    auto& stroke = strokes[i];
    if (!stroke.ring || stroke.points.size() < 3) {
      continue;
    }
    const optional<point_type_fp> previous = i == 0 ? start :
        boost::make_optional(get(strokes[i-1], Side::BACK));
    const optional<point_type_fp> next = i + 1 == strokes.size() ? boost::none :
        boost::make_optional(get(strokes[i+1], Side::FRONT));
    if (!previous && !next) {
      continue;
    }
    size_t best = 0;
    double best_detour = std::numeric_limits<double>::infinity();
    for (size_t v = 0; v + 1 < stroke.points.size(); v++) {
      const double detour = (previous ? distance(*previous, stroke.points[v]) : 0) +
                            (next ? distance(stroke.points[v], *next) : 0);
      if (detour < best_detour) {
        best = v;
        best_detour = detour;
      }
    }
    stroke.points = geometry_primitives::rotate_ring(stroke.points, best);
  }
}

RouteResult optimize(const vector<Stroke>& strokes, const RouteOptions& options) {
  RouteResult result;
  if (!options.optimise) {
    result.strokes = strokes;
    result.stats = compute_stats(result.strokes, RouteMethod::NONE);
    return result;
  }
  Budget budget(options.budget);
  std::unique_ptr<RouteStrategy> strategy;
  if (strokes.size() > options.threshold) {
    strategy.reset(new GreedyRoute(options.start));
  } else {
    strategy.reset(new TwoOptRoute(options.start));
  }
  auto ordered = strategy->optimize(strokes, budget);
  result.strokes = ordered.first;
  rotate_rings(result.strokes, options.start);
  result.stats = compute_stats(result.strokes, ordered.second);
  return result;
}

} // namespace route_optimizer
