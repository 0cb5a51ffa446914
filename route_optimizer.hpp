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

#ifndef ROUTE_OPTIMIZER_HPP
#define ROUTE_OPTIMIZER_HPP

#include <atomic>
#include <chrono>
#include <ostream>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "geometry.hpp"

namespace RouteMethod {
enum RouteMethod {
  NONE,
  GREEDY,
  TWO_OPT,
  GREEDY_FALLBACK
};

inline std::ostream& operator<<(std::ostream& out, const RouteMethod& method) {
  switch (method) {
    case NONE:
      out << "none";
      break;
    case GREEDY:
      out << "greedy";
      break;
    case TWO_OPT:
      out << "2-opt";
      break;
    case GREEDY_FALLBACK:
      out << "greedy (2-opt out of time)";
      break;
  }
  return out;
}
}; // namespace RouteMethod

struct RouteStats {
  RouteStats() :
      drawn_length(0),
      travel_length(0),
      segment_count(0),
      pen_lifts(0),
      method(RouteMethod::NONE),
      optimized(false) {}

  double drawn_length;
  double travel_length;
  size_t segment_count;
  size_t pen_lifts;
  RouteMethod::RouteMethod method;
  bool optimized;
};

// Time limit for a route search.  The search gives up when the deadline
// passes or when cancel() is called from another thread.
class Budget {
 public:
  explicit Budget(std::chrono::milliseconds duration) :
      deadline(std::chrono::steady_clock::now() + duration),
      cancelled(false) {}

  void cancel() {
    cancelled = true;
  }

  bool expired() const {
    return cancelled || std::chrono::steady_clock::now() >= deadline;
  }

 private:
  const std::chrono::steady_clock::time_point deadline;
  std::atomic<bool> cancelled;
};

// Orders strokes to reduce the pen-up travel between them.  Open strokes
// may be reversed.  Ring strokes are never reversed, they are rotated by
// rotate_rings() afterwards.  No stroke is added or removed.
class RouteStrategy {
 public:
  virtual ~RouteStrategy() {}
  virtual std::pair<std::vector<Stroke>, RouteMethod::RouteMethod> optimize(
      const std::vector<Stroke>& strokes, Budget& budget) const = 0;
};

// Nearest neighbour from the current pen position.
class GreedyRoute : public RouteStrategy {
 public:
  explicit GreedyRoute(const boost::optional<point_type_fp>& start = boost::none) :
      start(start) {}
  virtual std::pair<std::vector<Stroke>, RouteMethod::RouteMethod> optimize(
      const std::vector<Stroke>& strokes, Budget& budget) const;

 private:
  const boost::optional<point_type_fp> start;
};

// Greedy followed by 2-opt improvements until none is left or the budget
// runs out.  When out of time, the greedy order is returned.
class TwoOptRoute : public RouteStrategy {
 public:
  explicit TwoOptRoute(const boost::optional<point_type_fp>& start = boost::none) :
      start(start) {}
  virtual std::pair<std::vector<Stroke>, RouteMethod::RouteMethod> optimize(
      const std::vector<Stroke>& strokes, Budget& budget) const;

 private:
  const boost::optional<point_type_fp> start;
};

struct RouteOptions {
  RouteOptions() :
      optimise(true),
      threshold(200),
      budget(5000) {}

  bool optimise;
  size_t threshold;   // above this many strokes only greedy is used
  std::chrono::milliseconds budget;
  boost::optional<point_type_fp> start;
};

struct RouteResult {
  std::vector<Stroke> strokes;
  RouteStats stats;
};

namespace route_optimizer {

// Travel between the end of each stroke and the start of the next one.
double travel_length(const std::vector<Stroke>& strokes,
                     const boost::optional<point_type_fp>& start = boost::none);

RouteStats compute_stats(const std::vector<Stroke>& strokes, RouteMethod::RouteMethod method);

// Starts each ring stroke at the vertex that makes the detour from the
// previous stroke to the next one the shortest.
void rotate_rings(std::vector<Stroke>& strokes, const boost::optional<point_type_fp>& start = boost::none);

// Picks the strategy by stroke count, runs it and rotates the rings.
RouteResult optimize(const std::vector<Stroke>& strokes, const RouteOptions& options);

} // namespace route_optimizer

#endif //ROUTE_OPTIMIZER_HPP
