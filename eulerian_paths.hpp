#ifndef EULERIAN_PATHS_H
#define EULERIAN_PATHS_H

#include <vector>
#include <map>
#include <set>
#include <utility>

#include "geometry.hpp"
#include "bg_operators.hpp"

namespace eulerian_paths {

enum struct Side : bool {
  front,
  back,
};

static inline Side operator!(const Side& s) {
  return s == Side::front ? Side::back : Side::front;
}

/* Joins pen edges into as few strokes as possible.  Every edge may be
 * drawn in either direction.  The number of strokes returned is half the
 * number of vertices with an odd edge count, or one per closed island when
 * there are none.
 *
 * Edges are linked where their end points compare equal, so the caller
 * must produce shared vertices with identical coordinates.
 */
template <typename point_t, typename linestring_t>
class eulerian_paths {
 public:
  eulerian_paths(const std::vector<linestring_t>& edges) :
    edges(edges) {}

  std::vector<linestring_t> get() {
    // Hierholzer's algorithm.  Paths must start at the odd vertices; once
    // those are used up every vertex has an even count and any remaining
    // edges form loops that can be stitched into the paths found so far.
    add_edges_to_map();

    std::vector<linestring_t> paths;
    for (const auto& vertex : start_vertices) {
      while (vertex_to_unvisited_edge.count(vertex) % 2 == 1) {
        linestring_t new_path;
        new_path.push_back(vertex);
        make_path(vertex, &new_path);
        paths.push_back(new_path);
      }
    }
    for (auto& path : paths) {
      stitch_loops(&path);
    }

    // Islands with only loops.
    while (!vertex_to_unvisited_edge.empty()) {
      const point_t vertex = vertex_to_unvisited_edge.cbegin()->first;
      linestring_t new_path;
      new_path.push_back(vertex);
      make_path(vertex, &new_path);
      stitch_loops(&new_path);
      paths.push_back(new_path);
    }
    return paths;
  }

 private:
  void add_edges_to_map() {
    vertex_to_unvisited_edge.clear();
    start_vertices.clear();
    for (size_t i = 0; i < edges.size(); i++) {
      const auto& edge = edges[i];
      if (edge.size() < 2) {
        continue;
      }
      vertex_to_unvisited_edge.emplace(edge.front(), std::make_pair(i, Side::front));
      vertex_to_unvisited_edge.emplace(edge.back(), std::make_pair(i, Side::back));
      start_vertices.insert(edge.front());
      start_vertices.insert(edge.back());
    }
  }

  // Prefers the edge that turns the least from the direction we came in.
  typename std::multimap<point_t, std::pair<size_t, Side>>::iterator select_edge(
      const linestring_t& path_so_far,
      typename std::multimap<point_t, std::pair<size_t, Side>>::iterator first,
      typename std::multimap<point_t, std::pair<size_t, Side>>::iterator last) {
    if (path_so_far.size() < 2) {
      return first;
    }
    const auto& p0 = path_so_far[path_so_far.size() - 2];
    const auto& p1 = path_so_far.back();
    auto best = first;
    double best_score = -1;
    for (auto current = first; current != last; current++) {
      const auto& edge = edges[current->second.first];
      const auto& p2 = current->second.second == Side::front ? edge[1] : edge[edge.size() - 2];
      const double length_p0_p1 = bg::distance(p0, p1);
      const double length_p1_p2 = bg::distance(p1, p2);
      if (length_p0_p1 == 0 || length_p1_p2 == 0) {
        continue;
      }
      const double delta_x = (p1.x() - p0.x())/length_p0_p1 + (p2.x() - p1.x())/length_p1_p2;
      const double delta_y = (p1.y() - p0.y())/length_p0_p1 + (p2.y() - p1.y())/length_p1_p2;
      const double score = delta_x * delta_x + delta_y * delta_y;
      if (score > best_score) {
        best = current;
        best_score = score;
      }
    }
    return best;
  }

  // Follows unvisited edges from point until a dead end, appending them to
  // new_path.  point itself must already be the last point of new_path.
  void make_path(point_t point, linestring_t* new_path) {
    while (true) {
      auto range = vertex_to_unvisited_edge.equal_range(point);
      if (range.first == range.second) {
        return;
      }
      auto chosen = select_edge(*new_path, range.first, range.second);
      const size_t edge_index = chosen->second.first;
      const Side side = chosen->second.second;
      const auto& edge = edges[edge_index];
      if (side == Side::front) {
        new_path->insert(new_path->end(), edge.cbegin() + 1, edge.cend());
      } else {
        new_path->insert(new_path->end(), edge.crbegin() + 1, edge.crend());
      }
      vertex_to_unvisited_edge.erase(chosen);
      point = new_path->back();
      auto other_end = vertex_to_unvisited_edge.equal_range(point);
      for (auto iter = other_end.first; iter != other_end.second; iter++) {
        if (iter->second == std::make_pair(edge_index, !side)) {
          vertex_to_unvisited_edge.erase(iter);
          break;
        }
      }
    }
  }

  // Walks the path and splices in a loop at every vertex that still has
  // unvisited edges.
  void stitch_loops(linestring_t* path) {
    linestring_t new_loop;
    for (size_t i = 0; i < path->size(); i++) {
      new_loop.clear();
      new_loop.push_back((*path)[i]);
      make_path((*path)[i], &new_loop);
      if (new_loop.size() > 1) {
        path->insert(path->begin() + i + 1, new_loop.begin() + 1, new_loop.end());
      }
    }
  }

  const std::vector<linestring_t>& edges;
  std::multimap<point_t, std::pair<size_t, Side>> vertex_to_unvisited_edge;
  std::set<point_t> start_vertices;
}; //class eulerian_paths

template <typename point_t, typename linestring_t>
std::vector<linestring_t> get_eulerian_paths(const std::vector<linestring_t>& edges) {
  return eulerian_paths<point_t, linestring_t>(edges).get();
}

// Splits the input into single segments, drops segments that appear more
// than once in either direction and joins the rest into strokes.
std::vector<linestring_type_fp> join_edges(const std::vector<linestring_type_fp>& paths);

} // namespace eulerian_paths
#endif //EULERIAN_PATHS_H
