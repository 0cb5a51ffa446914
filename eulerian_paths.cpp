#include "geometry.hpp"
#include "bg_operators.hpp"
#include <set>
#include <utility>
#include <vector>

#include "eulerian_paths.hpp"

namespace eulerian_paths {

using std::vector;
using std::pair;

vector<linestring_type_fp> join_edges(const vector<linestring_type_fp>& paths) {
  std::set<pair<point_type_fp, point_type_fp>> seen;
  vector<linestring_type_fp> segments;
  for (const auto& path : paths) {
    for (size_t i = 1; i < path.size(); i++) {
      auto a = path[i-1];
      auto b = path[i];
      if (a == b) {
        continue;
      }
      if (b < a) {
        std::swap(a, b);
      }
      if (seen.insert(std::make_pair(a, b)).second) {
        segments.push_back(linestring_type_fp{path[i-1], path[i]});
      }
    }
  }
  return get_eulerian_paths<point_type_fp, linestring_type_fp>(segments);
}

} // namespace eulerian_paths
