#include <algorithm>
#include <cmath>
#include <numeric>

#include <boost/format.hpp>

#include "bg_operators.hpp"
#include "geometry_primitives.hpp"
#include "path_analysis.hpp"

using std::string;
using std::vector;
using boost::format;

namespace {

// True if every vertex of inner lies inside outer.  The bounding boxes are
// compared first because it's much cheaper.
bool contains(const PathNode& outer, const box_type_fp& outer_box,
              const PathNode& inner, const box_type_fp& inner_box) {
  if (!bg::covered_by(inner_box, outer_box)) {
    return false;
  }
  for (const auto& point : inner.ring) {
    if (!geometry_primitives::point_in_polygon(point, outer.ring)) {
      return false;
    }
  }
  return true;
}

PathRole::PathRole role_for_depth(unsigned int depth) {
  if (depth == 0) {
    return PathRole::OUTER;
  }
  return depth % 2 == 1 ? PathRole::HOLE : PathRole::NESTED_OBJECT;
}

} // namespace

PathAnalysisResult::PathAnalysisResult(vector<PathNode> nodes, vector<string> warnings) :
    nodes_(std::move(nodes)), warnings_(std::move(warnings)) {
  recompute_indices();
}

void PathAnalysisResult::override_role(size_t id, const boost::optional<PathRole::PathRole>& role) {
  nodes_.at(id).override_role = role;
  recompute_indices();
}

void PathAnalysisResult::recompute_indices() {
  outer_paths_.clear();
  holes_.clear();
  nested_objects_.clear();
  for (const auto& node : nodes_) {
    switch (node.role()) {
      case PathRole::OUTER:
        outer_paths_.push_back(node.id);
        break;
      case PathRole::HOLE:
        holes_.push_back(node.id);
        break;
      case PathRole::NESTED_OBJECT:
        nested_objects_.push_back(node.id);
        break;
    }
  }
}

vector<polygon_type_fp> PathAnalysisResult::fill_regions(const string& color) const {
  vector<polygon_type_fp> regions;
  for (const auto& node : nodes_) {
    if (node.color != color || node.role() == PathRole::HOLE) {
      continue;
    }
    polygon_type_fp region;
    region.outer() = node.ring;
    for (const auto child : node.children) {
      if (nodes_[child].role() == PathRole::HOLE) {
        region.inners().push_back(nodes_[child].ring);
      }
    }
    // Inner rings go the other way around.
    bg::correct(region);
    regions.push_back(region);
  }
  return regions;
}

PathAnalysisResult analyze_paths(const vector<SourcePath>& paths) {
  vector<PathNode> nodes;
  vector<string> warnings;

  for (size_t i = 0; i < paths.size(); i++) {
    const auto ring = geometry_primitives::normalize_ring(paths[i].points);
    if (!ring) {
      warnings.push_back(str(format("Path %1% of color %2% has fewer than 3 distinct points, ignored.")
                             % i % paths[i].color));
      continue;
    }
    PathNode node;
    node.id = nodes.size();
    node.source_index = i;
    node.color = paths[i].color;
    node.ring = *ring;
    node.area = std::abs(geometry_primitives::signed_area(*ring));
    node.depth = 0;
    node.auto_role = PathRole::OUTER;
    nodes.push_back(node);
  }

  vector<box_type_fp> boxes;
  boxes.reserve(nodes.size());
  for (const auto& node : nodes) {
    boxes.push_back(geometry_primitives::bounding_box(node.ring));
  }

  // Largest first, so that a parent always gets its depth before its
  // children.
  vector<size_t> by_area(nodes.size());
  std::iota(by_area.begin(), by_area.end(), 0);
  std::stable_sort(by_area.begin(), by_area.end(), [&](size_t a, size_t b) {
      return nodes[a].area > nodes[b].area;
    });

  for (size_t i = 0; i < by_area.size(); i++) {
    PathNode& child = nodes[by_area[i]];
    // Candidates are the larger ones, already visited.  Walking backward
    // finds the smallest container first.
    for (size_t j = i; j-- > 0; ) {
      const PathNode& candidate = nodes[by_area[j]];
      if (candidate.area <= child.area) {
        continue;
      }
      if (contains(candidate, boxes[candidate.id], child, boxes[child.id])) {
        child.parent = candidate.id;
        break;
      }
    }
    if (child.parent) {
      PathNode& parent = nodes[*child.parent];
      parent.children.push_back(child.id);
      child.depth = parent.depth + 1;
    }
    child.auto_role = role_for_depth(child.depth);
  }

  for (auto& node : nodes) {
    std::sort(node.children.begin(), node.children.end());
  }

  return PathAnalysisResult(std::move(nodes), std::move(warnings));
}
