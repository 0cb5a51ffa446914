#ifndef PATH_ANALYSIS_HPP
#define PATH_ANALYSIS_HPP

#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "geometry.hpp"

namespace PathRole {
enum PathRole {
  OUTER,
  HOLE,
  NESTED_OBJECT
};

inline std::istream& operator>>(std::istream& in, PathRole& role) {
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (token == "outer") {
    role = OUTER;
  } else if (token == "hole") {
    role = HOLE;
  } else if (token == "nested-object") {
    role = NESTED_OBJECT;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const PathRole& role) {
  switch (role) {
    case OUTER:
      out << "outer";
      break;
    case HOLE:
      out << "hole";
      break;
    case NESTED_OBJECT:
      out << "nested-object";
      break;
  }
  return out;
}
}; // namespace PathRole

// One input path as it comes from the drawing file.
struct SourcePath {
  std::string color;
  linestring_type_fp points;
};

struct PathNode {
  PathRole::PathRole role() const {
    return override_role ? *override_role : auto_role;
  }

  size_t id;
  // Index into the SourcePath vector that was analyzed.
  size_t source_index;
  std::string color;
  ring_type_fp ring;
  double area;
  unsigned int depth;
  PathRole::PathRole auto_role;
  boost::optional<PathRole::PathRole> override_role;
  boost::optional<size_t> parent;
  std::vector<size_t> children;
};

// Containment forest over all the closed paths of one drawing.  Nodes are
// addressed by id, which is their index in nodes().
class PathAnalysisResult {
 public:
  PathAnalysisResult() {}
  PathAnalysisResult(std::vector<PathNode> nodes, std::vector<std::string> warnings);

  const std::vector<PathNode>& nodes() const {
    return nodes_;
  }
  const PathNode& node(size_t id) const {
    return nodes_.at(id);
  }
  const std::vector<size_t>& outer_paths() const {
    return outer_paths_;
  }
  const std::vector<size_t>& holes() const {
    return holes_;
  }
  const std::vector<size_t>& nested_objects() const {
    return nested_objects_;
  }
  const std::vector<std::string>& warnings() const {
    return warnings_;
  }

  // Sets or clears (with boost::none) the user role of a node.  The forest
  // is unchanged, only the index lists are rebuilt.
  void override_role(size_t id, const boost::optional<PathRole::PathRole>& role);

  // The regions of one color that take an infill: every node of that color
  // whose effective role is not a hole, minus its children that are
  // effective holes, whatever their color.
  std::vector<polygon_type_fp> fill_regions(const std::string& color) const;

 private:
  void recompute_indices();

  std::vector<PathNode> nodes_;
  std::vector<size_t> outer_paths_;
  std::vector<size_t> holes_;
  std::vector<size_t> nested_objects_;
  std::vector<std::string> warnings_;
};

// Builds the forest.  Open paths must be filtered out by the caller; paths
// with fewer than 3 distinct points are left out of the forest and reported
// in warnings().
PathAnalysisResult analyze_paths(const std::vector<SourcePath>& paths);

#endif //PATH_ANALYSIS_HPP
