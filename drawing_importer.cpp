#include <algorithm>
#include <fstream>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "drawing_importer.hpp"
#include "geometry_primitives.hpp"

using std::string;
using std::vector;

bool DrawingImporter::load_file(const string& path) {
  std::ifstream in(path);
  if (!in) {
    return false;
  }
  load(in, path);
  return true;
}

void DrawingImporter::load(std::istream& in, const string& name) {
  string line;
  unsigned int line_number = 0;
  while (std::getline(in, line)) {
    line_number++;
    boost::trim(line);
    if (line.empty() || line[0] == ';') {
      continue;
    }
    if (!parse_line(line)) {
      const string warning = str(boost::format("%1%:%2%: can't parse \"%3%\", line skipped.")
                                 % name % line_number % line);
      std::cerr << "Warning: " << warning << std::endl;
      warnings_.push_back(warning);
    }
  }
}

box_type_fp DrawingImporter::get_bounding_box() const {
  box_type_fp box;
  bg::assign_inverse(box);
  for (const auto* paths : {&closed_paths_, &open_paths_}) {
    for (const auto& path : *paths) {
      for (const auto& point : path.points) {
        bg::expand(box, point);
      }
    }
  }
  return box;
}

bool DrawingImporter::parse_line(const string& line) {
  const auto space = line.find_first_of(" \t");
  if (space == string::npos) {
    return false;
  }
  const string color = line.substr(0, space);
  const string wkt = boost::trim_copy(line.substr(space + 1));
  const string kind = boost::to_upper_copy(wkt.substr(0, wkt.find('(')));
  try {
    if (boost::starts_with(kind, "MULTIPOLYGON")) {
      multi_polygon_type_fp mpoly;
      bg::read_wkt(wkt, mpoly);
      for (const auto& poly : mpoly) {
        add_ring(color, poly.outer());
        for (const auto& inner : poly.inners()) {
          add_ring(color, inner);
        }
      }
    } else if (boost::starts_with(kind, "POLYGON")) {
      polygon_type_fp poly;
      bg::read_wkt(wkt, poly);
      add_ring(color, poly.outer());
      for (const auto& inner : poly.inners()) {
        add_ring(color, inner);
      }
    } else if (boost::starts_with(kind, "MULTILINESTRING")) {
      multi_linestring_type_fp mls;
      bg::read_wkt(wkt, mls);
      for (const auto& ls : mls) {
        add_path(color, ls, geometry_primitives::is_closed(ls));
      }
    } else if (boost::starts_with(kind, "LINESTRING")) {
      linestring_type_fp ls;
      bg::read_wkt(wkt, ls);
      add_path(color, ls, geometry_primitives::is_closed(ls));
    } else {
      return false;
    }
  } catch (const bg::read_wkt_exception&) {
    return false;
  }
  return true;
}

template <typename ring_t>
void DrawingImporter::add_ring(const string& color, const ring_t& ring) {
  add_path(color, linestring_type_fp(ring.cbegin(), ring.cend()), true);
}

void DrawingImporter::add_path(const string& color, const linestring_type_fp& points, bool closed) {
  if (points.empty()) {
    return;
  }
  if (std::find(colors_.cbegin(), colors_.cend(), color) == colors_.cend()) {
    colors_.push_back(color);
  }
  if (closed) {
    closed_paths_.push_back(SourcePath{color, points});
  } else {
    open_paths_.push_back(SourcePath{color, points});
  }
}
