#ifndef DRAWING_IMPORTER_HPP
#define DRAWING_IMPORTER_HPP

#include <iostream>
#include <string>
#include <vector>

#include "geometry.hpp"
#include "path_analysis.hpp"

/******************************************************************************/
/*
 Importer for line oriented drawing files.

 Every line holds a color and a WKT geometry:

   #ff0000 POLYGON((0 0,10 0,10 10,0 10,0 0),(2 2,4 2,4 4,2 4,2 2))
   #000000 LINESTRING(0 0,5 5)

 Empty lines and lines starting with ';' are skipped.  Each polygon ring,
 outer or inner, becomes a closed path of its own.  Linestrings are closed
 paths when their ends meet, otherwise they are open paths.
 */
/******************************************************************************/
class DrawingImporter {
 public:
  DrawingImporter() {}

  // Returns false if the file can't be read.
  bool load_file(const std::string& path);
  // Unparsable lines are skipped with a warning.
  void load(std::istream& in, const std::string& name);

  const std::vector<SourcePath>& closed_paths() const {
    return closed_paths_;
  }
  const std::vector<SourcePath>& open_paths() const {
    return open_paths_;
  }
  // The colors in the order in which they first appear.
  const std::vector<std::string>& colors() const {
    return colors_;
  }
  const std::vector<std::string>& warnings() const {
    return warnings_;
  }

  box_type_fp get_bounding_box() const;

 private:
  bool parse_line(const std::string& line);
  void add_path(const std::string& color, const linestring_type_fp& points, bool closed);
  template <typename ring_t>
  void add_ring(const std::string& color, const ring_t& ring);

  std::vector<SourcePath> closed_paths_;
  std::vector<SourcePath> open_paths_;
  std::vector<std::string> colors_;
  std::vector<std::string> warnings_;
};

#endif // DRAWING_IMPORTER_HPP
