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
 
#ifndef DRAWING_H
#define DRAWING_H

#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "geometry.hpp"
#include "color_assignment.hpp"
#include "coordinate_transform.hpp"
#include "drawing_importer.hpp"
#include "path_analysis.hpp"
#include "polygon_offset.hpp"
#include "route_optimizer.hpp"
#include "tool_profile.hpp"

namespace PassOrder {
enum PassOrder {
  FILL_FIRST,
  CONTOUR_FIRST
};

inline std::istream& operator>>(std::istream& in, PassOrder& order) {
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (token == "fill-first") {
    order = FILL_FIRST;
  } else if (token == "contour-first") {
    order = CONTOUR_FIRST;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const PassOrder& order) {
  switch (order) {
    case FILL_FIRST:
      out << "fill-first";
      break;
    case CONTOUR_FIRST:
      out << "contour-first";
      break;
  }
  return out;
}
}; // namespace PassOrder

namespace PassKind {
enum PassKind {
  CONTOUR,
  FILL
};

inline std::ostream& operator<<(std::ostream& out, const PassKind& kind) {
  switch (kind) {
    case CONTOUR:
      out << "contour";
      break;
    case FILL:
      out << "fill";
      break;
  }
  return out;
}
}; // namespace PassKind

// A drawing file and its placement, written as
// "file[:x-offset:y-offset[:material-height]]".
class DrawingSpec {
 public:
  DrawingSpec() {}
  DrawingSpec(const std::string& filename, const Placement& placement = Placement()) :
      filename(filename), placement(placement) {}

  void read(const std::string& input_string);
  std::ostream& write(std::ostream& out) const;
  bool operator==(const DrawingSpec& other) const;

  std::string filename;
  Placement placement;
};

std::istream& operator>>(std::istream& in, DrawingSpec& spec);
std::ostream& operator<<(std::ostream& out, const DrawingSpec& spec);

// The strokes of one color that one tool draws, already ordered.
struct Pass {
  std::string color;
  PassKind::PassKind kind;
  unsigned int tool;
  Placement placement;
  std::vector<Stroke> strokes;
  RouteStats stats;
};

// Everything the pipeline needs besides the geometry.
struct DrawingSettings {
  DrawingSettings() :
      wall_mode(WallMode::CENTER) {}

  ColorDefaults color_defaults;
  std::vector<ColorAssignment> colors;
  std::map<unsigned int, ToolProfile> tools;
  WallMode::WallMode wall_mode;
  // Half of the contour tool's stroke width if not set.
  boost::optional<double> wall_offset;
  RouteOptions route;
};

// The tool with that number, or a default one.
ToolProfile find_tool(const std::map<unsigned int, ToolProfile>& tools, unsigned int number);

/******************************************************************************/
/*
 Represents one placed drawing.

 Runs the path analysis over all closed paths of the drawing, then makes the
 contour and fill strokes of every visible color and orders each set with
 the route optimizer.  The result is a list of passes in color order.
 */
/******************************************************************************/
class Drawing : private boost::noncopyable {
 public:
  Drawing(const std::string& name, const DrawingSettings& settings, const Placement& placement);

  void prepare(const DrawingImporter& importer);

  const std::string& get_name() const {
    return name;
  }
  const Placement& get_placement() const {
    return placement;
  }
  const PathAnalysisResult& get_analysis() const {
    return analysis;
  }
  // The assignments of the colors in the drawing, with fill statistics.
  const std::vector<ColorAssignment>& get_colors() const {
    return colors;
  }
  const std::vector<std::string>& get_warnings() const {
    return warnings;
  }

  // Passes of all visible colors in drawing order.  Within a color the
  // order decides whether fill or contour comes first.  Empty passes are
  // left out.
  std::vector<Pass> get_passes(PassOrder::PassOrder order) const;

  // Bounding box of all strokes after placement, in design space.
  box_type_fp get_bounds() const;

 private:
  std::vector<Stroke> contour_strokes(const ColorAssignment& assignment,
                                      const std::vector<SourcePath>& open_paths);
  std::vector<Stroke> fill_strokes(const ColorAssignment& assignment);
  Pass make_pass(const std::string& color, PassKind::PassKind kind, unsigned int tool,
                 const std::vector<Stroke>& strokes) const;
  void warn(const std::string& warning);

  const std::string name;
  const DrawingSettings settings;
  const Placement placement;

  PathAnalysisResult analysis;
  std::vector<ColorAssignment> colors;
  // Per color: contour pass then fill pass.
  std::vector<std::pair<Pass, Pass>> color_passes;
  std::vector<std::string> warnings;
};

#endif // DRAWING_H
