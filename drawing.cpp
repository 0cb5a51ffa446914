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

#include <cmath>
#include <utility>

#include <iostream>
using std::cerr;
using std::endl;

#include <string>
using std::string;

#include <vector>
using std::vector;

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
using boost::format;

#include "drawing.hpp"
#include "geometry_primitives.hpp"
#include "infill.hpp"
#include "units.hpp"

void DrawingSpec::read(const string& input_string) {
  vector<string> parts;
  boost::split(parts, input_string, boost::is_any_of(":"));
  if (parts.empty() || boost::trim_copy(parts[0]).empty()) {
    throw units_parse_exception("drawing file", input_string);
  }
  if (parts.size() != 1 && parts.size() != 3 && parts.size() != 4) {
    throw units_parse_exception("file[:x-offset:y-offset[:material-height]]", input_string);
  }
  filename = boost::trim_copy(parts[0]);
  placement = Placement();
  if (parts.size() >= 3) {
    placement.x_offset = parse_unit<Length>(boost::trim_copy(parts[1])).asMillimeter();
    placement.y_offset = parse_unit<Length>(boost::trim_copy(parts[2])).asMillimeter();
  }
  if (parts.size() == 4) {
    placement.material_height = parse_unit<Length>(boost::trim_copy(parts[3])).asMillimeter();
  }
}

std::ostream& DrawingSpec::write(std::ostream& out) const {
  out << filename << ":" << placement.x_offset << ":" << placement.y_offset
      << ":" << placement.material_height;
  return out;
}

bool DrawingSpec::operator==(const DrawingSpec& other) const {
  return filename == other.filename &&
      placement.x_offset == other.placement.x_offset &&
      placement.y_offset == other.placement.y_offset &&
      placement.material_height == other.placement.material_height;
}

std::istream& operator>>(std::istream& in, DrawingSpec& spec) {
  string input_string(std::istreambuf_iterator<char>(in), {});
  try {
    spec.read(input_string);
  } catch (const units_parse_exception& e) {
    cerr << e.what() << endl;
    throw boost::program_options::invalid_option_value(input_string);
  }
  return in;
}

std::ostream& operator<<(std::ostream& out, const DrawingSpec& spec) {
  return spec.write(out);
}

ToolProfile find_tool(const std::map<unsigned int, ToolProfile>& tools, unsigned int number) {
  const auto found = tools.find(number);
  if (found == tools.cend()) {
    return ToolProfile(number);
  }
  return found->second;
}

Drawing::Drawing(const string& name, const DrawingSettings& settings, const Placement& placement) :
    name(name), settings(settings), placement(placement) {}

void Drawing::warn(const string& warning) {
  cerr << "Warning: " << warning << endl;
  warnings.push_back(warning);
}

vector<Stroke> Drawing::contour_strokes(const ColorAssignment& assignment,
                                        const vector<SourcePath>& open_paths) {
  vector<Stroke> strokes;
  const ToolProfile tool = find_tool(settings.tools, assignment.contour_tool);
  const double offset = settings.wall_offset ? *settings.wall_offset : tool.stroke_width / 2;
  for (const auto& node : analysis.nodes()) {
    if (node.color != assignment.color) {
      continue;
    }
    // Inside and outside are relative to the inked area, which lies outside
    // of a hole's ring.
    WallMode::WallMode mode = settings.wall_mode;
    if (node.role() == PathRole::HOLE) {
      if (mode == WallMode::INSIDE) {
        mode = WallMode::OUTSIDE;
      } else if (mode == WallMode::OUTSIDE) {
        mode = WallMode::INSIDE;
      }
    }
    const auto rings = polygon_offset::wall_rings(node.ring, mode, offset);
    if (rings.empty()) {
      warn(str(format("Contour %1% of color %2% vanishes with a wall offset of %3%mm.")
               % node.id % node.color % offset));
    }
    for (const auto& ring : rings) {
      strokes.push_back(Stroke(linestring_type_fp(ring.cbegin(), ring.cend()),
                               assignment.color, assignment.contour_tool, true));
    }
  }
  for (const auto& path : open_paths) {
    if (path.color == assignment.color && path.points.size() >= 2) {
      strokes.push_back(Stroke(path.points, assignment.color, assignment.contour_tool, false));
    }
  }
  return strokes;
}

vector<Stroke> Drawing::fill_strokes(const ColorAssignment& assignment) {
  vector<Stroke> strokes;
  const InfillSpec& spec = assignment.infill(settings.color_defaults.infill);
  for (const auto& region : analysis.fill_regions(assignment.color)) {
    if (std::abs(bg::area(region)) < geometry_primitives::epsilon) {
      warn(str(format("A region of color %1% has no area and gets no fill.") % assignment.color));
      continue;
    }
    auto region_strokes = infill::generate_infill(region, spec);
    if (region_strokes.empty()) {
      warn(str(format("A region of color %1% is too small for a %2% fill at %3%mm, no fill generated.")
               % assignment.color % spec.pattern % spec.density));
    }
    for (auto& stroke : region_strokes) {
      stroke.color = assignment.color;
      stroke.tool = assignment.infill_tool();
      strokes.push_back(stroke);
    }
  }
  return strokes;
}

Pass Drawing::make_pass(const string& color, PassKind::PassKind kind, unsigned int tool,
                        const vector<Stroke>& strokes) const {
  Pass pass;
  pass.color = color;
  pass.kind = kind;
  pass.tool = tool;
  pass.placement = placement;
  RouteResult route = route_optimizer::optimize(strokes, settings.route);
  pass.strokes = route.strokes;
  pass.stats = route.stats;
  return pass;
}

void Drawing::prepare(const DrawingImporter& importer) {
  analysis = analyze_paths(importer.closed_paths());
  for (const auto& warning : analysis.warnings()) {
    warn(warning);
  }
  colors.clear();
  color_passes.clear();
  for (const auto& color : importer.colors()) {
    ColorAssignment assignment = find_color_assignment(settings.colors, color, settings.color_defaults);
    if (assignment.visible) {
      Pass contour = make_pass(color, PassKind::CONTOUR, assignment.contour_tool,
                               contour_strokes(assignment, importer.open_paths()));
      Pass fill = make_pass(color, PassKind::FILL, assignment.infill_tool(),
                            assignment.fill ? fill_strokes(assignment) : vector<Stroke>());
      if (assignment.fill) {
        assignment.fill_strokes = fill.strokes;
        assignment.fill_stats = fill.stats;
      }
      color_passes.push_back(std::make_pair(contour, fill));
    }
    colors.push_back(assignment);
  }
}

vector<Pass> Drawing::get_passes(PassOrder::PassOrder order) const {
  vector<Pass> passes;
  for (const auto& both : color_passes) {
    const Pass& first = order == PassOrder::FILL_FIRST ? both.second : both.first;
    const Pass& second = order == PassOrder::FILL_FIRST ? both.first : both.second;
    for (const Pass* pass : {&first, &second}) {
      if (!pass->strokes.empty()) {
        passes.push_back(*pass);
      }
    }
  }
  return passes;
}

box_type_fp Drawing::get_bounds() const {
  vector<Stroke> all;
  for (const auto& both : color_passes) {
    all.insert(all.end(), both.first.strokes.cbegin(), both.first.strokes.cend());
    all.insert(all.end(), both.second.strokes.cbegin(), both.second.strokes.cend());
  }
  return coordinate_transform::placed_bounds(all, placement);
}
