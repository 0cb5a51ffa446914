/*
 * This file is part of plot2gcode.
 * 
 * Copyright (C) 2009, 2010 Patrick Birnzain <pbirnzain@users.sourceforge.net> and others
 * Copyright (C) 2010 Bernhard Kubicek <kubicek@gmx.at>
 * Copyright (C) 2013 Erik Schuster <erik@muenchen-ist-toll.de>
 * Copyright (C) 2014, 2015 Nicola Corna <nicola@corna.info>
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

#include "gcode_exporter.hpp"
#include "bg_operators.hpp"
#include <iostream>
using std::endl;
using std::ios_base;
#include <string>
using std::string;

#include <vector>
using std::vector;

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>

#include <boost/format.hpp>
using boost::format;

namespace {

long feed(double mm_per_minute) {
  return std::lround(mm_per_minute);
}

} // namespace

GCode_Exporter::GCode_Exporter(const EmitterSettings& settings)
    : settings(settings), pump_accumulated(0), tool_changes(0), pumps(0) {}

void GCode_Exporter::add_header(string header)
{
    this->header.push_back(header);
}

void GCode_Exporter::set_preamble(string _preamble)
{
    preamble = _preamble;
}

void GCode_Exporter::set_postamble(string _postamble)
{
    postamble = _postamble;
}

vector<Pass> GCode_Exporter::group_passes(const vector<Pass>& passes, ToolGrouping::ToolGrouping grouping) {
  vector<Pass> ret(passes);
  if (grouping == ToolGrouping::BY_LAYER) {
    return ret;
  }
  std::map<unsigned int, size_t> first_use;
  for (const auto& pass : passes) {
    first_use.emplace(pass.tool, first_use.size());
  }
  std::stable_sort(ret.begin(), ret.end(), [&first_use](const Pass& a, const Pass& b) {
      return first_use.at(a.tool) < first_use.at(b.tool);
    });
  return ret;
}

void GCode_Exporter::export_all(const string& of_name, const vector<Pass>& passes) {
  std::ofstream of;
  of.open(of_name.c_str());
  if (!of.is_open()) {
    std::stringstream error_message;
    error_message << "Can't open for writing: " << of_name;
    throw std::invalid_argument(error_message.str());
  }
  write(of, passes);
  of.close();
}

void GCode_Exporter::write(std::ostream& of, const vector<Pass>& passes) {
  current_tool = boost::none;
  pen_height = boost::none;
  pump_accumulated = 0;
  tool_changes = 0;
  pumps = 0;

  for (const string& s : header) {
    of << "( " << s << " )\n";
  }

  of.setf(ios_base::fixed);      //write floating-point values in fixed-point notation
  of.precision(2);               //Set floating-point decimal precision

  of << "\n" << preamble;       //insert external preamble

  of << "G90 ( Absolute coordinates. )\n"
     << "G21 ( Units == Millimeters. )\n";

  for (const auto& pass : group_passes(passes, settings.grouping)) {
    if (pass.strokes.empty()) {
      continue;
    }
    if (current_tool && current_tool->number != pass.tool) {
      place_tool(of);
    }
    placement = pass.placement;
    if (!current_tool) {
      grab_tool(of, pass.tool);
    }
    of << "\n( Color " << pass.color << " " << pass.kind << ", "
       << pass.strokes.size() << " strokes )\n";
    for (const auto& stroke : pass.strokes) {
      draw_stroke(of, stroke);
    }
  }

  place_tool(of);
  of << "\n" << postamble;
  of << "G1 Y" << settings.park_y << " F" << feed(settings.travel_feed) << " ( Park. )\n"
     << "M2 ( Program end. )" << endl;
}

void GCode_Exporter::grab_tool(std::ostream& of, unsigned int number) {
  place_tool(of);
  const auto found = settings.tools.find(number);
  const ToolProfile tool = found == settings.tools.cend() ? ToolProfile(number) : found->second;
  of << "\n( Tool " << tool.number << ": " << tool.pen << " )\n"
     << "M98 P\"/macros/grab_tool_" << tool.number << "\"\n"
     << "M98 P\"/macros/move_to_drawingHeight_" << tool.pen << "\"\n";
  current_tool = tool;
  pen_height = boost::none;
  pump_accumulated = 0;
  tool_changes++;
  pen_up(of);
}

void GCode_Exporter::place_tool(std::ostream& of) {
  if (!current_tool) {
    return;
  }
  pen_up(of);
  of << "M98 P\"/macros/place_tool_" << current_tool->number << "\"\n";
  current_tool = boost::none;
  pen_height = boost::none;
}

void GCode_Exporter::move_pen(std::ostream& of, double height) {
  of << "G1 U" << height << " F" << feed(settings.pen_feed) << '\n';
  pen_height = height;
}

// The pen-up height includes the material height of the current placement.
// The pen is only ever raised here: coming from thicker material it stays
// at the higher height for the travel.
void GCode_Exporter::pen_up(std::ostream& of) {
  if (!current_tool) {
    return;
  }
  const double height = current_tool->pen_up + placement.material_height;
  if (!pen_height || *pen_height < height) {
    move_pen(of, height);
  }
}

void GCode_Exporter::pen_down(std::ostream& of) {
  if (!current_tool) {
    return;
  }
  const double height = current_tool->pen_down + placement.material_height;
  if (!pen_height || *pen_height != height) {
    move_pen(of, height);
  }
}

void GCode_Exporter::pump(std::ostream& of) {
  of << "M98 P\"/macros/pump\" S" << current_tool->pump_height << '\n';
  pump_accumulated = 0;
  pumps++;
}

void GCode_Exporter::travel_to(std::ostream& of, const point_type_fp& point) {
  const auto machine = coordinate_transform::to_machine(point, placement);
  of << "G1 X" << machine.x() << " Y" << machine.y() << " F" << feed(settings.travel_feed) << '\n';
}

void GCode_Exporter::draw_to(std::ostream& of, const point_type_fp& point) {
  const auto machine = coordinate_transform::to_machine(point, placement);
  of << "G1 X" << machine.x() << " Y" << machine.y() << " F" << feed(settings.drawing_feed) << '\n';
}

/* Lifts the pen, travels to the start of the stroke and draws it.  When the
 * distance drawn since the last pump reaches the tool's pump distance, the
 * segment is split at that point and the pump macro runs with the pen still
 * down. */
void GCode_Exporter::draw_stroke(std::ostream& of, const Stroke& stroke) {
  if (stroke.points.empty() || !current_tool) {
    return;
  }
  const double threshold = current_tool->pump_distance;
  pen_up(of);
  travel_to(of, stroke.points.front());
  pen_down(of);
  for (size_t i = 1; i < stroke.points.size(); i++) {
    point_type_fp start = stroke.points[i-1];
    const point_type_fp& end = stroke.points[i];
    double remaining = bg::distance(start, end);
    while (threshold > 0 && pump_accumulated + remaining >= threshold) {
      const double needed = threshold - pump_accumulated;
      if (needed > 0) {
        start = start + (end - start) * (needed / remaining);
        draw_to(of, start);
        remaining -= needed;
      }
      pump(of);
    }
    if (remaining > 0) {
      draw_to(of, end);
      pump_accumulated += remaining;
    }
  }
  pen_up(of);
}
