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
 
#ifndef GCODE_EXPORTER_H
#define GCODE_EXPORTER_H

#include <boost/core/noncopyable.hpp>
#include <boost/optional/optional.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

#include "coordinate_transform.hpp"
#include "drawing.hpp"
#include "geometry.hpp"
#include "tool_profile.hpp"

namespace ToolGrouping {
enum ToolGrouping {
  BY_TOOL,
  BY_LAYER
};

inline std::istream& operator>>(std::istream& in, ToolGrouping& grouping) {
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (token == "by-tool") {
    grouping = BY_TOOL;
  } else if (token == "by-layer") {
    grouping = BY_LAYER;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const ToolGrouping& grouping) {
  switch (grouping) {
    case BY_TOOL:
      out << "by-tool";
      break;
    case BY_LAYER:
      out << "by-layer";
      break;
  }
  return out;
}
}; // namespace ToolGrouping

struct EmitterSettings {
  EmitterSettings() :
      drawing_feed(3000),
      travel_feed(15000),
      pen_feed(6000),
      park_y(0),
      grouping(ToolGrouping::BY_TOOL) {}

  double drawing_feed; // mm/min
  double travel_feed;  // mm/min
  double pen_feed;     // mm/min, U axis
  double park_y;       // machine Y at the end of the program
  ToolGrouping::ToolGrouping grouping;
  std::map<unsigned int, ToolProfile> tools;
};

/******************************************************************************/
/*
 Writes the plotter program.

 Keeps track of the held tool, the pen height and the distance drawn since
 the last ink pump.  Tool changes and pumps are macro calls; the macros
 themselves live on the controller.
 */
/******************************************************************************/
class GCode_Exporter: private boost::noncopyable {
public:
    GCode_Exporter(const EmitterSettings& settings);
    void add_header(std::string);
    void set_preamble(std::string);
    void set_postamble(std::string);

    // Puts the passes in the order in which they are emitted.  by-tool
    // keeps the passes of each tool together, tools in order of first use.
    // by-layer keeps the given order.
    static std::vector<Pass> group_passes(const std::vector<Pass>& passes,
                                          ToolGrouping::ToolGrouping grouping);

    // Throws std::invalid_argument if the file can't be opened.
    void export_all(const std::string& of_name, const std::vector<Pass>& passes);
    void write(std::ostream& of, const std::vector<Pass>& passes);

    unsigned int get_tool_changes() const { return tool_changes; }
    unsigned int get_pumps() const { return pumps; }

protected:
    void grab_tool(std::ostream& of, unsigned int number);
    void place_tool(std::ostream& of);
    void move_pen(std::ostream& of, double height);
    void pen_up(std::ostream& of);
    void pen_down(std::ostream& of);
    void pump(std::ostream& of);
    void travel_to(std::ostream& of, const point_type_fp& point);
    void draw_to(std::ostream& of, const point_type_fp& point);
    void draw_stroke(std::ostream& of, const Stroke& stroke);

    const EmitterSettings settings;
    std::vector<std::string> header;
    std::string preamble;        //Preamble from command line (user file)
    std::string postamble;       //Postamble from command line (user file)

    // Emission state.
    boost::optional<ToolProfile> current_tool;
    // Last U height sent, unknown after a tool change.
    boost::optional<double> pen_height;
    Placement placement;
    double pump_accumulated;

    unsigned int tool_changes;
    unsigned int pumps;
};

#endif // GCODE_EXPORTER_H
