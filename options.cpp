/*
 * This file is part of plot2gcode.
 * 
 * Copyright (C) 2009, 2010 Patrick Birnzain <pbirnzain@users.sourceforge.net>
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

#include "options.hpp"
#include "config.h"

#include <cmath>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include "units.hpp"
#include "color_assignment.hpp"
#include "infill.hpp"
#include "polygon_offset.hpp"
#include "tool_profile.hpp"

#include <iostream>
using std::cerr;
using std::endl;
using std::string;
using std::vector;

/******************************************************************************/
/*
 */
/******************************************************************************/
options& options::instance() {
    static options singleton;
    return singleton;
}

void options::maybe_throw(const std::string& what, ErrorCodes error_code) {
  if (instance().vm["ignore-warnings"].as<bool>()) {
    cerr << "Ignoring error code " << error_code << ": " << what << endl;
  } else {
    throw plot2gcode_parse_exception(what, error_code);
  }
}

/* parse options, both command line and from the plotproject file if it exists.
 * Throws on error.
 */
void options::parse(int argc, const char** argv) {
    // guessing causes problems when one option is the start of another
    // (--drawing, --drawing-feed)
    int style = po::command_line_style::default_style
                & ~po::command_line_style::allow_guessing;

    po::options_description generic;
    generic.add(instance().cli_options).add(instance().cfg_options);

    try {
      po::store(po::parse_command_line(argc, argv, generic, style),
                instance().vm);
    } catch (std::logic_error& e) {
      throw plot2gcode_parse_exception(std::string("Error: You've supplied an invalid parameter.\n"
                                                   "Details: ")
                                       + e.what(), ERR_UNKNOWNPARAMETER);
    }

    po::notify(instance().vm);

    if( !instance().vm["noconfigfile"].as<bool>() )
        parse_files();

    po::notify(instance().vm);
}

/******************************************************************************/
/*
 */
/******************************************************************************/
string options::help()
{
    std::stringstream msg;
    msg << PACKAGE_STRING << "\n\n";
    msg << instance().cli_options << instance().cfg_options;
    return msg.str();
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::parse_files()
{

    std::string file("plotproject");

    try {
        std::ifstream stream(file.c_str());
        po::store(po::parse_config_file(stream, instance().cfg_options),
                  instance().vm);
    } catch (std::exception& e) {
      maybe_throw("Error parsing configuration file \"" + file + "\": " +
                  e.what(), ERR_INVALIDPARAMETER);
    }

    po::notify(instance().vm);
}

/******************************************************************************/
/*
 */
/******************************************************************************/
options::options()
         : cli_options("command line only options"), cfg_options("generic options (CLI and config files)") {

   cli_options.add_options()
       ("noconfigfile", po::value<bool>()->default_value(false)->implicit_value(true), "ignore any configuration file")
       ("help,?", "produce help message")
       ("version,V", "show the current software version");
   cfg_options.add_options()
       ("ignore-warnings", po::value<bool>()->default_value(false)->implicit_value(true), "Ignore warnings")
       ("drawing", po::value<vector<DrawingSpec>>(), "drawing file to plot, as file[:x-offset:y-offset[:material-height]]; may be repeated")
       ("output", po::value<string>()->default_value("plot.gcode"), "output file")
       ("output-dir", po::value<string>()->default_value(""), "output directory")
       ("tool", po::value<vector<ToolProfile>>(), "tool slot, as n:pen=...,up=...,down=...,width=...,pump-distance=...,pump-height=...; may be repeated")
       ("color", po::value<vector<string>>(), "settings of one color, as color:contour-tool=...,infill-tool=...,visible=...,fill=...,pattern=...,density=...,angle=...,outline-offset=...; may be repeated")
       ("contour-tool", po::value<unsigned int>()->default_value(1), "tool drawing the contours of colors without their own setting")
       ("infill-tool", po::value<unsigned int>(), "tool drawing the fills of colors without their own setting (default: the contour tool)")
       ("fill", po::value<bool>()->default_value(true)->implicit_value(true), "fill the solid regions of colors without their own setting")
       ("infill-pattern", po::value<InfillPattern::InfillPattern>()->default_value(InfillPattern::LINES),
        "default fill pattern: lines, grid, crosshatch, zigzag, honeycomb, concentric, spiral or hilbert")
       ("infill-density", po::value<Length>()->default_value(parse_unit<Length>("2mm")), "default spacing between fill lines")
       ("infill-angle", po::value<double>()->default_value(45), "default fill angle in degrees, from 0 to 180")
       ("infill-outline-offset", po::value<Length>()->default_value(parse_unit<Length>("0.5mm")), "default distance between a fill and its region's boundary")
       ("wall-mode", po::value<WallMode::WallMode>()->default_value(WallMode::CENTER), "where contours are drawn: center, inside or outside of the path")
       ("wall-offset", po::value<Length>(), "distance of the contour from the path for inside and outside (default: half the stroke width)")
       ("grouping", po::value<ToolGrouping::ToolGrouping>()->default_value(ToolGrouping::BY_TOOL), "by-tool draws everything of one tool at once, by-layer follows the color order")
       ("order", po::value<PassOrder::PassOrder>()->default_value(PassOrder::FILL_FIRST), "within a color: fill-first or contour-first")
       ("drawing-feed", po::value<Velocity>()->default_value(parse_unit<Velocity>("3000mm/min")), "feed while drawing")
       ("travel-feed", po::value<Velocity>()->default_value(parse_unit<Velocity>("15000mm/min")), "feed while moving with the pen up")
       ("pen-feed", po::value<Velocity>()->default_value(parse_unit<Velocity>("6000mm/min")), "feed of the pen axis")
       ("park-y", po::value<Length>()->default_value(Length(0)), "machine Y to move to at the end")
       ("optimise", po::value<bool>()->default_value(true)->implicit_value(true), "reorder strokes to reduce travel (enabled by default)")
       ("optimiser-threshold", po::value<unsigned int>()->default_value(200), "above this many strokes only the greedy search is used")
       ("optimiser-budget", po::value<Time>()->default_value(parse_unit<Time>("5s")), "time limit of the 2-opt search")
       ("bed-width", po::value<Length>(), "width of the plot bed, used to check the placement")
       ("bed-height", po::value<Length>(), "height of the plot bed, used to check the placement")
       ("preamble", po::value<string>(), "gcode preamble file, inserted at the very beginning.")
       ("postamble", po::value<string>(), "gcode postamble file, inserted before parking and M2.");
}

/******************************************************************************/
/*
 */
/******************************************************************************/
static void check_infill(const InfillSpec& spec, const string& where)
{
    if (spec.density <= 0) {
      options::maybe_throw("Error: " + where + " density must be greater than 0.", ERR_NEGATIVEDENSITY);
    } else {
      const DensityRange range = infill::density_range(spec.pattern);
      if (spec.density < range.min || spec.density > range.max) {
        cerr << "Warning: " << where << " density " << spec.density << "mm is outside of the range "
             << range.min << "mm to " << range.max << "mm recommended for " << spec.pattern << ".\n";
      }
    }
    if (spec.angle < 0 || spec.angle > 180) {
      options::maybe_throw("Error: " + where + " angle must be between 0 and 180 degrees.", ERR_ANGLERANGE);
    }
    if (spec.outline_offset < 0) {
      options::maybe_throw("Error: " + where + " outline offset can't be negative.", ERR_NEGATIVEOUTLINEOFFSET);
    }
}

static ColorDefaults color_defaults(po::variables_map const& vm)
{
    ColorDefaults defaults;
    defaults.contour_tool = vm["contour-tool"].as<unsigned int>();
    if (vm.count("infill-tool")) {
      defaults.infill_tool = vm["infill-tool"].as<unsigned int>();
    }
    defaults.fill = vm["fill"].as<bool>();
    defaults.infill.pattern = vm["infill-pattern"].as<InfillPattern::InfillPattern>();
    defaults.infill.density = vm["infill-density"].as<Length>().asMillimeter();
    defaults.infill.angle = vm["infill-angle"].as<double>();
    defaults.infill.outline_offset = vm["infill-outline-offset"].as<Length>().asMillimeter();
    return defaults;
}

static vector<string> color_specs(po::variables_map const& vm)
{
    return vm.count("color") ? vm["color"].as<vector<string>>() : vector<string>();
}

static void check_generic_parameters(po::variables_map const& vm)
{
    if (!vm.count("drawing") || vm["drawing"].as<vector<DrawingSpec>>().empty()) {
      options::maybe_throw("Error: No drawing specified (--drawing).", ERR_NODRAWING);
    }

    if (vm["drawing-feed"].as<Velocity>().asMillimeterPerMinute() <= 0) {
      options::maybe_throw("Error: Negative or equal to 0 drawing feed (--drawing-feed).", ERR_NEGATIVEDRAWINGFEED);
    }
    if (vm["travel-feed"].as<Velocity>().asMillimeterPerMinute() <= 0) {
      options::maybe_throw("Error: Negative or equal to 0 travel feed (--travel-feed).", ERR_NEGATIVETRAVELFEED);
    }
    if (vm["pen-feed"].as<Velocity>().asMillimeterPerMinute() <= 0) {
      options::maybe_throw("Error: Negative or equal to 0 pen feed (--pen-feed).", ERR_NEGATIVEPENFEED);
    }

    if (vm.count("wall-offset") && vm["wall-offset"].as<Length>().asMillimeter() < 0) {
      options::maybe_throw("Error: --wall-offset can't be negative.", ERR_NEGATIVEWALLOFFSET);
    }

    if (vm["optimiser-budget"].as<Time>().asSecond() < 0) {
      options::maybe_throw("Error: --optimiser-budget can't be negative.", ERR_NEGATIVEBUDGET);
    }

    for (const char* bed_option : {"bed-width", "bed-height"}) {
      if (vm.count(bed_option) && vm[bed_option].as<Length>().asMillimeter() <= 0) {
        options::maybe_throw(string("Error: --") + bed_option + " must be greater than 0.", ERR_NEGATIVEBEDSIZE);
      }
    }
}

static void check_tool_parameters(po::variables_map const& vm)
{
    if (!vm.count("tool")) {
      return;
    }
    std::set<unsigned int> numbers;
    for (const auto& tool : vm["tool"].as<vector<ToolProfile>>()) {
      const string name = "tool " + std::to_string(tool.number);
      if (!numbers.insert(tool.number).second) {
        options::maybe_throw("Error: " + name + " is defined more than once.", ERR_DUPLICATETOOL);
      }
      if (tool.pen_down > tool.pen_up) {
        options::maybe_throw("Error: The pen down height of " + name + " is above its pen up height.", ERR_PENDOWNABOVEUP);
      }
      if (tool.pump_distance < 0) {
        options::maybe_throw("Error: The pump distance of " + name + " can't be negative.", ERR_NEGATIVEPUMPDISTANCE);
      }
      if (tool.pump_height < 0) {
        options::maybe_throw("Error: The pump height of " + name + " can't be negative.", ERR_NEGATIVEPUMPHEIGHT);
      }
      if (tool.stroke_width < 0) {
        options::maybe_throw("Error: The stroke width of " + name + " can't be negative.", ERR_NEGATIVESTROKEWIDTH);
      }
    }
}

static void check_color_parameters(po::variables_map const& vm)
{
    const ColorDefaults defaults = color_defaults(vm);
    check_infill(defaults.infill, "Default infill");

    vector<ColorAssignment> colors;
    try {
      colors = parse_color_assignments(color_specs(vm), defaults);
    } catch (const units_parse_exception& e) {
      options::maybe_throw(string("Error: Invalid --color. ") + e.what(), ERR_INVALIDCOLOR);
      return;
    }

    std::set<unsigned int> tools;
    if (vm.count("tool")) {
      for (const auto& tool : vm["tool"].as<vector<ToolProfile>>()) {
        tools.insert(tool.number);
      }
    }
    auto check_tool = [&tools](unsigned int number, const string& user) {
      // Without any --tool every tool number gets the default profile.
      if (!tools.empty() && tools.count(number) == 0) {
        options::maybe_throw("Error: " + user + " uses tool " + std::to_string(number) +
                             " which is not defined with --tool.", ERR_UNDEFINEDTOOL);
      }
    };
    check_tool(defaults.contour_tool, "--contour-tool");
    if (defaults.infill_tool) {
      check_tool(*defaults.infill_tool, "--infill-tool");
    }
    for (const auto& color : colors) {
      if (!color.uses_defaults()) {
        check_infill(color.infill(defaults.infill), "Color " + color.color);
      }
      check_tool(color.contour_tool, "Color " + color.color);
      check_tool(color.infill_tool(), "Color " + color.color);
    }
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::check_parameters()
{
  po::variables_map const& vm = instance().vm;

  try {
    check_generic_parameters(vm);
    check_tool_parameters(vm);
    check_color_parameters(vm);
  } catch (std::runtime_error& re) {
    maybe_throw("Error: Invalid parameter. :-(", ERR_INVALIDPARAMETER);
  }
}

DrawingSettings options::drawing_settings()
{
  po::variables_map const& vm = instance().vm;
  DrawingSettings settings;
  settings.color_defaults = color_defaults(vm);
  try {
    settings.colors = parse_color_assignments(color_specs(vm), settings.color_defaults);
  } catch (const units_parse_exception& e) {
    // Only reached with --ignore-warnings, the colors are then ignored.
    cerr << "Warning: " << e.what() << endl;
  }
  if (vm.count("tool")) {
    for (const auto& tool : vm["tool"].as<vector<ToolProfile>>()) {
      settings.tools[tool.number] = tool;
    }
  }
  settings.wall_mode = vm["wall-mode"].as<WallMode::WallMode>();
  if (vm.count("wall-offset")) {
    settings.wall_offset = vm["wall-offset"].as<Length>().asMillimeter();
  }
  settings.route.optimise = vm["optimise"].as<bool>();
  settings.route.threshold = vm["optimiser-threshold"].as<unsigned int>();
  settings.route.budget = std::chrono::milliseconds(
      std::llround(vm["optimiser-budget"].as<Time>().asMillisecond()));
  return settings;
}

EmitterSettings options::emitter_settings()
{
  po::variables_map const& vm = instance().vm;
  EmitterSettings settings;
  settings.drawing_feed = vm["drawing-feed"].as<Velocity>().asMillimeterPerMinute();
  settings.travel_feed = vm["travel-feed"].as<Velocity>().asMillimeterPerMinute();
  settings.pen_feed = vm["pen-feed"].as<Velocity>().asMillimeterPerMinute();
  settings.park_y = vm["park-y"].as<Length>().asMillimeter();
  settings.grouping = vm["grouping"].as<ToolGrouping::ToolGrouping>();
  if (vm.count("tool")) {
    for (const auto& tool : vm["tool"].as<vector<ToolProfile>>()) {
      settings.tools[tool.number] = tool;
    }
  }
  return settings;
}
