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

#include <iostream>
#include <memory>

#include <vector>
using std::vector;

using std::cout;
using std::cerr;
using std::endl;
using std::flush;
using std::shared_ptr;

#include <string>
using std::string;

#include "config.h"

#include "common.hpp"
#include "coordinate_transform.hpp"
#include "drawing.hpp"
#include "drawing_importer.hpp"
#include "gcode_exporter.hpp"
#include "options.hpp"
#include "units.hpp"

#include <boost/format.hpp>
#include <boost/version.hpp>

namespace {

// Reads a preamble or postamble file, reporting progress like the imports.
string import_text(const po::variables_map& vm, const string& option) {
  string text;
  if (vm.count(option)) {
    cout << "Importing " << option << "... " << flush;
    const string name = vm[option].as<string>();
    const auto content = read_file(name);
    if (!content) {
      options::maybe_throw("Cannot read " + option + " file \"" + name + "\"", ERR_INVALIDPARAMETER);
      cout << "FAILED.\n";
    } else {
      text = *content + "\n";
      cout << "DONE.\n";
    }
  }
  return text;
}

} // namespace

void do_plot2gcode(int argc, const char* argv[]) {
    options::parse(argc, argv);      //parse the command line parameters

    po::variables_map& vm = options::get_vm();      //get the cli parameters

    if (vm.count("version")) {       //return version and quit
      cout << PACKAGE_VERSION << endl;
      cout << "Boost: " << BOOST_VERSION << endl;
      return;
    }

    if (vm.count("help")) {       //return help and quit
      cout << options::help();
      return;
    }

    options::check_parameters();      //check the cli parameters

    //---------------------------------------------------------------------------
    //prepare environment:

    const DrawingSettings settings = options::drawing_settings();
    const EmitterSettings emitter_settings = options::emitter_settings();
    const string outputdir = vm["output-dir"].as<string>();
    const auto order = vm["order"].as<PassOrder::PassOrder>();

    const string preamble = import_text(vm, "preamble");
    const string postamble = import_text(vm, "postamble");

    //---------------------------------------------------------------------------
    //import and prepare the drawings:

    vector<shared_ptr<Drawing>> drawings;
    for (const auto& spec : vm["drawing"].as<vector<DrawingSpec>>()) {
      cout << "Importing drawing \"" << spec.filename << "\"... " << flush;
      DrawingImporter importer;
      if (!importer.load_file(spec.filename)) {
        cout << "FAILED.\n";
        options::maybe_throw("Cannot read drawing file \"" + spec.filename + "\"", ERR_UNREADABLEINPUT);
        continue;
      }
      cout << "DONE.\n";

      cout << "Preparing drawing \"" << spec.filename << "\"... " << flush;
      shared_ptr<Drawing> drawing(new Drawing(spec.filename, settings, spec.placement));
      drawing->prepare(importer);
      cout << "DONE.\n";

      if (vm.count("bed-width") && vm.count("bed-height")) {
        const double width = vm["bed-width"].as<Length>().asMillimeter(1);
        const double height = vm["bed-height"].as<Length>().asMillimeter(1);
        if (!coordinate_transform::fits_bed(drawing->get_bounds(), width, height)) {
          cerr << "Warning: drawing \"" << spec.filename << "\" doesn't fit on a "
               << width << "mm x " << height << "mm bed." << endl;
        }
      }
      drawings.push_back(drawing);
    }

    //---------------------------------------------------------------------------
    //collect the passes and report the fills:

    vector<Pass> passes;
    vector<string> summary;
    for (const auto& drawing : drawings) {
      for (const auto& assignment : drawing->get_colors()) {
        if (!assignment.fill_strokes) {
          continue;
        }
        const RouteStats& stats = assignment.fill_stats;
        const string line = str(boost::format(
            "%1% color %2%: %3% strokes, drawn %4$.1fmm, travel %5$.1fmm, %6% pen lifts, route %7%")
                                % drawing->get_name() % assignment.color % stats.segment_count
                                % stats.drawn_length % stats.travel_length % stats.pen_lifts
                                % stats.method);
        cout << "Fill of " << line << endl;
        summary.push_back(line);
      }
      const auto drawing_passes = drawing->get_passes(order);
      passes.insert(passes.end(), drawing_passes.begin(), drawing_passes.end());
    }

    //---------------------------------------------------------------------------
    //write the program:

    GCode_Exporter exporter(emitter_settings);
    exporter.add_header(PACKAGE_STRING);
    for (const auto& line : summary) {
      exporter.add_header(line);
    }
    if (vm.count("preamble")) {
      exporter.set_preamble(preamble);
    }
    if (vm.count("postamble")) {
      exporter.set_postamble(postamble);
    }

    const string output = build_filename(outputdir, vm["output"].as<string>());
    cout << "Exporting " << output << "... " << flush;
    exporter.export_all(output, passes);
    cout << "DONE. (" << exporter.get_tool_changes() << " tool changes, "
         << exporter.get_pumps() << " pumps)" << endl;

    cout << "END." << endl;
}

int main(int argc, const char* argv[]) {
  try {
    do_plot2gcode(argc, argv);
  } catch (const plot2gcode_parse_exception& e) {
    cerr << e.what() << endl;
    return e.code();
  }
  return 0;
}
