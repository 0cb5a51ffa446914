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

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <stdexcept>

#include <memory>
#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include <boost/noncopyable.hpp>

#include <istream>
#include <string>

#include "drawing.hpp"
#include "gcode_exporter.hpp"

enum ErrorCodes {
    ERR_OK = 0,
    ERR_NODRAWING = 1,
    ERR_NEGATIVEDENSITY = 2,
    ERR_ANGLERANGE = 3,
    ERR_NEGATIVEOUTLINEOFFSET = 4,
    ERR_NEGATIVEWALLOFFSET = 5,
    ERR_NEGATIVEDRAWINGFEED = 6,
    ERR_NEGATIVETRAVELFEED = 7,
    ERR_NEGATIVEPENFEED = 8,
    ERR_PENDOWNABOVEUP = 9,
    ERR_NEGATIVEPUMPDISTANCE = 10,
    ERR_NEGATIVEPUMPHEIGHT = 11,
    ERR_NEGATIVEBUDGET = 12,
    ERR_UNDEFINEDTOOL = 13,
    ERR_INVALIDCOLOR = 14,
    ERR_DUPLICATETOOL = 15,
    ERR_NEGATIVEBEDSIZE = 16,
    ERR_NEGATIVESTROKEWIDTH = 17,
    ERR_UNREADABLEINPUT = 18,
    ERR_INVALIDPARAMETER = 100,
    ERR_UNKNOWNPARAMETER = 101
};

class plot2gcode_parse_exception : public std::exception {
 public:
  plot2gcode_parse_exception(const std::string& what, ErrorCodes error_code) {
    what_string = what;
    this->error_code = error_code;
  }
  virtual const char* what() const throw() {
    return what_string.c_str();
  }
  virtual ErrorCodes code() const throw() {
    return error_code;
  }

 private:
  std::string what_string;
  ErrorCodes error_code;
};

/******************************************************************************/
/*
 Command line and "plotproject" config file options.
 */
/******************************************************************************/
class options : private boost::noncopyable
{

public:
    static void parse(int argc, const char** argv);
    static void parse_files();
    static void check_parameters();
    static po::variables_map& get_vm()
    {
        return instance().vm;
    }
    ;
    static std::string help();

    static void maybe_throw(const std::string& what, ErrorCodes error_code);

    // Settings for the pipeline and the emitter, made from the parsed
    // options.  Call check_parameters() first.
    static DrawingSettings drawing_settings();
    static EmitterSettings emitter_settings();
private:
    options();
    po::variables_map vm;
    po::options_description cli_options;      //CLI options
    po::options_description cfg_options;      // all the non-CLI options
    static options& instance();
};

#endif // OPTIONS_HPP
