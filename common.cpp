/*
 * This file is part of plot2gcode.
 * 
 * Copyright (C) 2015 Nicola Corna <nicola@corna.info>
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

#include <fstream>
#include <iterator>

#include "common.hpp"

using std::string;

#include <boost/system/api_config.hpp>  // for BOOST_POSIX_API

// Joins a directory and a file name.  An absolute file name or an empty
// directory leaves the file name unchanged.
string build_filename(const string& dir, const string& file) {
#ifdef BOOST_WINDOWS_API
  const char separator = '\\';
#else
  const char separator = '/';
#endif
  if (dir.empty() || (!file.empty() && file.front() == separator)) {
    return file;
  }
  const bool has_separator = dir.back() == separator;
  return has_separator ? dir + file : dir + separator + file;
}

boost::optional<string> read_file(const string& name) {
  std::ifstream in(name.c_str());
  if (!in.good()) {
    return boost::none;
  }
  return string((std::istreambuf_iterator<char>(in)),
                std::istreambuf_iterator<char>());
}
