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
 
#ifndef COMMON_H
#define COMMON_H

#include <string>                     // for string

#include <boost/optional.hpp>

// Joins a directory and a file name like python's os.path.join.
std::string build_filename(const std::string& a, const std::string& b);

// The whole content of a file, or boost::none if it can't be read.
boost::optional<std::string> read_file(const std::string& name);

#endif // COMMON_H
