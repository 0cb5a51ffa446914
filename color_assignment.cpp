#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include "color_assignment.hpp"
#include "tool_profile.hpp"
#include "units.hpp"

using std::string;
using std::vector;

namespace {

bool parse_bool(const string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "off") {
    return false;
  }
  throw units_parse_exception("true or false", value);
}

unsigned int parse_tool_number(const string& value) {
  try {
    return boost::lexical_cast<unsigned int>(value);
  } catch (const boost::bad_lexical_cast&) {
    throw units_parse_exception("tool number", value);
  }
}

double parse_number(const string& value) {
  try {
    return boost::lexical_cast<double>(value);
  } catch (const boost::bad_lexical_cast&) {
    throw units_parse_exception("number", value);
  }
}

} // namespace

ColorAssignment::ColorAssignment(const string& color, const ColorDefaults& defaults) :
    color(color),
    contour_tool(defaults.contour_tool),
    infill_tool_override(defaults.infill_tool),
    visible(true),
    fill(defaults.fill),
    use_defaults(true) {}

unsigned int ColorAssignment::infill_tool() const {
  return infill_tool_override ? *infill_tool_override : contour_tool;
}

const InfillSpec& ColorAssignment::infill(const InfillSpec& defaults) const {
  return use_defaults ? defaults : own_infill;
}

void ColorAssignment::set_use_defaults(bool use, const InfillSpec& defaults) {
  if (use_defaults && !use) {
    own_infill = defaults;
  }
  use_defaults = use;
}

bool ColorAssignment::update(const string& key, const string& value, const InfillSpec& defaults) {
  switch (hash(key.c_str())) {
    case hash("contour-tool"):
      contour_tool = parse_tool_number(value);
      return true;
    case hash("infill-tool"):
      infill_tool_override = parse_tool_number(value);
      return true;
    case hash("visible"):
      visible = parse_bool(value);
      return true;
    case hash("fill"):
      fill = parse_bool(value);
      return true;
    case hash("pattern"): {
      set_use_defaults(false, defaults);
      std::istringstream in(value);
      in >> own_infill.pattern;
      return true;
    }
    case hash("density"):
      set_use_defaults(false, defaults);
      own_infill.density = parse_unit<Length>(value).asMillimeter();
      return true;
    case hash("angle"):
      set_use_defaults(false, defaults);
      own_infill.angle = parse_number(value);
      return true;
    case hash("outline-offset"):
      set_use_defaults(false, defaults);
      own_infill.outline_offset = parse_unit<Length>(value).asMillimeter();
      return true;
    default:
      return false;
  }
}

void ColorAssignment::read(const string& input_string, const ColorDefaults& defaults) {
  const auto colon = input_string.find(':');
  color = boost::trim_copy(input_string.substr(0, colon));
  if (color.empty()) {
    throw units_parse_exception("color", input_string);
  }
  if (colon == string::npos) {
    return;
  }
  vector<string> settings;
  const string rest = input_string.substr(colon + 1);
  boost::split(settings, rest, boost::is_any_of(","));
  for (const auto& setting : settings) {
    if (boost::trim_copy(setting).empty()) {
      continue;
    }
    const auto equals = setting.find('=');
    if (equals == string::npos) {
      throw units_parse_exception("key=value", setting);
    }
    const string key = boost::trim_copy(setting.substr(0, equals));
    const string value = boost::trim_copy(setting.substr(equals + 1));
    bool known;
    try {
      known = update(key, value, defaults.infill);
    } catch (const boost::program_options::invalid_option_value&) {
      throw units_parse_exception(key, value);
    }
    if (!known) {
      throw units_parse_exception("Unrecognized color option " + key + "=" + value);
    }
  }
}

std::ostream& ColorAssignment::write(std::ostream& out, const InfillSpec& defaults) const {
  const InfillSpec& spec = infill(defaults);
  out << color << ":contour-tool=" << contour_tool << ",infill-tool=" << infill_tool()
      << ",visible=" << (visible ? "true" : "false")
      << ",fill=" << (fill ? "true" : "false")
      << ",pattern=" << spec.pattern << ",density=" << spec.density
      << ",angle=" << spec.angle << ",outline-offset=" << spec.outline_offset;
  return out;
}

vector<ColorAssignment> parse_color_assignments(const vector<string>& specs, const ColorDefaults& defaults) {
  vector<ColorAssignment> ret;
  for (const auto& spec : specs) {
    ColorAssignment assignment("", defaults);
    assignment.read(spec, defaults);
    // A later --color for the same color wins.
    bool replaced = false;
    for (auto& existing : ret) {
      if (boost::iequals(existing.color, assignment.color)) {
        existing = assignment;
        replaced = true;
      }
    }
    if (!replaced) {
      ret.push_back(assignment);
    }
  }
  return ret;
}

ColorAssignment find_color_assignment(const vector<ColorAssignment>& assignments,
                                      const string& color, const ColorDefaults& defaults) {
  for (const auto& assignment : assignments) {
    if (boost::iequals(assignment.color, color)) {
      return assignment;
    }
  }
  return ColorAssignment(color, defaults);
}
