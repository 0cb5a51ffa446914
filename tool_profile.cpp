#include <algorithm>
#include <iterator>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include "tool_profile.hpp"
#include "units.hpp"

using std::string;
using std::vector;

static const vector<PenPreset> pen_presets = {
  {"stabilo", 13, 33},
  {"posca", 10, 35},
  {"fineliner", 15, 35},
  {"brushpen", 8, 33},
  {"marker", 11, 36},
};

boost::optional<PenPreset> find_pen_preset(const string& name) {
  for (const auto& preset : pen_presets) {
    if (boost::iequals(preset.name, name)) {
      return preset;
    }
  }
  return boost::none;
}

ToolProfile::ToolProfile(unsigned int number) :
    number(number), pen(pen_presets[0].name),
    pen_up(pen_presets[0].pen_up), pen_down(pen_presets[0].pen_down),
    pump_distance(0), pump_height(0), stroke_width(0.5) {}

bool ToolProfile::update(const string& key, const string& value) {
  switch (hash(key.c_str())) {
    case hash("pen"): {
      auto preset = find_pen_preset(value);
      if (!preset) {
        std::cerr << "Warning: Unknown pen type \"" << value << "\", using "
                  << pen_presets[0].name << "." << std::endl;
        preset = pen_presets[0];
      }
      pen = preset->name;
      pen_up = preset->pen_up;
      pen_down = preset->pen_down;
      return true;
    }
    case hash("up"):
      pen_up = parse_unit<Length>(value).asMillimeter();
      return true;
    case hash("down"):
      pen_down = parse_unit<Length>(value).asMillimeter();
      return true;
    case hash("width"):
      stroke_width = parse_unit<Length>(value).asMillimeter();
      return true;
    case hash("pump-distance"):
      pump_distance = parse_unit<Length>(value).asMillimeter();
      return true;
    case hash("pump-height"):
      pump_height = parse_unit<Length>(value).asMillimeter();
      return true;
    default:
      return false;
  }
}

void ToolProfile::read(const string& input_string) {
  const auto colon = input_string.find(':');
  const string number_text = boost::trim_copy(input_string.substr(0, colon));
  try {
    number = boost::lexical_cast<unsigned int>(number_text);
  } catch (const boost::bad_lexical_cast&) {
    throw units_parse_exception("tool number", number_text);
  }
  if (colon == string::npos) {
    return;
  }
  vector<string> settings;
  const string rest = input_string.substr(colon + 1);
  boost::split(settings, rest, boost::is_any_of(","));
  // The pen preset goes first so that explicit heights override it.
  std::stable_partition(settings.begin(), settings.end(), [](const string& setting) {
      return boost::starts_with(boost::trim_copy(setting), "pen=");
    });
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
    if (!update(key, value)) {
      throw units_parse_exception("Unrecognized tool option " + key + "=" + value);
    }
  }
}

std::ostream& ToolProfile::write(std::ostream& out) const {
  out << number << ":pen=" << pen << ",up=" << pen_up << ",down=" << pen_down
      << ",width=" << stroke_width;
  if (pump_distance > 0) {
    out << ",pump-distance=" << pump_distance << ",pump-height=" << pump_height;
  }
  return out;
}

bool ToolProfile::operator==(const ToolProfile& other) const {
  return number == other.number &&
      pen == other.pen &&
      pen_up == other.pen_up &&
      pen_down == other.pen_down &&
      pump_distance == other.pump_distance &&
      pump_height == other.pump_height &&
      stroke_width == other.stroke_width;
}

std::istream& operator>>(std::istream& in, ToolProfile& tool) {
  string input_string(std::istreambuf_iterator<char>(in), {});
  try {
    tool.read(input_string);
  } catch (const units_parse_exception& e) {
    std::cerr << e.what() << std::endl;
    throw boost::program_options::invalid_option_value(input_string);
  } catch (const boost::program_options::invalid_option_value& e) {
    std::cerr << e.what() << std::endl;
    throw boost::program_options::invalid_option_value(input_string);
  }
  return in;
}

std::ostream& operator<<(std::ostream& out, const ToolProfile& tool) {
  return tool.write(out);
}
