#ifndef TOOL_PROFILE_HPP
#define TOOL_PROFILE_HPP

#include <iostream>
#include <string>

#include <boost/optional.hpp>

constexpr unsigned int hash(const char *s, int off = 0) {
    return !s[off] ? 5381 : (hash(s, off+1)*33) ^ s[off];
}

// Heights of a pen type on the U axis, in mm.
struct PenPreset {
  std::string name;
  double pen_down;
  double pen_up;
};

boost::optional<PenPreset> find_pen_preset(const std::string& name);

// One physical tool slot of the plotter.
//
// Written as "<number>:key=value,key=value" with the keys pen, up, down,
// width, pump-distance and pump-height.  Lengths take units and default to
// mm.
class ToolProfile {
 public:
  ToolProfile(unsigned int number = 1);

  // Returns false if the key is unknown.
  bool update(const std::string& key, const std::string& value);
  void read(const std::string& input_string);
  std::ostream& write(std::ostream& out) const;
  bool operator==(const ToolProfile& other) const;

  unsigned int number;
  std::string pen;
  double pen_up;
  double pen_down;
  // Distance drawn between two pump actions, 0 disables pumping.
  double pump_distance;
  double pump_height;
  double stroke_width;
};

std::istream& operator>>(std::istream& in, ToolProfile& tool);
std::ostream& operator<<(std::ostream& out, const ToolProfile& tool);

#endif // TOOL_PROFILE_HPP
