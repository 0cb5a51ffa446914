#ifndef COLOR_ASSIGNMENT_HPP
#define COLOR_ASSIGNMENT_HPP

#include <iostream>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "geometry.hpp"
#include "infill.hpp"
#include "route_optimizer.hpp"

// Settings that colors without their own settings use.
struct ColorDefaults {
  ColorDefaults() :
      contour_tool(1),
      fill(true) {}

  unsigned int contour_tool;
  // The contour tool if not set.
  boost::optional<unsigned int> infill_tool;
  bool fill;
  InfillSpec infill;
};

// How one color of the drawing is plotted.
//
// Written as "<color>:key=value,..." with the keys contour-tool,
// infill-tool, visible, fill, pattern, density, angle and outline-offset.
// The infill keys stop the color from following the default InfillSpec.
class ColorAssignment {
 public:
  ColorAssignment(const std::string& color = "", const ColorDefaults& defaults = ColorDefaults());

  unsigned int infill_tool() const;

  // The InfillSpec in effect: the defaults while use_defaults is set,
  // otherwise the color's own.
  const InfillSpec& infill(const InfillSpec& defaults) const;

  // Turning use_defaults off copies the defaults into the color's own
  // InfillSpec so that editing starts from what was in effect.
  void set_use_defaults(bool use, const InfillSpec& defaults);
  bool uses_defaults() const { return use_defaults; }

  // Returns false if the key is unknown.
  bool update(const std::string& key, const std::string& value, const InfillSpec& defaults);
  void read(const std::string& input_string, const ColorDefaults& defaults);
  std::ostream& write(std::ostream& out, const InfillSpec& defaults) const;

  std::string color;
  unsigned int contour_tool;
  boost::optional<unsigned int> infill_tool_override;
  bool visible;
  bool fill;

  // Filled in by the drawing pipeline.
  boost::optional<std::vector<Stroke>> fill_strokes;
  RouteStats fill_stats;

 private:
  bool use_defaults;
  InfillSpec own_infill;
};

// Parses every --color value.  Throws units_parse_exception on bad input.
std::vector<ColorAssignment> parse_color_assignments(const std::vector<std::string>& specs,
                                                     const ColorDefaults& defaults);

// The assignment of color, or one made from the defaults if there is none.
ColorAssignment find_color_assignment(const std::vector<ColorAssignment>& assignments,
                                      const std::string& color, const ColorDefaults& defaults);

#endif // COLOR_ASSIGNMENT_HPP
