#define BOOST_TEST_MODULE options tests
#include <boost/test/included/unit_test.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include "options.hpp"
#include "units.hpp"

using namespace std;

BOOST_AUTO_TEST_SUITE(options_tests)

void parse(const std::string& args) {
  std::vector<std::string> words;
  boost::split(words, args, boost::is_any_of(" "), boost::token_compress_on);
  std::vector<const char*> argv;
  for (const auto& word : words) {
    argv.push_back(word.c_str());
  }
  cerr << endl << "Parsing: " << args << endl;
  options::get_vm().clear();
  options::parse(argv.size(), argv.data());
}

ErrorCodes get_error_code(const std::string& args) {
  try {
    parse(args);
  } catch (const plot2gcode_parse_exception& e) {
    cerr << e.what() << endl;
    return e.code();
  }
  return ERR_OK;
}

// Parses and checks, like the program does before plotting.
ErrorCodes get_check_code(const std::string& args) {
  try {
    parse(args);
    options::check_parameters();
  } catch (const plot2gcode_parse_exception& e) {
    cerr << e.what() << endl;
    return e.code();
  }
  return ERR_OK;
}

template<typename variable_t>
variable_t get_value(const std::string& args, const std::string& variable) {
  BOOST_CHECK_EQUAL(get_error_code(args), ERR_OK);
  BOOST_CHECK_NO_THROW(options::get_vm().at(variable).as<variable_t>());
  return options::get_vm().at(variable).as<variable_t>();
}

BOOST_AUTO_TEST_CASE(foo) {
  BOOST_CHECK_EQUAL(get_error_code("plot2gcode --foo"), ERR_UNKNOWNPARAMETER);
  BOOST_CHECK_EQUAL(get_error_code("plot2gcode --infill-pattern dots"), ERR_UNKNOWNPARAMETER);
}

BOOST_AUTO_TEST_CASE(no_drawing) {
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --noconfigfile"), ERR_NODRAWING);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --noconfigfile --drawing a.wkt"), ERR_OK);
}

BOOST_AUTO_TEST_CASE(drawings) {
  const auto drawings = get_value<vector<DrawingSpec>>(
      "plot2gcode --drawing a.wkt --drawing b.wkt:10:20:1mm", "drawing");
  BOOST_REQUIRE_EQUAL(drawings.size(), 2);
  BOOST_CHECK_EQUAL(drawings[0].filename, "a.wkt");
  BOOST_CHECK_EQUAL(drawings[1].placement.y_offset, 20);
  BOOST_CHECK_EQUAL(drawings[1].placement.material_height, 1);
}

BOOST_AUTO_TEST_CASE(defaults) {
  BOOST_REQUIRE_EQUAL(get_check_code("plot2gcode --drawing a.wkt"), ERR_OK);
  const DrawingSettings settings = options::drawing_settings();
  BOOST_CHECK_EQUAL(settings.color_defaults.contour_tool, 1);
  BOOST_CHECK(!settings.color_defaults.infill_tool);
  BOOST_CHECK(settings.color_defaults.fill);
  BOOST_CHECK_EQUAL(settings.color_defaults.infill.pattern, InfillPattern::LINES);
  BOOST_CHECK_CLOSE(settings.color_defaults.infill.density, 2, 1e-9);
  BOOST_CHECK_EQUAL(settings.color_defaults.infill.angle, 45);
  BOOST_CHECK_CLOSE(settings.color_defaults.infill.outline_offset, 0.5, 1e-9);
  BOOST_CHECK_EQUAL(settings.wall_mode, WallMode::CENTER);
  BOOST_CHECK(!settings.wall_offset);
  BOOST_CHECK(settings.route.optimise);
  BOOST_CHECK_EQUAL(settings.route.threshold, 200);
  BOOST_CHECK_EQUAL(settings.route.budget.count(), 5000);

  const EmitterSettings emitter = options::emitter_settings();
  BOOST_CHECK_CLOSE(emitter.drawing_feed, 3000, 1e-9);
  BOOST_CHECK_CLOSE(emitter.travel_feed, 15000, 1e-9);
  BOOST_CHECK_CLOSE(emitter.pen_feed, 6000, 1e-9);
  BOOST_CHECK_EQUAL(emitter.grouping, ToolGrouping::BY_TOOL);
  BOOST_CHECK_EQUAL(options::get_vm()["order"].as<PassOrder::PassOrder>(), PassOrder::FILL_FIRST);
}

BOOST_AUTO_TEST_CASE(settings_from_options) {
  BOOST_REQUIRE_EQUAL(get_check_code(
      "plot2gcode --drawing a.wkt --tool 1:pen=posca --tool 2:pen=fineliner,pump-distance=50"
      " --color red:contour-tool=2,pattern=spiral --infill-density 3mm --infill-angle 90"
      " --wall-mode inside --wall-offset 0.2mm --grouping by-layer --drawing-feed 50mm/s"
      " --optimiser-budget 250ms --optimise=false"), ERR_OK);
  const DrawingSettings settings = options::drawing_settings();
  BOOST_CHECK_EQUAL(settings.tools.size(), 2);
  BOOST_CHECK_EQUAL(settings.tools.at(2).pump_distance, 50);
  BOOST_REQUIRE_EQUAL(settings.colors.size(), 1);
  const auto& red = settings.colors.front();
  BOOST_CHECK_EQUAL(red.contour_tool, 2);
  const InfillSpec& spec = red.infill(settings.color_defaults.infill);
  BOOST_CHECK_EQUAL(spec.pattern, InfillPattern::SPIRAL);
  BOOST_CHECK_CLOSE(spec.density, 3, 1e-9);
  BOOST_CHECK_EQUAL(spec.angle, 90);
  BOOST_CHECK_EQUAL(settings.wall_mode, WallMode::INSIDE);
  BOOST_CHECK_CLOSE(*settings.wall_offset, 0.2, 1e-9);
  BOOST_CHECK(!settings.route.optimise);
  BOOST_CHECK_EQUAL(settings.route.budget.count(), 250);

  const EmitterSettings emitter = options::emitter_settings();
  BOOST_CHECK_EQUAL(emitter.grouping, ToolGrouping::BY_LAYER);
  BOOST_CHECK_CLOSE(emitter.drawing_feed, 3000, 1e-9);
  BOOST_CHECK_EQUAL(emitter.tools.at(1).pen, "posca");
}

BOOST_AUTO_TEST_CASE(invalid_values) {
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --infill-density 0"), ERR_NEGATIVEDENSITY);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --infill-angle 200"), ERR_ANGLERANGE);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --infill-outline-offset=-1"), ERR_NEGATIVEOUTLINEOFFSET);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --wall-offset=-1"), ERR_NEGATIVEWALLOFFSET);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --drawing-feed 0"), ERR_NEGATIVEDRAWINGFEED);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --travel-feed=-5"), ERR_NEGATIVETRAVELFEED);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --pen-feed 0"), ERR_NEGATIVEPENFEED);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --optimiser-budget=-1s"), ERR_NEGATIVEBUDGET);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --bed-width 0"), ERR_NEGATIVEBEDSIZE);
}

BOOST_AUTO_TEST_CASE(invalid_tools) {
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --tool 1:up=10,down=20"), ERR_PENDOWNABOVEUP);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --tool 1 --tool 1"), ERR_DUPLICATETOOL);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --tool 1:pump-distance=-1"), ERR_NEGATIVEPUMPDISTANCE);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --tool 1:pump-height=-1"), ERR_NEGATIVEPUMPHEIGHT);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --tool 1:width=-1"), ERR_NEGATIVESTROKEWIDTH);
}

BOOST_AUTO_TEST_CASE(undefined_tools) {
  // Without any --tool every tool number is allowed.
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --contour-tool 4"), ERR_OK);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --tool 1 --contour-tool 4"), ERR_UNDEFINEDTOOL);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --tool 1 --infill-tool 2"), ERR_UNDEFINEDTOOL);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --tool 1 --color red:infill-tool=3"), ERR_UNDEFINEDTOOL);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --tool 1 --tool 3 --color red:infill-tool=3"), ERR_OK);
}

BOOST_AUTO_TEST_CASE(invalid_colors) {
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --color red:shade=dark"), ERR_INVALIDCOLOR);
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --drawing a.wkt --color red:density=-2"), ERR_NEGATIVEDENSITY);
}

BOOST_AUTO_TEST_CASE(ignore_warnings) {
  BOOST_CHECK_EQUAL(get_check_code("plot2gcode --ignore-warnings --drawing a.wkt --infill-angle 200"), ERR_OK);
}

BOOST_AUTO_TEST_SUITE_END()
