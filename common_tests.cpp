#define BOOST_TEST_MODULE common tests
#include <boost/test/included/unit_test.hpp>

#include <cstdio>
#include <fstream>

#include "common.hpp"

#include <boost/system/api_config.hpp>  // for BOOST_POSIX_API or BOOST_WINDOWS_API
#ifdef BOOST_WINDOWS_API
#define SEP "\\"
#endif

#ifdef BOOST_POSIX_API
#define SEP "/"
#endif

BOOST_AUTO_TEST_SUITE(common_tests)

BOOST_AUTO_TEST_CASE(output_in_directory) {
  BOOST_CHECK_EQUAL(build_filename("", "plot.gcode"), "plot.gcode");
  BOOST_CHECK_EQUAL(build_filename("out", "plot.gcode"), "out" SEP "plot.gcode");
  BOOST_CHECK_EQUAL(build_filename("out" SEP, "plot.gcode"), "out" SEP "plot.gcode");
  BOOST_CHECK_EQUAL(build_filename(SEP "tmp", SEP "plot.gcode"), SEP "plot.gcode");
  BOOST_CHECK_EQUAL(build_filename("out", ""), "out" SEP);
  BOOST_CHECK_EQUAL(build_filename("", ""), "");
}

BOOST_AUTO_TEST_CASE(read_missing_file) {
  BOOST_CHECK(!read_file("no_such_file_for_common_tests.txt"));
}

BOOST_AUTO_TEST_CASE(read_whole_file) {
  const std::string name("common_tests_preamble.txt");
  {
    std::ofstream out(name.c_str());
    out << "G4 P1\nM117 Hello\n";
  }
  const auto content = read_file(name);
  BOOST_REQUIRE(content);
  BOOST_CHECK_EQUAL(*content, "G4 P1\nM117 Hello\n");
  std::remove(name.c_str());
}

BOOST_AUTO_TEST_SUITE_END()
