#define BOOST_TEST_MODULE units tests
#include <boost/test/included/unit_test.hpp>

#include <sstream>

#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include "units.hpp"

using namespace std;

BOOST_AUTO_TEST_SUITE(units_tests);

template <typename dimension_t>
dimension_t parse_option(const std::string& s) {
  po::options_description desc("Allowed options");
  desc.add_options()
      ("test_option", po::value<dimension_t>(), "test option");
  po::variables_map vm;
  po::store(po::command_line_parser(vector<std::string>{"--test_option", s}).options(desc).run(), vm);
  return vm["test_option"].as<dimension_t>();
}

BOOST_AUTO_TEST_CASE(parse_length) {
  BOOST_CHECK_EQUAL(parse_option<Length>("4").asMillimeter(), 4);
  BOOST_CHECK_EQUAL(parse_option<Length>("4").asMillimeter(2), 8);
  BOOST_CHECK_CLOSE(parse_option<Length>("2.5mm").asMillimeter(), 2.5, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Length>(" 3 cm ").asMillimeter(), 30, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Length>("1in").asMillimeter(), 25.4, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Length>("+0.5 m").asMillimeter(), 500, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Length>("  \t12\tmillimeters\t").asMillimeter(), 12, 1e-9);
  std::stringstream ss;
  ss << parse_option<Length>("4");
  BOOST_CHECK_EQUAL(ss.str(), "4");

  BOOST_CHECK_THROW(parse_option<Length>("50mm/s"), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Length>("50seconds"), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Length>("thou"), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Length>(""), po::validation_error);
}

BOOST_AUTO_TEST_CASE(parse_time) {
  BOOST_CHECK_EQUAL(parse_option<Time>("4").asSecond(), 4);
  BOOST_CHECK_EQUAL(parse_option<Time>("4").asMillisecond(), 4000);
  BOOST_CHECK_CLOSE(parse_option<Time>("250ms").asMillisecond(), 250, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Time>(" 2 min").asSecond(), 120, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Time>("5s").asMillisecond(), 5000, 1e-9);

  BOOST_CHECK_THROW(parse_option<Time>("5mm"), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Time>("blahblah"), po::validation_error);
}

BOOST_AUTO_TEST_CASE(parse_velocity) {
  BOOST_CHECK_EQUAL(parse_option<Velocity>("3000").asMillimeterPerMinute(), 3000);
  BOOST_CHECK_CLOSE(parse_option<Velocity>("50mm/s").asMillimeterPerMinute(), 3000, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Velocity>(" 6 m per min ").asMillimeterPerMinute(), 6000, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Velocity>("1in/min").asMillimeterPerMinute(), 25.4, 1e-9);

  BOOST_CHECK_THROW(parse_option<Velocity>("50mm"), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Velocity>("50 mm "), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Velocity>("50s"), po::validation_error);
}

BOOST_AUTO_TEST_CASE(parse_without_options) {
  BOOST_CHECK_CLOSE(parse_unit<Length>("2cm").asMillimeter(), 20, 1e-9);
  BOOST_CHECK_THROW(parse_unit<Length>("2 cm extra"), po::invalid_option_value);
}

BOOST_AUTO_TEST_CASE(parse_exception_messages) {
  BOOST_CHECK_EQUAL(units_parse_exception("tool number", "one").what(),
                    std::string("Can't get tool number from: one"));
  BOOST_CHECK_EQUAL(units_parse_exception("Unrecognized tool option ink=blue").what(),
                    std::string("Unrecognized tool option ink=blue"));
}

BOOST_AUTO_TEST_SUITE_END()
