#define BOOST_TEST_MODULE polygon offset tests
#include <boost/test/included/unit_test.hpp>

#include <sstream>

#include "polygon_offset.hpp"

using namespace polygon_offset;

BOOST_AUTO_TEST_SUITE(polygon_offset_tests)

static ring_type_fp square(double x, double y, double size) {
  ring_type_fp ring{{x, y}, {x, y + size}, {x + size, y + size}, {x + size, y}, {x, y}};
  bg::correct(ring);
  return ring;
}

BOOST_AUTO_TEST_CASE(grow_square) {
  const auto grown = offset(square(0, 0, 10), 1);
  BOOST_REQUIRE_EQUAL(grown.size(), 1);
  BOOST_CHECK_CLOSE(bg::area(grown), 144, 1e-6);
  const auto box = bg::return_envelope<box_type_fp>(grown);
  BOOST_CHECK_CLOSE(box.min_corner().x(), -1, 1e-6);
  BOOST_CHECK_CLOSE(box.max_corner().y(), 11, 1e-6);
}

BOOST_AUTO_TEST_CASE(shrink_square) {
  const auto shrunk = offset(square(0, 0, 10), -2);
  BOOST_REQUIRE_EQUAL(shrunk.size(), 1);
  BOOST_CHECK_CLOSE(bg::area(shrunk), 36, 1e-6);
}

BOOST_AUTO_TEST_CASE(shrink_away) {
  BOOST_CHECK(offset(square(0, 0, 2), -1.5).empty());
}

BOOST_AUTO_TEST_CASE(shrink_then_grow) {
  const ring_type_fp triangle = []() {
    ring_type_fp ring{{0, 0}, {20, 0}, {10, 15}, {0, 0}};
    bg::correct(ring);
    return ring;
  }();
  for (const ring_type_fp& ring : {square(0, 0, 10), triangle}) {
    const auto shrunk = offset(ring, -1);
    BOOST_REQUIRE_EQUAL(shrunk.size(), 1);
    const auto back = offset(shrunk.front().outer(), 1);
    BOOST_REQUIRE_EQUAL(back.size(), 1);
    BOOST_CHECK_CLOSE(bg::area(back), std::abs(bg::area(ring)), 1e-6);
    for (const auto& point : back.front().outer()) {
      BOOST_CHECK_SMALL(bg::distance(point, ring), 1e-6);
    }
  }
}

BOOST_AUTO_TEST_CASE(zero_distance) {
  const auto same = offset(square(0, 0, 4), 0);
  BOOST_REQUIRE_EQUAL(same.size(), 1);
  BOOST_CHECK_CLOSE(bg::area(same), 16, 1e-9);
}

BOOST_AUTO_TEST_CASE(round_join_has_round_corners) {
  const auto grown = offset(square(0, 0, 10), 1, JoinStyle::ROUND);
  BOOST_REQUIRE_EQUAL(grown.size(), 1);
  // Between the exact rounded area and the mitered one.
  BOOST_CHECK_GT(bg::area(grown), 100 + 40 + 3);
  BOOST_CHECK_LT(bg::area(grown), 144);
}

BOOST_AUTO_TEST_CASE(shrinking_grows_holes) {
  polygon_type_fp poly;
  poly.outer() = square(0, 0, 10);
  poly.inners().push_back(square(4, 4, 2));
  bg::correct(poly);
  const auto shrunk = offset(poly, -1);
  BOOST_REQUIRE_EQUAL(shrunk.size(), 1);
  BOOST_CHECK_CLOSE(bg::area(shrunk), 64 - 16, 1e-6);
}

BOOST_AUTO_TEST_CASE(walls) {
  const auto ring = square(0, 0, 10);
  const auto center = wall_rings(ring, WallMode::CENTER, 1);
  BOOST_REQUIRE_EQUAL(center.size(), 1);
  BOOST_CHECK_CLOSE(std::abs(bg::area(center.front())), 100, 1e-9);

  const auto inside = wall_rings(ring, WallMode::INSIDE, 0.5);
  BOOST_REQUIRE_EQUAL(inside.size(), 1);
  BOOST_CHECK_CLOSE(std::abs(bg::area(inside.front())), 81, 1e-6);

  const auto outside = wall_rings(ring, WallMode::OUTSIDE, 0.5);
  BOOST_REQUIRE_EQUAL(outside.size(), 1);
  BOOST_CHECK_CLOSE(std::abs(bg::area(outside.front())), 121, 1e-6);

  BOOST_CHECK(wall_rings(square(0, 0, 1), WallMode::INSIDE, 1).empty());
}

BOOST_AUTO_TEST_CASE(wall_mode_names) {
  WallMode::WallMode mode;
  std::istringstream("outside") >> mode;
  BOOST_CHECK_EQUAL(mode, WallMode::OUTSIDE);
  std::istringstream bad("middle");
  BOOST_CHECK_THROW(bad >> mode, boost::program_options::invalid_option_value);
  std::ostringstream out;
  out << WallMode::INSIDE;
  BOOST_CHECK_EQUAL(out.str(), "inside");
}

BOOST_AUTO_TEST_SUITE_END()
