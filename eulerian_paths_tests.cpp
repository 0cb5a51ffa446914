#define BOOST_TEST_MODULE eulerian paths tests
#include <boost/test/included/unit_test.hpp>

#include <vector>

#include "eulerian_paths.hpp"

using std::vector;
using namespace eulerian_paths;

BOOST_AUTO_TEST_SUITE(eulerian_paths_tests)

static size_t segment_count(const vector<linestring_type_fp>& paths) {
  size_t count = 0;
  for (const auto& path : paths) {
    count += path.size() - 1;
  }
  return count;
}

BOOST_AUTO_TEST_CASE(single_path) {
  const vector<linestring_type_fp> edges{
    linestring_type_fp{{1, 1}, {2, 2}, {3, 4}},
  };
  const auto paths = get_eulerian_paths<point_type_fp, linestring_type_fp>(edges);
  BOOST_REQUIRE_EQUAL(paths.size(), 1);
  BOOST_CHECK_EQUAL(paths.front().size(), 3);
}

// 3x3 grid connected like a window pane:
// 1---2---3
// |   |   |
// 4---5---6
// |   |   |
// 7---8---9
BOOST_AUTO_TEST_CASE(window_pane) {
  vector<linestring_type_fp> edges;
  for (int i = 0; i < 3; i++) {
    for (int j = 0; j < 2; j++) {
      edges.push_back(linestring_type_fp{{double(j), double(i)}, {double(j + 1), double(i)}});
      edges.push_back(linestring_type_fp{{double(i), double(j)}, {double(i), double(j + 1)}});
    }
  }
  const auto paths = get_eulerian_paths<point_type_fp, linestring_type_fp>(edges);
  BOOST_CHECK_EQUAL(segment_count(paths), 12);
  // Four odd vertices need two paths.
  BOOST_CHECK_EQUAL(paths.size(), 2);
}

BOOST_AUTO_TEST_CASE(loop_becomes_closed_path) {
  const vector<linestring_type_fp> edges{
    linestring_type_fp{{0, 0}, {1, 0}},
    linestring_type_fp{{1, 1}, {1, 0}},
    linestring_type_fp{{1, 1}, {0, 1}},
    linestring_type_fp{{0, 1}, {0, 0}},
  };
  const auto paths = get_eulerian_paths<point_type_fp, linestring_type_fp>(edges);
  BOOST_REQUIRE_EQUAL(paths.size(), 1);
  BOOST_REQUIRE_EQUAL(paths.front().size(), 5);
  BOOST_CHECK(paths.front().front() == paths.front().back());
}

BOOST_AUTO_TEST_CASE(loop_stitched_into_path) {
  // A line from (-1, 0) to (3, 0) with a square loop hanging off (1, 0).
  const vector<linestring_type_fp> edges{
    linestring_type_fp{{-1, 0}, {1, 0}},
    linestring_type_fp{{1, 0}, {3, 0}},
    linestring_type_fp{{1, 0}, {1, 1}},
    linestring_type_fp{{1, 1}, {2, 1}},
    linestring_type_fp{{2, 1}, {2, 2}},
    linestring_type_fp{{2, 2}, {1, 0}},
  };
  const auto paths = get_eulerian_paths<point_type_fp, linestring_type_fp>(edges);
  BOOST_REQUIRE_EQUAL(paths.size(), 1);
  BOOST_CHECK_EQUAL(segment_count(paths), 6);
}

BOOST_AUTO_TEST_CASE(separate_pieces) {
  const vector<linestring_type_fp> edges{
    linestring_type_fp{{0, 0}, {1, 0}},
    linestring_type_fp{{5, 5}, {6, 5}},
  };
  BOOST_CHECK_EQUAL((get_eulerian_paths<point_type_fp, linestring_type_fp>(edges).size()), 2);
}

BOOST_AUTO_TEST_CASE(join_drops_duplicates) {
  const vector<linestring_type_fp> paths{
    linestring_type_fp{{0, 0}, {1, 0}, {2, 0}},
    linestring_type_fp{{2, 0}, {1, 0}},
    linestring_type_fp{{2, 0}, {2, 1}},
    linestring_type_fp{{3, 3}, {3, 3}},
  };
  const auto joined = join_edges(paths);
  BOOST_REQUIRE_EQUAL(joined.size(), 1);
  BOOST_CHECK_EQUAL(joined.front().size(), 4);
  BOOST_CHECK_CLOSE(bg::length(joined.front()), 3, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
