#include "geometry.hpp"

#include "bg_operators.hpp"

using std::vector;

multi_polygon_type_fp operator-(const multi_polygon_type_fp& lhs, const multi_polygon_type_fp& rhs) {
  if (bg::area(rhs) <= 0 || bg::area(lhs) <= 0) {
    return lhs;
  }
  multi_polygon_type_fp ret;
  bg::difference(lhs, rhs, ret);
  return ret;
}

template <typename rhs_t>
multi_linestring_type_fp operator&(const linestring_type_fp& lhs, const rhs_t& rhs) {
  multi_linestring_type_fp ret;
  if (bg::area(rhs) <= 0 || bg::length(lhs) <= 0) {
    return ret;
  }
  bg::intersection(lhs, rhs, ret);
  return ret;
}

template multi_linestring_type_fp operator&(const linestring_type_fp&, const polygon_type_fp&);
template multi_linestring_type_fp operator&(const linestring_type_fp&, const multi_polygon_type_fp&);

multi_polygon_type_fp operator+(const multi_polygon_type_fp& lhs, const multi_polygon_type_fp& rhs) {
  if (bg::area(rhs) <= 0) {
    return lhs;
  }
  if (bg::area(lhs) <= 0) {
    return rhs;
  }
  multi_polygon_type_fp ret;
  bg::union_(lhs, rhs, ret);
  return ret;
}

multi_polygon_type_fp sum(const vector<multi_polygon_type_fp>& mpolys) {
  // Pairwise, so that each union works on operands of similar size.
  vector<multi_polygon_type_fp> current;
  for (const auto& mpoly : mpolys) {
    if (bg::area(mpoly) > 0) {
      current.push_back(mpoly);
    }
  }
  if (current.empty()) {
    return multi_polygon_type_fp();
  }
  while (current.size() > 1) {
    vector<multi_polygon_type_fp> next;
    for (size_t i = 0; i + 1 < current.size(); i += 2) {
      if (bg::intersects(bg::return_envelope<box_type_fp>(current[i]),
                         bg::return_envelope<box_type_fp>(current[i+1]))) {
        next.push_back(current[i] + current[i+1]);
      } else {
        next.push_back(current[i]);
        next.back().insert(next.back().end(), current[i+1].cbegin(), current[i+1].cend());
      }
    }
    if (current.size() % 2 == 1) {
      next.push_back(current.back());
    }
    current.swap(next);
  }
  return current.front();
}
