#ifndef BG_OPERATORS_HPP
#define BG_OPERATORS_HPP

#include <tuple>
#include <vector>

#include "geometry.hpp"

// Set operations that skip the work when one side is empty.

multi_polygon_type_fp operator-(const multi_polygon_type_fp& lhs, const multi_polygon_type_fp& rhs);

template <typename rhs_t>
multi_linestring_type_fp operator&(const linestring_type_fp& lhs, const rhs_t& rhs);

multi_polygon_type_fp operator+(const multi_polygon_type_fp& lhs, const multi_polygon_type_fp& rhs);

// Union of all the inputs.
multi_polygon_type_fp sum(const std::vector<multi_polygon_type_fp>& mpolys);

// It's not great to insert definitions into the bg namespace but they
// are useful for sorting and maps.

namespace boost { namespace geometry { namespace model { namespace d2 {

template <typename T>
inline bool operator<(const point_xy<T>& x, const point_xy<T>& y) {
  return std::tie(x.x(), x.y()) < std::tie(y.x(), y.y());
}

template <typename T>
inline bool operator==(const point_xy<T>& x, const point_xy<T>& y) {
  return std::tie(x.x(), x.y()) == std::tie(y.x(), y.y());
}

template <typename T>
inline bool operator!=(const point_xy<T>& x, const point_xy<T>& y) {
  return !(x == y);
}

template <typename T>
inline point_xy<T> operator-(const point_xy<T>& lhs, const point_xy<T>& rhs) {
  return {lhs.x() - rhs.x(), lhs.y() - rhs.y()};
}

template <typename T>
inline point_xy<T> operator+(const point_xy<T>& lhs, const point_xy<T>& rhs) {
  return {lhs.x() + rhs.x(), lhs.y() + rhs.y()};
}

template <typename T, typename S>
inline point_xy<T> operator*(const point_xy<T>& lhs, const S& rhs) {
  return {lhs.x() * static_cast<T>(rhs), lhs.y() * static_cast<T>(rhs)};
}

template <typename T, typename S>
inline point_xy<T> operator/(const point_xy<T>& lhs, const S& rhs) {
  return {lhs.x() / static_cast<T>(rhs), lhs.y() / static_cast<T>(rhs)};
}

}}}} // namespace boost::geometry::model::d2

#endif //BG_OPERATORS_HPP
