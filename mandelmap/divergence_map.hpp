#ifndef MANDELMAP_DIVERGENCE_MAP_HPP
#define MANDELMAP_DIVERGENCE_MAP_HPP

#include "grid.hpp"
//
#include <cstdint>
//
#include <opencv2/core.hpp>

namespace mandelmap {

//
// Host-owned result of one harness run: one divergence iteration per grid
// point, rows along the height axis, 0 for points that did not escape.
// Backed by a single-channel CV_32S matrix so it can go straight into
// OpenCV for display.
//
class DivergenceMap {
public:
  DivergenceMap() = default;

  // Allocates width x height zeroed entries. Throws allocation_error.
  explicit DivergenceMap(const Grid& grid);

  // Copies a row-major region of width * height entries.
  // Throws allocation_error.
  DivergenceMap(const Grid& grid, const std::int32_t* data);

  int width() const { return data_.cols; }
  int height() const { return data_.rows; }
  bool empty() const { return data_.empty(); }

  std::int32_t at(int x, int y) const { return data_.at<std::int32_t>(y, x); }
  std::int32_t& at(int x, int y) { return data_.at<std::int32_t>(y, x); }

  const std::int32_t* row(int y) const { return data_.ptr<std::int32_t>(y); }

  // Largest entry, 0 for an empty map.
  std::int32_t max_value() const;

  const cv::Mat& mat() const { return data_; }

  bool operator==(const DivergenceMap& other) const;
  bool operator!=(const DivergenceMap& other) const { return !(*this == other); }

private:
  cv::Mat data_;
};

} // namespace mandelmap

#endif //MANDELMAP_DIVERGENCE_MAP_HPP
