#include "divergence_map.hpp"
#include "errors.hpp"
//
#include <new>
#include <string>

namespace mandelmap {

//----------------------------------------------------------------------------
DivergenceMap::DivergenceMap(const Grid& grid)
{
  try {
    data_ = cv::Mat::zeros(grid.height, grid.width, CV_32S);
  }
  catch (const cv::Exception& e) {
    throw allocation_error(std::string(
        "cannot allocate divergence map: ") + e.what());
  }
  catch (const std::bad_alloc&) {
    throw allocation_error("cannot allocate divergence map");
  }
}
//----------------------------------------------------------------------------
DivergenceMap::DivergenceMap(const Grid& grid, const std::int32_t* data)
{
  try {
    // wrap the region without owning it, then take a deep copy
    cv::Mat region(grid.height, grid.width, CV_32S,
                   const_cast<std::int32_t*>(data));
    region.copyTo(data_);
  }
  catch (const cv::Exception& e) {
    throw allocation_error(std::string(
        "cannot transfer divergence map: ") + e.what());
  }
}
//----------------------------------------------------------------------------
std::int32_t DivergenceMap::max_value() const
{
  if (data_.empty())
    return 0;

  double max_val = 0.0;
  cv::minMaxLoc(data_, nullptr, &max_val);
  return static_cast<std::int32_t>(max_val);
}
//----------------------------------------------------------------------------
bool DivergenceMap::operator==(const DivergenceMap& other) const
{
  if (data_.size() != other.data_.size())
    return false;
  if (data_.empty())
    return true;

  return cv::countNonZero(data_ != other.data_) == 0;
}
//----------------------------------------------------------------------------

} // namespace mandelmap
