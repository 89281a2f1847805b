#ifndef MANDELMAP_OPENCV_EXECUTION_CONTEXT_HPP
#define MANDELMAP_OPENCV_EXECUTION_CONTEXT_HPP

#include "execution_context.hpp"

namespace mandelmap {

//
// Runs the lanes through cv::parallel_for_, i.e. on whatever parallel
// backend OpenCV was built with (HPX, TBB, OpenMP, pthreads).
//
class OpenCVExecutionContext : public ExecutionContext {
public:
  // nstripes is forwarded to cv::parallel_for_, -1 lets OpenCV choose.
  explicit OpenCVExecutionContext(double nstripes = -1.);

  std::string name() const override;
  std::size_t num_lanes() const override;

  void acquire() override;
  void launch(const KernelArgs& args, const LaunchGeometry& geometry,
              std::int32_t* out) override;

private:
  double nstripes_;
};

} // namespace mandelmap

#endif //MANDELMAP_OPENCV_EXECUTION_CONTEXT_HPP
