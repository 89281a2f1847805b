#include "opencv_execution_context.hpp"
#include "errors.hpp"
//
#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>
//
#include <limits>

namespace mandelmap {

//----------------------------------------------------------------------------
OpenCVExecutionContext::OpenCVExecutionContext(double nstripes)
  : nstripes_(nstripes)
{
}
//----------------------------------------------------------------------------
std::string OpenCVExecutionContext::name() const
{
  const char* framework = cv::currentParallelFramework();
  return std::string("opencv:") + (framework ? framework : "none");
}
//----------------------------------------------------------------------------
std::size_t OpenCVExecutionContext::num_lanes() const
{
  return static_cast<std::size_t>(cv::getNumThreads());
}
//----------------------------------------------------------------------------
void OpenCVExecutionContext::acquire()
{
  if (cv::getNumThreads() < 1)
    throw environment_error("OpenCV reports no threads for parallel_for_");
}
//----------------------------------------------------------------------------
void OpenCVExecutionContext::launch(const KernelArgs& args,
                                    const LaunchGeometry& geometry,
                                    std::int32_t* out)
{
  // cv::Range is int based
  if (geometry.num_lanes() >
      static_cast<std::size_t>(std::numeric_limits<int>::max()))
    throw environment_error("grid too large for cv::parallel_for_");

  int global_width = geometry.global_width;
  int num_lanes = static_cast<int>(geometry.num_lanes());

  try {
    cv::parallel_for_(cv::Range(0, num_lanes),
        [&](const cv::Range& range) {
          for (int r = range.start; r < range.end; r++)
          {
            run_lane(r % global_width, r / global_width, args, out);
          }
        },
        nstripes_);
  }
  catch (const cv::Exception& e) {
    throw environment_error(std::string(
        "OpenCV parallel_for_ failed: ") + e.what());
  }
}
//----------------------------------------------------------------------------

} // namespace mandelmap
