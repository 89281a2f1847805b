#include "dispatch_harness.hpp"
#include "errors.hpp"
#include "escape_kernel.hpp"
//
#include <hpx/util/high_resolution_timer.hpp>
//
#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <ostream>
#include <vector>

namespace mandelmap {

//----------------------------------------------------------------------------
DispatchHarness::DispatchHarness(ExecutionContext& context,
                                 LaunchConfig config)
  : context(context), config(config), log(nullptr)
{
}
//----------------------------------------------------------------------------
DivergenceMap DispatchHarness::run(int width, int height, int iteration_bound)
{
  return run(Grid{width, height}, iteration_bound, ComplexWindow());
}
//----------------------------------------------------------------------------
DivergenceMap DispatchHarness::run(const Grid& grid, int iteration_bound,
                                   const ComplexWindow& window)
{
  // all checks happen here, lanes cannot report anything
  validate(grid, iteration_bound, window);
  LaunchGeometry geometry = make_launch_geometry(grid, config);

  this->context.acquire();

  std::vector<std::int32_t> region;
  std::string region_error = "cannot allocate output region for a " +
      std::to_string(grid.width) + "x" + std::to_string(grid.height) +
      " grid";
  if (grid.num_points() > region.max_size())
    throw allocation_error(region_error);

  try {
    region.resize(grid.num_points());
  }
  catch (const std::bad_alloc&) {
    throw allocation_error(region_error);
  }
  catch (const std::length_error&) {
    throw allocation_error(region_error);
  }

  KernelArgs args{grid.width, grid.height, iteration_bound, window};

  if (this->log) {
    *this->log << "[dispatch] " << this->context.name() << " grid=" << grid
               << " global=" << geometry.global_width << "x"
               << geometry.global_height
               << " iterations=" << iteration_bound
               << " lanes=" << this->context.num_lanes() << "\n";
  }

  hpx::util::high_resolution_timer timer;
  this->context.launch(args, geometry, region.data());
  double elapsed = timer.elapsed();

  if (this->log) {
    *this->log << "[dispatch] " << this->context.name()
               << " execution time: " << elapsed << " s\n";
  }

  return DivergenceMap(grid, region.data());
}
//----------------------------------------------------------------------------

} // namespace mandelmap
