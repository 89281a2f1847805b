#include "hpx_execution_context.hpp"
#include "errors.hpp"
//
#include <hpx/include/runtime.hpp>
#include <hpx/include/threadmanager.hpp>
#include <hpx/exception.hpp>
//
#include <hpx/parallel/algorithms/for_loop.hpp>
#include <hpx/parallel/execution.hpp>
#include <hpx/runtime/threads/executors/pool_executor.hpp>
//
#include <algorithm>
#include <utility>

namespace mandelmap {

//----------------------------------------------------------------------------
HpxExecutionContext::HpxExecutionContext(std::string pool_name,
                                         std::size_t chunk_size)
  : pool_name_(std::move(pool_name)), chunk_size_(chunk_size)
{
}
//----------------------------------------------------------------------------
std::size_t HpxExecutionContext::num_lanes() const
{
  if (hpx::get_runtime_ptr() == nullptr)
    return 0;

  try {
    return hpx::threads::get_thread_manager().get_pool(pool_name_)
        .get_os_thread_count();
  }
  catch (const hpx::exception&) {
    // unknown pool
    return 0;
  }
}
//----------------------------------------------------------------------------
void HpxExecutionContext::acquire()
{
  hpx::runtime* rt = hpx::get_runtime_ptr();
  if (rt == nullptr || rt->get_state() != hpx::state_running)
    throw environment_error("HPX runtime is not running");

  try {
    hpx::threads::get_thread_manager().get_pool(pool_name_);
  }
  catch (const hpx::exception& e) {
    throw environment_error("HPX thread pool '" + pool_name_ +
                            "' is not available: " + e.what());
  }
}
//----------------------------------------------------------------------------
std::size_t HpxExecutionContext::chunk_size_for(std::size_t num_lanes) const
{
  if (chunk_size_ != 0)
    return chunk_size_;

  std::size_t num_work_threads = std::max<std::size_t>(this->num_lanes(), 1);
  return std::max<std::size_t>((num_lanes / num_work_threads) / 4, 1);
}
//----------------------------------------------------------------------------
void HpxExecutionContext::launch(const KernelArgs& args,
                                 const LaunchGeometry& geometry,
                                 std::int32_t* out)
{
  std::size_t num_lanes = geometry.num_lanes();
  std::size_t global_width = static_cast<std::size_t>(geometry.global_width);

  try {
    hpx::threads::executors::pool_executor executor(pool_name_);
    hpx::parallel::execution::static_chunk_size fixed(
        chunk_size_for(num_lanes));

    // for_loop returns once every lane completed, rethrowing lane
    // failures as an hpx::exception_list
    hpx::parallel::for_loop(
        hpx::parallel::execution::par.with(fixed).on(executor),
        std::size_t(0), num_lanes, [&](std::size_t r) {
          int x = static_cast<int>(r % global_width);
          int y = static_cast<int>(r / global_width);
          run_lane(x, y, args, out);
        });
  }
  catch (const hpx::exception& e) {
    throw environment_error("HPX launch on pool '" + pool_name_ +
                            "' failed: " + e.what());
  }
}
//----------------------------------------------------------------------------

} // namespace mandelmap
