#ifndef MANDELMAP_HPX_EXECUTION_CONTEXT_HPP
#define MANDELMAP_HPX_EXECUTION_CONTEXT_HPP

#include "execution_context.hpp"
//
#include <cstddef>
#include <string>

namespace mandelmap {

//
// Runs the lanes with hpx::parallel::for_loop on the executor of a named
// HPX thread pool. Only usable from inside a running HPX runtime.
//
class HpxExecutionContext : public ExecutionContext {
public:
  // chunk_size 0 splits the index space into four chunks per worker thread.
  explicit HpxExecutionContext(std::string pool_name = "default",
                               std::size_t chunk_size = 0);

  std::string name() const override { return "hpx:" + pool_name_; }
  std::size_t num_lanes() const override;

  void acquire() override;
  void launch(const KernelArgs& args, const LaunchGeometry& geometry,
              std::int32_t* out) override;

  const std::string& pool_name() const { return pool_name_; }

private:
  std::size_t chunk_size_for(std::size_t num_lanes) const;

  std::string pool_name_;
  std::size_t chunk_size_;
};

} // namespace mandelmap

#endif //MANDELMAP_HPX_EXECUTION_CONTEXT_HPP
