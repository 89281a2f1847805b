#ifndef MANDELMAP_DISPATCH_HARNESS_HPP
#define MANDELMAP_DISPATCH_HARNESS_HPP

#include "divergence_map.hpp"
#include "execution_context.hpp"
#include "grid.hpp"
//
#include <iosfwd>

namespace mandelmap {

//
// Evaluates the escape-time kernel for every point of a grid on an injected
// execution context and hands the result back as a host-owned map.
//
// A run is all or nothing: it validates, acquires the context, allocates
// the output region, launches one lane per grid point, waits for all of
// them and copies the region into a fresh DivergenceMap. Any failure
// throws (configuration_error, environment_error, allocation_error) and
// no map is produced. The harness keeps no state between runs.
//
class DispatchHarness {
public:
  explicit DispatchHarness(ExecutionContext& context,
                           LaunchConfig config = LaunchConfig());

  // Timings and launch geometry are written here when set.
  void setLog(std::ostream* log) { this->log = log; }

  DivergenceMap run(int width, int height, int iteration_bound);
  DivergenceMap run(const Grid& grid, int iteration_bound,
                    const ComplexWindow& window);

  ExecutionContext& executionContext() const { return context; }

private:
  ExecutionContext& context;
  LaunchConfig      config;
  std::ostream*     log;
};

} // namespace mandelmap

#endif //MANDELMAP_DISPATCH_HARNESS_HPP
