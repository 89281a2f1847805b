#ifndef MANDELMAP_EXECUTION_CONTEXT_HPP
#define MANDELMAP_EXECUTION_CONTEXT_HPP

#include "escape_kernel.hpp"
#include "grid.hpp"
//
#include <cstddef>
#include <cstdint>
#include <string>

namespace mandelmap {

//
// Base class for the backends the dispatch harness can launch on.
// The harness never picks one itself, it is handed a context.
//
class ExecutionContext {
public:
  virtual ~ExecutionContext() = default;
  //
  virtual std::string name() const = 0;
  virtual std::size_t num_lanes() const = 0;

  // Checks that the backend can execute right now.
  // Throws environment_error otherwise.
  virtual void acquire() = 0;

  // Runs run_lane for every index of the geometry and returns only when
  // all lanes completed. out must hold args.width * args.height entries;
  // padded lanes (x >= args.width or y >= args.height) must not write,
  // which run_lane already guarantees.
  virtual void launch(const KernelArgs& args, const LaunchGeometry& geometry,
                      std::int32_t* out) = 0;
};

//
// Plain nested loop on the calling thread. Deterministic reference the
// parallel backends are validated against.
//
class SequentialExecutionContext : public ExecutionContext {
public:
  std::string name() const override { return "sequential"; }
  std::size_t num_lanes() const override { return 1; }

  void acquire() override {}
  void launch(const KernelArgs& args, const LaunchGeometry& geometry,
              std::int32_t* out) override;
};

} // namespace mandelmap

#endif //MANDELMAP_EXECUTION_CONTEXT_HPP
