#ifndef MANDELMAP_ESCAPE_KERNEL_HPP
#define MANDELMAP_ESCAPE_KERNEL_HPP

#include "grid.hpp"
//
#include <cstddef>
#include <cstdint>

namespace mandelmap {

///////////////////////////////////////////////////////////////////////////
/// Everything a lane needs; copied by value into every lane.
struct KernelArgs
{
    int width;
    int height;
    int iteration_bound;
    ComplexWindow window;
};

// Escape-time algorithm: iterate z <- z*z + c from z = 0 and return the
// first iteration whose squared norm exceeds 4, or 0 if the orbit stays
// bounded for iteration_bound iterations.
//
// Lanes have no way to report failure, so nothing is checked here:
// width, height >= 2 and iteration_bound >= 1 are the caller's business.
int escape_time(int x, int y, int width, int height, int iteration_bound,
    const ComplexWindow& window) noexcept;

inline int escape_time(int x, int y, int width, int height,
    int iteration_bound) noexcept
{
    return escape_time(x, y, width, height, iteration_bound, ComplexWindow());
}

// One lane of the launch. Lanes outside the grid (padding of the launch
// geometry) return without touching out.
inline void run_lane(int x, int y, const KernelArgs& args,
    std::int32_t* out) noexcept
{
    if (x >= args.width || y >= args.height)
        return;

    out[static_cast<std::size_t>(y) * args.width + x] = escape_time(x, y,
        args.width, args.height, args.iteration_bound, args.window);
}

} // namespace mandelmap

#endif //MANDELMAP_ESCAPE_KERNEL_HPP
