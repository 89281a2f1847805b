#include "grid.hpp"
#include "errors.hpp"
//
#include <limits>
#include <ostream>
#include <string>

namespace mandelmap {

void validate(const Grid& grid, int iteration_bound,
    const ComplexWindow& window)
{
    if (grid.width < 2 || grid.height < 2)
    {
        throw configuration_error("grid must be at least 2x2, got " +
            std::to_string(grid.width) + "x" + std::to_string(grid.height));
    }
    if (iteration_bound < 1)
    {
        throw configuration_error("iteration bound must be positive, got " +
            std::to_string(iteration_bound));
    }
    // negated comparisons also reject NaN bounds
    if (!(window.real_min < window.real_max) ||
        !(window.imag_min < window.imag_max))
    {
        throw configuration_error("complex window is empty");
    }
}

LaunchGeometry make_launch_geometry(const Grid& grid,
    const LaunchConfig& config)
{
    int group = config.lane_group_size;
    if (group < 0)
    {
        throw configuration_error("lane group size must not be negative, "
            "got " + std::to_string(group));
    }
    if (group <= 1)
        return LaunchGeometry{grid.width, grid.height};

    // padded extents must still be addressable as int lane coordinates
    auto round_up = [group](int n) {
        long long padded = ((static_cast<long long>(n) + group - 1) / group) *
            group;
        if (padded > std::numeric_limits<int>::max())
        {
            throw configuration_error("padding " + std::to_string(n) +
                " to a multiple of " + std::to_string(group) +
                " lanes overflows the launch range");
        }
        return static_cast<int>(padded);
    };
    return LaunchGeometry{round_up(grid.width), round_up(grid.height)};
}

std::ostream& operator<<(std::ostream& os, const Grid& grid)
{
    return os << grid.width << "x" << grid.height;
}

} // namespace mandelmap
