#ifndef MANDELMAP_GRID_HPP
#define MANDELMAP_GRID_HPP

#include <cstddef>
#include <iosfwd>

namespace mandelmap {

///////////////////////////////////////////////////////////////////////////
/// Sample resolution of the complex plane window.
struct Grid
{
    int width;
    int height;

    std::size_t num_points() const
    {
        return static_cast<std::size_t>(width) *
            static_cast<std::size_t>(height);
    }
};

///////////////////////////////////////////////////////////////////////////
/// Rectangle of the complex plane the grid is stretched over. The default
/// is the classic view real in [-2, 1], imaginary in [-1, 1].
struct ComplexWindow
{
    double real_min = -2.0;
    double real_max = 1.0;
    double imag_min = -1.0;
    double imag_max = 1.0;
};

///////////////////////////////////////////////////////////////////////////
/// How the 2-D index space is handed to the execution context.
/// lane_group_size pads the global range up to a multiple of itself in
/// both axes; 0 launches exactly width x height lanes.
struct LaunchConfig
{
    int lane_group_size = 0;
};

/// Global range actually launched, padded lanes included.
struct LaunchGeometry
{
    int global_width;
    int global_height;

    std::size_t num_lanes() const
    {
        return static_cast<std::size_t>(global_width) *
            static_cast<std::size_t>(global_height);
    }
};

// Throws configuration_error when the grid, bound or window cannot be
// evaluated: width or height below 2, bound below 1, empty window.
void validate(const Grid& grid, int iteration_bound,
    const ComplexWindow& window = ComplexWindow());

// Throws configuration_error for a negative lane group size.
LaunchGeometry make_launch_geometry(const Grid& grid,
    const LaunchConfig& config);

std::ostream& operator<<(std::ostream& os, const Grid& grid);

} // namespace mandelmap

#endif //MANDELMAP_GRID_HPP
