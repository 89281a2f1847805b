#include "escape_kernel.hpp"

namespace mandelmap {

int escape_time(int x, int y, int width, int height, int iteration_bound,
    const ComplexWindow& window) noexcept
{
    double c_real = x * (window.real_max - window.real_min) / (width - 1) +
        window.real_min;
    double c_imag = y * (window.imag_max - window.imag_min) / (height - 1) +
        window.imag_min;

    double z_real = 0.0;
    double z_imag = 0.0;

    for (int i = 1; i <= iteration_bound; ++i)
    {
        double tmp_z_real = z_real * z_real - z_imag * z_imag + c_real;
        z_imag = 2 * z_real * z_imag + c_imag;
        z_real = tmp_z_real;

        // outside the escape radius the orbit is known to diverge
        if (z_real * z_real + z_imag * z_imag > 4.0)
            return i;
    }

    return 0;
}

} // namespace mandelmap
