#include "execution_context.hpp"

namespace mandelmap {

//----------------------------------------------------------------------------
void SequentialExecutionContext::launch(const KernelArgs& args,
                                        const LaunchGeometry& geometry,
                                        std::int32_t* out)
{
  for (int y = 0; y < geometry.global_height; y++)
  {
    for (int x = 0; x < geometry.global_width; x++)
    {
      run_lane(x, y, args, out);
    }
  }
}
//----------------------------------------------------------------------------

} // namespace mandelmap
