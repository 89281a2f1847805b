#ifndef MANDELMAP_INTENSITY_HPP
#define MANDELMAP_INTENSITY_HPP

#include "divergence_map.hpp"
//
#include <string>
//
#include <opencv2/core.hpp>

namespace mandelmap {

// Scales a map to an 8-bit grey image, 255 * v / max(v). A map without any
// divergent point gives a black image.
cv::Mat to_intensity(const DivergenceMap& map);

// Warning - blocks until the user closes the window, run it on a pool
// meant for blocking calls.
void show_image(const cv::Mat& image, const std::string& win_name);

// Throws std::runtime_error if OpenCV cannot encode or write the file.
void save_image(const cv::Mat& image, const std::string& path);

} // namespace mandelmap

#endif //MANDELMAP_INTENSITY_HPP
