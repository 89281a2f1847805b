#include "intensity.hpp"
//
#include <stdexcept>
//
#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>

namespace mandelmap {

cv::Mat to_intensity(const DivergenceMap& map)
{
    cv::Mat image;
    if (map.empty())
        return image;

    std::int32_t max_value = map.max_value();
    if (max_value == 0)
        return cv::Mat::zeros(map.height(), map.width(), CV_8U);

    map.mat().convertTo(image, CV_8U, 255.0 / max_value);
    return image;
}

void show_image(const cv::Mat& image, const std::string& win_name)
{
    cv::namedWindow(win_name, cv::WINDOW_AUTOSIZE);
    cv::imshow(win_name, image);
    cv::waitKey(0);
}

void save_image(const cv::Mat& image, const std::string& path)
{
    bool written = false;
    try
    {
        written = cv::imwrite(path, image);
    }
    catch (const cv::Exception& e)
    {
        throw std::runtime_error("cannot write " + path + ": " + e.what());
    }
    if (!written)
        throw std::runtime_error("cannot write " + path);
}

} // namespace mandelmap
