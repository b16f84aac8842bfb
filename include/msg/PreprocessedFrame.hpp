#pragma once
#include <opencv2/core.hpp>

namespace msg {

// Working surfaces for one decode attempt. All three share the working
// resolution (input * scale).
struct PreprocessedFrame {
    cv::Mat gray;       // CV_8UC1, downscaled intensity
    cv::Mat enhanced;   // CLAHE + Gaussian blur of gray
    cv::Mat binary;     // CV_8UC1, pattern = 0, background = 255

    float scale = 1.0f; // working / input, <= 1

    int source_width  = 0;
    int source_height = 0;
};

} // namespace msg
