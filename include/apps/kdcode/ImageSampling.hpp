#pragma once
#include <algorithm>
#include <cmath>

#include <opencv2/core.hpp>

namespace kdcode {

// Bilinear read of a CV_8UC1 image. False when (x, y) is outside
// [0, cols-1] x [0, rows-1].
inline bool bilinearAt(const cv::Mat& img, float x, float y, float& value) {
    if (!(x >= 0.0f && y >= 0.0f && x <= img.cols - 1 && y <= img.rows - 1)) {
        return false;
    }

    const int x0 = static_cast<int>(std::floor(x));
    const int y0 = static_cast<int>(std::floor(y));
    const int x1 = std::min(x0 + 1, img.cols - 1);
    const int y1 = std::min(y0 + 1, img.rows - 1);
    const float fx = x - x0;
    const float fy = y - y0;

    const float p00 = img.at<uint8_t>(y0, x0);
    const float p01 = img.at<uint8_t>(y0, x1);
    const float p10 = img.at<uint8_t>(y1, x0);
    const float p11 = img.at<uint8_t>(y1, x1);

    value = (p00 * (1.0f - fx) + p01 * fx) * (1.0f - fy)
          + (p10 * (1.0f - fx) + p11 * fx) * fy;
    return true;
}

// Clamped variant used for neighbourhood reads next to the border.
inline float bilinearClamped(const cv::Mat& img, float x, float y) {
    x = std::min(std::max(x, 0.0f), static_cast<float>(img.cols - 1));
    y = std::min(std::max(y, 0.0f), static_cast<float>(img.rows - 1));
    float v = 0.0f;
    bilinearAt(img, x, y, v);
    return v;
}

} // namespace kdcode
