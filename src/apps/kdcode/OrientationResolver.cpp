#include "apps/kdcode/OrientationResolver.hpp"
#include "apps/kdcode/ImageSampling.hpp"

#include <cmath>
#include <iostream>

namespace kdcode {
static inline OrientationConfig sanitise(const OrientationConfig& in) {
    OrientationConfig cfg = in;

    if (cfg.PROBE_BAND_RATIO <= 0.0f || cfg.PROBE_BAND_RATIO >= 1.0f) cfg.PROBE_BAND_RATIO = 0.5f;
    if (cfg.PROBE_HALF_WINDOW < 0) cfg.PROBE_HALF_WINDOW = 0;
    if (cfg.PROBE_HALF_WINDOW > 4) cfg.PROBE_HALF_WINDOW = 4;

    return cfg;
}
} // namespace kdcode

kdcode::OrientationResolver::OrientationResolver(const OrientationConfig& cfg) : m_cfg(sanitise(cfg)) {}

void kdcode::OrientationResolver::setConfig(const OrientationConfig& cfg) {
    m_cfg = sanitise(cfg);
}

float kdcode::OrientationResolver::resolve(const cv::Mat& gray, const msg::DetectedGeometry& g) const {
    static const int DIRECTIONS[4] = {0, 90, 180, 270};

    const float r = g.anchor_radius + m_cfg.PROBE_BAND_RATIO * g.estimated_ring_width;
    const int h = m_cfg.PROBE_HALF_WINDOW;

    int   darkest = -1;
    float darkest_val = 256.0f;

    for (int d : DIRECTIONS) {
        const float a  = static_cast<float>(d * CV_PI / 180.0);
        const float px = g.center_x + r * std::cos(a);
        const float py = g.center_y + r * std::sin(a);

        float sum = 0.0f;
        int n = 0;
        for (int dv = -h; dv <= h; ++dv) {
            for (int du = -h; du <= h; ++du) {
                float v = 0.0f;
                if (bilinearAt(gray, px + du, py + dv, v)) {
                    sum += v;
                    ++n;
                }
            }
        }
        if (n == 0) continue;

        const float mean = sum / n;
        if (mean < darkest_val) {
            darkest_val = mean;
            darkest = d;
        }
    }

    if (darkest < 0) {
        std::cerr << "[Orientation] no probe inside the image, assuming 0 deg\n";
        return 0.0f;
    }
    return static_cast<float>((darkest + 180) % 360);
}
