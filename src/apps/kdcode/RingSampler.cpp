#include "apps/kdcode/RingSampler.hpp"
#include "apps/kdcode/ImageSampling.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace kdcode {
static inline RingSamplerConfig sanitise(const RingSamplerConfig& in) {
    RingSamplerConfig cfg = in;

    if (cfg.INTENSITY_THRESHOLD < 1.0f || cfg.INTENSITY_THRESHOLD > 254.0f) cfg.INTENSITY_THRESHOLD = 128.0f;
    if (cfg.CONFIDENCE_SCALE <= 0.0f) cfg.CONFIDENCE_SCALE = 128.0f;
    if (cfg.MIN_WINDOW_RADIUS < 1) cfg.MIN_WINDOW_RADIUS = 1;
    if (cfg.WINDOW_ANCHOR_DIV < 1.0f) cfg.WINDOW_ANCHOR_DIV = 1.0f;

    return cfg;
}
} // namespace kdcode

kdcode::RingSampler::RingSampler(const RingSamplerConfig& cfg) : m_cfg(sanitise(cfg)) {}

void kdcode::RingSampler::setConfig(const RingSamplerConfig& cfg) {
    m_cfg = sanitise(cfg);
}

void kdcode::RingSampler::sampleAt(const cv::Mat& gray, float x, float y, int window,
                                   msg::SampledBit& s) const {
    float raw = 0.0f;
    if (!bilinearAt(gray, x, y, raw)) {
        // Outside: zero bit, zero confidence
        s.in_bounds = 0;
        s.threshold_bit = 0;
        s.confidence = 0.0f;
        return;
    }
    s.in_bounds = 1;
    s.raw_intensity = raw;

    // Local mean, window clipped to the image
    const int u = cvRound(x);
    const int v = cvRound(y);
    const cv::Rect roi = cv::Rect(u - window, v - window, 2 * window + 1, 2 * window + 1)
                       & cv::Rect(0, 0, gray.cols, gray.rows);
    s.local_average = roi.area() > 0 ? static_cast<float>(cv::mean(gray(roi))[0]) : raw;

    const float gx = 0.5f * (bilinearClamped(gray, x + 1.0f, y) - bilinearClamped(gray, x - 1.0f, y));
    const float gy = 0.5f * (bilinearClamped(gray, x, y + 1.0f) - bilinearClamped(gray, x, y - 1.0f));
    s.gradient_magnitude = std::sqrt(gx * gx + gy * gy);

    s.confidence = std::min(1.0f, std::fabs(raw - s.local_average) / m_cfg.CONFIDENCE_SCALE);
    s.threshold_bit = raw < m_cfg.INTENSITY_THRESHOLD ? 1 : 0;
}

bool kdcode::RingSampler::sample(const cv::Mat& gray, const msg::DetectedGeometry& g,
                                 float angle_deg, int segments,
                                 std::vector<msg::SampledBit>& out) const {
    out.clear();

    if (gray.empty() || gray.type() != CV_8UC1 || segments <= 0 ||
        g.rings_needed_estimate <= 0 || g.estimated_ring_width <= 0.0f) {
        std::cerr << "[Sampler] invalid surface or geometry\n";
        return false;
    }

    const int window = std::max(m_cfg.MIN_WINDOW_RADIUS,
                                static_cast<int>(g.anchor_radius / m_cfg.WINDOW_ANCHOR_DIV));
    const float step = 360.0f / static_cast<float>(segments);

    out.resize(static_cast<std::size_t>(g.rings_needed_estimate) * segments);

    for (int ring = 0; ring < g.rings_needed_estimate; ++ring) {
        const float radius = g.anchor_radius + (ring + 1.5f) * g.estimated_ring_width;

        for (int k = 0; k < segments; ++k) {
            msg::SampledBit& s = out[static_cast<std::size_t>(ring) * segments + k];
            s.ring    = static_cast<uint16_t>(ring);
            s.segment = static_cast<uint16_t>(k);

            const float a = static_cast<float>((angle_deg + k * step) * CV_PI / 180.0);
            sampleAt(gray, g.center_x + radius * std::cos(a), g.center_y + radius * std::sin(a), window, s);
        }
    }
    return true;
}
