#pragma once
#include <vector>

#include <opencv2/core.hpp>

#include "msg/DetectedGeometry.hpp"
#include "msg/SampledBit.hpp"

namespace kdcode {

struct RingSamplerConfig {
    float INTENSITY_THRESHOLD = 128.0f;  // below -> threshold_bit = 1
    float CONFIDENCE_SCALE    = 128.0f;  // |raw - local| / scale, clamped to 1
    int   MIN_WINDOW_RADIUS   = 2;       // local average window, px
    float WINDOW_ANCHOR_DIV   = 4.0f;    // window radius = anchor / div
};

// ---------------------------------------------------------------------------
// RingSampler: one SampledBit per (ring, segment) at the ring mid-radius,
// segment k at angle + k * 360 / segments. Ring-major order.
// ---------------------------------------------------------------------------
class RingSampler {
public:
    explicit RingSampler(const RingSamplerConfig& cfg = {});

    void setConfig(const RingSamplerConfig& cfg);
    const RingSamplerConfig& getConfig() const { return m_cfg; }

    bool sample(const cv::Mat& gray, const msg::DetectedGeometry& g,
                float angle_deg, int segments,
                std::vector<msg::SampledBit>& out) const;

private:
    RingSamplerConfig m_cfg{};

    void sampleAt(const cv::Mat& gray, float x, float y, int window, msg::SampledBit& s) const;
};

} // namespace kdcode
