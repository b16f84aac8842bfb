#pragma once
#include <opencv2/core.hpp>

#include "msg/DetectedGeometry.hpp"

namespace kdcode {

struct OrientationConfig {
    float PROBE_BAND_RATIO  = 0.5f;   // probe at anchor + ratio * ring width
    int   PROBE_HALF_WINDOW = 1;      // probes average (2h+1)^2 bilinear reads
};

// ---------------------------------------------------------------------------
// OrientationResolver: finds the fin among the four cardinal directions and
// returns the angle of segment 0 (fin + 180 deg).
// ---------------------------------------------------------------------------
class OrientationResolver {
public:
    explicit OrientationResolver(const OrientationConfig& cfg = {});

    void setConfig(const OrientationConfig& cfg);
    const OrientationConfig& getConfig() const { return m_cfg; }

    // Degrees in [0, 360). 0 when no probe falls inside the image.
    float resolve(const cv::Mat& gray, const msg::DetectedGeometry& g) const;

private:
    OrientationConfig m_cfg{};
};

} // namespace kdcode
