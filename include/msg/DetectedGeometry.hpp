#pragma once
#include <cstdint>

namespace msg {

// Pixel coords of the working frame: origin = top-left, x -> right, y -> down.
// Multiply by 1/scale to get back to the input image.
struct DetectedGeometry {
    float center_x = 0.0f;
    float center_y = 0.0f;

    float anchor_radius = 0.0f;         // [px]
    float outer_radius  = 0.0f;         // inner edge of the distortion ring [px]

    float orientation_angle_deg = 0.0f; // centre of segment 0, [0, 360)

    float estimated_ring_width  = 0.0f; // [px]
    int   rings_needed_estimate = 0;    // data rings (excludes marker band)

    float scale = 1.0f;                 // working frame / input image

    uint8_t refined = 0;                // 1 if radial refinement replaced the coarse estimate
    int hough_set = -1;                 // index of the parameter set that produced the circles
};

} // namespace msg
