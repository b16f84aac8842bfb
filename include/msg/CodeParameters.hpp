#pragma once
#include <array>
#include <cstdint>

namespace msg {

// ---------------------------------------------------------------------------
// Format limits shared by encoder and decoder. Changing any of these breaks
// compatibility with codes already printed.
// ---------------------------------------------------------------------------
constexpr int MAX_RINGS      = 20;     // data rings per code
constexpr int MAX_IMAGE_SIZE = 2000;   // canvas side [px]
constexpr int RASTER_MARGIN  = 20;     // unscaled px added to the outer diameter
constexpr int BITS_PER_CHAR  = 8;
constexpr int MAX_SCAN_RADIUS = 4 * MAX_IMAGE_SIZE;  // decoder anchor search limit [px]

constexpr std::array<int, 3> ALLOWED_SEGMENTS = {8, 16, 32};

// Orientation fin, in ring widths measured from the anchor edge.
constexpr float FIN_APEX_RATIO      = 0.9f;  // apex above the anchor edge
constexpr float FIN_BASE_DEPTH      = 0.3f;  // base sits this far inside the disk
constexpr float FIN_HALF_BASE_RATIO = 0.5f;

// Segment 0 is centred opposite the fin (fin points to 270 deg, y down).
constexpr float SEGMENT_ZERO_ANGLE_DEG = 90.0f;

// Distortion ring thickness per unit of scale factor.
constexpr int BORDER_THICKNESS_PER_SCALE = 2;

constexpr bool isAllowedSegmentCount(int n) {
    for (int s : ALLOWED_SEGMENTS) {
        if (s == n) return true;
    }
    return false;
}

// Encoder-side geometry. All values are in unscaled units.
struct CodeParameters {
    int segments_per_ring = 16;
    int anchor_radius     = 10;
    int ring_width        = 15;
    int scale_factor      = 5;
    int max_chars         = 128;
};

// 100 -> lossless PNG, anything lower -> JPEG at that quality.
struct EncodeOptions {
    int compression_quality = 100;
};

// Decoder-side hints. Radii are in pixels of the input image.
struct ScanParameters {
    int  segments_per_ring     = 16;
    int  min_anchor_radius     = 5;
    int  max_anchor_radius     = 100;
    bool enable_multithreading = false;
};

} // namespace msg
