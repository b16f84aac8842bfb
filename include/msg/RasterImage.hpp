#pragma once
#include <cstdint>
#include <vector>

namespace msg {

// Layout derived from bit count + CodeParameters, computed before drawing.
struct RasterPlan {
    int total_bits   = 0;   // bits before ring padding
    int rings_needed = 0;   // ceil(total_bits / segments_per_ring)
    int outer_radius = 0;   // unscaled: anchor + rings*ring_width + ring_width
    int image_size   = 0;   // scaled canvas side [px]
};

enum class ImageFormat : uint8_t { PNG = 0, JPEG = 1 };

// Encoded image handed back to the caller.
struct RasterImage {
    std::vector<uint8_t> bytes;   // PNG or JPEG stream
    uint32_t width  = 0;          // pixels
    uint32_t height = 0;          // pixels
    ImageFormat format = ImageFormat::PNG;
    RasterPlan plan{};
};

} // namespace msg
