#pragma once
#include <cstdint>

namespace msg {

// One (ring, segment) sample. Context only; the decision is made by the
// error corrector.
struct SampledBit {
    float raw_intensity      = 0.0f;  // bilinear grey value, 0..255
    float local_average      = 0.0f;  // mean of the window around the sample
    float gradient_magnitude = 0.0f;  // central differences, both axes
    float confidence         = 0.0f;  // min(1, |raw - local| / 128), 0 when out of bounds

    uint16_t ring    = 0;
    uint16_t segment = 0;

    uint8_t threshold_bit = 0;        // raw < 128 -> 1 (dark = foreground)
    uint8_t in_bounds     = 0;
};

} // namespace msg
