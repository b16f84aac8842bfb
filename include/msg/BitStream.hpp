#pragma once
#include <cstdint>
#include <vector>

namespace msg {

// One element per bit, values 0 or 1, MSB of each character first.
// Length produced by the encoder is always a multiple of 8.
using BitStream = std::vector<uint8_t>;

// Output of the error corrector; same layout as BitStream.
using CorrectedBitStream = BitStream;

} // namespace msg
