#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "msg/BitStream.hpp"

namespace kdcode {

// ---------------------------------------------------------------------------
// Text <-> bit stream transcoding (8 bits per character, MSB first).
// Input text is UTF-8; every code point must fit in one byte.
// ---------------------------------------------------------------------------

// Decode UTF-8 into code points. On malformed input returns false and sets
// bad_index to the character index where decoding stopped.
bool decodeUtf8(const std::string& text, std::vector<uint32_t>& code_points,
                std::size_t* bad_index = nullptr);

// Number of characters (code points). Malformed bytes count as one each.
std::size_t characterCount(const std::string& text);

// Fails (EncodingError) when a code point is > 255 or the UTF-8 is malformed.
// 'out' is left empty on failure.
bool textToBits(const std::string& text, msg::BitStream& out,
                std::size_t* bad_index = nullptr);

// Byte values: 32..126 -> char, 9/10/13 -> tab/LF/CR, 0 -> stop, others skipped.
std::string bitsToText(const msg::BitStream& bits);

// Lazy walk over the characters of a bit stream. Stops for good at the first
// NUL byte; restart() rewinds to the first bit.
class ByteCursor {
public:
    explicit ByteCursor(const msg::BitStream& bits);

    // Next emitted character. False at the terminator or at the end.
    bool next(char& out);

    void restart();

    bool terminated() const { return m_terminated; }
    std::size_t bitPosition() const { return m_pos; }

private:
    const msg::BitStream& m_bits;
    std::size_t m_pos = 0;
    bool m_terminated = false;

    // Incomplete trailing group is zero-padded.
    uint8_t readByte();
};

} // namespace kdcode
