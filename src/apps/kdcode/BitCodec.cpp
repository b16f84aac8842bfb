#include "apps/kdcode/BitCodec.hpp"
#include "msg/CodeParameters.hpp"

namespace kdcode {

bool decodeUtf8(const std::string& text, std::vector<uint32_t>& code_points,
                std::size_t* bad_index) {
    code_points.clear();
    code_points.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const uint8_t lead = static_cast<uint8_t>(text[i]);

        uint32_t cp = 0;
        std::size_t extra = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            if (bad_index) *bad_index = code_points.size();
            return false;
        }

        // Truncated sequence at the end of the string
        if (i + extra >= text.size()) {
            if (bad_index) *bad_index = code_points.size();
            return false;
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            const uint8_t cont = static_cast<uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                if (bad_index) *bad_index = code_points.size();
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Overlong forms are rejected so that each code point has one spelling
        static const uint32_t MIN_FOR_LEN[4] = {0x0, 0x80, 0x800, 0x10000};
        if (cp < MIN_FOR_LEN[extra] || cp > 0x10FFFF) {
            if (bad_index) *bad_index = code_points.size();
            return false;
        }

        code_points.push_back(cp);
        i += extra + 1;
    }
    return true;
}

std::size_t characterCount(const std::string& text) {
    std::size_t count = 0;
    for (char c : text) {
        // Count every byte that is not a UTF-8 continuation byte
        if ((static_cast<uint8_t>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

bool textToBits(const std::string& text, msg::BitStream& out, std::size_t* bad_index) {
    out.clear();

    std::vector<uint32_t> code_points;
    if (!decodeUtf8(text, code_points, bad_index)) {
        return false;
    }

    out.reserve(code_points.size() * msg::BITS_PER_CHAR);
    for (std::size_t i = 0; i < code_points.size(); ++i) {
        const uint32_t cp = code_points[i];
        if (cp > 0xFF) {
            if (bad_index) *bad_index = i;
            out.clear();
            return false;
        }
        for (int b = msg::BITS_PER_CHAR - 1; b >= 0; --b) {
            out.push_back(static_cast<uint8_t>((cp >> b) & 0x1u));
        }
    }
    return true;
}

std::string bitsToText(const msg::BitStream& bits) {
    std::string text;
    text.reserve(bits.size() / msg::BITS_PER_CHAR);

    ByteCursor cursor(bits);
    char c = 0;
    while (cursor.next(c)) {
        text.push_back(c);
    }
    return text;
}

ByteCursor::ByteCursor(const msg::BitStream& bits) : m_bits(bits) {}

void ByteCursor::restart() {
    m_pos = 0;
    m_terminated = false;
}

uint8_t ByteCursor::readByte() {
    uint8_t value = 0;
    for (int b = 0; b < msg::BITS_PER_CHAR; ++b) {
        const uint8_t bit = (m_pos < m_bits.size()) ? (m_bits[m_pos] & 0x1u) : 0u;
        value = static_cast<uint8_t>((value << 1) | bit);
        ++m_pos;
    }
    return value;
}

bool ByteCursor::next(char& out) {
    while (!m_terminated && m_pos < m_bits.size()) {
        const uint8_t v = readByte();

        if (v >= 32 && v <= 126) {
            out = static_cast<char>(v);
            return true;
        }
        if (v == 0) {
            m_terminated = true;
            return false;
        }
        if (v == 9 || v == 10 || v == 13) {
            out = static_cast<char>(v);
            return true;
        }
        // Any other byte is dropped without ending the walk
    }
    return false;
}

} // namespace kdcode
