#include "apps/kdcode/BitCodec.hpp"
#include <iostream>
#include <string>

#define T_ASSERT(expr) do { if (!(expr)) { std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } } while (0)

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

// Bits of one byte, MSB first
static void pushByte(msg::BitStream& bits, uint8_t v) {
    for (int b = 7; b >= 0; --b) bits.push_back((v >> b) & 1u);
}

static bool testKnownPattern() {
    msg::BitStream bits;
    T_ASSERT(kdcode::textToBits("HI", bits));
    T_ASSERT(bits.size() == 16);

    // 'H' = 0x48, 'I' = 0x49
    const uint8_t expect[16] = {0,1,0,0,1,0,0,0, 0,1,0,0,1,0,0,1};
    for (int i = 0; i < 16; ++i) T_ASSERT(bits[i] == expect[i]);
    return true;
}

static bool testPrintableRoundTrip() {
    std::string all;
    for (int c = 32; c <= 126; ++c) all.push_back(static_cast<char>(c));

    msg::BitStream bits;
    T_ASSERT(kdcode::textToBits(all, bits));
    T_ASSERT(bits.size() == all.size() * 8);
    T_ASSERT(kdcode::bitsToText(bits) == all);
    return true;
}

static bool testByteRules() {
    msg::BitStream bits;
    pushByte(bits, 'A');
    pushByte(bits, 0x01);   // skipped
    pushByte(bits, '\t');   // kept
    pushByte(bits, 0x80);   // skipped
    pushByte(bits, '\n');
    pushByte(bits, 'B');
    pushByte(bits, 0x00);   // terminator
    pushByte(bits, 'C');    // never reached
    T_ASSERT(kdcode::bitsToText(bits) == std::string("A\t\nB"));
    return true;
}

static bool testTrailingGroupPadded() {
    // 0100000 -> padded to 01000000 = '@'
    msg::BitStream bits = {0,1,0,0,0,0,0};
    T_ASSERT(kdcode::bitsToText(bits) == "@");

    msg::BitStream empty;
    T_ASSERT(kdcode::bitsToText(empty).empty());
    return true;
}

static bool testEightBitLimit() {
    msg::BitStream bits;
    std::size_t bad = 99;

    // U+20AC does not fit in a byte
    T_ASSERT(!kdcode::textToBits("a\xE2\x82\xAC", bits, &bad));
    T_ASSERT(bad == 1);
    T_ASSERT(bits.empty());

    // U+00E9 does
    T_ASSERT(kdcode::textToBits("\xC3\xA9", bits));
    const uint8_t expect[8] = {1,1,1,0,1,0,0,1};
    T_ASSERT(bits.size() == 8);
    for (int i = 0; i < 8; ++i) T_ASSERT(bits[i] == expect[i]);

    // Truncated sequence
    T_ASSERT(!kdcode::textToBits("ok\xC3", bits, &bad));
    T_ASSERT(bad == 2);

    // Overlong encoding of '/'
    T_ASSERT(!kdcode::textToBits("\xC0\xAF", bits));
    return true;
}

static bool testCharacterCount() {
    T_ASSERT(kdcode::characterCount("") == 0);
    T_ASSERT(kdcode::characterCount("hello") == 5);
    T_ASSERT(kdcode::characterCount("h\xC3\xA9llo") == 5);
    T_ASSERT(kdcode::characterCount("\xE2\x82\xAC") == 1);
    return true;
}

static bool testCursorRestart() {
    msg::BitStream bits;
    T_ASSERT(kdcode::textToBits("KD", bits));
    pushByte(bits, 0x00);
    pushByte(bits, 'X');

    kdcode::ByteCursor cur(bits);
    std::string first;
    char c = 0;
    while (cur.next(c)) first.push_back(c);
    T_ASSERT(first == "KD");
    T_ASSERT(cur.terminated());
    T_ASSERT(cur.bitPosition() == 24);
    T_ASSERT(!cur.next(c));

    cur.restart();
    T_ASSERT(!cur.terminated());
    T_ASSERT(cur.next(c) && c == 'K');
    return true;
}

int main() {
    std::cout << "=== kdcode_bitcodec_test ===\n";
    int failed = 0;

    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] = {
        {"textToBits(\"HI\") pattern", testKnownPattern},
        {"printable ASCII round trip", testPrintableRoundTrip},
        {"byte mapping rules", testByteRules},
        {"trailing group zero padded", testTrailingGroupPadded},
        {"8-bit limit and malformed UTF-8", testEightBitLimit},
        {"characterCount()", testCharacterCount},
        {"ByteCursor stop and restart", testCursorRestart},
    };

    int idx = 0;
    for (const auto& c : cases) {
        std::cout << "\n[Test " << idx++ << "] " << c.name << "\n";
        const bool ok = c.fn();
        printResult(c.name, ok);
        if (!ok) ++failed;
    }

    std::cout << "\nkdcode_bitcodec_test: " << (failed ? "FAIL" : "PASS") << "\n";
    return failed ? 1 : 0;
}
