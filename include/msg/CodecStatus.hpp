#pragma once
#include <cstdint>
#include <string>

namespace msg {

enum class EncodeStatus : uint8_t {
    OK = 0,
    VALIDATION_ERROR,    // caller input, names the offending field
    CAPACITY_EXCEEDED,   // derived layout exceeds MAX_RINGS / MAX_IMAGE_SIZE
    ENCODING_ERROR,      // a character cannot be represented in 8 bits
    IMAGE_WRITE_FAILED,  // image codec refused the canvas
};

// NOT_FOUND is an expected outcome, not a failure.
enum class DecodeStatus : uint8_t {
    FOUND = 0,
    NOT_FOUND,
    INVALID_INPUT,       // empty buffer or out-of-range ScanParameters
};

struct EncodeFault {
    EncodeStatus status = EncodeStatus::OK;
    std::string field;   // empty when the fault is not tied to one field
    std::string detail;
};

inline const char* StatusStr(EncodeStatus s) {
    switch (s) {
        case EncodeStatus::OK:                 return "OK";
        case EncodeStatus::VALIDATION_ERROR:   return "VALIDATION_ERROR";
        case EncodeStatus::CAPACITY_EXCEEDED:  return "CAPACITY_EXCEEDED";
        case EncodeStatus::ENCODING_ERROR:     return "ENCODING_ERROR";
        case EncodeStatus::IMAGE_WRITE_FAILED: return "IMAGE_WRITE_FAILED";
    }
    return "UNKNOWN";
}

inline const char* StatusStr(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::FOUND:         return "FOUND";
        case DecodeStatus::NOT_FOUND:     return "NOT_FOUND";
        case DecodeStatus::INVALID_INPUT: return "INVALID_INPUT";
    }
    return "UNKNOWN";
}

} // namespace msg
