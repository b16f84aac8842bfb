#include "apps/kdcode/KDCodec.hpp"

#include <opencv2/imgcodecs.hpp>

#include <iostream>
#include <limits>
#include <string>

#define T_ASSERT(expr) do { if (!(expr)) { std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } } while (0)

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

static bool encodeDecode(const kdcode::KDCodec& codec, const std::string& text,
                         const msg::CodeParameters& p, const msg::ScanParameters& scan,
                         int quality = 100) {
    msg::EncodeOptions opt;
    opt.compression_quality = quality;

    msg::RasterImage img;
    if (codec.encode(text, p, opt, img) != msg::EncodeStatus::OK) {
        std::cerr << "  encode failed for '" << text << "'\n";
        return false;
    }

    std::string decoded;
    const msg::DecodeStatus st = codec.decode(img.bytes, scan, decoded);
    std::cout << "  '" << text << "' -> " << msg::StatusStr(st) << " '" << decoded << "'\n";
    return st == msg::DecodeStatus::FOUND && decoded == text;
}

static bool testSingleRing() {
    kdcode::KDCodec codec;
    T_ASSERT(encodeDecode(codec, "HI", {}, {}));
    return true;
}

static bool testMultiRing() {
    kdcode::KDCodec codec;
    T_ASSERT(encodeDecode(codec, "KD-Code 42", {}, {}));

    // Detailed report carries the geometry in working-frame pixels
    msg::RasterImage img;
    T_ASSERT(codec.encode("KD-Code 42", {}, img) == msg::EncodeStatus::OK);
    T_ASSERT(img.plan.rings_needed == 5);

    kdcode::DecodeReport report;
    T_ASSERT(codec.decodeDetailed(img.bytes, {}, report) == msg::DecodeStatus::FOUND);
    T_ASSERT(report.localized);
    T_ASSERT(report.geometry.rings_needed_estimate == 5);
    T_ASSERT(report.samples.size() == 80);
    T_ASSERT(report.bits.size() == 80);
    T_ASSERT(report.geometry.orientation_angle_deg == 90.0f);
    return true;
}

// First ring has a single dark run, the rings outside it alternate
static bool testSparseFirstRing() {
    kdcode::KDCodec codec;
    const std::string text = "@@????????";

    msg::RasterImage img;
    T_ASSERT(codec.encode(text, {}, img) == msg::EncodeStatus::OK);
    T_ASSERT(img.plan.rings_needed == 5);

    kdcode::DecodeReport report;
    T_ASSERT(codec.decodeDetailed(img.bytes, {}, report) == msg::DecodeStatus::FOUND);
    T_ASSERT(report.geometry.rings_needed_estimate == 5);
    T_ASSERT(report.text == text);
    return true;
}

static bool testRotations() {
    kdcode::KDCodec codec;
    msg::RasterImage img;
    T_ASSERT(codec.encode("Rot8", {}, img) == msg::EncodeStatus::OK);
    const cv::Mat clean = cv::imdecode(img.bytes, cv::IMREAD_GRAYSCALE);
    T_ASSERT(!clean.empty());

    const int codes[3] = {cv::ROTATE_90_CLOCKWISE, cv::ROTATE_180, cv::ROTATE_90_COUNTERCLOCKWISE};
    const float angles[3] = {180.0f, 270.0f, 0.0f};

    for (int i = 0; i < 3; ++i) {
        cv::Mat rot;
        cv::rotate(clean, rot, codes[i]);

        kdcode::DecodeReport report;
        T_ASSERT(codec.decodeImage(rot, {}, report) == msg::DecodeStatus::FOUND);
        T_ASSERT(report.text == "Rot8");
        T_ASSERT(report.geometry.orientation_angle_deg == angles[i]);
    }
    return true;
}

static bool testSegmentCounts() {
    kdcode::KDCodec codec;

    msg::CodeParameters p8;
    p8.segments_per_ring = 8;
    msg::ScanParameters s8;
    s8.segments_per_ring = 8;
    T_ASSERT(encodeDecode(codec, "OK", p8, s8));

    msg::CodeParameters p32;
    p32.segments_per_ring = 32;
    msg::ScanParameters s32;
    s32.segments_per_ring = 32;
    T_ASSERT(encodeDecode(codec, "KD-Code 42", p32, s32));   // 3 rings, padded tail
    return true;
}

static bool testJpeg() {
    kdcode::KDCodec codec;

    msg::RasterImage img;
    msg::EncodeOptions opt;
    opt.compression_quality = 80;
    T_ASSERT(codec.encode("JPEG", {}, opt, img) == msg::EncodeStatus::OK);
    T_ASSERT(img.format == msg::ImageFormat::JPEG);

    T_ASSERT(encodeDecode(codec, "JPEG", {}, {}, 80));
    return true;
}

static bool testWhitespaceCharacters() {
    kdcode::KDCodec codec;
    T_ASSERT(encodeDecode(codec, "a\tb\nc", {}, {}));
    return true;
}

static bool testNotFound() {
    kdcode::KDCodec codec;

    cv::Mat noise(400, 400, CV_8UC1);
    cv::theRNG().state = 12345;
    cv::randu(noise, 0, 256);
    std::vector<uint8_t> bytes;
    T_ASSERT(cv::imencode(".png", noise, bytes));

    std::string text = "stale";
    T_ASSERT(codec.decode(bytes, {}, text) == msg::DecodeStatus::NOT_FOUND);
    T_ASSERT(text.empty());

    const cv::Mat blank(300, 300, CV_8UC1, cv::Scalar(255));
    T_ASSERT(cv::imencode(".png", blank, bytes));
    T_ASSERT(codec.decode(bytes, {}, text) == msg::DecodeStatus::NOT_FOUND);

    // Not an image at all
    const std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
    T_ASSERT(codec.decode(garbage, {}, text) == msg::DecodeStatus::NOT_FOUND);
    return true;
}

static bool testInvalidInput() {
    kdcode::KDCodec codec;
    std::string text;

    T_ASSERT(codec.decode({}, {}, text) == msg::DecodeStatus::INVALID_INPUT);

    msg::RasterImage img;
    T_ASSERT(codec.encode("HI", {}, img) == msg::EncodeStatus::OK);

    msg::ScanParameters s;
    s.min_anchor_radius = 0;
    T_ASSERT(codec.decode(img.bytes, s, text) == msg::DecodeStatus::INVALID_INPUT);

    s = msg::ScanParameters{};
    s.max_anchor_radius = s.min_anchor_radius;
    T_ASSERT(codec.decode(img.bytes, s, text) == msg::DecodeStatus::INVALID_INPUT);

    s = msg::ScanParameters{};
    s.segments_per_ring = 15;
    T_ASSERT(codec.decode(img.bytes, s, text) == msg::DecodeStatus::INVALID_INPUT);

    // Anchor search radius must stay within the scan limit
    s = msg::ScanParameters{};
    s.max_anchor_radius = std::numeric_limits<int>::max();
    T_ASSERT(codec.decode(img.bytes, s, text) == msg::DecodeStatus::INVALID_INPUT);
    std::string why;
    T_ASSERT(!kdcode::KDCodec::validateScanParameters(s, &why));
    T_ASSERT(why.find("max_anchor_radius") != std::string::npos);
    s.max_anchor_radius = msg::MAX_SCAN_RADIUS;
    T_ASSERT(kdcode::KDCodec::validateScanParameters(s, nullptr));

    kdcode::DecodeReport report;
    T_ASSERT(codec.decodeImage(cv::Mat(), {}, report) == msg::DecodeStatus::INVALID_INPUT);
    return true;
}

static bool testEncodeErrors() {
    kdcode::KDCodec codec;
    msg::RasterImage img;
    msg::EncodeFault fault;

    T_ASSERT(codec.encode("", {}, img, &fault) == msg::EncodeStatus::VALIDATION_ERROR);
    T_ASSERT(fault.field == "text");
    T_ASSERT(img.bytes.empty());

    msg::CodeParameters p;
    p.segments_per_ring = 12;
    T_ASSERT(codec.encode("HI", p, img, &fault) == msg::EncodeStatus::VALIDATION_ERROR);
    T_ASSERT(fault.field == "segments_per_ring");

    T_ASSERT(codec.encode(std::string(60, 'x'), {}, img, &fault) == msg::EncodeStatus::CAPACITY_EXCEEDED);
    return true;
}

static bool testMultithreadedMatchesSequential() {
    kdcode::KDCodec codec;
    msg::RasterImage img;
    T_ASSERT(codec.encode("Threads", {}, img) == msg::EncodeStatus::OK);

    msg::ScanParameters seq;
    msg::ScanParameters mt;
    mt.enable_multithreading = true;

    kdcode::DecodeReport a, b;
    T_ASSERT(codec.decodeDetailed(img.bytes, seq, a) == msg::DecodeStatus::FOUND);
    T_ASSERT(codec.decodeDetailed(img.bytes, mt, b) == msg::DecodeStatus::FOUND);
    T_ASSERT(a.text == b.text);
    T_ASSERT(a.geometry.hough_set == b.geometry.hough_set);
    T_ASSERT(a.geometry.center_x == b.geometry.center_x);
    T_ASSERT(a.geometry.anchor_radius == b.geometry.anchor_radius);
    T_ASSERT(a.bits == b.bits);
    return true;
}

static bool testAnnotation() {
    kdcode::KDCodec codec;
    msg::RasterImage img;
    T_ASSERT(codec.encode("KD-Code 42", {}, img) == msg::EncodeStatus::OK);
    const cv::Mat input = cv::imdecode(img.bytes, cv::IMREAD_UNCHANGED);

    kdcode::DecodeReport report;
    T_ASSERT(codec.decodeImage(input, {}, report) == msg::DecodeStatus::FOUND);

    cv::Mat annotated;
    T_ASSERT(kdcode::annotateDetection(input, report, annotated));
    T_ASSERT(annotated.type() == CV_8UC3);
    T_ASSERT(annotated.size() == input.size());

    kdcode::DecodeReport empty;
    T_ASSERT(!kdcode::annotateDetection(input, empty, annotated));
    return true;
}

int main() {
    std::cout << "=== kdcode_roundtrip_test ===\n";
    int failed = 0;

    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] = {
        {"single ring", testSingleRing},
        {"multi ring + report", testMultiRing},
        {"sparse first ring", testSparseFirstRing},
        {"90/180/270 rotations", testRotations},
        {"8 and 32 segments", testSegmentCounts},
        {"JPEG q80", testJpeg},
        {"tab / newline survive", testWhitespaceCharacters},
        {"no code -> NOT_FOUND", testNotFound},
        {"invalid input", testInvalidInput},
        {"encode errors", testEncodeErrors},
        {"multithreaded == sequential", testMultithreadedMatchesSequential},
        {"annotation", testAnnotation},
    };

    int idx = 0;
    for (const auto& c : cases) {
        std::cout << "\n[Test " << idx++ << "] " << c.name << "\n";
        const bool ok = c.fn();
        printResult(c.name, ok);
        if (!ok) ++failed;
    }

    std::cout << "\nkdcode_roundtrip_test: " << (failed ? "FAIL" : "PASS") << "\n";
    return failed ? 1 : 0;
}
