#include "apps/kdcode/BitCodec.hpp"
#include "apps/kdcode/Rasterizer.hpp"

#include <opencv2/imgcodecs.hpp>

#include <iostream>
#include <string>

#define T_ASSERT(expr) do { if (!(expr)) { std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } } while (0)

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

static bool testPlan() {
    msg::CodeParameters p;   // 16 / 10 / 15 / 5
    msg::RasterPlan plan;

    T_ASSERT(kdcode::Rasterizer::planRaster(16, p, plan) == msg::EncodeStatus::OK);
    T_ASSERT(plan.rings_needed == 1);
    T_ASSERT(plan.outer_radius == 40);
    T_ASSERT(plan.image_size == 500);

    p.segments_per_ring = 8;
    T_ASSERT(kdcode::Rasterizer::planRaster(16, p, plan) == msg::EncodeStatus::OK);
    T_ASSERT(plan.rings_needed == 2);
    T_ASSERT(plan.outer_radius == 55);
    T_ASSERT(plan.image_size == 650);

    // 17 bits still need a second ring
    p.segments_per_ring = 16;
    T_ASSERT(kdcode::Rasterizer::planRaster(17, p, plan) == msg::EncodeStatus::OK);
    T_ASSERT(plan.rings_needed == 2);
    return true;
}

static bool testValidation() {
    kdcode::Rasterizer r;
    msg::CodeParameters p;
    msg::EncodeOptions o;
    msg::EncodeFault f;
    msg::RasterImage img;

    T_ASSERT(r.encode("", p, o, img, f) == msg::EncodeStatus::VALIDATION_ERROR);
    T_ASSERT(f.field == "text");

    T_ASSERT(r.encode(std::string(1000, 'A'), p, o, img, f) == msg::EncodeStatus::VALIDATION_ERROR);
    T_ASSERT(f.field == "text");

    T_ASSERT(r.encode("\xE2\x82\xAC", p, o, img, f) == msg::EncodeStatus::VALIDATION_ERROR);
    T_ASSERT(f.field == "text");

    msg::CodeParameters bad = p;
    bad.segments_per_ring = 15;
    T_ASSERT(r.encode("HI", bad, o, img, f) == msg::EncodeStatus::VALIDATION_ERROR);
    T_ASSERT(f.field == "segments_per_ring");

    bad = p;
    bad.ring_width = 0;
    T_ASSERT(r.encode("HI", bad, o, img, f) == msg::EncodeStatus::VALIDATION_ERROR);
    T_ASSERT(f.field == "ring_width");

    bad = p;
    bad.scale_factor = -1;
    T_ASSERT(r.encode("HI", bad, o, img, f) == msg::EncodeStatus::VALIDATION_ERROR);
    T_ASSERT(f.field == "scale_factor");

    msg::EncodeOptions q;
    q.compression_quality = 0;
    T_ASSERT(r.encode("HI", p, q, img, f) == msg::EncodeStatus::VALIDATION_ERROR);
    T_ASSERT(f.field == "compression_quality");
    T_ASSERT(img.bytes.empty());
    return true;
}

static bool testCapacity() {
    kdcode::Rasterizer r;
    msg::EncodeFault f;
    msg::RasterImage img;

    // 128 chars at 8 segments -> 128 rings
    msg::CodeParameters p;
    p.segments_per_ring = 8;
    T_ASSERT(r.encode(std::string(128, 'x'), p, {}, img, f) == msg::EncodeStatus::CAPACITY_EXCEEDED);
    T_ASSERT(img.bytes.empty());

    // One ring, but the canvas is too large
    msg::CodeParameters big;
    big.scale_factor = 50;
    T_ASSERT(r.encode("HI", big, {}, img, f) == msg::EncodeStatus::CAPACITY_EXCEEDED);

    // Exactly MAX_RINGS fits: 40 chars = 320 bits = 20 rings at 16 segments,
    // but the canvas needs scale 1 to stay under the size limit
    msg::CodeParameters edge;
    edge.scale_factor = 1;
    edge.anchor_radius = 5;
    edge.ring_width = 5;
    T_ASSERT(r.encode(std::string(40, 'k'), edge, {}, img, f) == msg::EncodeStatus::OK);
    T_ASSERT(img.plan.rings_needed == msg::MAX_RINGS);
    T_ASSERT(r.encode(std::string(41, 'k'), edge, {}, img, f) == msg::EncodeStatus::CAPACITY_EXCEEDED);
    return true;
}

static bool testHugeRingWidth() {
    // anchor + 2 * ring_width is past INT_MAX
    msg::CodeParameters p;
    p.ring_width = 1500000000;

    msg::RasterPlan plan;
    T_ASSERT(kdcode::Rasterizer::planRaster(16, p, plan) == msg::EncodeStatus::CAPACITY_EXCEEDED);
    T_ASSERT(plan.rings_needed == 1);
    T_ASSERT(plan.outer_radius > 0);
    T_ASSERT(plan.image_size > msg::MAX_IMAGE_SIZE);

    kdcode::Rasterizer r;
    msg::EncodeFault f;
    msg::RasterImage img;
    T_ASSERT(r.encode("HI", p, {}, img, f) == msg::EncodeStatus::CAPACITY_EXCEEDED);
    T_ASSERT(img.bytes.empty());
    return true;
}

static bool testDeterministicPng() {
    kdcode::Rasterizer r;
    msg::EncodeFault f;
    msg::RasterImage a, b;

    T_ASSERT(r.encode("Deterministic", {}, {}, a, f) == msg::EncodeStatus::OK);
    T_ASSERT(r.encode("Deterministic", {}, {}, b, f) == msg::EncodeStatus::OK);
    T_ASSERT(a.format == msg::ImageFormat::PNG);
    T_ASSERT(a.bytes.size() > 8);
    T_ASSERT(a.bytes[0] == 0x89 && a.bytes[1] == 'P' && a.bytes[2] == 'N' && a.bytes[3] == 'G');
    T_ASSERT(a.bytes == b.bytes);

    const cv::Mat back = cv::imdecode(a.bytes, cv::IMREAD_UNCHANGED);
    T_ASSERT(back.type() == CV_8UC1);
    T_ASSERT(back.cols == static_cast<int>(a.width) && back.rows == static_cast<int>(a.height));
    return true;
}

static bool testJpegOnRequest() {
    kdcode::Rasterizer r;
    msg::EncodeFault f;
    msg::RasterImage img;
    msg::EncodeOptions o;
    o.compression_quality = 80;

    T_ASSERT(r.encode("HI", {}, o, img, f) == msg::EncodeStatus::OK);
    T_ASSERT(img.format == msg::ImageFormat::JPEG);
    T_ASSERT(img.bytes.size() > 2 && img.bytes[0] == 0xFF && img.bytes[1] == 0xD8);
    return true;
}

static bool testLayout() {
    kdcode::Rasterizer r;
    msg::CodeParameters p;
    msg::BitStream bits;
    msg::RasterPlan plan;
    cv::Mat canvas;

    T_ASSERT(kdcode::textToBits("HI", bits));
    T_ASSERT(kdcode::Rasterizer::planRaster(bits.size(), p, plan) == msg::EncodeStatus::OK);
    T_ASSERT(r.rasterize(bits, p, plan, canvas));
    T_ASSERT(canvas.type() == CV_8UC1 && canvas.cols == 500 && canvas.rows == 500);

    // A = 50, w = 75, data ring 0 = [125, 200], distortion ring = [200, 210]
    auto px = [&](int x, int y) { return static_cast<int>(canvas.at<uint8_t>(y, x)); };

    T_ASSERT(px(250, 250) == 0);          // anchor
    T_ASSERT(px(250, 163) == 0);          // fin (up)
    T_ASSERT(px(250, 337) == 255);        // marker band, no fin below
    T_ASSERT(px(163, 250) == 255);        // marker band, left
    T_ASSERT(px(250, 412) == 255);        // segment 0 (90 deg) carries 'H' bit 0 = 0
    T_ASSERT(px(188, 400) == 0);          // segment 1 (112.5 deg) carries bit 1 = 1
    T_ASSERT(px(250, 455) == 0);          // distortion ring below
    T_ASSERT(px(250, 45) == 0);           // distortion ring above
    T_ASSERT(px(250, 465 + 2) == 255);    // outside the ring
    T_ASSERT(px(2, 2) == 255);            // margin
    return true;
}

int main() {
    std::cout << "=== kdcode_rasterizer_test ===\n";
    int failed = 0;

    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] = {
        {"planRaster()", testPlan},
        {"validation faults name the field", testValidation},
        {"capacity limits", testCapacity},
        {"huge ring width", testHugeRingWidth},
        {"PNG output is deterministic", testDeterministicPng},
        {"JPEG only when quality < 100", testJpegOnRequest},
        {"layout of \"HI\"", testLayout},
    };

    int idx = 0;
    for (const auto& c : cases) {
        std::cout << "\n[Test " << idx++ << "] " << c.name << "\n";
        const bool ok = c.fn();
        printResult(c.name, ok);
        if (!ok) ++failed;
    }

    std::cout << "\nkdcode_rasterizer_test: " << (failed ? "FAIL" : "PASS") << "\n";
    return failed ? 1 : 0;
}
