#pragma once
#include <cstddef>
#include <string>

#include <opencv2/core.hpp>

#include "msg/BitStream.hpp"
#include "msg/CodeParameters.hpp"
#include "msg/CodecStatus.hpp"
#include "msg/RasterImage.hpp"

namespace kdcode {

// ---------------------------------------------------------------------------
// Configuration for the Rasterizer (tunable parameters, no state).
// Nothing here changes the code format; only how finely wedges are drawn.
// ---------------------------------------------------------------------------
struct RasterizerConfig {
    int ARC_POINTS_PER_DEGREE = 10;   // vertices per degree along each wedge arc
    int MIN_ARC_POINTS        = 10;   // lower bound per arc
    int POLY_SHIFT            = 4;    // fractional bits of polygon vertices
};

// ---------------------------------------------------------------------------
// Rasterizer: text -> bit stream -> layered KD-Code canvas -> PNG/JPEG bytes.
// Stateless apart from its configuration; safe to share between threads.
// ---------------------------------------------------------------------------
class Rasterizer {
public:
    explicit Rasterizer(const RasterizerConfig& cfg = {});

    void setConfig(const RasterizerConfig& cfg);
    const RasterizerConfig& getConfig() const { return m_cfg; }

    // Field-level checks. Fills 'fault' with the first offending field.
    msg::EncodeStatus validate(const std::string& text,
                               const msg::CodeParameters& params,
                               const msg::EncodeOptions& options,
                               msg::EncodeFault& fault) const;

    // Derived layout. Returns CAPACITY_EXCEEDED when rings or canvas side
    // exceed the format limits; 'plan' is filled in either case.
    static msg::EncodeStatus planRaster(std::size_t bit_count,
                                        const msg::CodeParameters& params,
                                        msg::RasterPlan& plan);

    // Draws anchor, fin, data wedges and distortion ring onto a fresh
    // CV_8UC1 canvas (white background, black foreground).
    bool rasterize(const msg::BitStream& bits,
                   const msg::CodeParameters& params,
                   const msg::RasterPlan& plan,
                   cv::Mat& canvas) const;

    // Full encode: validate, plan, draw, compress.
    msg::EncodeStatus encode(const std::string& text,
                             const msg::CodeParameters& params,
                             const msg::EncodeOptions& options,
                             msg::RasterImage& out,
                             msg::EncodeFault& fault) const;

    static constexpr uint8_t FOREGROUND = 0;
    static constexpr uint8_t BACKGROUND = 255;

private:
    RasterizerConfig m_cfg{};

    void drawAnchor(cv::Mat& canvas, const cv::Point2f& c, float anchor_px) const;
    void drawFin(cv::Mat& canvas, const cv::Point2f& c, float anchor_px, float ring_px) const;
    void drawWedge(cv::Mat& canvas, const cv::Point2f& c,
                   float r_inner, float r_outer,
                   float start_deg, float end_deg) const;
    void drawDistortionRing(cv::Mat& canvas, const cv::Point2f& c,
                            float outer_px, int thickness) const;

    cv::Point toFixed(const cv::Point2f& p) const;
};

} // namespace kdcode
