#include "apps/kdcode/Rasterizer.hpp"
#include "apps/kdcode/BitCodec.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

namespace kdcode {
static inline RasterizerConfig sanitise(const RasterizerConfig& in) {
    RasterizerConfig cfg = in;

    if (cfg.ARC_POINTS_PER_DEGREE < 1) cfg.ARC_POINTS_PER_DEGREE = 1;
    if (cfg.MIN_ARC_POINTS < 10) cfg.MIN_ARC_POINTS = 10;     // wedges degrade below this
    if (cfg.POLY_SHIFT < 0) cfg.POLY_SHIFT = 0;
    if (cfg.POLY_SHIFT > 8) cfg.POLY_SHIFT = 8;

    return cfg;
}

static inline msg::EncodeStatus fail(msg::EncodeFault& fault, msg::EncodeStatus s,
                                     const char* field, const std::string& detail) {
    fault.status = s;
    fault.field  = field;
    fault.detail = detail;
    return s;
}

constexpr float DEG2RAD = static_cast<float>(CV_PI / 180.0);
} // namespace kdcode

kdcode::Rasterizer::Rasterizer(const RasterizerConfig& cfg) : m_cfg(sanitise(cfg)) {}

void kdcode::Rasterizer::setConfig(const RasterizerConfig& cfg) {
    m_cfg = sanitise(cfg);
}

msg::EncodeStatus kdcode::Rasterizer::validate(const std::string& text,
                                               const msg::CodeParameters& params,
                                               const msg::EncodeOptions& options,
                                               msg::EncodeFault& fault) const {
    fault = msg::EncodeFault{};
    using S = msg::EncodeStatus;

    if (!msg::isAllowedSegmentCount(params.segments_per_ring)) {
        return fail(fault, S::VALIDATION_ERROR, "segments_per_ring",
                    "must be one of 8, 16, 32 (got " + std::to_string(params.segments_per_ring) + ")");
    }
    if (params.anchor_radius <= 0) {
        return fail(fault, S::VALIDATION_ERROR, "anchor_radius", "must be a positive integer");
    }
    if (params.ring_width <= 0) {
        return fail(fault, S::VALIDATION_ERROR, "ring_width", "must be a positive integer");
    }
    if (params.scale_factor <= 0) {
        return fail(fault, S::VALIDATION_ERROR, "scale_factor", "must be a positive integer");
    }
    if (params.max_chars <= 0) {
        return fail(fault, S::VALIDATION_ERROR, "max_chars", "must be a positive integer");
    }
    if (options.compression_quality < 1 || options.compression_quality > 100) {
        return fail(fault, S::VALIDATION_ERROR, "compression_quality", "must be between 1 and 100");
    }
    if (text.empty()) {
        return fail(fault, S::VALIDATION_ERROR, "text", "cannot be empty");
    }

    const std::size_t n_chars = characterCount(text);
    if (n_chars > static_cast<std::size_t>(params.max_chars)) {
        return fail(fault, S::VALIDATION_ERROR, "text",
                    "exceeds maximum length of " + std::to_string(params.max_chars) + " characters");
    }

    std::vector<uint32_t> code_points;
    std::size_t bad = 0;
    if (!decodeUtf8(text, code_points, &bad)) {
        return fail(fault, S::VALIDATION_ERROR, "text",
                    "malformed UTF-8 at character " + std::to_string(bad));
    }
    for (std::size_t i = 0; i < code_points.size(); ++i) {
        if (code_points[i] > 0xFF) {
            return fail(fault, S::VALIDATION_ERROR, "text",
                        "character " + std::to_string(i) + " is outside the 8-bit range");
        }
    }

    return S::OK;
}

msg::EncodeStatus kdcode::Rasterizer::planRaster(std::size_t bit_count,
                                                 const msg::CodeParameters& params,
                                                 msg::RasterPlan& plan) {
    const std::size_t seg = static_cast<std::size_t>(params.segments_per_ring);

    // 64-bit throughout: huge parameters must not wrap before the limit checks
    const long long rings = static_cast<long long>((bit_count + seg - 1) / seg);
    const long long outer = static_cast<long long>(params.anchor_radius) +
                            (rings + 1) * static_cast<long long>(params.ring_width);
    const long long side  = (2LL * outer + msg::RASTER_MARGIN) * params.scale_factor;

    constexpr long long INT_CAP = std::numeric_limits<int>::max();
    plan.total_bits   = static_cast<int>(std::min<long long>(static_cast<long long>(bit_count), INT_CAP));
    plan.rings_needed = static_cast<int>(std::min(rings, INT_CAP));
    plan.outer_radius = static_cast<int>(std::min(outer, INT_CAP));
    plan.image_size   = static_cast<int>(std::min(side, INT_CAP));

    if (rings > msg::MAX_RINGS) return msg::EncodeStatus::CAPACITY_EXCEEDED;
    if (side > msg::MAX_IMAGE_SIZE) return msg::EncodeStatus::CAPACITY_EXCEEDED;
    return msg::EncodeStatus::OK;
}

cv::Point kdcode::Rasterizer::toFixed(const cv::Point2f& p) const {
    const float k = static_cast<float>(1 << m_cfg.POLY_SHIFT);
    return cv::Point(cvRound(p.x * k), cvRound(p.y * k));
}

void kdcode::Rasterizer::drawAnchor(cv::Mat& canvas, const cv::Point2f& c, float anchor_px) const {
    cv::circle(canvas, toFixed(c), cvRound(anchor_px * (1 << m_cfg.POLY_SHIFT)),
               cv::Scalar(FOREGROUND), cv::FILLED, cv::LINE_8, m_cfg.POLY_SHIFT);
}

void kdcode::Rasterizer::drawFin(cv::Mat& canvas, const cv::Point2f& c,
                                 float anchor_px, float ring_px) const {
    // Upward isosceles triangle: base buried in the top of the disk, apex in
    // the marker band, short of data ring 0.
    const float base_y = c.y - anchor_px + msg::FIN_BASE_DEPTH * ring_px;
    const float half   = msg::FIN_HALF_BASE_RATIO * ring_px;

    const cv::Point pts[3] = {
        toFixed({c.x, c.y - anchor_px - msg::FIN_APEX_RATIO * ring_px}),
        toFixed({c.x - half, base_y}),
        toFixed({c.x + half, base_y}),
    };
    cv::fillConvexPoly(canvas, pts, 3, cv::Scalar(FOREGROUND), cv::LINE_8, m_cfg.POLY_SHIFT);
}

void kdcode::Rasterizer::drawWedge(cv::Mat& canvas, const cv::Point2f& c,
                                   float r_inner, float r_outer,
                                   float start_deg, float end_deg) const {
    if (r_inner < 0.0f || r_outer <= r_inner) {
        return;
    }

    const float span = end_deg - start_deg;
    const int n = std::max(m_cfg.MIN_ARC_POINTS,
                           static_cast<int>(std::ceil(std::fabs(span) * m_cfg.ARC_POINTS_PER_DEGREE)));

    std::vector<cv::Point> poly;
    poly.reserve(2 * (n + 1));

    // Outer arc forward, inner arc backward
    for (int i = 0; i <= n; ++i) {
        const float a = (start_deg + span * static_cast<float>(i) / n) * DEG2RAD;
        poly.push_back(toFixed({c.x + r_outer * std::cos(a), c.y + r_outer * std::sin(a)}));
    }
    for (int i = 0; i <= n; ++i) {
        const float a = (end_deg - span * static_cast<float>(i) / n) * DEG2RAD;
        poly.push_back(toFixed({c.x + r_inner * std::cos(a), c.y + r_inner * std::sin(a)}));
    }

    const cv::Point* pts = poly.data();
    const int npts = static_cast<int>(poly.size());
    cv::fillPoly(canvas, &pts, &npts, 1, cv::Scalar(FOREGROUND), cv::LINE_8, m_cfg.POLY_SHIFT);
}

void kdcode::Rasterizer::drawDistortionRing(cv::Mat& canvas, const cv::Point2f& c,
                                            float outer_px, int thickness) const {
    // Stroke is centred on its radius; push it out so the inner edge sits on outer_px
    const float r = outer_px + 0.5f * static_cast<float>(thickness);
    cv::circle(canvas, toFixed(c), cvRound(r * (1 << m_cfg.POLY_SHIFT)),
               cv::Scalar(FOREGROUND), thickness, cv::LINE_8, m_cfg.POLY_SHIFT);
}

bool kdcode::Rasterizer::rasterize(const msg::BitStream& bits,
                                   const msg::CodeParameters& params,
                                   const msg::RasterPlan& plan,
                                   cv::Mat& canvas) const {
    if (plan.image_size <= 0 || plan.image_size > msg::MAX_IMAGE_SIZE || plan.rings_needed <= 0) {
        std::cerr << "[Rasterizer] refusing to draw an invalid plan (side=" << plan.image_size
                  << ", rings=" << plan.rings_needed << ")\n";
        return false;
    }

    const int size = plan.image_size;
    canvas.create(size, size, CV_8UC1);
    canvas.setTo(cv::Scalar(BACKGROUND));

    const float s = static_cast<float>(params.scale_factor);
    const cv::Point2f c(static_cast<float>(size / 2), static_cast<float>(size / 2));
    const float anchor_px = params.anchor_radius * s;
    const float ring_px   = params.ring_width * s;
    const int   seg       = params.segments_per_ring;
    const float step_deg  = 360.0f / static_cast<float>(seg);

    // (a) anchor, (b) fin
    drawAnchor(canvas, c, anchor_px);
    drawFin(canvas, c, anchor_px, ring_px);

    // (c) data rings; ring 0 sits outside the marker band.
    // Bits past the end of the stream are padding zeros (not drawn).
    for (int ring = 0; ring < plan.rings_needed; ++ring) {
        const float r_in  = anchor_px + (ring + 1) * ring_px;
        const float r_out = r_in + ring_px;

        for (int k = 0; k < seg; ++k) {
            const std::size_t idx = static_cast<std::size_t>(ring) * seg + k;
            if (idx >= bits.size() || bits[idx] == 0) {
                continue;
            }
            const float centre = msg::SEGMENT_ZERO_ANGLE_DEG + k * step_deg;
            drawWedge(canvas, c, r_in, r_out, centre - 0.5f * step_deg, centre + 0.5f * step_deg);
        }
    }

    // (d) distortion ring
    const int thickness = std::max(1, msg::BORDER_THICKNESS_PER_SCALE * params.scale_factor);
    drawDistortionRing(canvas, c, plan.outer_radius * s, thickness);

    return true;
}

msg::EncodeStatus kdcode::Rasterizer::encode(const std::string& text,
                                             const msg::CodeParameters& params,
                                             const msg::EncodeOptions& options,
                                             msg::RasterImage& out,
                                             msg::EncodeFault& fault) const {
    out = msg::RasterImage{};

    const msg::EncodeStatus vs = validate(text, params, options, fault);
    if (vs != msg::EncodeStatus::OK) {
        std::cerr << "[Rasterizer] " << msg::StatusStr(vs) << " field=" << fault.field
                  << ": " << fault.detail << "\n";
        return vs;
    }

    msg::BitStream bits;
    std::size_t bad = 0;
    if (!textToBits(text, bits, &bad)) {
        fail(fault, msg::EncodeStatus::ENCODING_ERROR, "text",
             "character " + std::to_string(bad) + " cannot be represented in 8 bits");
        std::cerr << "[Rasterizer] " << fault.detail << "\n";
        return fault.status;
    }

    msg::RasterPlan plan{};
    if (planRaster(bits.size(), params, plan) != msg::EncodeStatus::OK) {
        fail(fault, msg::EncodeStatus::CAPACITY_EXCEEDED, "",
             "layout needs " + std::to_string(plan.rings_needed) + " rings (max " +
             std::to_string(msg::MAX_RINGS) + ") and a " + std::to_string(plan.image_size) +
             " px canvas (max " + std::to_string(msg::MAX_IMAGE_SIZE) + ")");
        std::cerr << "[Rasterizer] CAPACITY_EXCEEDED: " << fault.detail << "\n";
        return fault.status;
    }

    cv::Mat canvas;
    if (!rasterize(bits, params, plan, canvas)) {
        fail(fault, msg::EncodeStatus::IMAGE_WRITE_FAILED, "", "rasterization failed");
        return fault.status;
    }

    // Lossy output only on explicit request
    const bool lossy = options.compression_quality < 100;
    const char* ext = lossy ? ".jpg" : ".png";
    std::vector<int> enc_params;
    if (lossy) {
        enc_params = {cv::IMWRITE_JPEG_QUALITY, options.compression_quality,
                      cv::IMWRITE_JPEG_OPTIMIZE, 1};
    } else {
        enc_params = {cv::IMWRITE_PNG_COMPRESSION, 3};
    }

    try {
        if (!cv::imencode(ext, canvas, out.bytes, enc_params)) {
            fail(fault, msg::EncodeStatus::IMAGE_WRITE_FAILED, "", "imencode returned false");
            std::cerr << "[Rasterizer] " << fault.detail << "\n";
            return fault.status;
        }
    } catch (const cv::Exception& e) {
        fail(fault, msg::EncodeStatus::IMAGE_WRITE_FAILED, "", e.what());
        std::cerr << "[Rasterizer] imencode threw: " << e.what() << "\n";
        return fault.status;
    }

    out.width  = static_cast<uint32_t>(canvas.cols);
    out.height = static_cast<uint32_t>(canvas.rows);
    out.format = lossy ? msg::ImageFormat::JPEG : msg::ImageFormat::PNG;
    out.plan   = plan;
    return msg::EncodeStatus::OK;
}
