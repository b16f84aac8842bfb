#include "apps/kdcode/KDCodec.hpp"
#include "apps/kdcode/BitCodec.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

kdcode::KDCodec::KDCodec(const CodecConfig& cfg, std::shared_ptr<const ErrorCorrectionModel> model)
    : m_cfg(cfg),
      m_rasterizer(cfg.rasterizer),
      m_preprocessor(cfg.preprocess),
      m_localizer(cfg.localizer),
      m_orientation(cfg.orientation),
      m_sampler(cfg.sampler),
      m_corrector(cfg.corrector, std::move(model)) {}

msg::EncodeStatus kdcode::KDCodec::encode(const std::string& text,
                                          const msg::CodeParameters& params,
                                          msg::RasterImage& out,
                                          msg::EncodeFault* fault) const {
    return encode(text, params, msg::EncodeOptions{}, out, fault);
}

msg::EncodeStatus kdcode::KDCodec::encode(const std::string& text,
                                          const msg::CodeParameters& params,
                                          const msg::EncodeOptions& options,
                                          msg::RasterImage& out,
                                          msg::EncodeFault* fault) const {
    msg::EncodeFault local;
    const msg::EncodeStatus st = m_rasterizer.encode(text, params, options, out, local);
    if (fault) *fault = local;

    if (st == msg::EncodeStatus::OK) {
        std::cout << "[KDCodec] encoded " << characterCount(text) << " chars -> "
                  << out.plan.rings_needed << " rings, " << out.width << "x" << out.height
                  << (out.format == msg::ImageFormat::PNG ? " PNG" : " JPEG")
                  << " (" << out.bytes.size() << " bytes)\n";
    }
    return st;
}

bool kdcode::KDCodec::validateScanParameters(const msg::ScanParameters& scan, std::string* why) {
    if (!msg::isAllowedSegmentCount(scan.segments_per_ring)) {
        if (why) *why = "segments_per_ring must be 8, 16 or 32";
        return false;
    }
    if (scan.min_anchor_radius <= 0) {
        if (why) *why = "min_anchor_radius must be > 0";
        return false;
    }
    if (scan.max_anchor_radius <= scan.min_anchor_radius) {
        if (why) *why = "max_anchor_radius must be > min_anchor_radius";
        return false;
    }
    if (scan.max_anchor_radius > msg::MAX_SCAN_RADIUS) {
        if (why) *why = "max_anchor_radius must be <= " + std::to_string(msg::MAX_SCAN_RADIUS);
        return false;
    }
    return true;
}

msg::DecodeStatus kdcode::KDCodec::decode(const std::vector<uint8_t>& image_bytes,
                                          const msg::ScanParameters& scan,
                                          std::string& text) const {
    DecodeReport report;
    const msg::DecodeStatus st = decodeDetailed(image_bytes, scan, report);
    text = (st == msg::DecodeStatus::FOUND) ? report.text : std::string();
    return st;
}

msg::DecodeStatus kdcode::KDCodec::decodeDetailed(const std::vector<uint8_t>& image_bytes,
                                                  const msg::ScanParameters& scan,
                                                  DecodeReport& report) const {
    report = DecodeReport{};

    if (image_bytes.empty()) {
        std::cerr << "[KDCodec] empty image buffer\n";
        report.status = msg::DecodeStatus::INVALID_INPUT;
        return report.status;
    }

    std::string why;
    if (!validateScanParameters(scan, &why)) {
        std::cerr << "[KDCodec] invalid scan parameters: " << why << "\n";
        report.status = msg::DecodeStatus::INVALID_INPUT;
        return report.status;
    }

    cv::Mat image;
    try {
        image = cv::imdecode(image_bytes, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        std::cerr << "[KDCodec] imdecode threw: " << e.what() << "\n";
    }
    if (image.empty()) {
        std::cerr << "[KDCodec] bytes are not a decodable image\n";
        report.status = msg::DecodeStatus::NOT_FOUND;
        return report.status;
    }

    return runPipeline(image, scan, report);
}

msg::DecodeStatus kdcode::KDCodec::decodeImage(const cv::Mat& image,
                                               const msg::ScanParameters& scan,
                                               DecodeReport& report) const {
    report = DecodeReport{};

    std::string why;
    if (image.empty() || !validateScanParameters(scan, &why)) {
        std::cerr << "[KDCodec] invalid input: " << (image.empty() ? "empty image" : why) << "\n";
        report.status = msg::DecodeStatus::INVALID_INPUT;
        return report.status;
    }
    return runPipeline(image, scan, report);
}

msg::DecodeStatus kdcode::KDCodec::runPipeline(const cv::Mat& image,
                                               const msg::ScanParameters& scan,
                                               DecodeReport& report) const {
    report.status   = msg::DecodeStatus::NOT_FOUND;
    report.segments = scan.segments_per_ring;

    try {
        msg::PreprocessedFrame frame;
        if (!m_preprocessor.preprocess(image, frame)) {
            return report.status;
        }

        if (!m_localizer.localize(frame, scan, report.geometry)) {
            std::cout << "[KDCodec] no code found\n";
            return report.status;
        }
        report.localized = true;

        report.geometry.orientation_angle_deg = m_orientation.resolve(frame.gray, report.geometry);

        if (!m_sampler.sample(frame.gray, report.geometry, report.geometry.orientation_angle_deg,
                              scan.segments_per_ring, report.samples)) {
            return report.status;
        }

        if (!m_corrector.correct(report.samples, report.bits)) {
            return report.status;
        }

        report.text = bitsToText(report.bits);
    } catch (const cv::Exception& e) {
        std::cerr << "[KDCodec] decode aborted by OpenCV: " << e.what() << "\n";
        report.text.clear();
        return report.status;
    }

    if (report.text.empty()) {
        std::cout << "[KDCodec] code located but no characters decoded\n";
        return report.status;
    }

    std::cout << "[KDCodec] decoded " << report.text.size() << " chars at angle "
              << report.geometry.orientation_angle_deg << "\n";
    report.status = msg::DecodeStatus::FOUND;
    return report.status;
}

bool kdcode::annotateDetection(const cv::Mat& input, const DecodeReport& report, cv::Mat& out) {
    if (input.empty() || !report.localized) {
        return false;
    }

    cv::Mat src8;
    if (input.depth() == CV_16U) {
        input.convertTo(src8, CV_8U, 1.0 / 257.0);
    } else {
        src8 = input;
    }
    switch (src8.channels()) {
        case 1: cv::cvtColor(src8, out, cv::COLOR_GRAY2BGR); break;
        case 3: out = src8.clone(); break;
        case 4: cv::cvtColor(src8, out, cv::COLOR_BGRA2BGR); break;
        default: return false;
    }

    const msg::DetectedGeometry& g = report.geometry;
    const float inv = g.scale > 0.0f ? 1.0f / g.scale : 1.0f;
    const cv::Point2f c(g.center_x * inv, g.center_y * inv);
    const int thick = std::max(1, cvRound(2.0f * inv));

    cv::circle(out, c, cvRound(g.anchor_radius * inv), cv::Scalar(255, 0, 0), thick);
    cv::circle(out, c, cvRound(g.outer_radius * inv), cv::Scalar(255, 0, 0), thick);

    const float a0 = static_cast<float>(g.orientation_angle_deg * CV_PI / 180.0);
    const cv::Point2f tip(c.x + g.outer_radius * inv * std::cos(a0), c.y + g.outer_radius * inv * std::sin(a0));
    cv::line(out, c, tip, cv::Scalar(0, 200, 255), thick);

    if (report.segments > 0) {
        const float step = 360.0f / static_cast<float>(report.segments);
        for (std::size_t i = 0; i < report.samples.size(); ++i) {
            const msg::SampledBit& s = report.samples[i];
            const float r = g.anchor_radius + (s.ring + 1.5f) * g.estimated_ring_width;
            const float a = static_cast<float>((g.orientation_angle_deg + s.segment * step) * CV_PI / 180.0);
            const cv::Point2f p(c.x + r * inv * std::cos(a), c.y + r * inv * std::sin(a));
            const uint8_t bit = i < report.bits.size() ? report.bits[i] : s.threshold_bit;
            const cv::Scalar col = bit ? cv::Scalar(0, 200, 0) : cv::Scalar(0, 0, 255);
            cv::circle(out, p, std::max(2, thick * 2), col, cv::FILLED);
        }
    }
    return true;
}
