#include "apps/kdcode/ImagePreprocessor.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iostream>

namespace kdcode {
static inline PreprocessorConfig sanitise(const PreprocessorConfig& in) {
    PreprocessorConfig cfg = in;

    if (cfg.MAX_WORKING_DIM < 64) cfg.MAX_WORKING_DIM = 64;

    if (cfg.CLAHE_CLIP <= 0.0) cfg.CLAHE_CLIP = 2.0;
    if (cfg.CLAHE_TILES < 1) cfg.CLAHE_TILES = 1;

    if (cfg.BLUR_KSIZE < 1) cfg.BLUR_KSIZE = 1;
    if (cfg.BLUR_KSIZE % 2 == 0) cfg.BLUR_KSIZE += 1;

    if (cfg.ADAPTIVE_BLOCK < 3) cfg.ADAPTIVE_BLOCK = 3;
    if (cfg.ADAPTIVE_BLOCK % 2 == 0) cfg.ADAPTIVE_BLOCK += 1;

    return cfg;
}
} // namespace kdcode

kdcode::ImagePreprocessor::ImagePreprocessor(const PreprocessorConfig& cfg) : m_cfg(sanitise(cfg)) {}

void kdcode::ImagePreprocessor::setConfig(const PreprocessorConfig& cfg) {
    m_cfg = sanitise(cfg);
}

bool kdcode::ImagePreprocessor::toGray8(const cv::Mat& in, cv::Mat& gray) const {
    cv::Mat src8;
    switch (in.depth()) {
        case CV_8U:
            src8 = in;
            break;
        case CV_16U:
            in.convertTo(src8, CV_8U, 1.0 / 257.0);
            break;
        default:
            std::cerr << "[Preprocess] unsupported depth " << in.depth() << "\n";
            return false;
    }

    switch (src8.channels()) {
        case 1: gray = src8; break;
        case 3: cv::cvtColor(src8, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(src8, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            std::cerr << "[Preprocess] unsupported channel count " << src8.channels() << "\n";
            return false;
    }
    return true;
}

bool kdcode::ImagePreprocessor::preprocess(const cv::Mat& raw, msg::PreprocessedFrame& out) const {
    out = msg::PreprocessedFrame{};

    if (raw.empty()) {
        std::cerr << "[Preprocess] empty image\n";
        return false;
    }

    out.source_width  = raw.cols;
    out.source_height = raw.rows;

    // ----------------------------------------------------
    // 1) Downscale (area interpolation keeps thin rings)
    // ----------------------------------------------------
    cv::Mat working = raw;
    const int max_dim = std::max(raw.cols, raw.rows);
    if (max_dim > m_cfg.MAX_WORKING_DIM) {
        out.scale = static_cast<float>(m_cfg.MAX_WORKING_DIM) / static_cast<float>(max_dim);
        const int w = std::max(1, cvRound(raw.cols * out.scale));
        const int h = std::max(1, cvRound(raw.rows * out.scale));
        cv::resize(raw, working, cv::Size(w, h), 0, 0, cv::INTER_AREA);
    }

    // ----------------------------------------------------
    // 2) Single channel 8-bit
    // ----------------------------------------------------
    if (!toGray8(working, out.gray)) {
        return false;
    }
    if (out.gray.data == raw.data) {
        out.gray = out.gray.clone();   // never alias the caller's buffer
    }

    // ----------------------------------------------------
    // 3) + 4) Local contrast, then denoise
    // ----------------------------------------------------
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(m_cfg.CLAHE_CLIP,
                                               cv::Size(m_cfg.CLAHE_TILES, m_cfg.CLAHE_TILES));
    cv::Mat equalised;
    clahe->apply(out.gray, equalised);
    cv::GaussianBlur(equalised, out.enhanced, cv::Size(m_cfg.BLUR_KSIZE, m_cfg.BLUR_KSIZE), 0);

    // ----------------------------------------------------
    // 5) + 6) Global and adaptive thresholds; background survives only where both agree
    // ----------------------------------------------------
    cv::Mat otsu, adaptive;
    cv::threshold(out.enhanced, otsu, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    cv::adaptiveThreshold(out.enhanced, adaptive, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                          cv::THRESH_BINARY, m_cfg.ADAPTIVE_BLOCK, m_cfg.ADAPTIVE_C);
    cv::bitwise_and(otsu, adaptive, out.binary);

    return true;
}
