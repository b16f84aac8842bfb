#pragma once
#include <opencv2/core.hpp>

#include "msg/PreprocessedFrame.hpp"

namespace kdcode {

// ---------------------------------------------------------------------------
// Configuration for the ImagePreprocessor (tunable parameters, no state).
// ---------------------------------------------------------------------------
struct PreprocessorConfig {
    int    MAX_WORKING_DIM = 800;    // larger side above this is area-downscaled [px]

    double CLAHE_CLIP      = 2.0;
    int    CLAHE_TILES     = 8;      // tiles per axis

    int    BLUR_KSIZE      = 5;      // odd

    int    ADAPTIVE_BLOCK  = 11;     // odd, >= 3
    double ADAPTIVE_C      = 2.0;
};

// ---------------------------------------------------------------------------
// ImagePreprocessor: raw decoded image -> gray / enhanced / binary surfaces.
// Pure transform; no state between calls.
// ---------------------------------------------------------------------------
class ImagePreprocessor {
public:
    explicit ImagePreprocessor(const PreprocessorConfig& cfg = {});

    void setConfig(const PreprocessorConfig& cfg);
    const PreprocessorConfig& getConfig() const { return m_cfg; }

    // Accepts 1/3/4 channels, 8 or 16 bit. False on empty or unsupported input.
    bool preprocess(const cv::Mat& raw, msg::PreprocessedFrame& out) const;

private:
    PreprocessorConfig m_cfg{};

    bool toGray8(const cv::Mat& in, cv::Mat& gray) const;
};

} // namespace kdcode
