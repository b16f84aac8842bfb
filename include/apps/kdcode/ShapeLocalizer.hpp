#pragma once
#include <array>
#include <functional>
#include <vector>

#include <opencv2/core.hpp>

#include "msg/CodeParameters.hpp"
#include "msg/DetectedGeometry.hpp"
#include "msg/PreprocessedFrame.hpp"

namespace kdcode {

// One Hough-gradient configuration (cv::HoughCircles arguments).
struct HoughParamSet {
    double dp;          // inverse accumulator resolution
    double min_dist;    // between detected centres [px]
    double canny_high;  // upper Canny threshold
    double acc_thresh;  // accumulator votes
};

// ---------------------------------------------------------------------------
// Configuration for the ShapeLocalizer (tunable parameters, no state).
// ---------------------------------------------------------------------------
struct ShapeLocalizerConfig {
    // Tried in order, most permissive first.
    std::array<HoughParamSet, 3> HOUGH_SETS = {{
        {1.0, 30.0, 40.0, 25.0},
        {1.0, 50.0, 50.0, 30.0},
        {2.0, 40.0, 60.0, 35.0},
    }};
    int   MIN_CIRCLES        = 2;      // a set "succeeds" at this many circles
    int   MAX_WORKERS        = 3;      // concurrent Hough tasks

    float CENTER_TOL_RATIO   = 0.4f;   // |c - frame centre| < ratio * min(w,h), per axis
    float ANCHOR_CENTER_RATIO = 0.3f;  // anchor centre within ratio * outer radius
    float ANCHOR_MAX_RATIO   = 0.3f;   // anchor radius <= ratio * outer radius
    float COARSE_RING_DIVISOR = 10.0f; // coarse ring width = (outer - anchor) / divisor

    // Radial refinement
    bool  REFINE             = true;
    int   REFINE_RAYS        = 360;
    float OUTER_SEARCH_RATIO = 1.25f;  // outer edge search starts at ratio * Hough radius
    float MIN_EDGE_SUPPORT   = 0.6f;   // rays agreeing with the fitted outer radius
    float MIN_ANCHOR_FILL    = 0.85f;  // dark fraction inside 0.8 * anchor radius
    float GRID_MATCH_RATIO   = 0.85f;  // transitions on the ring grid
    float BORDER_PERCENTILE  = 0.10f;  // distortion ring thickness from dark runs
    int   MIN_GRID_TRANSITIONS = 12;   // this many transitions off every grid -> not a code
};

// ---------------------------------------------------------------------------
// ShapeLocalizer: binary surface -> anchor / outer ring / ring pitch.
// Stateless; each call owns its working copies.
// ---------------------------------------------------------------------------
class ShapeLocalizer {
public:
    using CircleStrategy = std::function<std::vector<cv::Vec3f>(const cv::Mat&)>;

    explicit ShapeLocalizer(const ShapeLocalizerConfig& cfg = {});

    void setConfig(const ShapeLocalizerConfig& cfg);
    const ShapeLocalizerConfig& getConfig() const { return m_cfg; }

    // Core API. False when no plausible code is present.
    bool localize(const msg::PreprocessedFrame& frame,
                  const msg::ScanParameters& scan,
                  msg::DetectedGeometry& out) const;

    // Hough stage only. 'set_index' is the parameter set whose circles were kept
    // (-1 when every set came back empty).
    bool detectCircles(const msg::PreprocessedFrame& frame,
                       const msg::ScanParameters& scan,
                       std::vector<cv::Vec3f>& circles,
                       int& set_index) const;

    // One strategy per parameter set; runs the anchor band and the ring band
    // separately so concentric circles survive min_dist suppression.
    CircleStrategy makeStrategy(const HoughParamSet& set, int anchor_min_px, int anchor_max_px) const;

    // Runs one strategy. On an exception the set counts as empty: 'circles' is
    // cleared and the result is false.
    static bool runStrategy(const CircleStrategy& strategy, const cv::Mat& surface,
                            int index, std::vector<cv::Vec3f>& circles);

    // Band count n in [2, MAX_RINGS + 1]. The pitch comes from the innermost
    // boundary seen on several rays; n = round((outer - anchor) / pitch), or a
    // neighbour of it, and its grid anchor + k * (outer - anchor) / n must
    // explain enough of the transitions. Returns 0 otherwise.
    static int estimateBandCount(const std::vector<float>& transitions,
                                 float anchor_r, float outer_r, float match_ratio);

private:
    ShapeLocalizerConfig m_cfg{};

    struct HoughWorkerCtx;
    static void houghWorker(void* arg);

    void filterCentered(std::vector<cv::Vec3f>& circles, int width, int height) const;
    bool assignRoles(const std::vector<cv::Vec3f>& circles, msg::DetectedGeometry& g) const;
    // anchor_min/max_px: scan band in working pixels
    bool refineGeometry(const cv::Mat& binary, float anchor_min_px, float anchor_max_px,
                        msg::DetectedGeometry& g) const;
};

} // namespace kdcode
