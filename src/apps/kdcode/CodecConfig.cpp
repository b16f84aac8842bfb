#include "apps/kdcode/CodecConfig.hpp"

#include <iostream>
#include <stdexcept>

namespace kdcode {

// Value under 'key', or the default when the key is absent
template<typename T>
static T get_yaml_value(const YAML::Node& node, const std::string& key, const T& default_value)
{
    if (node[key]) {
        return node[key].as<T>();
    }
    return default_value;
}

static void loadHoughSets(const YAML::Node& seq, ShapeLocalizerConfig& cfg)
{
    if (!seq || !seq.IsSequence()) {
        return;
    }
    if (seq.size() != cfg.HOUGH_SETS.size()) {
        throw std::runtime_error("localizer.hough_sets needs exactly " +
                                 std::to_string(cfg.HOUGH_SETS.size()) + " entries");
    }
    for (std::size_t i = 0; i < seq.size(); ++i) {
        const YAML::Node s = seq[i];
        HoughParamSet& h = cfg.HOUGH_SETS[i];
        h.dp         = get_yaml_value(s, "dp", h.dp);
        h.min_dist   = get_yaml_value(s, "min_dist", h.min_dist);
        h.canny_high = get_yaml_value(s, "canny", h.canny_high);
        h.acc_thresh = get_yaml_value(s, "acc", h.acc_thresh);
    }
}

bool CodecConfig::loadFromYaml(const std::string& yaml_path, const std::string& profile_name)
{
    try {
        YAML::Node config_file = YAML::LoadFile(yaml_path);

        if (!loadFromNode(config_file)) {
            return false;
        }

        if (profile_name.empty()) {
            return true;
        }
        if (!config_file["profiles"] || !config_file["profiles"][profile_name]) {
            std::cerr << "[Config] profile '" << profile_name << "' not found in " << yaml_path << std::endl;
            return false;
        }
        return loadFromNode(config_file["profiles"][profile_name]);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "[Config] YAML parsing error: " << e.what() << std::endl;
        return false;
    }
    catch (const std::exception& e) {
        std::cerr << "[Config] configuration error: " << e.what() << std::endl;
        return false;
    }
}

bool CodecConfig::loadFromNode(const YAML::Node& node)
{
    model_path = get_yaml_value(node, "model_path", model_path);

    if (const YAML::Node n = node["code"]) {
        code.segments_per_ring = get_yaml_value(n, "segments_per_ring", code.segments_per_ring);
        code.anchor_radius     = get_yaml_value(n, "anchor_radius", code.anchor_radius);
        code.ring_width        = get_yaml_value(n, "ring_width", code.ring_width);
        code.scale_factor      = get_yaml_value(n, "scale_factor", code.scale_factor);
        code.max_chars         = get_yaml_value(n, "max_chars", code.max_chars);
        encode.compression_quality = get_yaml_value(n, "compression_quality", encode.compression_quality);
    }

    if (const YAML::Node n = node["scan"]) {
        scan.segments_per_ring     = get_yaml_value(n, "segments_per_ring", scan.segments_per_ring);
        scan.min_anchor_radius     = get_yaml_value(n, "min_anchor_radius", scan.min_anchor_radius);
        scan.max_anchor_radius     = get_yaml_value(n, "max_anchor_radius", scan.max_anchor_radius);
        scan.enable_multithreading = get_yaml_value(n, "enable_multithreading", scan.enable_multithreading);
    }

    if (const YAML::Node n = node["rasterizer"]) {
        rasterizer.ARC_POINTS_PER_DEGREE = get_yaml_value(n, "arc_points_per_degree", rasterizer.ARC_POINTS_PER_DEGREE);
        rasterizer.MIN_ARC_POINTS        = get_yaml_value(n, "min_arc_points", rasterizer.MIN_ARC_POINTS);
        rasterizer.POLY_SHIFT            = get_yaml_value(n, "poly_shift", rasterizer.POLY_SHIFT);
    }

    if (const YAML::Node n = node["preprocess"]) {
        preprocess.MAX_WORKING_DIM = get_yaml_value(n, "max_working_dim", preprocess.MAX_WORKING_DIM);
        preprocess.CLAHE_CLIP      = get_yaml_value(n, "clahe_clip", preprocess.CLAHE_CLIP);
        preprocess.CLAHE_TILES     = get_yaml_value(n, "clahe_tiles", preprocess.CLAHE_TILES);
        preprocess.BLUR_KSIZE      = get_yaml_value(n, "blur_ksize", preprocess.BLUR_KSIZE);
        preprocess.ADAPTIVE_BLOCK  = get_yaml_value(n, "adaptive_block", preprocess.ADAPTIVE_BLOCK);
        preprocess.ADAPTIVE_C      = get_yaml_value(n, "adaptive_c", preprocess.ADAPTIVE_C);
    }

    if (const YAML::Node n = node["localizer"]) {
        localizer.MIN_CIRCLES         = get_yaml_value(n, "min_circles", localizer.MIN_CIRCLES);
        localizer.MAX_WORKERS         = get_yaml_value(n, "max_workers", localizer.MAX_WORKERS);
        localizer.CENTER_TOL_RATIO    = get_yaml_value(n, "center_tol_ratio", localizer.CENTER_TOL_RATIO);
        localizer.ANCHOR_CENTER_RATIO = get_yaml_value(n, "anchor_center_ratio", localizer.ANCHOR_CENTER_RATIO);
        localizer.ANCHOR_MAX_RATIO    = get_yaml_value(n, "anchor_max_ratio", localizer.ANCHOR_MAX_RATIO);
        localizer.REFINE              = get_yaml_value(n, "refine", localizer.REFINE);
        localizer.REFINE_RAYS         = get_yaml_value(n, "refine_rays", localizer.REFINE_RAYS);
        localizer.OUTER_SEARCH_RATIO  = get_yaml_value(n, "outer_search_ratio", localizer.OUTER_SEARCH_RATIO);
        localizer.MIN_EDGE_SUPPORT    = get_yaml_value(n, "min_edge_support", localizer.MIN_EDGE_SUPPORT);
        localizer.MIN_ANCHOR_FILL     = get_yaml_value(n, "min_anchor_fill", localizer.MIN_ANCHOR_FILL);
        localizer.GRID_MATCH_RATIO    = get_yaml_value(n, "grid_match_ratio", localizer.GRID_MATCH_RATIO);
        localizer.MIN_GRID_TRANSITIONS = get_yaml_value(n, "min_grid_transitions", localizer.MIN_GRID_TRANSITIONS);
        loadHoughSets(n["hough_sets"], localizer);
    }

    if (const YAML::Node n = node["orientation"]) {
        orientation.PROBE_BAND_RATIO  = get_yaml_value(n, "probe_band_ratio", orientation.PROBE_BAND_RATIO);
        orientation.PROBE_HALF_WINDOW = get_yaml_value(n, "probe_half_window", orientation.PROBE_HALF_WINDOW);
    }

    if (const YAML::Node n = node["sampler"]) {
        sampler.INTENSITY_THRESHOLD = get_yaml_value(n, "intensity_threshold", sampler.INTENSITY_THRESHOLD);
        sampler.MIN_WINDOW_RADIUS   = get_yaml_value(n, "min_window_radius", sampler.MIN_WINDOW_RADIUS);
    }

    if (const YAML::Node n = node["corrector"]) {
        corrector.NEIGHBOR_OVERRIDE_BAND = get_yaml_value(n, "neighbor_override_band", corrector.NEIGHBOR_OVERRIDE_BAND);
        corrector.WINDOW_HALF            = get_yaml_value(n, "window_half", corrector.WINDOW_HALF);
    }

    return validate();
}

bool CodecConfig::validate() const
{
    if (!msg::isAllowedSegmentCount(code.segments_per_ring) ||
        !msg::isAllowedSegmentCount(scan.segments_per_ring)) {
        std::cerr << "[Config] segments_per_ring must be 8, 16 or 32" << std::endl;
        return false;
    }

    if (code.anchor_radius <= 0 || code.ring_width <= 0 || code.scale_factor <= 0 || code.max_chars <= 0) {
        std::cerr << "[Config] code geometry values must be > 0" << std::endl;
        return false;
    }

    if (encode.compression_quality < 1 || encode.compression_quality > 100) {
        std::cerr << "[Config] compression_quality must be in [1, 100]" << std::endl;
        return false;
    }

    if (scan.min_anchor_radius <= 0 || scan.max_anchor_radius <= scan.min_anchor_radius) {
        std::cerr << "[Config] need 0 < min_anchor_radius < max_anchor_radius" << std::endl;
        return false;
    }
    if (scan.max_anchor_radius > msg::MAX_SCAN_RADIUS) {
        std::cerr << "[Config] max_anchor_radius must be <= " << msg::MAX_SCAN_RADIUS << std::endl;
        return false;
    }

    if (model_path.empty()) {
        std::cerr << "[Config] model_path must not be empty" << std::endl;
        return false;
    }

    return true;
}

void CodecConfig::print() const
{
    std::cout << "[Config] code: segments=" << code.segments_per_ring
              << " anchor=" << code.anchor_radius
              << " ring_width=" << code.ring_width
              << " scale=" << code.scale_factor
              << " max_chars=" << code.max_chars
              << " quality=" << encode.compression_quality << std::endl;
    std::cout << "[Config] scan: segments=" << scan.segments_per_ring
              << " anchor=[" << scan.min_anchor_radius << ", " << scan.max_anchor_radius << "]"
              << " mt=" << (scan.enable_multithreading ? "on" : "off") << std::endl;
    std::cout << "[Config] preprocess: max_dim=" << preprocess.MAX_WORKING_DIM
              << " clahe=" << preprocess.CLAHE_CLIP << "/" << preprocess.CLAHE_TILES
              << " blur=" << preprocess.BLUR_KSIZE
              << " adaptive=" << preprocess.ADAPTIVE_BLOCK << "/" << preprocess.ADAPTIVE_C << std::endl;
    std::cout << "[Config] localizer: workers=" << localizer.MAX_WORKERS
              << " refine=" << (localizer.REFINE ? "on" : "off")
              << " rays=" << localizer.REFINE_RAYS << std::endl;
    std::cout << "[Config] corrector: override_band=" << corrector.NEIGHBOR_OVERRIDE_BAND << std::endl;
    std::cout << "[Config] model: " << model_path << std::endl;
}

} // namespace kdcode
