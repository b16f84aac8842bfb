#include "apps/kdcode/ShapeLocalizer.hpp"
#include "os/rtos.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace kdcode {
static inline ShapeLocalizerConfig sanitise(const ShapeLocalizerConfig& in) {
    ShapeLocalizerConfig cfg = in;

    for (auto& s : cfg.HOUGH_SETS) {
        if (s.dp < 1.0) s.dp = 1.0;
        if (s.min_dist < 1.0) s.min_dist = 1.0;
        if (s.canny_high < 1.0) s.canny_high = 1.0;
        if (s.acc_thresh < 1.0) s.acc_thresh = 1.0;
    }

    if (cfg.MIN_CIRCLES < 1) cfg.MIN_CIRCLES = 1;
    if (cfg.MAX_WORKERS < 1) cfg.MAX_WORKERS = 1;
    if (cfg.MAX_WORKERS > static_cast<int>(cfg.HOUGH_SETS.size()))
        cfg.MAX_WORKERS = static_cast<int>(cfg.HOUGH_SETS.size());

    if (cfg.CENTER_TOL_RATIO <= 0.0f || cfg.CENTER_TOL_RATIO > 0.5f) cfg.CENTER_TOL_RATIO = 0.4f;
    if (cfg.ANCHOR_CENTER_RATIO <= 0.0f) cfg.ANCHOR_CENTER_RATIO = 0.3f;
    if (cfg.ANCHOR_MAX_RATIO <= 0.0f || cfg.ANCHOR_MAX_RATIO >= 1.0f) cfg.ANCHOR_MAX_RATIO = 0.3f;
    if (cfg.COARSE_RING_DIVISOR < 1.0f) cfg.COARSE_RING_DIVISOR = 10.0f;

    if (cfg.REFINE_RAYS < 36) cfg.REFINE_RAYS = 36;
    if (cfg.OUTER_SEARCH_RATIO < 1.0f) cfg.OUTER_SEARCH_RATIO = 1.0f;
    cfg.MIN_EDGE_SUPPORT  = std::min(1.0f, std::max(0.0f, cfg.MIN_EDGE_SUPPORT));
    cfg.MIN_ANCHOR_FILL   = std::min(1.0f, std::max(0.0f, cfg.MIN_ANCHOR_FILL));
    if (cfg.GRID_MATCH_RATIO <= 0.0f || cfg.GRID_MATCH_RATIO > 1.0f) cfg.GRID_MATCH_RATIO = 0.85f;
    if (cfg.BORDER_PERCENTILE < 0.0f || cfg.BORDER_PERCENTILE > 0.5f) cfg.BORDER_PERCENTILE = 0.10f;
    if (cfg.MIN_GRID_TRANSITIONS < 1) cfg.MIN_GRID_TRANSITIONS = 1;

    return cfg;
}

constexpr float RAY_STEP_PX      = 0.5f;  // radial sampling step
constexpr float TRANSITION_GUARD = 1.5f;  // keep away from anchor / outer edges [px]
constexpr float NEIGHBOUR_TOL_PX = 2.0f;  // transition confirmed by an adjacent ray
constexpr float ANCHOR_BAND_SLACK = 0.2f; // measured anchor may leave the scan band by this much
constexpr float PITCH_CLUSTER_PX  = 2.0f; // transitions pooled into one boundary
constexpr long  PITCH_MIN_SUPPORT = 5;    // rays needed before a boundary sets the pitch

// 1 = pattern, 0 = background, -1 = outside the frame
static inline int pixelState(const cv::Mat& bin, float x, float y) {
    const int u = cvRound(x);
    const int v = cvRound(y);
    if (u < 0 || v < 0 || u >= bin.cols || v >= bin.rows) return -1;
    return bin.at<uint8_t>(v, u) == 0 ? 1 : 0;
}

// Largest r so that c + r*d stays inside the frame.
static inline float rayLimit(const cv::Mat& bin, const cv::Point2f& c, float dx, float dy) {
    float lim = 1e9f;
    if (dx > 1e-6f)  lim = std::min(lim, (bin.cols - 1 - c.x) / dx);
    if (dx < -1e-6f) lim = std::min(lim, -c.x / dx);
    if (dy > 1e-6f)  lim = std::min(lim, (bin.rows - 1 - c.y) / dy);
    if (dy < -1e-6f) lim = std::min(lim, -c.y / dy);
    return std::max(0.0f, lim);
}

static inline float percentile(std::vector<float> v, float p) {
    if (v.empty()) return 0.0f;
    const std::size_t k = std::min(v.size() - 1, static_cast<std::size_t>(p * (v.size() - 1) + 0.5f));
    std::nth_element(v.begin(), v.begin() + k, v.end());
    return v[k];
}
} // namespace kdcode

// Per-task context for the concurrent Hough pool
struct kdcode::ShapeLocalizer::HoughWorkerCtx {
    CircleStrategy strategy;
    cv::Mat surface;                       // private copy
    int index = 0;
    int min_circles = 2;
    std::atomic<int>* best_success = nullptr;

    std::vector<cv::Vec3f> circles;
    bool ran = false;
};

bool kdcode::ShapeLocalizer::runStrategy(const CircleStrategy& strategy, const cv::Mat& surface,
                                         int index, std::vector<cv::Vec3f>& circles) {
    // Runs on a worker thread: nothing may escape
    try {
        circles = strategy(surface);
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "[Localizer] Hough set " << index << " threw: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[Localizer] Hough set " << index << " failed: " << e.what() << "\n";
    }
    circles.clear();
    return false;
}

void kdcode::ShapeLocalizer::houghWorker(void* arg) {
    auto* ctx = static_cast<HoughWorkerCtx*>(arg);

    // A lower set already succeeded; this result can never be selected
    if (ctx->best_success->load() < ctx->index) {
        return;
    }

    runStrategy(ctx->strategy, ctx->surface, ctx->index, ctx->circles);
    ctx->ran = true;

    if (static_cast<int>(ctx->circles.size()) >= ctx->min_circles) {
        int cur = ctx->best_success->load();
        while (ctx->index < cur && !ctx->best_success->compare_exchange_weak(cur, ctx->index)) {
        }
    }
}

kdcode::ShapeLocalizer::ShapeLocalizer(const ShapeLocalizerConfig& cfg) : m_cfg(sanitise(cfg)) {}

void kdcode::ShapeLocalizer::setConfig(const ShapeLocalizerConfig& cfg) {
    m_cfg = sanitise(cfg);
}

kdcode::ShapeLocalizer::CircleStrategy
kdcode::ShapeLocalizer::makeStrategy(const HoughParamSet& set, int anchor_min_px, int anchor_max_px) const {
    return [set, anchor_min_px, anchor_max_px](const cv::Mat& surface) {
        std::vector<cv::Vec3f> all;
        std::vector<cv::Vec3f> band;

        cv::HoughCircles(surface, band, cv::HOUGH_GRADIENT, set.dp, set.min_dist,
                         set.canny_high, set.acc_thresh, anchor_min_px, anchor_max_px);
        all.insert(all.end(), band.begin(), band.end());

        const int ring_min = anchor_max_px + 1;
        const int ring_max = std::min(surface.cols, surface.rows) / 2;
        if (ring_min < ring_max) {
            band.clear();
            cv::HoughCircles(surface, band, cv::HOUGH_GRADIENT, set.dp, set.min_dist,
                             set.canny_high, set.acc_thresh, ring_min, ring_max);
            all.insert(all.end(), band.begin(), band.end());
        }
        return all;
    };
}

bool kdcode::ShapeLocalizer::detectCircles(const msg::PreprocessedFrame& frame,
                                           const msg::ScanParameters& scan,
                                           std::vector<cv::Vec3f>& circles,
                                           int& set_index) const {
    circles.clear();
    set_index = -1;

    if (frame.binary.empty()) {
        return false;
    }

    // Scan radii are given in input pixels
    const float r_lo = static_cast<float>(std::min(scan.min_anchor_radius, msg::MAX_SCAN_RADIUS));
    const float r_hi = static_cast<float>(std::min(scan.max_anchor_radius, msg::MAX_SCAN_RADIUS));
    const int a_min = std::max(1, static_cast<int>(std::floor(r_lo * frame.scale)));
    const int a_max = std::max(a_min + 1, static_cast<int>(std::ceil(r_hi * frame.scale)));

    const int n_sets = static_cast<int>(m_cfg.HOUGH_SETS.size());
    std::vector<std::unique_ptr<HoughWorkerCtx>> ctx(n_sets);
    std::atomic<int> best_success{n_sets};

    for (int i = 0; i < n_sets; ++i) {
        ctx[i].reset(new HoughWorkerCtx);
        ctx[i]->strategy     = makeStrategy(m_cfg.HOUGH_SETS[i], a_min, a_max);
        ctx[i]->index        = i;
        ctx[i]->min_circles  = m_cfg.MIN_CIRCLES;
        ctx[i]->best_success = &best_success;
    }

    if (scan.enable_multithreading) {
        // Bounded pool: batches of MAX_WORKERS tasks
        for (int first = 0; first < n_sets; first += m_cfg.MAX_WORKERS) {
            const int last = std::min(n_sets, first + m_cfg.MAX_WORKERS);
            std::vector<std::unique_ptr<Rtos::Task>> tasks;
            std::vector<int> inline_jobs;

            for (int i = first; i < last; ++i) {
                ctx[i]->surface = frame.binary.clone();
                std::unique_ptr<Rtos::Task> t(new Rtos::Task);
                const std::string name = "kd_hough" + std::to_string(i);
                if (t->Create(name.c_str(), &ShapeLocalizer::houghWorker, ctx[i].get())) {
                    tasks.push_back(std::move(t));
                } else {
                    inline_jobs.push_back(i);
                }
            }
            for (int i : inline_jobs) {
                houghWorker(ctx[i].get());
            }
            for (auto& t : tasks) {
                t->Join();
            }
            if (best_success.load() < last) {
                break;
            }
        }
    } else {
        for (int i = 0; i < n_sets; ++i) {
            ctx[i]->surface = frame.binary;
            houghWorker(ctx[i].get());
            if (best_success.load() <= i) {
                break;
            }
        }
    }

    // Same pick as sequential evaluation: first success, else last non-empty
    int chosen = -1;
    for (int i = 0; i < n_sets; ++i) {
        if (!ctx[i]->ran) continue;
        const int n = static_cast<int>(ctx[i]->circles.size());
        if (n >= m_cfg.MIN_CIRCLES) {
            chosen = i;
            break;
        }
        if (n > 0) {
            chosen = i;
        }
    }

    if (chosen < 0) {
        return false;
    }

    circles   = ctx[chosen]->circles;
    set_index = chosen;
    return true;
}

void kdcode::ShapeLocalizer::filterCentered(std::vector<cv::Vec3f>& circles, int width, int height) const {
    const float cx  = 0.5f * width;
    const float cy  = 0.5f * height;
    const float tol = m_cfg.CENTER_TOL_RATIO * static_cast<float>(std::min(width, height));

    circles.erase(std::remove_if(circles.begin(), circles.end(),
                                 [&](const cv::Vec3f& c) {
                                     return std::fabs(c[0] - cx) >= tol || std::fabs(c[1] - cy) >= tol;
                                 }),
                  circles.end());
}

bool kdcode::ShapeLocalizer::assignRoles(const std::vector<cv::Vec3f>& circles, msg::DetectedGeometry& g) const {
    if (circles.empty()) {
        return false;
    }

    // Outer ring = largest circle
    const auto outer_it = std::max_element(circles.begin(), circles.end(),
                                           [](const cv::Vec3f& a, const cv::Vec3f& b) { return a[2] < b[2]; });
    const cv::Vec3f outer = *outer_it;
    const float R = outer[2];

    // Anchor = smallest circle near the outer centre
    int anchor_idx = -1;
    for (std::size_t i = 0; i < circles.size(); ++i) {
        const cv::Vec3f& c = circles[i];
        const float d = std::hypot(c[0] - outer[0], c[1] - outer[1]);
        if (d >= m_cfg.ANCHOR_CENTER_RATIO * R || c[2] > m_cfg.ANCHOR_MAX_RATIO * R) {
            continue;
        }
        if (anchor_idx < 0 || c[2] < circles[anchor_idx][2]) {
            anchor_idx = static_cast<int>(i);
        }
    }
    if (anchor_idx < 0) {
        return false;
    }

    const cv::Vec3f& anchor = circles[anchor_idx];
    g.center_x      = anchor[0];
    g.center_y      = anchor[1];
    g.anchor_radius = anchor[2];
    g.outer_radius  = R;

    // Coarse pitch; replaced by refineGeometry() when transitions are found
    g.estimated_ring_width  = std::max(1.0f, (R - anchor[2]) / m_cfg.COARSE_RING_DIVISOR);
    g.rings_needed_estimate = std::max(1, static_cast<int>((R - anchor[2]) / g.estimated_ring_width));
    g.refined = 0;
    return true;
}

int kdcode::ShapeLocalizer::estimateBandCount(const std::vector<float>& transitions,
                                              float anchor_r, float outer_r, float match_ratio) {
    const float span = outer_r - anchor_r;
    if (transitions.empty() || span <= 0.0f) {
        return 0;
    }

    std::vector<float> sorted(transitions);
    std::sort(sorted.begin(), sorted.end());

    // Marker band is empty and ring 0 always holds a wedge, so the innermost
    // supported boundary sits one pitch out from the anchor. Anything finer
    // than the finest grid is edge residue.
    const float min_pitch = 0.75f * span / static_cast<float>(msg::MAX_RINGS + 1);
    float pitch = 0.0f;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const auto lo = std::lower_bound(sorted.begin(), sorted.end(), sorted[i] - PITCH_CLUSTER_PX);
        const auto hi = std::upper_bound(sorted.begin(), sorted.end(), sorted[i] + PITCH_CLUSTER_PX);
        if (hi - lo < PITCH_MIN_SUPPORT) continue;
        std::vector<float> cluster(lo, hi);
        const float p = percentile(cluster, 0.5f) - anchor_r;
        if (p >= min_pitch) {
            pitch = p;
            break;
        }
    }
    if (pitch <= 0.0f) {
        return 0;
    }

    const int n0 = static_cast<int>(std::lround(span / pitch));

    auto gridHits = [&](int n) -> std::size_t {
        const float step = span / static_cast<float>(n);
        const float tol  = std::max(1.5f, 0.12f * step);
        std::size_t hits = 0;
        for (float r : transitions) {
            int k = static_cast<int>(std::lround((r - anchor_r) / step));
            k = std::min(n - 1, std::max(1, k));
            if (std::fabs(r - (anchor_r + k * step)) <= tol) ++hits;
        }
        return hits;
    };

    // Measured pitch first; a neighbour count only when it fits strictly better
    int best = 0;
    std::size_t best_hits = 0;
    const int candidates[3] = {n0, n0 - 1, n0 + 1};
    for (int n : candidates) {
        if (n < 2 || n > msg::MAX_RINGS + 1) continue;
        const std::size_t hits = gridHits(n);
        if (best == 0 || hits > best_hits) {
            best = n;
            best_hits = hits;
        }
    }

    if (best == 0 || static_cast<float>(best_hits) < match_ratio * static_cast<float>(transitions.size())) {
        return 0;
    }
    return best;
}

bool kdcode::ShapeLocalizer::refineGeometry(const cv::Mat& bin, float anchor_min_px, float anchor_max_px,
                                            msg::DetectedGeometry& g) const {
    const int N = m_cfg.REFINE_RAYS;
    const cv::Point2f c0(g.center_x, g.center_y);

    std::vector<float> cos_t(N), sin_t(N);
    for (int j = 0; j < N; ++j) {
        const double a = 2.0 * CV_PI * j / N;
        cos_t[j] = static_cast<float>(std::cos(a));
        sin_t[j] = static_cast<float>(std::sin(a));
    }

    // ----------------------------------------------------
    // 1) Outer edge of the distortion ring, scanning inwards
    // ----------------------------------------------------
    std::vector<cv::Point2f> edge_pts;
    std::vector<float> dark_runs;
    edge_pts.reserve(N);

    for (int j = 0; j < N; ++j) {
        const float dx = cos_t[j];
        const float dy = sin_t[j];
        float r = std::min(m_cfg.OUTER_SEARCH_RATIO * g.outer_radius, rayLimit(bin, c0, dx, dy));
        const float r_stop = g.anchor_radius;

        // Skip clutter touching the search start
        while (r > r_stop && pixelState(bin, c0.x + r * dx, c0.y + r * dy) == 1) r -= RAY_STEP_PX;
        while (r > r_stop && pixelState(bin, c0.x + r * dx, c0.y + r * dy) != 1) r -= RAY_STEP_PX;
        if (r <= r_stop) {
            continue;
        }

        edge_pts.emplace_back(c0.x + r * dx, c0.y + r * dy);

        float run = 0.0f;
        while (r > r_stop && pixelState(bin, c0.x + r * dx, c0.y + r * dy) == 1) {
            r   -= RAY_STEP_PX;
            run += RAY_STEP_PX;
        }
        dark_runs.push_back(run);
    }

    if (static_cast<int>(edge_pts.size()) < std::max(5, N / 4)) {
        std::cerr << "[Localizer] outer edge found on " << edge_pts.size() << "/" << N << " rays\n";
        return false;
    }

    const cv::RotatedRect ell = cv::fitEllipse(edge_pts);
    const cv::Point2f c1 = ell.center;
    const float r_edge = 0.25f * (ell.size.width + ell.size.height);

    const float tol = std::max(2.0f, 0.05f * r_edge);
    int support = 0;
    for (const auto& p : edge_pts) {
        if (std::fabs(std::hypot(p.x - c1.x, p.y - c1.y) - r_edge) <= tol) ++support;
    }
    if (static_cast<float>(support) < m_cfg.MIN_EDGE_SUPPORT * N) {
        std::cerr << "[Localizer] outer edge support " << support << "/" << N << " below gate\n";
        return false;
    }

    // ----------------------------------------------------
    // 2) Ring thickness -> inner edge = outer radius of the data area
    // ----------------------------------------------------
    const float thickness = std::max(RAY_STEP_PX, percentile(dark_runs, m_cfg.BORDER_PERCENTILE));
    const float R = r_edge - thickness;

    // ----------------------------------------------------
    // 3) Anchor radius: median first dark -> light distance from c1
    // ----------------------------------------------------
    if (pixelState(bin, c1.x, c1.y) != 1) {
        std::cerr << "[Localizer] anchor centre is not dark\n";
        return false;
    }

    std::vector<float> anchor_samples;
    anchor_samples.reserve(N);
    for (int j = 0; j < N; ++j) {
        const float dx = cos_t[j];
        const float dy = sin_t[j];

        float r = 0.0f;
        int st = 1;
        while (r < R && (st = pixelState(bin, c1.x + r * dx, c1.y + r * dy)) == 1) r += RAY_STEP_PX;
        if (st == 0) anchor_samples.push_back(r);
    }
    if (anchor_samples.size() < static_cast<std::size_t>(N / 2)) {
        std::cerr << "[Localizer] anchor edge found on " << anchor_samples.size() << "/" << N << " rays\n";
        return false;
    }
    const float A = percentile(anchor_samples, 0.5f);
    if (A < 1.0f || A + 2.0f * TRANSITION_GUARD >= R ||
        A < (1.0f - ANCHOR_BAND_SLACK) * anchor_min_px ||
        A > (1.0f + ANCHOR_BAND_SLACK) * anchor_max_px) {
        std::cerr << "[Localizer] implausible radii anchor=" << A << " outer=" << R << "\n";
        return false;
    }

    // Anchor disk must be solid
    {
        const float rf = 0.8f * A;
        int total = 0;
        int dark = 0;
        const int u0 = std::max(0, static_cast<int>(std::floor(c1.x - rf)));
        const int u1 = std::min(bin.cols - 1, static_cast<int>(std::ceil(c1.x + rf)));
        const int v0 = std::max(0, static_cast<int>(std::floor(c1.y - rf)));
        const int v1 = std::min(bin.rows - 1, static_cast<int>(std::ceil(c1.y + rf)));
        for (int v = v0; v <= v1; ++v) {
            for (int u = u0; u <= u1; ++u) {
                const float du = u - c1.x;
                const float dv = v - c1.y;
                if (du * du + dv * dv > rf * rf) continue;
                ++total;
                if (bin.at<uint8_t>(v, u) == 0) ++dark;
            }
        }
        if (total == 0 || static_cast<float>(dark) < m_cfg.MIN_ANCHOR_FILL * total) {
            std::cerr << "[Localizer] anchor fill " << dark << "/" << total << " below gate\n";
            return false;
        }
    }

    g.center_x      = c1.x;
    g.center_y      = c1.y;
    g.anchor_radius = A;
    g.outer_radius  = R;
    g.estimated_ring_width  = std::max(1.0f, (R - A) / m_cfg.COARSE_RING_DIVISOR);
    g.rings_needed_estimate = std::max(1, static_cast<int>((R - A) / g.estimated_ring_width));

    // ----------------------------------------------------
    // 4) Ring boundaries from radial transitions
    // ----------------------------------------------------
    std::vector<std::vector<float>> per_ray(N);
    for (int j = 0; j < N; ++j) {
        const float dx = cos_t[j];
        const float dy = sin_t[j];

        float r = A + TRANSITION_GUARD;
        int prev = pixelState(bin, c1.x + r * dx, c1.y + r * dy);

        // Leading dark run belongs to the anchor (fin, blur)
        while (prev == 1 && r < R - TRANSITION_GUARD) {
            r += RAY_STEP_PX;
            prev = pixelState(bin, c1.x + r * dx, c1.y + r * dy);
        }

        for (r += RAY_STEP_PX; r < R - TRANSITION_GUARD; r += RAY_STEP_PX) {
            const int st = pixelState(bin, c1.x + r * dx, c1.y + r * dy);
            if (st < 0) break;
            if (prev >= 0 && st != prev) {
                per_ray[j].push_back(r - 0.5f * RAY_STEP_PX);
            }
            prev = st;
        }
    }

    std::vector<float> transitions;
    for (int j = 0; j < N; ++j) {
        const auto& left  = per_ray[(j + N - 1) % N];
        const auto& right = per_ray[(j + 1) % N];
        for (float r : per_ray[j]) {
            const auto near = [r](float q) { return std::fabs(q - r) <= NEIGHBOUR_TOL_PX; };
            if (std::any_of(left.begin(), left.end(), near) || std::any_of(right.begin(), right.end(), near)) {
                transitions.push_back(r);
            }
        }
    }

    const int n = estimateBandCount(transitions, A, R, m_cfg.GRID_MATCH_RATIO);
    if (n == 0) {
        if (static_cast<int>(transitions.size()) >= m_cfg.MIN_GRID_TRANSITIONS) {
            std::cerr << "[Localizer] " << transitions.size() << " transitions fit no ring grid\n";
            return false;
        }
        return true;   // too little evidence, coarse pitch stays
    }

    g.estimated_ring_width  = (R - A) / static_cast<float>(n);
    g.rings_needed_estimate = n - 1;
    g.refined = 1;
    return true;
}

bool kdcode::ShapeLocalizer::localize(const msg::PreprocessedFrame& frame,
                                      const msg::ScanParameters& scan,
                                      msg::DetectedGeometry& out) const {
    out = msg::DetectedGeometry{};
    out.scale = frame.scale;

    std::vector<cv::Vec3f> circles;
    int set_index = -1;
    if (!detectCircles(frame, scan, circles, set_index)) {
        return false;
    }

    filterCentered(circles, frame.binary.cols, frame.binary.rows);
    if (!assignRoles(circles, out)) {
        return false;
    }
    out.hough_set = set_index;

    const float a_min = scan.min_anchor_radius * frame.scale;
    const float a_max = scan.max_anchor_radius * frame.scale;
    if (m_cfg.REFINE && !refineGeometry(frame.binary, a_min, a_max, out)) {
        return false;
    }

    std::cout << "[Localizer] set=" << set_index
              << " c=(" << out.center_x << "," << out.center_y << ")"
              << " anchor=" << out.anchor_radius
              << " outer=" << out.outer_radius
              << " pitch=" << out.estimated_ring_width
              << " rings=" << out.rings_needed_estimate
              << (out.refined ? "" : " (coarse)") << "\n";
    return true;
}
