#include "apps/kdcode/ErrorCorrector.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

namespace kdcode {
static inline ErrorCorrectorConfig sanitise(const ErrorCorrectorConfig& in) {
    ErrorCorrectorConfig cfg = in;

    if (cfg.NEIGHBOR_OVERRIDE_BAND < 0.0f) cfg.NEIGHBOR_OVERRIDE_BAND = 0.0f;
    if (cfg.NEIGHBOR_OVERRIDE_BAND > 128.0f) cfg.NEIGHBOR_OVERRIDE_BAND = 128.0f;
    if (cfg.INTENSITY_MIDPOINT < 1.0f || cfg.INTENSITY_MIDPOINT > 254.0f) cfg.INTENSITY_MIDPOINT = 128.0f;
    if (cfg.WINDOW_HALF < 1) cfg.WINDOW_HALF = 1;
    if (cfg.WINDOW_HALF > 8) cfg.WINDOW_HALF = 8;

    return cfg;
}
} // namespace kdcode

// =======================
// ErrorCorrectionModel
// =======================

kdcode::ErrorCorrectionModel::ErrorCorrectionModel(cv::Ptr<cv::ml::RTrees> forest)
    : m_forest(std::move(forest)) {}

std::shared_ptr<const kdcode::ErrorCorrectionModel>
kdcode::ErrorCorrectionModel::load(const std::string& path) {
    if (path.empty() || !std::ifstream(path).good()) {
        std::cout << "[ErrorCorrector] no model at '" << path << "', threshold-only correction\n";
        return nullptr;
    }

    try {
        cv::Ptr<cv::ml::RTrees> forest = cv::ml::RTrees::load(path);
        if (forest.empty() || !forest->isTrained() || forest->getVarCount() != FEATURE_COUNT) {
            std::cerr << "[ErrorCorrector] '" << path << "' is not a " << FEATURE_COUNT
                      << "-feature forest, ignoring\n";
            return nullptr;
        }
        std::cout << "[ErrorCorrector] loaded model '" << path << "'\n";
        return std::shared_ptr<const ErrorCorrectionModel>(new ErrorCorrectionModel(forest));
    } catch (const cv::Exception& e) {
        std::cerr << "[ErrorCorrector] failed to load '" << path << "': " << e.what() << "\n";
        return nullptr;
    }
}

std::shared_ptr<kdcode::ErrorCorrectionModel>
kdcode::ErrorCorrectionModel::train(const cv::Mat& features, const cv::Mat& labels,
                                    const ModelTrainingConfig& cfg) {
    if (features.empty() || features.type() != CV_32F || features.cols != FEATURE_COUNT ||
        labels.type() != CV_32S || labels.rows != features.rows) {
        std::cerr << "[ErrorCorrector] training data has the wrong shape or type\n";
        return nullptr;
    }

    cv::Ptr<cv::ml::RTrees> forest = cv::ml::RTrees::create();
    forest->setMaxDepth(std::max(1, cfg.MAX_DEPTH));
    forest->setMinSampleCount(std::max(1, cfg.MIN_SAMPLE_COUNT));
    forest->setCalculateVarImportance(false);
    forest->setActiveVarCount(0);   // sqrt(FEATURE_COUNT)
    forest->setTermCriteria(cv::TermCriteria(cv::TermCriteria::MAX_ITER | cv::TermCriteria::EPS,
                                             std::max(1, cfg.MAX_TREES), cfg.FOREST_EPSILON));

    try {
        cv::Ptr<cv::ml::TrainData> data = cv::ml::TrainData::create(features, cv::ml::ROW_SAMPLE, labels);
        if (!forest->train(data)) {
            std::cerr << "[ErrorCorrector] forest training failed\n";
            return nullptr;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[ErrorCorrector] forest training threw: " << e.what() << "\n";
        return nullptr;
    }

    return std::shared_ptr<ErrorCorrectionModel>(new ErrorCorrectionModel(forest));
}

bool kdcode::ErrorCorrectionModel::save(const std::string& path) const {
    try {
        m_forest->save(path);
    } catch (const cv::Exception& e) {
        std::cerr << "[ErrorCorrector] failed to save '" << path << "': " << e.what() << "\n";
        return false;
    }
    return true;
}

int kdcode::ErrorCorrectionModel::predict(const cv::Mat& row) const {
    if (row.rows != 1 || row.cols != FEATURE_COUNT || row.type() != CV_32F) {
        return -1;
    }
    try {
        const float label = m_forest->predict(row);
        return label >= 0.5f ? 1 : 0;
    } catch (const cv::Exception& e) {
        std::cerr << "[ErrorCorrector] predict threw: " << e.what() << "\n";
        return -1;
    }
}

float kdcode::ErrorCorrectionModel::accuracy(const cv::Mat& features, const cv::Mat& labels) const {
    if (features.rows == 0 || labels.rows != features.rows) {
        return 0.0f;
    }
    int correct = 0;
    for (int i = 0; i < features.rows; ++i) {
        if (predict(features.row(i)) == labels.at<int>(i, 0)) ++correct;
    }
    return static_cast<float>(correct) / static_cast<float>(features.rows);
}

// =======================
// ErrorCorrector
// =======================

kdcode::ErrorCorrector::ErrorCorrector(const ErrorCorrectorConfig& cfg,
                                       std::shared_ptr<const ErrorCorrectionModel> model)
    : m_cfg(sanitise(cfg)), m_model(std::move(model)) {}

void kdcode::ErrorCorrector::setConfig(const ErrorCorrectorConfig& cfg) {
    m_cfg = sanitise(cfg);
}

void kdcode::ErrorCorrector::setModel(std::shared_ptr<const ErrorCorrectionModel> model) {
    m_model = std::move(model);
}

void kdcode::ErrorCorrector::extractFeatures(const std::vector<msg::SampledBit>& samples,
                                             std::size_t i, float* row) const {
    const msg::SampledBit& s = samples[i];
    const std::size_t n = samples.size();

    const float contrast = std::fabs(s.raw_intensity - s.local_average);

    int ones = 0;
    const std::size_t lo = i >= static_cast<std::size_t>(m_cfg.WINDOW_HALF) ? i - m_cfg.WINDOW_HALF : 0;
    const std::size_t hi = std::min(n - 1, i + m_cfg.WINDOW_HALF);
    for (std::size_t k = lo; k <= hi; ++k) ones += samples[k].threshold_bit;

    row[0] = s.raw_intensity;
    row[1] = s.local_average;
    row[2] = 255.0f - contrast;                                     // noise estimate
    row[3] = s.gradient_magnitude;
    row[4] = s.confidence;
    row[5] = i > 0 ? static_cast<float>(samples[i - 1].threshold_bit) : -1.0f;
    row[6] = i + 1 < n ? static_cast<float>(samples[i + 1].threshold_bit) : -1.0f;
    row[7] = n > 1 ? static_cast<float>(i) / static_cast<float>(n - 1) : 0.0f;
    row[8] = static_cast<float>(ones);
    row[9] = static_cast<float>(s.threshold_bit);
}

cv::Mat kdcode::ErrorCorrector::featureMatrix(const std::vector<msg::SampledBit>& samples) const {
    cv::Mat m(static_cast<int>(samples.size()), ErrorCorrectionModel::FEATURE_COUNT, CV_32F);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        extractFeatures(samples, i, m.ptr<float>(static_cast<int>(i)));
    }
    return m;
}

bool kdcode::ErrorCorrector::neighbourOverride(const std::vector<msg::SampledBit>& samples,
                                               std::size_t i, uint8_t& bit) const {
    if (i == 0 || i + 1 >= samples.size()) {
        return false;
    }
    const msg::SampledBit& s = samples[i];
    const uint8_t prev = samples[i - 1].threshold_bit;
    const uint8_t next = samples[i + 1].threshold_bit;

    if (prev != next || prev == s.threshold_bit) {
        return false;
    }
    // Clear samples keep their own value
    if (std::fabs(s.raw_intensity - m_cfg.INTENSITY_MIDPOINT) > m_cfg.NEIGHBOR_OVERRIDE_BAND) {
        return false;
    }
    bit = prev;
    return true;
}

bool kdcode::ErrorCorrector::correct(const std::vector<msg::SampledBit>& samples, msg::BitStream& out) const {
    out.clear();
    out.reserve(samples.size());

    if (!m_model) {
        for (const auto& s : samples) out.push_back(s.threshold_bit);
        return true;
    }

    std::size_t overridden = 0;
    std::size_t changed = 0;
    cv::Mat row(1, ErrorCorrectionModel::FEATURE_COUNT, CV_32F);

    for (std::size_t i = 0; i < samples.size(); ++i) {
        uint8_t bit = samples[i].threshold_bit;

        if (neighbourOverride(samples, i, bit)) {
            ++overridden;
        } else if (samples[i].in_bounds) {
            extractFeatures(samples, i, row.ptr<float>(0));
            const int p = m_model->predict(row);
            if (p >= 0) bit = static_cast<uint8_t>(p);
        }

        if (bit != samples[i].threshold_bit) ++changed;
        out.push_back(bit);
    }

    if (changed > 0) {
        std::cout << "[ErrorCorrector] " << changed << "/" << samples.size()
                  << " bits changed (" << overridden << " by neighbours)\n";
    }
    return true;
}
