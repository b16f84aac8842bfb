#pragma once
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>

#include "msg/BitStream.hpp"
#include "msg/SampledBit.hpp"

namespace kdcode {

// Random forest hyper-parameters for ErrorCorrectionModel::train().
struct ModelTrainingConfig {
    int    MAX_TREES        = 100;
    int    MAX_DEPTH        = 12;
    int    MIN_SAMPLE_COUNT = 4;
    double FOREST_EPSILON   = 0.01;
};

// ---------------------------------------------------------------------------
// ErrorCorrectionModel: immutable bit classifier over FEATURE_COUNT features.
// Shared between decodes as shared_ptr<const>; predict() is read-only.
// ---------------------------------------------------------------------------
class ErrorCorrectionModel {
public:
    static constexpr int FEATURE_COUNT = 10;

    // Null when the file does not exist or cannot be parsed.
    static std::shared_ptr<const ErrorCorrectionModel> load(const std::string& path);

    // features: N x FEATURE_COUNT CV_32F, labels: N x 1 CV_32S (0/1).
    static std::shared_ptr<ErrorCorrectionModel> train(const cv::Mat& features,
                                                       const cv::Mat& labels,
                                                       const ModelTrainingConfig& cfg = {});

    bool save(const std::string& path) const;

    // 0/1, or -1 when the row is malformed or prediction fails.
    int predict(const cv::Mat& row) const;

    // Fraction of rows classified as their label.
    float accuracy(const cv::Mat& features, const cv::Mat& labels) const;

private:
    explicit ErrorCorrectionModel(cv::Ptr<cv::ml::RTrees> forest);

    cv::Ptr<cv::ml::RTrees> m_forest;
};

struct ErrorCorrectorConfig {
    // Neighbour override only when |raw - 128| <= band; 128 = always.
    float NEIGHBOR_OVERRIDE_BAND = 48.0f;
    float INTENSITY_MIDPOINT     = 128.0f;
    int   WINDOW_HALF            = 2;      // ones counted over 2h+1 bits
};

// ---------------------------------------------------------------------------
// ErrorCorrector: SampledBits -> corrected bit stream. Each bit is decided
// once: neighbour override, then the model, else the threshold bit.
// ---------------------------------------------------------------------------
class ErrorCorrector {
public:
    explicit ErrorCorrector(const ErrorCorrectorConfig& cfg = {},
                            std::shared_ptr<const ErrorCorrectionModel> model = nullptr);

    void setConfig(const ErrorCorrectorConfig& cfg);
    const ErrorCorrectorConfig& getConfig() const { return m_cfg; }

    void setModel(std::shared_ptr<const ErrorCorrectionModel> model);
    bool hasModel() const { return static_cast<bool>(m_model); }

    bool correct(const std::vector<msg::SampledBit>& samples, msg::BitStream& out) const;

    // Feature row i (FEATURE_COUNT floats), shared with the model trainer.
    void extractFeatures(const std::vector<msg::SampledBit>& samples, std::size_t i, float* row) const;
    cv::Mat featureMatrix(const std::vector<msg::SampledBit>& samples) const;

private:
    ErrorCorrectorConfig m_cfg{};
    std::shared_ptr<const ErrorCorrectionModel> m_model;

    bool neighbourOverride(const std::vector<msg::SampledBit>& samples, std::size_t i, uint8_t& bit) const;
};

} // namespace kdcode
