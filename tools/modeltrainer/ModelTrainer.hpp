#pragma once
#include <cstdint>
#include <memory>
#include <random>
#include <string>

#include <opencv2/core.hpp>

#include "apps/kdcode/CodecConfig.hpp"
#include "apps/kdcode/ErrorCorrector.hpp"

namespace trainer {

// -------------------- Model trainer --------------------
// Offline tool:
// - Renders random codes with the production rasterizer.
// - Degrades them (rotation, Gaussian noise, blur, JPEG round trip).
// - Samples them with the threshold-only decoder and labels every
//   sample with the bit that was actually drawn.
// - Fits the random forest and writes the OpenCV model file.

struct ModelTrainerConfig {
    int      codes = 200;
    uint32_t seed = 42;
    float    test_split = 0.2f;

    // Text generation
    int min_text_len = 1;
    int max_text_len = 10;

    // Degradations, drawn uniformly per code
    float max_noise_sigma = 40.0f;
    int   max_blur_ksize = 5;          // odd; 1 = off
    int   min_jpeg_quality = 40;       // 100 = skip JPEG round trip
    bool  rotate = true;               // random multiple of 90 deg

    // Minimum threshold-bit agreement before a render is used; below this the
    // orientation or ring count was wrong and the labels would not line up
    float min_label_agreement = 0.75f;

    std::string out_path;              // empty -> CodecConfig::model_path

    kdcode::ModelTrainingConfig forest{};
};

// Reads the optional 'trainer:' section; missing keys keep their value.
bool loadTrainerConfig(const std::string& yaml_path, ModelTrainerConfig& cfg);

struct TrainingSet {
    cv::Mat features;   // N x FEATURE_COUNT, CV_32F
    cv::Mat labels;     // N x 1, CV_32S
    int codes_used = 0;
    int codes_skipped = 0;
};

struct TrainingReport {
    int train_rows = 0;
    int test_rows = 0;
    float test_accuracy = 0.0f;       // forest
    float baseline_accuracy = 0.0f;   // threshold bit alone
};

class ModelTrainer {
public:
    ModelTrainer(const kdcode::CodecConfig& codec_cfg, const ModelTrainerConfig& cfg);

    bool generate(TrainingSet& out);

    std::shared_ptr<kdcode::ErrorCorrectionModel> train(const TrainingSet& set, TrainingReport& report);

    // generate -> train -> save. False on any failure.
    bool run();

    // Public for tests
    std::string randomText(std::mt19937& rng) const;
    cv::Mat degrade(const cv::Mat& clean, std::mt19937& rng) const;

private:
    kdcode::CodecConfig m_codec_cfg;
    ModelTrainerConfig m_cfg;
};

} // namespace trainer
