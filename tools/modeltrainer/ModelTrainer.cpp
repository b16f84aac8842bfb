#include "ModelTrainer.hpp"

#include "apps/kdcode/BitCodec.hpp"
#include "apps/kdcode/KDCodec.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <vector>

namespace trainer {

template<typename T>
static T get_yaml_value(const YAML::Node& node, const std::string& key, const T& default_value)
{
    if (node[key]) {
        return node[key].as<T>();
    }
    return default_value;
}

bool loadTrainerConfig(const std::string& yaml_path, ModelTrainerConfig& cfg) {
    try {
        const YAML::Node root = YAML::LoadFile(yaml_path);
        const YAML::Node n = root["trainer"];
        if (!n) {
            return true;
        }
        cfg.codes               = get_yaml_value(n, "codes", cfg.codes);
        cfg.seed                = get_yaml_value(n, "seed", cfg.seed);
        cfg.test_split          = get_yaml_value(n, "test_split", cfg.test_split);
        cfg.min_text_len        = get_yaml_value(n, "min_text_len", cfg.min_text_len);
        cfg.max_text_len        = get_yaml_value(n, "max_text_len", cfg.max_text_len);
        cfg.max_noise_sigma     = get_yaml_value(n, "max_noise_sigma", cfg.max_noise_sigma);
        cfg.max_blur_ksize      = get_yaml_value(n, "max_blur_ksize", cfg.max_blur_ksize);
        cfg.min_jpeg_quality    = get_yaml_value(n, "min_jpeg_quality", cfg.min_jpeg_quality);
        cfg.rotate              = get_yaml_value(n, "rotate", cfg.rotate);
        cfg.min_label_agreement = get_yaml_value(n, "min_label_agreement", cfg.min_label_agreement);
        cfg.out_path            = get_yaml_value(n, "out_path", cfg.out_path);

        cfg.forest.MAX_TREES        = get_yaml_value(n, "trees", cfg.forest.MAX_TREES);
        cfg.forest.MAX_DEPTH        = get_yaml_value(n, "max_depth", cfg.forest.MAX_DEPTH);
        cfg.forest.MIN_SAMPLE_COUNT = get_yaml_value(n, "min_sample_count", cfg.forest.MIN_SAMPLE_COUNT);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "[Trainer] YAML parsing error: " << e.what() << std::endl;
        return false;
    }
    return true;
}

static inline ModelTrainerConfig sanitise(const ModelTrainerConfig& in) {
    ModelTrainerConfig cfg = in;

    if (cfg.codes < 1) cfg.codes = 1;
    if (cfg.test_split < 0.0f || cfg.test_split >= 1.0f) cfg.test_split = 0.2f;
    if (cfg.min_text_len < 1) cfg.min_text_len = 1;
    if (cfg.max_text_len < cfg.min_text_len) cfg.max_text_len = cfg.min_text_len;
    if (cfg.max_noise_sigma < 0.0f) cfg.max_noise_sigma = 0.0f;
    if (cfg.max_blur_ksize < 1) cfg.max_blur_ksize = 1;
    if (cfg.max_blur_ksize % 2 == 0) cfg.max_blur_ksize += 1;
    cfg.min_jpeg_quality = std::min(100, std::max(1, cfg.min_jpeg_quality));

    return cfg;
}

ModelTrainer::ModelTrainer(const kdcode::CodecConfig& codec_cfg, const ModelTrainerConfig& cfg)
    : m_codec_cfg(codec_cfg), m_cfg(sanitise(cfg)) {}

std::string ModelTrainer::randomText(std::mt19937& rng) const {
    std::uniform_int_distribution<int> len_d(m_cfg.min_text_len, m_cfg.max_text_len);
    std::uniform_int_distribution<int> ch_d(32, 126);

    const int len = std::min(len_d(rng), m_codec_cfg.code.max_chars);
    std::string s;
    s.reserve(len);
    for (int i = 0; i < len; ++i) s.push_back(static_cast<char>(ch_d(rng)));
    return s;
}

cv::Mat ModelTrainer::degrade(const cv::Mat& clean, std::mt19937& rng) const {
    cv::Mat img = clean.clone();

    if (m_cfg.rotate) {
        static const int ROT[3] = {cv::ROTATE_90_CLOCKWISE, cv::ROTATE_180, cv::ROTATE_90_COUNTERCLOCKWISE};
        const int k = std::uniform_int_distribution<int>(0, 3)(rng);
        if (k > 0) {
            cv::Mat rotated;
            cv::rotate(img, rotated, ROT[k - 1]);
            img = rotated;
        }
    }

    if (m_cfg.max_blur_ksize > 1) {
        const int half = std::uniform_int_distribution<int>(0, m_cfg.max_blur_ksize / 2)(rng);
        if (half > 0) cv::GaussianBlur(img, img, cv::Size(2 * half + 1, 2 * half + 1), 0);
    }

    const float sigma = std::uniform_real_distribution<float>(0.0f, m_cfg.max_noise_sigma)(rng);
    if (sigma > 0.0f) {
        cv::Mat noise(img.size(), CV_32F);
        cv::theRNG().state = rng();
        cv::randn(noise, 0.0, sigma);
        cv::Mat f;
        img.convertTo(f, CV_32F);
        f += noise;
        f.convertTo(img, CV_8U);   // saturating
    }

    if (m_cfg.min_jpeg_quality < 100) {
        const int q = std::uniform_int_distribution<int>(m_cfg.min_jpeg_quality, 95)(rng);
        std::vector<uint8_t> buf;
        if (cv::imencode(".jpg", img, buf, {cv::IMWRITE_JPEG_QUALITY, q})) {
            cv::Mat back = cv::imdecode(buf, cv::IMREAD_GRAYSCALE);
            if (!back.empty()) img = back;
        }
    }
    return img;
}

bool ModelTrainer::generate(TrainingSet& out) {
    out = TrainingSet{};

    std::mt19937 rng(m_cfg.seed);

    // Threshold-only decoder: the model must not label its own input
    const kdcode::KDCodec codec(m_codec_cfg, nullptr);
    const msg::CodeParameters& params = m_codec_cfg.code;

    std::vector<cv::Mat> feature_blocks;
    std::vector<int> labels;

    for (int i = 0; i < m_cfg.codes; ++i) {
        const std::string text = randomText(rng);

        msg::BitStream bits;
        msg::RasterPlan plan;
        cv::Mat canvas;
        if (!kdcode::textToBits(text, bits) ||
            kdcode::Rasterizer::planRaster(bits.size(), params, plan) != msg::EncodeStatus::OK ||
            !codec.rasterizer().rasterize(bits, params, plan, canvas)) {
            ++out.codes_skipped;
            continue;
        }

        const cv::Mat noisy = degrade(canvas, rng);

        // NOT_FOUND is fine here as long as the code was localized
        kdcode::DecodeReport rep;
        if (codec.decodeImage(noisy, m_codec_cfg.scan, rep) == msg::DecodeStatus::INVALID_INPUT ||
            !rep.localized || rep.geometry.rings_needed_estimate != plan.rings_needed ||
            rep.samples.size() != static_cast<std::size_t>(plan.rings_needed) * params.segments_per_ring) {
            ++out.codes_skipped;
            continue;
        }

        // Ground truth, zero padded to whole rings
        std::vector<int> truth(rep.samples.size(), 0);
        for (std::size_t k = 0; k < bits.size() && k < truth.size(); ++k) truth[k] = bits[k];

        std::size_t agree = 0;
        for (std::size_t k = 0; k < truth.size(); ++k) {
            if (rep.samples[k].threshold_bit == truth[k]) ++agree;
        }
        if (static_cast<float>(agree) < m_cfg.min_label_agreement * truth.size()) {
            ++out.codes_skipped;
            continue;
        }

        feature_blocks.push_back(codec.corrector().featureMatrix(rep.samples));
        labels.insert(labels.end(), truth.begin(), truth.end());
        ++out.codes_used;
    }

    if (feature_blocks.empty()) {
        std::cerr << "[Trainer] no usable renders (" << out.codes_skipped << " skipped)\n";
        return false;
    }

    cv::vconcat(feature_blocks, out.features);
    out.labels = cv::Mat(labels, true).reshape(1, static_cast<int>(labels.size()));

    std::cout << "[Trainer] " << out.codes_used << " codes used, " << out.codes_skipped
              << " skipped, " << out.features.rows << " samples\n";
    return true;
}

std::shared_ptr<kdcode::ErrorCorrectionModel>
ModelTrainer::train(const TrainingSet& set, TrainingReport& report) {
    report = TrainingReport{};
    const int n = set.features.rows;
    if (n < 2) {
        std::cerr << "[Trainer] not enough samples\n";
        return nullptr;
    }

    // Shuffled train / test split
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(m_cfg.seed);
    std::shuffle(order.begin(), order.end(), rng);

    const int n_test = std::min(n - 1, static_cast<int>(n * m_cfg.test_split));
    const int n_train = n - n_test;

    cv::Mat x_train(n_train, set.features.cols, CV_32F), y_train(n_train, 1, CV_32S);
    cv::Mat x_test(n_test, set.features.cols, CV_32F), y_test(n_test, 1, CV_32S);
    for (int i = 0; i < n; ++i) {
        const int src = order[i];
        if (i < n_train) {
            set.features.row(src).copyTo(x_train.row(i));
            y_train.at<int>(i, 0) = set.labels.at<int>(src, 0);
        } else {
            set.features.row(src).copyTo(x_test.row(i - n_train));
            y_test.at<int>(i - n_train, 0) = set.labels.at<int>(src, 0);
        }
    }

    auto model = kdcode::ErrorCorrectionModel::train(x_train, y_train, m_cfg.forest);
    if (!model) {
        return nullptr;
    }

    report.train_rows = n_train;
    report.test_rows = n_test;
    if (n_test > 0) {
        report.test_accuracy = model->accuracy(x_test, y_test);
        int base = 0;
        for (int i = 0; i < n_test; ++i) {
            // column 9 is the threshold bit
            if (static_cast<int>(x_test.at<float>(i, 9)) == y_test.at<int>(i, 0)) ++base;
        }
        report.baseline_accuracy = static_cast<float>(base) / n_test;
    }

    std::cout << "[Trainer] trained on " << n_train << " rows; test accuracy "
              << report.test_accuracy << " (threshold only " << report.baseline_accuracy << ")\n";
    return model;
}

bool ModelTrainer::run() {
    TrainingSet set;
    if (!generate(set)) {
        return false;
    }

    TrainingReport report;
    auto model = train(set, report);
    if (!model) {
        return false;
    }

    const std::string path = m_cfg.out_path.empty() ? m_codec_cfg.model_path : m_cfg.out_path;
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[Trainer] cannot create " << parent.string() << ": " << ec.message() << "\n";
            return false;
        }
    }
    if (!model->save(path)) {
        return false;
    }
    std::cout << "[Trainer] model written to " << path << "\n";
    return true;
}

} // namespace trainer
