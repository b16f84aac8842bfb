#include "modeltrainer/ModelTrainer.hpp"

#include <cstdio>
#include <iostream>

#define T_ASSERT(expr) do { if (!(expr)) { std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } } while (0)

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

// Light degradations so every render localizes
static trainer::ModelTrainerConfig smallRun() {
    trainer::ModelTrainerConfig cfg;
    cfg.codes = 8;
    cfg.seed = 7;
    cfg.min_text_len = 3;
    cfg.max_text_len = 8;
    cfg.max_noise_sigma = 10.0f;
    cfg.max_blur_ksize = 3;
    cfg.min_jpeg_quality = 100;
    cfg.forest.MAX_TREES = 20;
    return cfg;
}

static bool testRandomText() {
    kdcode::CodecConfig codec_cfg;
    trainer::ModelTrainerConfig cfg = smallRun();
    trainer::ModelTrainer t(codec_cfg, cfg);

    std::mt19937 rng(1);
    for (int i = 0; i < 50; ++i) {
        const std::string s = t.randomText(rng);
        T_ASSERT(s.size() >= 3 && s.size() <= 8);
        for (char c : s) T_ASSERT(c >= 32 && c <= 126);
    }

    // Capped by the code's character limit
    codec_cfg.code.max_chars = 2;
    trainer::ModelTrainer capped(codec_cfg, cfg);
    for (int i = 0; i < 10; ++i) T_ASSERT(capped.randomText(rng).size() <= 2);
    return true;
}

static bool testDegradeKeepsGeometry() {
    kdcode::CodecConfig codec_cfg;
    trainer::ModelTrainerConfig cfg = smallRun();
    cfg.min_jpeg_quality = 50;
    trainer::ModelTrainer t(codec_cfg, cfg);

    const cv::Mat clean(320, 320, CV_8UC1, cv::Scalar(255));
    std::mt19937 rng(3);
    for (int i = 0; i < 5; ++i) {
        const cv::Mat d = t.degrade(clean, rng);
        T_ASSERT(d.size() == clean.size());     // square input: rotation keeps the size
        T_ASSERT(d.type() == CV_8UC1);
    }
    return true;
}

static bool testGenerateAndTrain() {
    kdcode::CodecConfig codec_cfg;
    trainer::ModelTrainer t(codec_cfg, smallRun());

    trainer::TrainingSet set;
    T_ASSERT(t.generate(set));
    T_ASSERT(set.codes_used > 0);
    T_ASSERT(set.codes_used + set.codes_skipped == 8);
    T_ASSERT(set.features.rows > 0);
    T_ASSERT(set.features.cols == kdcode::ErrorCorrectionModel::FEATURE_COUNT);
    T_ASSERT(set.labels.rows == set.features.rows && set.labels.cols == 1);
    T_ASSERT(set.labels.type() == CV_32S);

    trainer::TrainingReport report;
    auto model = t.train(set, report);
    T_ASSERT(model != nullptr);
    T_ASSERT(report.train_rows + report.test_rows == set.features.rows);
    T_ASSERT(report.test_rows > 0);
    T_ASSERT(report.test_accuracy >= 0.9f);
    return true;
}

static bool testRunWritesModel() {
    kdcode::CodecConfig codec_cfg;
    trainer::ModelTrainerConfig cfg = smallRun();
    cfg.codes = 4;
    cfg.out_path = "trainer_test_out/model.yml";

    trainer::ModelTrainer t(codec_cfg, cfg);
    T_ASSERT(t.run());

    const auto loaded = kdcode::ErrorCorrectionModel::load(cfg.out_path);
    std::remove(cfg.out_path.c_str());
    std::remove("trainer_test_out");
    T_ASSERT(loaded != nullptr);
    return true;
}

static bool testTrainerSection() {
    trainer::ModelTrainerConfig cfg;
    T_ASSERT(trainer::loadTrainerConfig(KDCODE_CONFIG_PATH, cfg));
    T_ASSERT(cfg.codes == 200);
    T_ASSERT(cfg.forest.MAX_TREES == 100);
    T_ASSERT(cfg.test_split == 0.2f);

    T_ASSERT(!trainer::loadTrainerConfig("missing_trainer.yaml", cfg));
    return true;
}

int main() {
    std::cout << "=== trainer_modeltrainer_test ===\n";
    int failed = 0;

    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] = {
        {"random text bounds", testRandomText},
        {"degrade keeps size and type", testDegradeKeepsGeometry},
        {"generate + train", testGenerateAndTrain},
        {"run writes a loadable model", testRunWritesModel},
        {"trainer section of config/kdcode.yaml", testTrainerSection},
    };

    int idx = 0;
    for (const auto& c : cases) {
        std::cout << "\n[Test " << idx++ << "] " << c.name << "\n";
        const bool ok = c.fn();
        printResult(c.name, ok);
        if (!ok) ++failed;
    }

    std::cout << "\ntrainer_modeltrainer_test: " << (failed ? "FAIL" : "PASS") << "\n";
    return failed ? 1 : 0;
}
