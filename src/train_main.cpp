#include "modeltrainer/ModelTrainer.hpp"

#include <iostream>
#include <string>

static void print_usage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " [--out FILE.yml] [--codes N] [--seed S] [--config FILE.yaml [--profile NAME]]\n"
        << "\nExample:\n"
        << "  " << exe << " --config ../config/kdcode.yaml --codes 500 --out models/kd_error_correction_model.yml\n";
}

int main(int argc, char** argv) {
    std::string config_file;
    std::string profile;
    std::string out_path;
    int codes = -1;
    long long seed = -1;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        try {
            if (a == "--config") {
                const char* v = need_value("--config");
                if (!v) { print_usage(argv[0]); return 2; }
                config_file = v;
            } else if (a == "--profile") {
                const char* v = need_value("--profile");
                if (!v) { print_usage(argv[0]); return 2; }
                profile = v;
            } else if (a == "--out") {
                const char* v = need_value("--out");
                if (!v) { print_usage(argv[0]); return 2; }
                out_path = v;
            } else if (a == "--codes") {
                const char* v = need_value("--codes");
                if (!v) { print_usage(argv[0]); return 2; }
                codes = std::stoi(v);
            } else if (a == "--seed") {
                const char* v = need_value("--seed");
                if (!v) { print_usage(argv[0]); return 2; }
                seed = std::stoll(v);
            } else {
                std::cerr << "Unknown arg: " << a << "\n";
                print_usage(argv[0]);
                return 2;
            }
        } catch (const std::exception&) {
            std::cerr << "Bad value for " << a << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    kdcode::CodecConfig codec_cfg;
    trainer::ModelTrainerConfig cfg;
    if (!config_file.empty()) {
        if (!codec_cfg.loadFromYaml(config_file, profile) || !trainer::loadTrainerConfig(config_file, cfg)) {
            return 2;
        }
    }
    if (codes > 0) cfg.codes = codes;
    if (seed >= 0) cfg.seed = static_cast<uint32_t>(seed);
    if (!out_path.empty()) cfg.out_path = out_path;

    trainer::ModelTrainer t(codec_cfg, cfg);
    return t.run() ? 0 : 1;
}
