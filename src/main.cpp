#include "apps/kdcode/KDCodec.hpp"
#include "os/rtos.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Exit codes
constexpr int EXIT_OK       = 0;
constexpr int EXIT_NO_CODE  = 1;   // also any runtime failure
constexpr int EXIT_USAGE    = 2;

struct Args {
    std::string command;

    std::string config_file;
    std::string profile;
    std::string model_path;       // overrides the config when set

    // encode
    std::string text;
    fs::path out_path;

    // decode / batch
    fs::path in_path;
    fs::path annotate_path;
    fs::path dir;
    int jobs = 1;

    // Overrides applied after the config file; -1 = keep
    int segments = -1;
    int anchor_radius = -1;
    int ring_width = -1;
    int scale = -1;
    int max_chars = -1;
    int quality = -1;
    int min_anchor = -1;
    int max_anchor = -1;
    int mt = -1;
};

static void print_usage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " encode --text T --out FILE [--segments N --anchor-radius N --ring-width N"
        << " --scale N --max-chars N --quality Q]\n"
        << "  " << exe << " decode --in FILE [--segments N --min-anchor N --max-anchor N --mt 0|1"
        << " --annotate FILE]\n"
        << "  " << exe << " batch  --dir DIR [--jobs N] [scan options as for decode]\n"
        << "\nCommon options:\n"
        << "  --config FILE.yaml [--profile NAME]   load defaults from YAML\n"
        << "  --model FILE.yml                     error-correction model (decode/batch)\n"
        << "\nExit codes: 0 success, 1 no code / failure, 2 usage error\n";
}

static bool parse_int(const char* v, int& out) {
    try {
        std::size_t used = 0;
        out = std::stoi(v, &used);
        return used == std::string(v).size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_args(int argc, char** argv, Args& out) {
    if (argc < 2) return false;
    out.command = argv[1];
    if (out.command != "encode" && out.command != "decode" && out.command != "batch") {
        std::cerr << "Unknown command: " << out.command << "\n";
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };
        auto need_int = [&](const char* name, int& dst) -> bool {
            const char* v = need_value(name);
            if (!v) return false;
            if (!parse_int(v, dst)) {
                std::cerr << "Not an integer for " << name << ": " << v << "\n";
                return false;
            }
            return true;
        };

        if (a == "--config") {
            const char* v = need_value("--config");
            if (!v) return false;
            out.config_file = v;
        } else if (a == "--profile") {
            const char* v = need_value("--profile");
            if (!v) return false;
            out.profile = v;
        } else if (a == "--model") {
            const char* v = need_value("--model");
            if (!v) return false;
            out.model_path = v;
        } else if (a == "--text") {
            const char* v = need_value("--text");
            if (!v) return false;
            out.text = v;
        } else if (a == "--out") {
            const char* v = need_value("--out");
            if (!v) return false;
            out.out_path = fs::path(v);
        } else if (a == "--in") {
            const char* v = need_value("--in");
            if (!v) return false;
            out.in_path = fs::path(v);
        } else if (a == "--annotate") {
            const char* v = need_value("--annotate");
            if (!v) return false;
            out.annotate_path = fs::path(v);
        } else if (a == "--dir") {
            const char* v = need_value("--dir");
            if (!v) return false;
            out.dir = fs::path(v);
        } else if (a == "--jobs") {
            if (!need_int("--jobs", out.jobs)) return false;
        } else if (a == "--segments") {
            if (!need_int("--segments", out.segments)) return false;
        } else if (a == "--anchor-radius") {
            if (!need_int("--anchor-radius", out.anchor_radius)) return false;
        } else if (a == "--ring-width") {
            if (!need_int("--ring-width", out.ring_width)) return false;
        } else if (a == "--scale") {
            if (!need_int("--scale", out.scale)) return false;
        } else if (a == "--max-chars") {
            if (!need_int("--max-chars", out.max_chars)) return false;
        } else if (a == "--quality") {
            if (!need_int("--quality", out.quality)) return false;
        } else if (a == "--min-anchor") {
            if (!need_int("--min-anchor", out.min_anchor)) return false;
        } else if (a == "--max-anchor") {
            if (!need_int("--max-anchor", out.max_anchor)) return false;
        } else if (a == "--mt") {
            if (!need_int("--mt", out.mt)) return false;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
    }

    if (out.command == "encode" && (out.text.empty() || out.out_path.empty())) return false;
    if (out.command == "decode" && out.in_path.empty()) return false;
    if (out.command == "batch" && out.dir.empty()) return false;
    if (out.jobs < 1) out.jobs = 1;
    return true;
}

static void apply_overrides(const Args& a, kdcode::CodecConfig& cfg) {
    if (a.segments >= 0) {
        cfg.code.segments_per_ring = a.segments;
        cfg.scan.segments_per_ring = a.segments;
    }
    if (a.anchor_radius >= 0) cfg.code.anchor_radius = a.anchor_radius;
    if (a.ring_width >= 0)    cfg.code.ring_width = a.ring_width;
    if (a.scale >= 0)         cfg.code.scale_factor = a.scale;
    if (a.max_chars >= 0)     cfg.code.max_chars = a.max_chars;
    if (a.quality >= 0)       cfg.encode.compression_quality = a.quality;
    if (a.min_anchor >= 0)    cfg.scan.min_anchor_radius = a.min_anchor;
    if (a.max_anchor >= 0)    cfg.scan.max_anchor_radius = a.max_anchor;
    if (a.mt >= 0)            cfg.scan.enable_multithreading = (a.mt != 0);
    if (!a.model_path.empty()) cfg.model_path = a.model_path;
}

static bool read_file(const fs::path& p, std::vector<uint8_t>& bytes) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return false;
    bytes.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return true;
}

static int run_encode(const Args& args, const kdcode::KDCodec& codec) {
    const kdcode::CodecConfig& cfg = codec.getConfig();

    msg::RasterImage img;
    msg::EncodeFault fault;
    const msg::EncodeStatus st = codec.encode(args.text, cfg.code, cfg.encode, img, &fault);
    if (st != msg::EncodeStatus::OK) {
        std::cerr << "[CLI] encode failed: " << msg::StatusStr(st);
        if (!fault.field.empty()) std::cerr << " (" << fault.field << ")";
        std::cerr << ": " << fault.detail << "\n";
        return EXIT_NO_CODE;
    }

    std::ofstream f(args.out_path, std::ios::binary);
    f.write(reinterpret_cast<const char*>(img.bytes.data()), static_cast<std::streamsize>(img.bytes.size()));
    if (!f) {
        std::cerr << "[CLI] cannot write " << args.out_path.string() << "\n";
        return EXIT_NO_CODE;
    }
    std::cout << "[CLI] wrote " << args.out_path.string() << "\n";
    return EXIT_OK;
}

static int run_decode(const Args& args, const kdcode::KDCodec& codec) {
    std::vector<uint8_t> bytes;
    if (!read_file(args.in_path, bytes)) {
        std::cerr << "[CLI] cannot read " << args.in_path.string() << "\n";
        return EXIT_NO_CODE;
    }

    const auto t0 = std::chrono::steady_clock::now();
    kdcode::DecodeReport report;
    const msg::DecodeStatus st = codec.decodeDetailed(bytes, codec.getConfig().scan, report);
    const auto t1 = std::chrono::steady_clock::now();
    const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    if (!args.annotate_path.empty()) {
        cv::Mat input = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
        cv::Mat vis;
        if (kdcode::annotateDetection(input, report, vis)) {
            if (!cv::imwrite(args.annotate_path.string(), vis)) {
                std::cerr << "[CLI] cannot write " << args.annotate_path.string() << "\n";
            }
        } else {
            std::cerr << "[CLI] nothing to annotate\n";
        }
    }

    std::cout << "[CLI] " << msg::StatusStr(st) << " in " << ms << " ms\n";
    if (st == msg::DecodeStatus::INVALID_INPUT) {
        return EXIT_USAGE;
    }
    if (st != msg::DecodeStatus::FOUND) {
        return EXIT_NO_CODE;
    }
    std::cout << report.text << "\n";
    return EXIT_OK;
}

// ---------------------------------------------------------------------------
// Batch: every image in a directory, results.txt in the same directory.
// ---------------------------------------------------------------------------
struct BatchResult {
    fs::path file;
    msg::DecodeStatus status = msg::DecodeStatus::NOT_FOUND;
    std::string text;
    double ms = 0.0;
};

struct BatchCtx {
    const kdcode::KDCodec* codec = nullptr;
    const std::vector<fs::path>* files = nullptr;
    std::vector<BatchResult>* results = nullptr;
    Rtos::Mutex* lock = nullptr;
    std::size_t* next = nullptr;
};

static void batch_worker(void* arg) {
    auto* ctx = static_cast<BatchCtx*>(arg);

    while (true) {
        ctx->lock->lock();
        const std::size_t idx = (*ctx->next)++;
        ctx->lock->unlock();
        if (idx >= ctx->files->size()) return;

        BatchResult& r = (*ctx->results)[idx];
        r.file = (*ctx->files)[idx];

        std::vector<uint8_t> bytes;
        if (!read_file(r.file, bytes)) {
            r.status = msg::DecodeStatus::INVALID_INPUT;
            continue;
        }
        const auto t0 = std::chrono::steady_clock::now();
        r.status = ctx->codec->decode(bytes, ctx->codec->getConfig().scan, r.text);
        const auto t1 = std::chrono::steady_clock::now();
        r.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    }
}

static bool is_image(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tif" || ext == ".tiff";
}

static int run_batch(const Args& args, const kdcode::KDCodec& codec) {
    std::error_code ec;
    if (!fs::is_directory(args.dir, ec)) {
        std::cerr << "[CLI] not a directory: " << args.dir.string() << "\n";
        return EXIT_USAGE;
    }

    std::vector<fs::path> files;
    for (const auto& e : fs::directory_iterator(args.dir, ec)) {
        if (e.is_regular_file() && is_image(e.path())) files.push_back(e.path());
    }
    std::sort(files.begin(), files.end());
    if (files.empty()) {
        std::cerr << "[CLI] no images in " << args.dir.string() << "\n";
        return EXIT_NO_CODE;
    }

    std::vector<BatchResult> results(files.size());
    Rtos::Mutex lock;
    std::size_t next = 0;
    BatchCtx ctx{&codec, &files, &results, &lock, &next};

    const int n_workers = std::min<int>(args.jobs, static_cast<int>(files.size()));
    std::vector<std::unique_ptr<Rtos::Task>> tasks;
    for (int i = 1; i < n_workers; ++i) {
        std::unique_ptr<Rtos::Task> t(new Rtos::Task);
        const std::string name = "kd_batch" + std::to_string(i);
        if (t->Create(name.c_str(), batch_worker, &ctx)) tasks.push_back(std::move(t));
    }
    batch_worker(&ctx);   // caller is worker 0
    for (auto& t : tasks) t->Join();

    const fs::path results_path = args.dir / "results.txt";
    std::ofstream rf(results_path);
    std::size_t found = 0;
    for (const auto& r : results) {
        if (r.status == msg::DecodeStatus::FOUND) ++found;
        rf << r.file.filename().string() << "\t" << msg::StatusStr(r.status) << "\t"
           << r.ms << "\t" << r.text << "\n";
    }
    if (!rf) {
        std::cerr << "[CLI] cannot write " << results_path.string() << "\n";
        return EXIT_NO_CODE;
    }

    std::cout << "[CLI] " << found << "/" << results.size() << " images decoded, see "
              << results_path.string() << "\n";
    return found > 0 ? EXIT_OK : EXIT_NO_CODE;
}

int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    kdcode::CodecConfig cfg;
    if (!args.config_file.empty()) {
        std::cout << "[CLI] loading configuration from " << args.config_file << "\n";
        if (!cfg.loadFromYaml(args.config_file, args.profile)) {
            return EXIT_USAGE;
        }
    }
    apply_overrides(args, cfg);
    if (!cfg.validate()) {
        return EXIT_USAGE;
    }

    std::shared_ptr<const kdcode::ErrorCorrectionModel> model;
    if (args.command != "encode") {
        model = kdcode::ErrorCorrectionModel::load(cfg.model_path);
    }
    const kdcode::KDCodec codec(cfg, model);

    if (args.command == "encode") return run_encode(args, codec);
    if (args.command == "decode") return run_decode(args, codec);
    return run_batch(args, codec);
}
