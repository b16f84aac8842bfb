#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/kdcode/CodecConfig.hpp"
#include "msg/BitStream.hpp"
#include "msg/CodecStatus.hpp"
#include "msg/DetectedGeometry.hpp"
#include "msg/RasterImage.hpp"
#include "msg/SampledBit.hpp"

namespace kdcode {

// Everything a decode attempt produced, for debugging and annotation.
struct DecodeReport {
    msg::DecodeStatus status = msg::DecodeStatus::NOT_FOUND;
    std::string text;

    bool localized = false;
    msg::DetectedGeometry geometry{};   // working-frame coordinates
    int segments = 0;

    std::vector<msg::SampledBit> samples;
    msg::BitStream bits;                // after correction
};

// ---------------------------------------------------------------------------
// KDCodec: the two entry points. Holds the stage objects and the shared
// model handle; encode/decode are const and keep no per-call state.
// ---------------------------------------------------------------------------
class KDCodec {
public:
    explicit KDCodec(const CodecConfig& cfg = {},
                     std::shared_ptr<const ErrorCorrectionModel> model = nullptr);

    const CodecConfig& getConfig() const { return m_cfg; }
    bool hasModel() const { return m_corrector.hasModel(); }

    msg::EncodeStatus encode(const std::string& text,
                             const msg::CodeParameters& params,
                             msg::RasterImage& out,
                             msg::EncodeFault* fault = nullptr) const;

    msg::EncodeStatus encode(const std::string& text,
                             const msg::CodeParameters& params,
                             const msg::EncodeOptions& options,
                             msg::RasterImage& out,
                             msg::EncodeFault* fault = nullptr) const;

    // FOUND fills 'text'. NOT_FOUND is the normal "no code" outcome.
    msg::DecodeStatus decode(const std::vector<uint8_t>& image_bytes,
                             const msg::ScanParameters& scan,
                             std::string& text) const;

    msg::DecodeStatus decodeDetailed(const std::vector<uint8_t>& image_bytes,
                                     const msg::ScanParameters& scan,
                                     DecodeReport& report) const;

    // Same pipeline on an already decoded image (1/3/4 channels, 8/16 bit).
    msg::DecodeStatus decodeImage(const cv::Mat& image,
                                  const msg::ScanParameters& scan,
                                  DecodeReport& report) const;

    static bool validateScanParameters(const msg::ScanParameters& scan, std::string* why = nullptr);

    const Rasterizer& rasterizer() const { return m_rasterizer; }
    const ErrorCorrector& corrector() const { return m_corrector; }

private:
    CodecConfig m_cfg{};

    Rasterizer          m_rasterizer;
    ImagePreprocessor   m_preprocessor;
    ShapeLocalizer      m_localizer;
    OrientationResolver m_orientation;
    RingSampler         m_sampler;
    ErrorCorrector      m_corrector;

    msg::DecodeStatus runPipeline(const cv::Mat& image,
                                  const msg::ScanParameters& scan,
                                  DecodeReport& report) const;
};

// BGR copy of 'input' with the detected circles, segment-0 ray and sample
// points (green = 1, red = 0) drawn in input coordinates.
bool annotateDetection(const cv::Mat& input, const DecodeReport& report, cv::Mat& out);

} // namespace kdcode
