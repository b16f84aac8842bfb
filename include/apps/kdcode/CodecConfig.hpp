#pragma once
#include <string>

#include <yaml-cpp/yaml.h>

#include "apps/kdcode/ErrorCorrector.hpp"
#include "apps/kdcode/ImagePreprocessor.hpp"
#include "apps/kdcode/OrientationResolver.hpp"
#include "apps/kdcode/Rasterizer.hpp"
#include "apps/kdcode/RingSampler.hpp"
#include "apps/kdcode/ShapeLocalizer.hpp"
#include "msg/CodeParameters.hpp"

namespace kdcode {

// ---------------------------------------------------------------------------
// CodecConfig: default code/scan parameters plus every stage's tunables.
// Stage sections map 1:1 onto the XxxConfig structs; keys are lower case.
// ---------------------------------------------------------------------------
struct CodecConfig {
    msg::CodeParameters code{};
    msg::EncodeOptions  encode{};
    msg::ScanParameters scan{};

    RasterizerConfig     rasterizer{};
    PreprocessorConfig   preprocess{};
    ShapeLocalizerConfig localizer{};
    OrientationConfig    orientation{};
    RingSamplerConfig    sampler{};
    ErrorCorrectorConfig corrector{};

    std::string model_path = "models/kd_error_correction_model.yml";

    /**
     * @brief Load from a YAML file; root keys first, then the named entry
     *        under 'profiles:' on top. An unknown profile is an error.
     */
    bool loadFromYaml(const std::string& yaml_path, const std::string& profile_name = "");

    // Keys missing from 'node' keep their current value.
    bool loadFromNode(const YAML::Node& node);

    // Checks code/scan parameters; stage tunables are clamped by the stages.
    bool validate() const;

    void print() const;
};

} // namespace kdcode
