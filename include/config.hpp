#pragma once
#include "palette.hpp"
#include "dominant_colors.hpp"
#include <string>

// Full set of engine parameters, as read from a configuration file
struct EngineConfig {
	ClassifierConfig classifier;
	ExtractorConfig extractor;
};

// Read an engine configuration through cv::FileStorage (YAML, JSON or XML)
//
// Recognized keys (all optional, missing keys keep their defaults):
//   classifier:
//     saturation_threshold, value_threshold, achromatic_confidence, confidence_radius: reals
//     reject_below_floor: int (0 or 1), confidence_floor: real
//     palette_preset: "standard" or "merged_purple"
//     palette: sequence of { label: <name>, hue: <degrees> }, overrides palette_preset
//   extractor:
//     clusters, iterations, stride, mean_stride: ints
//     channel_order: "rgb" or "bgr"
//
// Throws std::runtime_error if the file cannot be opened and std::invalid_argument for
// unknown label names, presets, channel orders or values of the wrong type.
// Malformed documents raise the cv::Exception thrown by the OpenCV parser.
EngineConfig loadEngineConfig(const std::string& path);

// Same as loadEngineConfig, reading the document from a string instead of a file
EngineConfig parseEngineConfig(const std::string& text);
