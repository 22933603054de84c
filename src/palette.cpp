#include "palette.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

Palette standardPalette()
{
	return Palette{
		{ LABEL_RED, 0.0 },
		{ LABEL_ORANGE, 30.0 },
		{ LABEL_YELLOW, 55.0 },
		{ LABEL_SKY_BLUE, 195.0 },
		{ LABEL_PURPLE, 275.0 },
	};
}

Palette mergedPurplePalette()
{
	return Palette{
		{ LABEL_RED, 0.0 },
		{ LABEL_ORANGE, 25.0 },
		{ LABEL_YELLOW, 50.0 },
		{ LABEL_SKY_BLUE, 175.0 }, // Cyan / sky only
		{ LABEL_PURPLE, 210.0 },   // Light blue
		{ LABEL_PURPLE, 250.0 },   // Blue
		{ LABEL_PURPLE, 290.0 },   // Violet
	};
}

std::string colorLabelName(ColorLabel label)
{
	switch (label) {
	case LABEL_RED: return "red";
	case LABEL_ORANGE: return "orange";
	case LABEL_YELLOW: return "yellow";
	case LABEL_SKY_BLUE: return "sky_blue";
	case LABEL_PURPLE: return "purple";
	case LABEL_UNKNOWN: return "unknown";
	default:
		throw std::invalid_argument("Unknown color label in colorLabelName");
	}
}

ColorLabel colorLabelFromName(const std::string& name)
{
	static const ColorLabel all[] = { LABEL_RED, LABEL_ORANGE, LABEL_YELLOW, LABEL_SKY_BLUE, LABEL_PURPLE, LABEL_UNKNOWN };
	for (ColorLabel label : all)
		if (colorLabelName(label) == name) return label;
	throw std::invalid_argument("Unknown color label name: " + name);
}

PaletteClassifier::PaletteClassifier(const ClassifierConfig& config) : cfg(config)
{
	if (!(cfg.confidenceRadius > 0.0))
		throw std::invalid_argument("PaletteClassifier: confidence radius must be positive");
	if (cfg.saturationThreshold < 0.0 || cfg.valueThreshold < 0.0)
		throw std::invalid_argument("PaletteClassifier: achromatic thresholds must not be negative");
	if (cfg.confidenceFloor < 0.0 || cfg.confidenceFloor > 1.0)
		throw std::invalid_argument("PaletteClassifier: confidence floor must be in [0, 1]");
	if (cfg.achromaticConfidence < 0.0 || cfg.achromaticConfidence > 1.0)
		throw std::invalid_argument("PaletteClassifier: achromatic confidence must be in [0, 1]");

	// Reference hues are kept in [0, 360) so circular distances stay within [0, 180]
	for (PaletteEntry& entry : cfg.palette) {
		if (!std::isfinite(entry.hue))
			throw std::invalid_argument("PaletteClassifier: palette hue must be finite");
		entry.hue = std::fmod(entry.hue, 360.0);
		if (entry.hue < 0.0) entry.hue += 360.0;
		if (entry.hue >= 360.0) entry.hue -= 360.0;
	}
}

ColorLabel PaletteClassifier::nearestLabel(double h, double& minDistance) const
{
	// Bring the hue into [0, 360) so that h and h + 360 behave the same
	// A non-finite hue carries no angle and is read as 0
	h = std::isfinite(h) ? std::fmod(h, 360.0) : 0.0;
	if (h < 0.0) h += 360.0;
	if (h >= 360.0) h -= 360.0;

	minDistance = std::numeric_limits<double>::infinity();
	ColorLabel closest = LABEL_UNKNOWN;

	for (const PaletteEntry& entry : cfg.palette) {
		// Circular hue distance
		double dist = std::abs(h - entry.hue);
		if (dist > 180.0) dist = 360.0 - dist;

		// Red sits on both ends of the hue wheel
		if (entry.label == LABEL_RED)
			dist = std::min(dist, std::abs(h - 360.0));

		// Strict comparison: the first entry wins ties
		if (dist < minDistance) {
			minDistance = dist;
			closest = entry.label;
		}
	}
	return closest;
}

Classification PaletteClassifier::classify(double h, double s, double v) const
{
	// Gray, black and white carry no usable hue
	if (s < cfg.saturationThreshold || v < cfg.valueThreshold)
		return Classification{ LABEL_UNKNOWN, cfg.achromaticConfidence };

	if (cfg.palette.empty())
		return Classification{ LABEL_UNKNOWN, 0.0 };

	double minDistance = 0.0;
	ColorLabel label = nearestLabel(h, minDistance);

	double confidence = std::max(0.0, 1.0 - minDistance / cfg.confidenceRadius);

	if (cfg.rejectBelowFloor && confidence < cfg.confidenceFloor)
		label = LABEL_UNKNOWN;

	return Classification{ label, confidence };
}

ColorLabel PaletteClassifier::forceClassify(double h) const
{
	double minDistance = 0.0;
	return nearestLabel(h, minDistance);
}
