#pragma once
#include "color_space.hpp"
#include <string>
#include <vector>

// The closed set of color labels the engine can produce
// LABEL_UNKNOWN is returned for achromatic colors (gray, black, white), empty regions and rejected matches
enum ColorLabel { LABEL_RED = 0, LABEL_ORANGE = 1, LABEL_YELLOW = 2, LABEL_SKY_BLUE = 3, LABEL_PURPLE = 4, LABEL_UNKNOWN = 5 };

// A reference hue in the palette and the label it maps to
// Several entries may map to the same label
struct PaletteEntry {
	ColorLabel label;
	double hue;
};

// Ordered list of palette entries. On equal hue distance the earlier entry wins
typedef std::vector<PaletteEntry> Palette;

// Red 0, orange 30, yellow 55, sky blue 195, purple 275
Palette standardPalette();

// Palette where light blue, blue and violet hues all collapse into LABEL_PURPLE and only
// cyan-ish hues count as sky blue
Palette mergedPurplePalette();

// Stable lowercase name of a label ("red", "orange", "yellow", "sky_blue", "purple", "unknown")
std::string colorLabelName(ColorLabel label);

// Inverse of colorLabelName. Throws std::invalid_argument for names outside the label set
ColorLabel colorLabelFromName(const std::string& name);

// Result of classifying one color
// - `label`: the classified label
// - `confidence`: in [0, 1], 1 meaning an exact hit on a palette reference hue
// - `rgb`, `hsv`: the color that was classified
struct ColorResult {
	ColorLabel label = LABEL_UNKNOWN;
	double confidence = 0.0;
	RgbColor rgb;
	HsvColor hsv;
};

// Construction-time parameters of the classifier
// - `saturationThreshold`, `valueThreshold`: colors with s or v below these (percent) are achromatic
// - `achromaticConfidence`: confidence reported for achromatic colors
// - `confidenceRadius`: hue distance (degrees) at which confidence reaches zero
// - `rejectBelowFloor`: when set, matches with confidence below `confidenceFloor` are downgraded to LABEL_UNKNOWN
// - `palette`: reference hues to classify against
struct ClassifierConfig {
	double saturationThreshold = 8.0;
	double valueThreshold = 15.0;
	double achromaticConfidence = 0.5;
	double confidenceRadius = 60.0;
	bool rejectBelowFloor = false;
	double confidenceFloor = 0.3;
	Palette palette = standardPalette();
};

struct Classification {
	ColorLabel label;
	double confidence;
};

// Maps HSV colors to the nearest palette label by circular hue distance
class PaletteClassifier {
public:
	// Throws std::invalid_argument when the configuration is out of range
	// (non-positive radius, negative thresholds, floor or achromatic confidence outside [0, 1],
	// non-finite palette hue). Palette hues are normalized into [0, 360)
	explicit PaletteClassifier(const ClassifierConfig& config = ClassifierConfig());

	// Classify a color given in HSV
	//
	// Args:
	//   h: hue in degrees (any value, normalized into [0, 360); NaN and infinities are read as 0)
	//   s, v: saturation and value in percent
	//
	// Returns:
	//   The nearest palette label and its confidence, LABEL_UNKNOWN for achromatic colors,
	//   an empty palette, or (if enabled) a confidence below the floor
	Classification classify(double h, double s, double v) const;

	Classification classify(const HsvColor& hsv) const { return classify(hsv.h, hsv.s, hsv.v); }

	// Nearest palette label for a hue, ignoring the achromatic gate and the confidence floor
	// Only returns LABEL_UNKNOWN when the palette is empty. A non-finite hue is read as 0
	ColorLabel forceClassify(double h) const;

	const ClassifierConfig& config() const { return cfg; }

private:
	ClassifierConfig cfg;

	// Nearest-hue search shared by classify and forceClassify
	// Writes the best distance to `minDistance` (infinity for an empty palette)
	ColorLabel nearestLabel(double h, double& minDistance) const;
};
