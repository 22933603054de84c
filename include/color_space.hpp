#pragma once

// An 8-bit RGB color, each channel in [0, 255]
struct RgbColor {
	int r = 0;
	int g = 0;
	int b = 0;
};

// A color in HSV space
// - `h`: hue in degrees, [0, 360). Set to 0 for achromatic colors (s == 0)
// - `s`: saturation in percent, [0, 100]
// - `v`: value (brightness) in percent, [0, 100]
struct HsvColor {
	double h = 0.0;
	double s = 0.0;
	double v = 0.0;
};

// Convert an RGB color to HSV
//
// The channels are taken as doubles so that unrounded cluster centroids can be converted too.
// When several channels share the maximum, the hue sector is chosen from the first of them in r, g, b order.
//
// Args:
//   r, g, b: channel values in [0, 255]
//
// Returns:
//   The HSV representation of the color
HsvColor rgbToHsv(double r, double g, double b);

inline HsvColor rgbToHsv(const RgbColor& rgb) { return rgbToHsv(rgb.r, rgb.g, rgb.b); }
