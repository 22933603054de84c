#include "color_space.hpp"
#include <algorithm>
#include <cmath>

HsvColor rgbToHsv(double r, double g, double b)
{
	// Normalize to the [0, 1] range
	r /= 255.0;
	g /= 255.0;
	b /= 255.0;

	double max = std::max(r, std::max(g, b));
	double min = std::min(r, std::min(g, b));
	double diff = max - min;

	HsvColor hsv;
	hsv.v = max * 100.0;
	hsv.s = (max == 0.0) ? 0.0 : diff / max * 100.0;

	if (diff != 0.0) {
		// Pick the hue sector from the first channel holding the maximum (r, then g, then b)
		if (max == r)
			hsv.h = 60.0 * std::fmod((g - b) / diff, 6.0);
		else if (max == g)
			hsv.h = 60.0 * ((b - r) / diff + 2.0);
		else
			hsv.h = 60.0 * ((r - g) / diff + 4.0);
	}

	if (hsv.h < 0.0) hsv.h += 360.0;
	if (hsv.h >= 360.0) hsv.h -= 360.0; // A tiny negative hue can round up to exactly 360

	return hsv;
}
