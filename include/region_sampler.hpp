#pragma once
#include <opencv2/core.hpp>
#include "color_space.hpp"
#include "palette.hpp"
#include <vector>

// Channel order of the pixel buffer
// ORDER_RGB also covers RGBA buffers (e.g. canvas image data), ORDER_BGR also covers BGRA (OpenCV native order)
enum ChannelOrder { ORDER_RGB = 0, ORDER_BGR = 1 };

// Region sampling functions
//
// Common args:
//   frame: pixel buffer (cv::Mat, CV_8UC3 or CV_8UC4)
//   x, y, width, height: the region. It may extend past the buffer or have a negative size;
//                        only the part inside the buffer is sampled, possibly nothing
//   stride: sample every `stride`-th row and column, starting at the region origin
//   order: channel order of the buffer
//
// All of them throw std::invalid_argument if the buffer is empty, has an unsupported type,
// or if stride < 1.

// Average color of a region
//
// Returns:
//   The per-channel mean rounded to the nearest integer, or RgbColor{0, 0, 0} if no pixel was sampled
RgbColor sampleMean(
	const cv::Mat& frame,
	int x,
	int y,
	int width,
	int height,
	int stride = 2,
	ChannelOrder order = ORDER_RGB
);

// Collect the sampled pixels of a region, used as the population for clustering
//
// Returns:
//   The sampled pixels in row-major order (empty if the region does not intersect the buffer)
std::vector<RgbColor> samplePixels(
	const cv::Mat& frame,
	int x,
	int y,
	int width,
	int height,
	int stride = 3,
	ChannelOrder order = ORDER_RGB
);

// Classify the average color of a region
//
// Returns:
//   The classification of the mean color. An empty region yields LABEL_UNKNOWN with
//   confidence 0 and zero RGB/HSV.
ColorResult analyzeRegionColor(
	const cv::Mat& frame,
	int x,
	int y,
	int width,
	int height,
	const PaletteClassifier& classifier,
	int stride = 2,
	ChannelOrder order = ORDER_RGB
);
