#include "region_sampler.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

// Check the buffer and stride before any pixel is touched
void validateBuffer(const cv::Mat& frame, int stride)
{
	if (frame.empty())
		throw std::invalid_argument("Region sampling requires a non-empty pixel buffer");
	if (frame.type() != CV_8UC3 && frame.type() != CV_8UC4)
		throw std::invalid_argument("Region sampling supports only CV_8UC3 and CV_8UC4 buffers");
	if (stride < 1)
		throw std::invalid_argument("Region sampling stride must be at least 1");
}

// Clip one axis of the region to [0, limit) while keeping the stride anchored at the region origin
// Sets [first, end) to the coordinates to visit; the range is empty if nothing lies inside the buffer
void clipAxis(int origin, int size, int limit, int stride, long long& first, long long& end)
{
	first = origin;
	if (first < 0) {
		long long steps = (-first + stride - 1) / stride; // Skip whole strides until we are inside the buffer
		first += steps * stride;
	}
	end = std::min<long long>((long long)origin + size, limit);
}

// Visit every sampled pixel of the region, passing its color in RGB order to `visit`
template<class F>
void forEachSample(const cv::Mat& frame, int x, int y, int width, int height, int stride, ChannelOrder order, F&& visit)
{
	validateBuffer(frame, stride);

	long long rowFirst, rowEnd, colFirst, colEnd;
	clipAxis(y, height, frame.rows, stride, rowFirst, rowEnd);
	clipAxis(x, width, frame.cols, stride, colFirst, colEnd);

	const int channels = frame.channels();
	const int rIdx = (order == ORDER_BGR) ? 2 : 0;
	const int bIdx = (order == ORDER_BGR) ? 0 : 2;

	// First go row by row
	for (long long py = rowFirst; py < rowEnd; py += stride) {
		const uchar* row = frame.ptr<uchar>((int)py); // Pointer to the current row of the buffer

		// Then every stride-th pixel in the row
		for (long long px = colFirst; px < colEnd; px += stride) {
			const uchar* pix = row + px * channels;
			visit(RgbColor{ pix[rIdx], pix[1], pix[bIdx] });
		}
	}
}

// Per-channel sums over the sampled pixels of a region
struct RegionSums {
	long long r = 0, g = 0, b = 0;
	long long count = 0;
};

RegionSums sumRegion(const cv::Mat& frame, int x, int y, int width, int height, int stride, ChannelOrder order)
{
	RegionSums sums;
	forEachSample(frame, x, y, width, height, stride, order, [&](const RgbColor& c) {
		sums.r += c.r;
		sums.g += c.g;
		sums.b += c.b;
		++sums.count;
		});
	return sums;
}

// Rounded mean of the sums (half up), zero color for an empty region
RgbColor meanOf(const RegionSums& sums)
{
	if (sums.count == 0) return RgbColor{ 0, 0, 0 };

	RgbColor mean;
	mean.r = (int)std::floor((double)sums.r / (double)sums.count + 0.5);
	mean.g = (int)std::floor((double)sums.g / (double)sums.count + 0.5);
	mean.b = (int)std::floor((double)sums.b / (double)sums.count + 0.5);
	return mean;
}

} // namespace

RgbColor sampleMean(
	const cv::Mat& frame,
	int x,
	int y,
	int width,
	int height,
	int stride,
	ChannelOrder order)
{
	return meanOf(sumRegion(frame, x, y, width, height, stride, order));
}

std::vector<RgbColor> samplePixels(
	const cv::Mat& frame,
	int x,
	int y,
	int width,
	int height,
	int stride,
	ChannelOrder order)
{
	std::vector<RgbColor> pixels;
	forEachSample(frame, x, y, width, height, stride, order, [&](const RgbColor& c) { pixels.push_back(c); });
	return pixels;
}

ColorResult analyzeRegionColor(
	const cv::Mat& frame,
	int x,
	int y,
	int width,
	int height,
	const PaletteClassifier& classifier,
	int stride,
	ChannelOrder order)
{
	RegionSums sums = sumRegion(frame, x, y, width, height, stride, order);

	ColorResult result;
	if (sums.count == 0) {
		CV_LOG_DEBUG(NULL, "Empty region at (" << x << ", " << y << ") size " << width << "x" << height);
		return result; // LABEL_UNKNOWN, confidence 0, zero RGB/HSV
	}

	result.rgb = meanOf(sums);
	result.hsv = rgbToHsv(result.rgb);

	CV_LOG_DEBUG(NULL, "Region HSV: H=" << cvRound(result.hsv.h) << ", S=" << cvRound(result.hsv.s)
		<< ", V=" << cvRound(result.hsv.v));

	Classification c = classifier.classify(result.hsv);
	result.label = c.label;
	result.confidence = c.confidence;
	return result;
}
