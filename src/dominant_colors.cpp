#include "dominant_colors.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

std::mt19937& defaultRandomEngine()
{
	// Created on first use in each thread, seeded from the OS entropy source
	thread_local std::mt19937 gen{ std::random_device{}() };
	return gen;
}

std::vector<cv::Vec3d> kMeansCentroids(
	const std::vector<RgbColor>& pixels,
	int k,
	int iterations,
	std::mt19937& rng)
{
	std::vector<cv::Vec3d> centroids;
	if (pixels.empty() || k <= 0) return centroids;

	// Seed the centroids with random pixels. Drawing with replacement fills all k slots
	// even when the population has fewer distinct pixels than k
	std::uniform_int_distribution<size_t> pick(0, pixels.size() - 1);
	centroids.reserve(k);
	for (int i = 0; i < k; ++i) {
		const RgbColor& p = pixels[pick(rng)];
		centroids.push_back(cv::Vec3d(p.r, p.g, p.b));
	}

	std::vector<cv::Vec3d> sums(k);
	std::vector<int> counts(k);

	for (int iter = 0; iter < iterations; ++iter) {
		std::fill(sums.begin(), sums.end(), cv::Vec3d(0.0, 0.0, 0.0));
		std::fill(counts.begin(), counts.end(), 0);

		// Assignment step: find the nearest centroid of every pixel
		for (const RgbColor& p : pixels) {
			cv::Vec3d v(p.r, p.g, p.b);

			int bestIdx = 0;
			double bestDist2 = std::numeric_limits<double>::max();
			for (int ci = 0; ci < k; ++ci) {
				cv::Vec3d diff = v - centroids[ci];
				double d2 = diff.dot(diff); // Squared Euclidean distance in RGB space
				if (d2 < bestDist2) { bestDist2 = d2; bestIdx = ci; }
			}

			sums[bestIdx] += v;
			counts[bestIdx]++;
		}

		// Update step: move each centroid to the mean of its members
		// A centroid with no members stays where it is
		for (int ci = 0; ci < k; ++ci) {
			if (counts[ci] > 0) {
				double n = (double)counts[ci];
				centroids[ci] = cv::Vec3d(sums[ci][0] / n, sums[ci][1] / n, sums[ci][2] / n);
			}
		}
	}

	return centroids;
}

DominantColorExtractor::DominantColorExtractor(const PaletteClassifier& classifier, const ExtractorConfig& config, std::mt19937& rng)
	: classifier(classifier), cfg(config), rng(&rng)
{
	if (cfg.iterations < 0)
		throw std::invalid_argument("DominantColorExtractor: iterations must not be negative");
	if (cfg.stride < 1 || cfg.meanStride < 1)
		throw std::invalid_argument("DominantColorExtractor: sampling strides must be at least 1");
	if (cfg.clusters <= 0) cfg.clusters = 1;
}

DominantColorExtractor::DominantColorExtractor(const PaletteClassifier& classifier, const ExtractorConfig& config)
	: DominantColorExtractor(classifier, config, defaultRandomEngine())
{
	rng = nullptr; // Resolved per call, on the calling thread
}

std::vector<ColorResult> DominantColorExtractor::extract(const cv::Mat& frame, int x, int y, int width, int height) const
{
	return extract(frame, x, y, width, height, cfg.clusters);
}

std::vector<ColorResult> DominantColorExtractor::extract(const cv::Mat& frame, int x, int y, int width, int height, int k) const
{
	if (k <= 0) k = 1;

	std::vector<RgbColor> pixels = samplePixels(frame, x, y, width, height, cfg.stride, cfg.order);

	// Too few pixels to cluster: classify the region mean instead
	if ((int)pixels.size() < k) {
		CV_LOG_DEBUG(NULL, "Only " << pixels.size() << " pixels sampled for k=" << k << ", using the region mean");
		return { analyzeRegionColor(frame, x, y, width, height, classifier, cfg.meanStride, cfg.order) };
	}

	std::mt19937& gen = rng ? *rng : defaultRandomEngine();
	std::vector<cv::Vec3d> centroids = kMeansCentroids(pixels, k, cfg.iterations, gen);

	std::vector<ColorResult> results;
	results.reserve(centroids.size());
	for (const cv::Vec3d& c : centroids) {
		ColorResult result;
		result.hsv = rgbToHsv(c[0], c[1], c[2]); // Classify the unrounded centroid
		result.rgb = RgbColor{ (int)std::floor(c[0] + 0.5), (int)std::floor(c[1] + 0.5), (int)std::floor(c[2] + 0.5) };

		Classification cls = classifier.classify(result.hsv);
		result.label = cls.label;
		result.confidence = cls.confidence;

		CV_LOG_DEBUG(NULL, "Dominant HSV: H=" << cvRound(result.hsv.h) << " => " << colorLabelName(result.label));

		// Achromatic or rejected centroids are not reported
		if (result.label != LABEL_UNKNOWN)
			results.push_back(result);
	}
	return results;
}
