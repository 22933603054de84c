#pragma once
#include <opencv2/core.hpp>
#include "color_space.hpp"
#include "palette.hpp"
#include "region_sampler.hpp"
#include <random>
#include <vector>

// Construction-time parameters of the dominant color extractor
// - `clusters`: default number of clusters k (values below 1 are treated as 1)
// - `iterations`: number of k-means refinement rounds, always run in full
// - `stride`: sampling stride used to build the clustering population
// - `meanStride`: sampling stride of the single-mean fallback
// - `order`: channel order of the buffers passed to extract()
struct ExtractorConfig {
	int clusters = 3;
	int iterations = 10;
	int stride = 3;
	int meanStride = 2;
	ChannelOrder order = ORDER_RGB;
};

// Process-wide default random engine, seeded from std::random_device
// One instance per thread: the engine returned is the one of the calling thread
std::mt19937& defaultRandomEngine();

// Run k-means on a population of RGB pixels
//
// Centroids are seeded with `k` pixels drawn uniformly at random (with replacement) from the population.
// Each round assigns every pixel to its nearest centroid (Euclidean RGB distance, lowest index on ties)
// and moves each centroid to the mean of its members. A centroid that receives no member keeps its position.
//
// Args:
//   pixels: the population to cluster
//   k: number of centroids
//   iterations: number of assign/update rounds (no convergence test)
//   rng: random engine used for seeding
//
// Returns:
//   k centroids in RGB order (unrounded), or no centroid if the population is empty
std::vector<cv::Vec3d> kMeansCentroids(
	const std::vector<RgbColor>& pixels,
	int k,
	int iterations,
	std::mt19937& rng
);

// Extracts the dominant colors of an image region and labels them
class DominantColorExtractor {
public:
	// The extractor keeps its own copy of `classifier` and a reference to `rng`, which must outlive it.
	// An injected engine is not synchronized: share the extractor across threads only without one
	// Throws std::invalid_argument if iterations < 0 or a stride is below 1
	DominantColorExtractor(const PaletteClassifier& classifier, const ExtractorConfig& config, std::mt19937& rng);

	// Same, drawing from defaultRandomEngine() of the thread calling extract()
	explicit DominantColorExtractor(const PaletteClassifier& classifier, const ExtractorConfig& config = ExtractorConfig());

	// Extract up to k dominant colors of a region
	//
	// Args:
	//   frame: pixel buffer (cv::Mat, CV_8UC3 or CV_8UC4, channel order from the config)
	//   x, y, width, height: the region, clipped to the buffer
	//   k: number of clusters, overriding the configured one
	//
	// Returns:
	//   If the sampled population is smaller than k, exactly one result: the classification of the region mean.
	//   Otherwise one result per centroid, with LABEL_UNKNOWN results removed (possibly none left).
	std::vector<ColorResult> extract(const cv::Mat& frame, int x, int y, int width, int height) const;
	std::vector<ColorResult> extract(const cv::Mat& frame, int x, int y, int width, int height, int k) const;

	const ExtractorConfig& config() const { return cfg; }

private:
	PaletteClassifier classifier;
	ExtractorConfig cfg;
	std::mt19937* rng; // nullptr: use the calling thread's default engine
};
