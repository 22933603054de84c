#include "config.hpp"
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <stdexcept>

namespace {

void readReal(const cv::FileNode& parent, const char* key, double& value)
{
	cv::FileNode node = parent[key];
	if (node.empty()) return;
	if (!node.isReal() && !node.isInt())
		throw std::invalid_argument(std::string("Config key '") + key + "' must be a number");
	value = (double)node;
}

void readInt(const cv::FileNode& parent, const char* key, int& value)
{
	cv::FileNode node = parent[key];
	if (node.empty()) return;
	if (!node.isInt())
		throw std::invalid_argument(std::string("Config key '") + key + "' must be an integer");
	value = (int)node;
}

bool readString(const cv::FileNode& parent, const char* key, std::string& value)
{
	cv::FileNode node = parent[key];
	if (node.empty()) return false;
	if (!node.isString())
		throw std::invalid_argument(std::string("Config key '") + key + "' must be a string");
	value = (std::string)node;
	return true;
}

Palette readPalette(const cv::FileNode& node)
{
	if (!node.isSeq())
		throw std::invalid_argument("Config key 'palette' must be a sequence of { label, hue } entries");

	Palette palette;
	for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it) {
		cv::FileNode entry = *it;
		std::string name;
		double hue = 0.0;
		if (!readString(entry, "label", name))
			throw std::invalid_argument("Palette entry is missing its 'label'");
		if (entry["hue"].empty())
			throw std::invalid_argument("Palette entry '" + name + "' is missing its 'hue'");
		readReal(entry, "hue", hue);
		palette.push_back(PaletteEntry{ colorLabelFromName(name), hue });
	}
	return palette;
}

void readClassifier(const cv::FileNode& node, ClassifierConfig& cfg)
{
	if (node.empty()) return;

	readReal(node, "saturation_threshold", cfg.saturationThreshold);
	readReal(node, "value_threshold", cfg.valueThreshold);
	readReal(node, "achromatic_confidence", cfg.achromaticConfidence);
	readReal(node, "confidence_radius", cfg.confidenceRadius);
	readReal(node, "confidence_floor", cfg.confidenceFloor);

	int reject = cfg.rejectBelowFloor ? 1 : 0;
	readInt(node, "reject_below_floor", reject);
	cfg.rejectBelowFloor = (reject != 0);

	std::string preset;
	if (readString(node, "palette_preset", preset)) {
		if (preset == "standard")
			cfg.palette = standardPalette();
		else if (preset == "merged_purple")
			cfg.palette = mergedPurplePalette();
		else
			throw std::invalid_argument("Unknown palette preset: " + preset);
	}

	// An explicit palette wins over the preset
	if (!node["palette"].empty())
		cfg.palette = readPalette(node["palette"]);
}

void readExtractor(const cv::FileNode& node, ExtractorConfig& cfg)
{
	if (node.empty()) return;

	readInt(node, "clusters", cfg.clusters);
	readInt(node, "iterations", cfg.iterations);
	readInt(node, "stride", cfg.stride);
	readInt(node, "mean_stride", cfg.meanStride);

	std::string order;
	if (readString(node, "channel_order", order)) {
		if (order == "rgb")
			cfg.order = ORDER_RGB;
		else if (order == "bgr")
			cfg.order = ORDER_BGR;
		else
			throw std::invalid_argument("Unknown channel order: " + order);
	}
}

EngineConfig readEngineConfig(const cv::FileStorage& fs)
{
	EngineConfig config;
	readClassifier(fs["classifier"], config.classifier);
	readExtractor(fs["extractor"], config.extractor);
	return config;
}

} // namespace

EngineConfig loadEngineConfig(const std::string& path)
{
	cv::FileStorage fs(path, cv::FileStorage::READ);
	if (!fs.isOpened())
		throw std::runtime_error("Could not open engine config: " + path);

	EngineConfig config = readEngineConfig(fs);
	CV_LOG_INFO(NULL, "Loaded engine config from " << path << " (" << config.classifier.palette.size()
		<< " palette entries, k=" << config.extractor.clusters << ")");
	return config;
}

EngineConfig parseEngineConfig(const std::string& text)
{
	cv::FileStorage fs(text, cv::FileStorage::READ | cv::FileStorage::MEMORY);
	if (!fs.isOpened())
		throw std::invalid_argument("Engine config text could not be parsed");
	return readEngineConfig(fs);
}
