#pragma once
#ifndef hm_runconfig_h
#define hm_runconfig_h

#include"RasterSource.hpp"
#include"RandomForest.hpp"
#include"RasterAlgos.hpp"

namespace YAML {
	class Node;
}

namespace himal {

	//a composite built from a manifest of images
	struct ImageryConfig {
		std::filesystem::path manifest;
		DateRange dates;
		std::vector<std::string> bands;
		std::optional<double> maxCloudCoverPercent;
		Reducer reducer = Reducer::median;
	};

	struct WaterConfig {
		bool enabled = false;
		ImageryConfig imagery;
		std::string bandA = "B3";
		std::string bandB = "B8";
		double threshold = 0.3;
		Connectivity connectivity = Connectivity::eight;
	};

	struct TerrainConfig {
		bool enabled = false;
		std::filesystem::path dem;
		coord_t metersPerUnit = 1;
	};

	struct GlacierConfig {
		bool enabled = false;
		//optional; glacier outlines to clip to the study area
		std::filesystem::path outlines;
		double snowlineElevation = 3000;
		double velocityFactor = 0.02;
	};

	//a time series of one band, reduced over the study area, plus a summary raster
	struct SeriesConfig {
		bool enabled = false;
		ImageryConfig imagery;
		std::string band;
		PeriodType period = PeriodType::month;
		coord_t scale = 0;
		//applied to the series values and the summary raster
		double valueMultiplier = 1;
		std::string valueColumn = "value";
	};

	struct ProblemConfig {
		std::string name;
		//x, y, class, in the CRS of the study area
		std::vector<std::array<double, 3>> points;
		std::filesystem::path pointsFile;
		std::string classField = "class";
	};

	struct ClassificationConfig {
		bool enabled = false;
		ImageryConfig imagery;
		ForestParams forest;
		std::vector<ProblemConfig> problems;
	};

	struct RunConfig {
		std::string logLevel = "info";
		std::filesystem::path studyArea;
		std::filesystem::path outputDir = "output";

		WaterConfig water;
		TerrainConfig terrain;
		GlacierConfig glacier;
		SeriesConfig precipitation;
		SeriesConfig temperature;
		ClassificationConfig classification;
	};

	//Relative paths are resolved against baseDir
	//throws InvalidConfigException for missing required keys and values that can't be used; out-of-range tunables are clamped with a warning
	RunConfig parseRunConfig(const YAML::Node& root, const std::filesystem::path& baseDir = {});
	RunConfig loadRunConfig(const std::filesystem::path& file);

	//the checks run by parseRunConfig; exposed for configs built in code
	void validateRunConfig(RunConfig& cfg);
}

#endif
