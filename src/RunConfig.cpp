#include"RunConfig.hpp"

#include<yaml-cpp/yaml.h>

namespace himal {
	namespace {

		template<typename T>
		void load(const YAML::Node& node, const std::string& key, T& value) {
			if (node[key]) {
				value = node[key].as<T>();
			}
		}

		void loadPath(const YAML::Node& node, const std::string& key, std::filesystem::path& value, const std::filesystem::path& baseDir) {
			if (node[key]) {
				std::filesystem::path p = node[key].as<std::string>();
				value = p.is_absolute() || baseDir.empty() ? p : baseDir / p;
			}
		}

		template<typename T>
		T require(const YAML::Node& node, const std::string& section, const std::string& key) {
			if (!node[key]) {
				throw InvalidConfigException(section + "." + key + " is required");
			}
			return node[key].as<T>();
		}

		Reducer parseReducer(const std::string& s) {
			if (s == "mean") return Reducer::mean;
			if (s == "median") return Reducer::median;
			throw InvalidConfigException("Unknown reducer '" + s + "'");
		}

		PeriodType parsePeriod(const std::string& s) {
			if (s == "month") return PeriodType::month;
			if (s == "year") return PeriodType::year;
			if (s == "day") return PeriodType::day;
			throw InvalidConfigException("Unknown period '" + s + "'");
		}

		Connectivity parseConnectivity(int n) {
			if (n == 4) return Connectivity::four;
			if (n == 8) return Connectivity::eight;
			throw InvalidConfigException("Connectivity must be 4 or 8");
		}

		ImageryConfig parseImagery(const YAML::Node& n, const std::string& section, const std::filesystem::path& baseDir, Reducer defaultReducer) {
			ImageryConfig out;
			out.reducer = defaultReducer;
			if (!n) {
				throw InvalidConfigException(section + " is required");
			}
			if (!n["manifest"]) {
				throw InvalidConfigException(section + ".manifest is required");
			}
			loadPath(n, "manifest", out.manifest, baseDir);
			try {
				out.dates.start = parseDate(require<std::string>(n, section, "start"));
				out.dates.end = parseDate(require<std::string>(n, section, "end"));
			}
			catch (const InvalidConfigException&) {
				throw;
			}
			catch (const std::invalid_argument& e) {
				throw InvalidConfigException(section + ": " + e.what());
			}
			load(n, "bands", out.bands);
			if (n["max_cloud_cover"]) {
				out.maxCloudCoverPercent = n["max_cloud_cover"].as<double>();
			}
			std::string reducer;
			load(n, "reducer", reducer);
			if (!reducer.empty()) {
				out.reducer = parseReducer(reducer);
			}
			return out;
		}

		SeriesConfig parseSeries(const YAML::Node& n, const std::string& section, const std::filesystem::path& baseDir,
			const std::string& defaultBand, PeriodType defaultPeriod, const std::string& defaultColumn) {
			SeriesConfig out;
			out.enabled = true;
			out.band = defaultBand;
			out.period = defaultPeriod;
			out.valueColumn = defaultColumn;
			out.imagery = parseImagery(n["imagery"], section + ".imagery", baseDir, Reducer::mean);
			load(n, "band", out.band);
			std::string period;
			load(n, "period", period);
			if (!period.empty()) {
				out.period = parsePeriod(period);
			}
			out.scale = require<double>(n, section, "scale");
			load(n, "value_multiplier", out.valueMultiplier);
			load(n, "value_column", out.valueColumn);
			if (out.imagery.bands.empty()) {
				out.imagery.bands = { out.band };
			}
			return out;
		}

		ProblemConfig parseProblem(const YAML::Node& n, const std::filesystem::path& baseDir) {
			ProblemConfig out;
			out.name = require<std::string>(n, "classification.problems", "name");
			load(n, "class_field", out.classField);
			loadPath(n, "points_file", out.pointsFile, baseDir);
			if (n["points"]) {
				for (const YAML::Node& p : n["points"]) {
					if (!p.IsSequence() || p.size() != 3) {
						throw InvalidConfigException("classification.problems." + out.name + ": points must be [x, y, class]");
					}
					out.points.push_back({ p[0].as<double>(), p[1].as<double>(), p[2].as<double>() });
				}
			}
			return out;
		}

		void warnClamp(const std::string& name, auto& val, auto lo, auto hi) {
			if (val < lo || val > hi) {
				auto clamped = std::clamp(val, (std::remove_reference_t<decltype(val)>)lo, (std::remove_reference_t<decltype(val)>)hi);
				spdlog::warn("[Config] {} = {} is out of range [{}, {}]; using {}", name, val, lo, hi, clamped);
				val = clamped;
			}
		}

		void validateImagery(ImageryConfig& img, const std::string& section) {
			if (img.dates.end <= img.dates.start) {
				throw InvalidConfigException(section + ": end must be after start");
			}
			if (img.maxCloudCoverPercent.has_value()) {
				warnClamp(section + ".max_cloud_cover", img.maxCloudCoverPercent.value(), 0., 100.);
			}
		}

		void validateSeries(SeriesConfig& s, const std::string& section) {
			if (!s.enabled) {
				return;
			}
			validateImagery(s.imagery, section + ".imagery");
			if (s.scale <= 0) {
				throw InvalidConfigException(section + ".scale must be positive");
			}
			if (std::find(s.imagery.bands.begin(), s.imagery.bands.end(), s.band) == s.imagery.bands.end()) {
				throw InvalidConfigException(section + ".band " + s.band + " is not one of the imagery bands");
			}
		}
	}

	void validateRunConfig(RunConfig& cfg)
	{
		// --- Fatal ---
		if (cfg.studyArea.empty()) {
			throw InvalidConfigException("study_area is required");
		}
		if (cfg.glacier.enabled && !cfg.terrain.enabled) {
			throw InvalidConfigException("glacier requires terrain.dem");
		}
		if (cfg.terrain.enabled && cfg.terrain.metersPerUnit <= 0) {
			throw InvalidConfigException("terrain.meters_per_unit must be positive");
		}
		if (cfg.water.enabled) {
			validateImagery(cfg.water.imagery, "water.imagery");
			auto& bands = cfg.water.imagery.bands;
			for (const std::string& b : { cfg.water.bandA, cfg.water.bandB }) {
				if (std::find(bands.begin(), bands.end(), b) == bands.end()) {
					throw InvalidConfigException("water band " + b + " is not one of the imagery bands");
				}
			}
		}
		validateSeries(cfg.precipitation, "precipitation");
		validateSeries(cfg.temperature, "temperature");
		if (cfg.classification.enabled) {
			validateImagery(cfg.classification.imagery, "classification.imagery");
			if (cfg.classification.imagery.bands.empty()) {
				throw InvalidConfigException("classification.imagery.bands is required");
			}
			if (cfg.classification.problems.empty()) {
				throw InvalidConfigException("classification.problems must list at least one problem");
			}
			for (const ProblemConfig& p : cfg.classification.problems) {
				if (p.points.empty() && p.pointsFile.empty()) {
					throw InvalidConfigException("classification.problems." + p.name + " needs points or points_file");
				}
				if (p.points.size() && !p.pointsFile.empty()) {
					throw InvalidConfigException("classification.problems." + p.name + " can't have both points and points_file");
				}
			}
		}

		// --- Non-fatal: warn and clamp ---
		if (spdlog::level::from_str(cfg.logLevel) == spdlog::level::off && cfg.logLevel != "off") {
			spdlog::warn("[Config] Unknown logging.level '{}'; using info", cfg.logLevel);
			cfg.logLevel = "info";
		}
		warnClamp("water.threshold", cfg.water.threshold, -1., 1.);
		ForestParams& f = cfg.classification.forest;
		warnClamp("classification.trees", f.nTrees, 1, 10000);
		warnClamp("classification.min_leaf_size", f.minLeafSize, 1, std::numeric_limits<int>::max());
		warnClamp("classification.max_depth", f.maxDepth, 0, std::numeric_limits<int>::max());
		warnClamp("classification.features_per_split", f.featuresPerSplit, 0, std::numeric_limits<int>::max());
	}

	RunConfig parseRunConfig(const YAML::Node& root, const std::filesystem::path& baseDir)
	{
		RunConfig cfg;
		try {
			if (auto n = root["logging"]) {
				load(n, "level", cfg.logLevel);
			}
			loadPath(root, "study_area", cfg.studyArea, baseDir);
			loadPath(root, "output_dir", cfg.outputDir, baseDir);
			if (!root["output_dir"]) {
				cfg.outputDir = baseDir.empty() ? cfg.outputDir : baseDir / cfg.outputDir;
			}

			if (auto n = root["water"]) {
				auto& w = cfg.water;
				w.enabled = true;
				w.imagery = parseImagery(n["imagery"], "water.imagery", baseDir, Reducer::median);
				load(n, "band_a", w.bandA);
				load(n, "band_b", w.bandB);
				load(n, "threshold", w.threshold);
				if (n["connectivity"]) {
					w.connectivity = parseConnectivity(n["connectivity"].as<int>());
				}
			}

			if (auto n = root["terrain"]) {
				cfg.terrain.enabled = true;
				if (!n["dem"]) {
					throw InvalidConfigException("terrain.dem is required");
				}
				loadPath(n, "dem", cfg.terrain.dem, baseDir);
				load(n, "meters_per_unit", cfg.terrain.metersPerUnit);
			}

			if (auto n = root["glacier"]) {
				cfg.glacier.enabled = true;
				loadPath(n, "outlines", cfg.glacier.outlines, baseDir);
				load(n, "snowline_elevation", cfg.glacier.snowlineElevation);
				load(n, "velocity_factor", cfg.glacier.velocityFactor);
			}

			if (auto n = root["precipitation"]) {
				cfg.precipitation = parseSeries(n, "precipitation", baseDir, "precipitation", PeriodType::month, "mean_precipitation");
			}
			if (auto n = root["temperature"]) {
				cfg.temperature = parseSeries(n, "temperature", baseDir, "LST_Day_1km", PeriodType::day, "mean_LST_Celsius");
			}

			if (auto n = root["classification"]) {
				auto& c = cfg.classification;
				c.enabled = true;
				c.imagery = parseImagery(n["imagery"], "classification.imagery", baseDir, Reducer::median);
				load(n, "trees", c.forest.nTrees);
				load(n, "features_per_split", c.forest.featuresPerSplit);
				load(n, "min_leaf_size", c.forest.minLeafSize);
				load(n, "max_depth", c.forest.maxDepth);
				load(n, "seed", c.forest.seed);
				if (n["problems"]) {
					for (const YAML::Node& p : n["problems"]) {
						c.problems.push_back(parseProblem(p, baseDir));
					}
				}
			}
		}
		catch (const YAML::Exception& e) {
			throw InvalidConfigException(std::string("Malformed configuration: ") + e.what());
		}

		validateRunConfig(cfg);
		return cfg;
	}

	RunConfig loadRunConfig(const std::filesystem::path& file)
	{
		YAML::Node root;
		try {
			root = YAML::LoadFile(file.string());
		}
		catch (const YAML::Exception& e) {
			throw InvalidConfigException("Unable to read " + file.string() + ": " + e.what());
		}
		spdlog::info("[Config] Loaded {}", file.string());
		return parseRunConfig(root, file.parent_path());
	}
}
