#include"WatershedRun.hpp"

namespace himal {

	namespace {
		//GDAL won't create a vector file over an existing one
		void removeExistingVector(const std::filesystem::path& file) {
			std::filesystem::remove(file);
			if (file.extension() == ".shp") {
				for (const char* ext : { ".shx", ".dbf", ".prj", ".cpg" }) {
					std::filesystem::path sidecar = file;
					sidecar.replace_extension(ext);
					std::filesystem::remove(sidecar);
				}
			}
		}

		QualityFilter filterFor(const ImageryConfig& imagery) {
			return QualityFilter{ imagery.maxCloudCoverPercent };
		}

		RasterCollection fetch(RasterSource& source, const ImageryConfig& imagery, const MultiPolygon& studyArea) {
			RasterCollection collection = source.fetchCollection(imagery.bands, studyArea.boundingBox(), imagery.dates, filterFor(imagery));
			if (collection.empty()) {
				spdlog::warn("[Pipeline] No usable images in {} between {} and {}", imagery.manifest.string(),
					formatDate(imagery.dates.start), formatDate(imagery.dates.end));
			}
			return collection;
		}

		RasterCollection fetchOrThrow(RasterSource& source, const ImageryConfig& imagery, const MultiPolygon& studyArea) {
			RasterCollection collection = fetch(source, imagery, studyArea);
			if (collection.empty()) {
				throw std::runtime_error("No usable images in " + imagery.manifest.string());
			}
			return collection;
		}

		//the grid that series composites take when no image could be fetched
		Alignment gridOverStudyArea(const MultiPolygon& studyArea, coord_t res) {
			Extent bbox = studyArea.boundingBox();
			rowcol_t ncol = std::max((rowcol_t)1, (rowcol_t)std::ceil((bbox.xmax() - bbox.xmin()) / res - HIMAL_EPSILON));
			rowcol_t nrow = std::max((rowcol_t)1, (rowcol_t)std::ceil((bbox.ymax() - bbox.ymin()) / res - HIMAL_EPSILON));
			return Alignment(bbox.xmin(), bbox.ymax() - nrow * res, nrow, ncol, res, res, studyArea.crs());
		}

		void clipToStudyArea(MultiBandRaster<metric_t>& image, const MultiPolygon& studyArea) {
			for (band_t band = 1; band <= image.nBands(); ++band) {
				image.bandAtUnsafe(band).maskByPolygon(studyArea);
			}
		}

		TimeSeries seriesFromComposites(const std::vector<Composite>& composites, const SeriesConfig& cfg, const MultiPolygon& studyArea) {
			TimeSeries series = buildTimeSeries(composites, studyArea, cfg.band, Reducer::mean, cfg.scale, cfg.period);
			cell_t unmeasured = 0;
			for (TimeSeriesEntry& e : series.entries) {
				if (std::isnan(e.value)) {
					++unmeasured;
				}
				e.value *= cfg.valueMultiplier;
			}
			if (unmeasured) {
				spdlog::warn("[Pipeline] {} of {} periods of {} have no data", unmeasured, series.entries.size(), cfg.band);
			}
			return series;
		}

		void scaleSummary(Composite& summary, const SeriesConfig& cfg, const MultiPolygon& studyArea) {
			clipToStudyArea(summary.image, studyArea);
			if (cfg.valueMultiplier != 1) {
				for (band_t band = 1; band <= summary.image.nBands(); ++band) {
					summary.image.bandAtUnsafe(band) *= cfg.valueMultiplier;
				}
			}
		}

		//the outlines with bounding boxes overlapping the box, with all of their attributes
		VectorDataset<MultiPolygon> filterByBoundingBox(const VectorDataset<MultiPolygon>& all, const Extent& box) {
			VectorDataset<MultiPolygon> out{ all.crs() };
			out.addFieldsFrom(all);
			for (size_t i = 0; i < all.nGeometry(); ++i) {
				const MultiPolygon& g = all.getGeometry(i);
				if (!g.boundingBox().overlaps(box)) {
					continue;
				}
				out.addGeometry(g);
				out.copyRow(out.nFeature() - 1, all, i);
			}
			return out;
		}
	}

	MultiPolygon readStudyArea(const std::filesystem::path& file)
	{
		VectorDataset<MultiPolygon> features{ file };
		MultiPolygon out;
		out.setCrs(features.crs());
		for (size_t i = 0; i < features.nGeometry(); ++i) {
			for (const Polygon& p : features.getGeometry(i)) {
				out.addPolygon(p);
			}
		}
		if (out.nPolygon() == 0) {
			throw InvalidVectorFileException(file.string() + " contains no polygons");
		}
		spdlog::info("[Pipeline] Study area: {} polygons, area {}", out.nPolygon(), out.area());
		return out;
	}

	Composite buildComposite(RasterSource& source, const ImageryConfig& imagery, const MultiPolygon& studyArea)
	{
		RasterCollection collection = fetchOrThrow(source, imagery, studyArea);
		Composite out = compositeCollection(collection, imagery.reducer, filterFor(imagery));
		clipToStudyArea(out.image, studyArea);
		spdlog::info("[Pipeline] Composite of {} images from {}", out.sources.size(), imagery.manifest.string());
		return out;
	}

	WaterResult runWaterDetection(RasterSource& source, const WaterConfig& cfg, const MultiPolygon& studyArea)
	{
		spdlog::info("[Pipeline] Detecting surface water");
		Composite composite = buildComposite(source, cfg.imagery, studyArea);
		Raster<metric_t> index = normalizedDifference(composite.image, cfg.bandA, cfg.bandB);
		Raster<label_t> mask = thresholdAbove(index, cfg.threshold);
		VectorDataset<Polygon> lakes = vectorizeMask(mask, cfg.connectivity);
		spdlog::info("[Pipeline] {} water bodies", lakes.nGeometry());
		return WaterResult{ std::move(composite), std::move(index), std::move(mask), std::move(lakes) };
	}

	TerrainResult runTerrainAnalysis(const TerrainConfig& cfg, const MultiPolygon& studyArea)
	{
		spdlog::info("[Pipeline] Deriving terrain from {}", cfg.dem.string());
		Raster<metric_t> dem{ cfg.dem.string(), studyArea.boundingBox(), SnapType::out };
		dem.maskByPolygon(studyArea);
		TerrainParams params;
		params.metersPerUnit = cfg.metersPerUnit;
		SlopeAspect slopeAspect = deriveSlopeAspect(dem, params);
		return TerrainResult{ std::move(dem), std::move(slopeAspect) };
	}

	GlacierResult runGlacierAnalysis(const GlacierConfig& cfg, const TerrainResult& terrain, const MultiPolygon& studyArea)
	{
		spdlog::info("[Pipeline] Glacier proxies with snowline at {}", cfg.snowlineElevation);
		GlacierResult out{
			snowlineMask(terrain.dem, cfg.snowlineElevation),
			estimateThickness(terrain.dem, terrain.slopeAspect.slope, cfg.snowlineElevation, cfg.velocityFactor),
			VectorDataset<MultiPolygon>{ studyArea.crs() }
		};
		if (!cfg.outlines.empty()) {
			VectorDataset<MultiPolygon> all{ cfg.outlines };
			if (!all.crs().isConsistentHoriz(studyArea.crs())) {
				throw CRSMismatchException(cfg.outlines.string() + " is not in the CRS of the study area");
			}
			out.outlines = filterByBoundingBox(all, studyArea.boundingBox());
			spdlog::info("[Pipeline] {} of {} glacier outlines near the study area", out.outlines.nGeometry(), all.nGeometry());
		}
		return out;
	}

	SeriesResult runPrecipitation(RasterSource& source, const SeriesConfig& cfg, const MultiPolygon& studyArea)
	{
		spdlog::info("[Pipeline] Precipitation climatology");
		RasterCollection collection = fetch(source, cfg.imagery, studyArea);
		std::vector<period_t> periods;
		if (cfg.period == PeriodType::month) {
			for (period_t month = 1; month <= 12; ++month) {
				periods.push_back(month);
			}
		}
		const Alignment emptyGrid = gridOverStudyArea(studyArea, cfg.scale);
		SeriesResult out;
		out.composites = aggregateByPeriod(collection, periodFunction(cfg.period), cfg.imagery.reducer, periods, filterFor(cfg.imagery), emptyGrid);
		if (out.composites.empty()) {
			out.summary = compositeCollection(collection, cfg.imagery.reducer, filterFor(cfg.imagery), emptyGrid);
		}
		else {
			out.summary = meanOfComposites(out.composites);
		}
		scaleSummary(out.summary, cfg, studyArea);
		out.series = seriesFromComposites(out.composites, cfg, studyArea);
		return out;
	}

	SeriesResult runTemperature(RasterSource& source, const SeriesConfig& cfg, const MultiPolygon& studyArea)
	{
		spdlog::info("[Pipeline] Land surface temperature");
		RasterCollection collection = fetch(source, cfg.imagery, studyArea);
		SeriesResult out;
		out.composites = aggregateByPeriod(collection, periodFunction(cfg.period), cfg.imagery.reducer, {}, filterFor(cfg.imagery));
		out.summary = compositeCollection(collection, Reducer::mean, filterFor(cfg.imagery), gridOverStudyArea(studyArea, cfg.scale));
		scaleSummary(out.summary, cfg, studyArea);
		out.series = seriesFromComposites(out.composites, cfg, studyArea);
		return out;
	}

	HazardProblem loadProblem(const ProblemConfig& cfg, const CoordRef& crs)
	{
		HazardProblem out;
		out.name = cfg.name;
		out.classField = cfg.classField;
		if (!cfg.pointsFile.empty()) {
			out.points = VectorDataset<Point>{ cfg.pointsFile };
			return out;
		}
		out.points = VectorDataset<Point>{ crs };
		out.points.addIntegerField(cfg.classField);
		for (const auto& p : cfg.points) {
			out.points.addGeometry(Point(p[0], p[1], crs));
			out.points.setIntegerField(out.points.nFeature() - 1, cfg.classField, std::lround(p[2]));
		}
		return out;
	}

	std::vector<HazardResult> runHazardClassification(RasterSource& source, const ClassificationConfig& cfg, const MultiPolygon& studyArea)
	{
		Composite composite = buildComposite(source, cfg.imagery, studyArea);
		std::vector<HazardResult> out;
		for (const ProblemConfig& p : cfg.problems) {
			out.push_back(classifyHazard(composite.image, loadProblem(p, studyArea.crs()), cfg.forest, cfg.imagery.bands));
		}
		return out;
	}

	std::vector<std::string> runFromConfig(const RunConfig& cfg, const std::function<std::unique_ptr<RasterSource>(const std::filesystem::path&)>& sources)
	{
		spdlog::set_level(spdlog::level::from_str(cfg.logLevel));
		gdalAllRegisterThreadSafe();

		auto openSource = [&](const std::filesystem::path& manifest) -> std::unique_ptr<RasterSource> {
			if (sources) {
				return sources(manifest);
			}
			return std::make_unique<ManifestRasterSource>(manifest);
		};

		const std::filesystem::path& dir = cfg.outputDir;
		std::filesystem::create_directories(dir);
		MultiPolygon studyArea = readStudyArea(cfg.studyArea);

		//a failed stage is logged and the remaining stages still run
		std::vector<std::string> failed;
		auto runStage = [&](const std::string& name, const std::function<void()>& stage) {
			try {
				stage();
			}
			catch (const std::exception& e) {
				spdlog::error("[Pipeline] {} failed: {}", name, e.what());
				failed.push_back(name);
			}
		};

		if (cfg.water.enabled) {
			runStage("water", [&] {
				auto source = openSource(cfg.water.imagery.manifest);
				WaterResult water = runWaterDetection(*source, cfg.water, studyArea);
				water.composite.image.writeRaster((dir / "water_composite.tif").string());
				water.index.writeRaster((dir / "ndwi.tif").string());
				water.mask.writeRaster((dir / "lakes_mask.tif").string());
				removeExistingVector(dir / "lakes.shp");
				water.lakes.writeVector(dir / "lakes.shp");
			});
		}

		if (cfg.terrain.enabled) {
			runStage("terrain", [&] {
				TerrainResult terrain = runTerrainAnalysis(cfg.terrain, studyArea);
				terrain.dem.writeRaster((dir / "dem.tif").string());
				terrain.slopeAspect.slope.writeRaster((dir / "slope.tif").string());
				terrain.slopeAspect.aspect.writeRaster((dir / "aspect.tif").string());

				if (cfg.glacier.enabled) {
					runStage("glacier", [&] {
						GlacierResult glacier = runGlacierAnalysis(cfg.glacier, terrain, studyArea);
						glacier.snowline.writeRaster((dir / "snowline_mask.tif").string());
						glacier.proxy.thickness.writeRaster((dir / "glacier_thickness.tif").string());
						glacier.proxy.velocity.writeRaster((dir / "glacier_velocity.tif").string());
						if (!cfg.glacier.outlines.empty()) {
							removeExistingVector(dir / "glaciers.geojson");
							glacier.outlines.writeVector(dir / "glaciers.geojson", "GeoJSON");
						}
					});
				}
			});
		}

		if (cfg.precipitation.enabled) {
			runStage("precipitation", [&] {
				auto source = openSource(cfg.precipitation.imagery.manifest);
				SeriesResult precip = runPrecipitation(*source, cfg.precipitation, studyArea);
				precip.summary.image.writeRaster((dir / "precipitation_annual.tif").string());
				precip.series.writeCsv(dir / "precipitation_series.csv", cfg.precipitation.valueColumn);
			});
		}

		if (cfg.temperature.enabled) {
			runStage("temperature", [&] {
				auto source = openSource(cfg.temperature.imagery.manifest);
				SeriesResult lst = runTemperature(*source, cfg.temperature, studyArea);
				lst.summary.image.writeRaster((dir / "lst_mean.tif").string());
				lst.series.writeCsv(dir / "lst_series.csv", cfg.temperature.valueColumn);
			});
		}

		if (cfg.classification.enabled) {
			runStage("classification", [&] {
				auto source = openSource(cfg.classification.imagery.manifest);
				for (const HazardResult& r : runHazardClassification(*source, cfg.classification, studyArea)) {
					r.classification.writeRaster((dir / (r.name + "_classification.tif")).string());
				}
			});
		}

		spdlog::info("[Pipeline] Outputs written to {}", dir.string());
		return failed;
	}
}
