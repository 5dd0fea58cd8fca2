#pragma once
#ifndef hm_watershedrun_h
#define hm_watershedrun_h

#include"RunConfig.hpp"
#include"SpectralIndex.hpp"
#include"Vectorize.hpp"
#include"Terrain.hpp"
#include"HazardClassifier.hpp"

namespace himal {

	//every polygon of every feature in the file, as one geometry in the file's CRS
	MultiPolygon readStudyArea(const std::filesystem::path& file);

	//fetches the imagery and reduces it into a single composite, clipped to the study area
	//throws std::runtime_error if no image could be fetched
	Composite buildComposite(RasterSource& source, const ImageryConfig& imagery, const MultiPolygon& studyArea);

	struct WaterResult {
		Composite composite;
		Raster<metric_t> index;
		Raster<label_t> mask;
		VectorDataset<Polygon> lakes;
	};
	WaterResult runWaterDetection(RasterSource& source, const WaterConfig& cfg, const MultiPolygon& studyArea);

	struct TerrainResult {
		Raster<metric_t> dem;
		SlopeAspect slopeAspect;
	};
	//the DEM is read within the bounding box of the study area and clipped to it
	TerrainResult runTerrainAnalysis(const TerrainConfig& cfg, const MultiPolygon& studyArea);

	struct GlacierResult {
		Raster<label_t> snowline;
		GlacierProxy proxy;
		//the glacier outlines whose bounding boxes overlap the study area's; empty if no outlines were configured
		VectorDataset<MultiPolygon> outlines;
	};
	GlacierResult runGlacierAnalysis(const GlacierConfig& cfg, const TerrainResult& terrain, const MultiPolygon& studyArea);

	struct SeriesResult {
		std::vector<Composite> composites;
		Composite summary;
		TimeSeries series;
	};
	//one mean composite per calendar month, and their mean as the summary
	//without any usable image, every month is nodata on a grid of cfg.scale over the study area
	SeriesResult runPrecipitation(RasterSource& source, const SeriesConfig& cfg, const MultiPolygon& studyArea);
	//one composite per period with data, and the mean of the whole collection as the summary
	//without any usable image, the series is empty and the summary is nodata
	SeriesResult runTemperature(RasterSource& source, const SeriesConfig& cfg, const MultiPolygon& studyArea);

	//the labeled points of a problem; inline points are taken to be in the CRS of the study area
	HazardProblem loadProblem(const ProblemConfig& cfg, const CoordRef& crs);
	std::vector<HazardResult> runHazardClassification(RasterSource& source, const ClassificationConfig& cfg, const MultiPolygon& studyArea);

	//runs every configured analysis and writes its outputs to cfg.outputDir
	//sources is used to open the imagery manifests; if null, each manifest is read from disk
	//a stage that throws is logged and skipped; returns the names of the stages that failed
	//throws if the study area can't be read
	std::vector<std::string> runFromConfig(const RunConfig& cfg, const std::function<std::unique_ptr<RasterSource>(const std::filesystem::path&)>& sources = nullptr);
}

#endif
