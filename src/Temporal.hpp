#pragma once
#ifndef hm_temporal_h
#define hm_temporal_h

#include"MultiBandRaster.hpp"
#include"RasterAlgos.hpp"

namespace himal {

	using timestamp_t = std::chrono::sys_seconds;

	//YYYY-MM-DD, at midnight UTC; throws std::invalid_argument on anything else
	timestamp_t parseDate(const std::string& s);
	std::string formatDate(timestamp_t t);

	enum class PeriodType {
		month, //1..12, regardless of year
		year, //calendar year
		day //days since 1970-01-01
	};

	period_t periodKey(timestamp_t t, PeriodType type);
	//"1".."12" for months, "2024" for years, "2024-01-05" for days
	std::string periodLabel(period_t key, PeriodType type);

	using PeriodFunction = std::function<period_t(timestamp_t)>;
	PeriodFunction periodFunction(PeriodType type);

	enum class Reducer {
		mean,
		median //the mean of the two middle values for an even count
	};

	struct ImageQuality {
		std::optional<double> cloudCoverPercent;
	};

	//an image passes if it has no limit, or if its cloud cover is known and strictly below the limit
	struct QualityFilter {
		std::optional<double> maxCloudCoverPercent;

		bool passes(const ImageQuality& q) const;
	};

	struct CollectionImage {
		MultiBandRaster<metric_t> image;
		timestamp_t timestamp;
		ImageQuality quality;
	};

	//Time-ordered images sharing one band schema and one grid
	//Images with equal timestamps stay in the order they were added
	class RasterCollection {
	public:
		RasterCollection() = default;
		explicit RasterCollection(const std::vector<std::string>& bandSchema);

		//throws BandMismatchException if the bands don't match the schema, and AlignmentMismatchException if the grid differs from the images already present
		void add(CollectionImage image);

		size_t size() const;
		bool empty() const;
		const std::vector<std::string>& bandSchema() const;
		const CollectionImage& operator[](size_t i) const;

		auto begin() const { return _images.begin(); }
		auto end() const { return _images.end(); }

	private:
		std::vector<std::string> _bandSchema;
		std::vector<CollectionImage> _images;
	};

	struct Composite {
		period_t period = 0;
		MultiBandRaster<metric_t> image;
		//the timestamps of the images that contributed, in collection order
		std::vector<timestamp_t> sources;
	};

	//One composite per period, in increasing period order
	//If periods is empty, the periods are those of the images that pass the filter
	//Otherwise exactly the listed periods are produced, and a period without contributors is entirely nodata with no sources
	//emptyGrid is the grid of the composites when the collection is empty; without it, fixed periods over an empty collection throw std::invalid_argument
	std::vector<Composite> aggregateByPeriod(const RasterCollection& collection, const PeriodFunction& periodFn, Reducer reducer,
		const std::vector<period_t>& periods = {}, const QualityFilter& filter = QualityFilter(),
		const std::optional<Alignment>& emptyGrid = std::nullopt);

	//the whole collection reduced into one composite with period 0
	//an empty collection gives an entirely nodata composite on emptyGrid, or throws std::invalid_argument if there is none
	Composite compositeCollection(const RasterCollection& collection, Reducer reducer, const QualityFilter& filter = QualityFilter(),
		const std::optional<Alignment>& emptyGrid = std::nullopt);

	//the per-pixel mean of the composites, whose sources are the union of theirs in time order
	//throws std::invalid_argument if there are no composites
	Composite meanOfComposites(const std::vector<Composite>& composites);

	//The mean of the raster over the region
	//If scale is larger than the raster's resolution, the raster is first aggregated to a grid of that resolution anchored at the raster's origin
	//A cell is included if its center is inside the region
	//Returns nullopt if no valued cell is included
	std::optional<double> reduceRegion(const Raster<metric_t>& raster, const MultiPolygon& region, Reducer reducer, coord_t scale);

	struct TimeSeriesEntry {
		period_t period;
		std::string label;
		double value; //NaN when the period is unmeasured
	};

	struct TimeSeries {
		PeriodType periodType = PeriodType::month;
		std::vector<TimeSeriesEntry> entries;

		//columns are period,label,<valueColumn>; unmeasured values are written as an empty field
		void writeCsv(const std::filesystem::path& path, const std::string& valueColumn) const;
	};

	//the region reduction of one band of each composite, sorted by period
	TimeSeries buildTimeSeries(const std::vector<Composite>& composites, const MultiPolygon& region, const std::string& band,
		Reducer reducer, coord_t scale, PeriodType periodType);
}

#endif
