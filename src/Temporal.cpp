#include"Temporal.hpp"

namespace himal {

	using namespace std::chrono;

	timestamp_t parseDate(const std::string& s)
	{
		int y = 0;
		unsigned m = 0, d = 0;
		char trailing = 0;
		if (s.size() != 10 || std::sscanf(s.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &trailing) != 3) {
			throw std::invalid_argument("Expected a date of the form YYYY-MM-DD, got " + s);
		}
		year_month_day ymd{ year{y}, month{m}, day{d} };
		if (!ymd.ok()) {
			throw std::invalid_argument(s + " is not a valid date");
		}
		return timestamp_t{ sys_days{ymd} };
	}

	std::string formatDate(timestamp_t t)
	{
		year_month_day ymd{ floor<days>(t) };
		std::ostringstream ss;
		ss << std::setfill('0') << std::setw(4) << (int)ymd.year() << "-"
			<< std::setw(2) << (unsigned)ymd.month() << "-"
			<< std::setw(2) << (unsigned)ymd.day();
		return ss.str();
	}

	period_t periodKey(timestamp_t t, PeriodType type)
	{
		sys_days dayPart = floor<days>(t);
		year_month_day ymd{ dayPart };
		switch (type) {
		case PeriodType::month:
			return (period_t)(unsigned)ymd.month();
		case PeriodType::year:
			return (period_t)(int)ymd.year();
		case PeriodType::day:
			return (period_t)dayPart.time_since_epoch().count();
		}
		throw std::invalid_argument("Unknown period type");
	}

	std::string periodLabel(period_t key, PeriodType type)
	{
		switch (type) {
		case PeriodType::month:
		case PeriodType::year:
			return std::to_string(key);
		case PeriodType::day:
			return formatDate(timestamp_t{ sys_days{ days{ key } } });
		}
		throw std::invalid_argument("Unknown period type");
	}

	PeriodFunction periodFunction(PeriodType type)
	{
		return [type](timestamp_t t) { return periodKey(t, type); };
	}

	bool QualityFilter::passes(const ImageQuality& q) const
	{
		if (!maxCloudCoverPercent.has_value()) {
			return true;
		}
		return q.cloudCoverPercent.has_value() && q.cloudCoverPercent.value() < maxCloudCoverPercent.value();
	}

	RasterCollection::RasterCollection(const std::vector<std::string>& bandSchema)
		: _bandSchema(bandSchema)
	{
	}

	void RasterCollection::add(CollectionImage image)
	{
		if (image.image.bandNames() != _bandSchema) {
			throw BandMismatchException("Image bands do not match the band schema of the collection");
		}
		if (_images.size() && !_images.front().image.isSameAlignment(image.image)) {
			throw AlignmentMismatchException("Image grid does not match the grid of the collection");
		}
		auto after = std::upper_bound(_images.begin(), _images.end(), image.timestamp,
			[](const timestamp_t& t, const CollectionImage& ci) { return t < ci.timestamp; });
		_images.insert(after, std::move(image));
	}

	size_t RasterCollection::size() const
	{
		return _images.size();
	}

	bool RasterCollection::empty() const
	{
		return _images.empty();
	}

	const std::vector<std::string>& RasterCollection::bandSchema() const
	{
		return _bandSchema;
	}

	const CollectionImage& RasterCollection::operator[](size_t i) const
	{
		return _images.at(i);
	}

	namespace {
		double reduceValues(std::vector<double>& values, Reducer reducer) {
			if (reducer == Reducer::mean) {
				double sum = 0;
				for (double v : values) {
					sum += v;
				}
				return sum / values.size();
			}
			std::sort(values.begin(), values.end());
			size_t mid = values.size() / 2;
			if (values.size() % 2) {
				return values[mid];
			}
			return (values[mid - 1] + values[mid]) / 2.;
		}

		//reduces the given images pixel by pixel into a raster on the alignment a
		MultiBandRaster<metric_t> reduceImages(const std::vector<const MultiBandRaster<metric_t>*>& images, const Alignment& a,
			const std::vector<std::string>& bandNames, Reducer reducer) {
			MultiBandRaster<metric_t> out{ a, bandNames };
			std::vector<double> values;
			for (band_t band = 1; band <= out.nBands(); ++band) {
				Raster<metric_t>& outBand = out.bandAtUnsafe(band);
				for (cell_t cell = 0; cell < outBand.ncell(); ++cell) {
					values.clear();
					for (const MultiBandRaster<metric_t>* image : images) {
						auto v = image->atCellUnsafe(cell, band);
						if (v.has_value()) {
							values.push_back(v.value());
						}
					}
					if (values.empty()) {
						continue;
					}
					outBand[cell].has_value() = true;
					outBand[cell].value() = (metric_t)reduceValues(values, reducer);
				}
			}
			return out;
		}
	}

	std::vector<Composite> aggregateByPeriod(const RasterCollection& collection, const PeriodFunction& periodFn, Reducer reducer,
		const std::vector<period_t>& periods, const QualityFilter& filter, const std::optional<Alignment>& emptyGrid)
	{
		std::map<period_t, std::vector<const CollectionImage*>> byPeriod;
		for (period_t p : periods) {
			byPeriod[p];
		}
		for (const CollectionImage& ci : collection) {
			if (!filter.passes(ci.quality)) {
				spdlog::debug("[Temporal] Skipping image from {} for cloud cover", formatDate(ci.timestamp));
				continue;
			}
			period_t p = periodFn(ci.timestamp);
			if (periods.size() && !byPeriod.contains(p)) {
				continue;
			}
			byPeriod[p].push_back(&ci);
		}

		std::vector<Composite> out;
		if (byPeriod.empty()) {
			return out;
		}
		if (collection.empty() && !emptyGrid) {
			throw std::invalid_argument("Cannot build composites for fixed periods from an empty collection: the grid is unknown");
		}
		const Alignment& a = collection.empty() ? *emptyGrid : (const Alignment&)collection[0].image;
		for (const auto& [period, members] : byPeriod) {
			Composite c;
			c.period = period;
			std::vector<const MultiBandRaster<metric_t>*> images;
			for (const CollectionImage* ci : members) {
				images.push_back(&ci->image);
				c.sources.push_back(ci->timestamp);
			}
			if (members.empty()) {
				spdlog::warn("[Temporal] No images for period {}", period);
			}
			c.image = reduceImages(images, a, collection.bandSchema(), reducer);
			out.push_back(std::move(c));
		}
		return out;
	}

	Composite compositeCollection(const RasterCollection& collection, Reducer reducer, const QualityFilter& filter,
		const std::optional<Alignment>& emptyGrid)
	{
		if (collection.empty() && !emptyGrid) {
			throw std::invalid_argument("Cannot composite an empty collection");
		}
		auto whole = [](timestamp_t) { return (period_t)0; };
		std::vector<Composite> out = aggregateByPeriod(collection, whole, reducer, { 0 }, filter, emptyGrid);
		return std::move(out.front());
	}

	Composite meanOfComposites(const std::vector<Composite>& composites)
	{
		if (composites.empty()) {
			throw std::invalid_argument("Cannot average zero composites");
		}
		const MultiBandRaster<metric_t>& first = composites.front().image;
		std::vector<const MultiBandRaster<metric_t>*> images;
		Composite out;
		for (const Composite& c : composites) {
			if (!c.image.isSameAlignment(first)) {
				throw AlignmentMismatchException("Alignment mismatch in meanOfComposites");
			}
			if (c.image.bandNames() != first.bandNames()) {
				throw BandMismatchException("Band mismatch in meanOfComposites");
			}
			images.push_back(&c.image);
			out.sources.insert(out.sources.end(), c.sources.begin(), c.sources.end());
		}
		std::sort(out.sources.begin(), out.sources.end());
		out.image = reduceImages(images, first, first.bandNames(), Reducer::mean);
		return out;
	}

	std::optional<double> reduceRegion(const Raster<metric_t>& raster, const MultiPolygon& region, Reducer reducer, coord_t scale)
	{
		if (!region.crs().isConsistentHoriz(raster.crs())) {
			throw CRSMismatchException("Region CRS does not match the raster in reduceRegion");
		}
		Extent bbox = region.boundingBox();
		if (!raster.overlaps(bbox)) {
			return std::nullopt;
		}

		const Raster<metric_t>* sampled = &raster;
		Raster<metric_t> aggregated;
		if (scale > raster.xres() || scale > raster.yres()) {
			rowcol_t ncol = (rowcol_t)std::ceil((raster.xmax() - raster.xmin()) / scale - HIMAL_EPSILON);
			rowcol_t nrow = (rowcol_t)std::ceil((raster.ymax() - raster.ymin()) / scale - HIMAL_EPSILON);
			Alignment coarse{ raster.xmin(), raster.ymax() - nrow * scale, nrow, ncol, scale, scale, raster.crs() };
			aggregated = aggregateMean(raster, coarse);
			sampled = &aggregated;
		}

		std::vector<double> values;
		for (cell_t cell : CellIterator(*sampled, bbox, SnapType::out)) {
			auto v = (*sampled)[cell];
			if (!v.has_value()) {
				continue;
			}
			if (!region.containsPoint(sampled->xFromCellUnsafe(cell), sampled->yFromCellUnsafe(cell))) {
				continue;
			}
			values.push_back(v.value());
		}
		if (values.empty()) {
			return std::nullopt;
		}
		return reduceValues(values, reducer);
	}

	void TimeSeries::writeCsv(const std::filesystem::path& path, const std::string& valueColumn) const
	{
		std::ofstream out{ path };
		if (!out) {
			throw std::runtime_error("Unable to open " + path.string() + " for writing");
		}
		out << "period,label," << valueColumn << "\n";
		out << std::setprecision(10);
		for (const TimeSeriesEntry& e : entries) {
			out << e.period << "," << e.label << ",";
			if (!std::isnan(e.value)) {
				out << e.value;
			}
			out << "\n";
		}
	}

	TimeSeries buildTimeSeries(const std::vector<Composite>& composites, const MultiPolygon& region, const std::string& band,
		Reducer reducer, coord_t scale, PeriodType periodType)
	{
		TimeSeries out;
		out.periodType = periodType;
		for (const Composite& c : composites) {
			std::optional<double> v = reduceRegion(c.image.bandByName(band), region, reducer, scale);
			out.entries.push_back({ c.period, periodLabel(c.period, periodType), v.value_or(std::numeric_limits<double>::quiet_NaN()) });
		}
		std::stable_sort(out.entries.begin(), out.entries.end(),
			[](const TimeSeriesEntry& a, const TimeSeriesEntry& b) { return a.period < b.period; });
		for (size_t i = 1; i < out.entries.size(); ++i) {
			if (out.entries[i].period == out.entries[i - 1].period) {
				throw std::invalid_argument("Duplicate period " + out.entries[i].label + " in buildTimeSeries");
			}
		}
		return out;
	}
}
