#include"RasterSource.hpp"

#include<yaml-cpp/yaml.h>

namespace himal {

	ManifestRasterSource::ManifestRasterSource(const std::filesystem::path& manifest)
	{
		YAML::Node root;
		try {
			root = YAML::LoadFile(manifest.string());
		}
		catch (const YAML::Exception& e) {
			throw InvalidConfigException("Unable to read manifest " + manifest.string() + ": " + e.what());
		}
		_parseManifest(root, manifest.parent_path());
		spdlog::info("[RasterSource] {} images listed in {}", _images.size(), manifest.string());
	}

	ManifestRasterSource::ManifestRasterSource(std::vector<ManifestImage> images, double multiplier, double offset)
		: _images(std::move(images)), _multiplier(multiplier), _offset(offset)
	{
	}

	RasterCollection ManifestRasterSource::fetchCollection(const std::vector<std::string>& bandSchema, const Extent& bounds,
		const DateRange& dates, const QualityFilter& filter)
	{
		RasterCollection out{ bandSchema };
		for (const ManifestImage& mi : _images) {
			if (!dates.contains(mi.date)) {
				continue;
			}
			if (!filter.passes(mi.quality)) {
				spdlog::debug("[RasterSource] Skipping {}: fails the quality filter", mi.file.string());
				continue;
			}

			MultiBandRaster<metric_t> image;
			try {
				image = MultiBandRaster<metric_t>(mi.file.string(), bounds, SnapType::out, bandSchema);
			}
			catch (const InvalidRasterFileException& e) {
				spdlog::warn("[RasterSource] Skipping {}: {}", mi.file.string(), e.what());
				continue;
			}
			catch (const BandMismatchException& e) {
				spdlog::warn("[RasterSource] Skipping {}: {}", mi.file.string(), e.what());
				continue;
			}
			catch (const OutsideExtentException& e) {
				spdlog::warn("[RasterSource] Skipping {}: {}", mi.file.string(), e.what());
				continue;
			}
			if (!image.crs().isConsistentHoriz(bounds.crs())) {
				throw CRSMismatchException(mi.file.string() + " is not in the CRS of the study area");
			}

			if (_multiplier != 1 || _offset != 0) {
				for (band_t band = 1; band <= image.nBands(); ++band) {
					Raster<metric_t>& r = image.bandAtUnsafe(band);
					r *= _multiplier;
					r += _offset;
				}
			}

			try {
				out.add(CollectionImage{ std::move(image), mi.date, mi.quality });
			}
			catch (const AlignmentMismatchException& e) {
				spdlog::warn("[RasterSource] Skipping {}: {}", mi.file.string(), e.what());
			}
		}
		spdlog::info("[RasterSource] Fetched {} images between {} and {}", out.size(), formatDate(dates.start), formatDate(dates.end));
		return out;
	}

	const std::vector<ManifestImage>& ManifestRasterSource::images() const
	{
		return _images;
	}

	double ManifestRasterSource::multiplier() const
	{
		return _multiplier;
	}

	double ManifestRasterSource::offset() const
	{
		return _offset;
	}

	void ManifestRasterSource::_parseManifest(const YAML::Node& root, const std::filesystem::path& baseDir)
	{
		try {
			if (root["multiplier"]) {
				_multiplier = root["multiplier"].as<double>();
			}
			if (root["offset"]) {
				_offset = root["offset"].as<double>();
			}
			const YAML::Node& images = root["images"];
			if (!images || !images.IsSequence()) {
				throw InvalidConfigException("Manifest has no images list");
			}
			for (const YAML::Node& n : images) {
				if (!n["file"] || !n["date"]) {
					throw InvalidConfigException("Every manifest image needs a file and a date");
				}
				ManifestImage mi;
				std::filesystem::path file = n["file"].as<std::string>();
				mi.file = file.is_absolute() ? file : baseDir / file;
				mi.date = parseDate(n["date"].as<std::string>());
				if (n["cloud_cover"]) {
					mi.quality.cloudCoverPercent = n["cloud_cover"].as<double>();
				}
				_images.push_back(std::move(mi));
			}
		}
		catch (const YAML::Exception& e) {
			throw InvalidConfigException(std::string("Malformed manifest: ") + e.what());
		}
		catch (const InvalidConfigException&) {
			throw;
		}
		catch (const std::invalid_argument& e) {
			throw InvalidConfigException(std::string("Malformed manifest: ") + e.what());
		}
	}
}
