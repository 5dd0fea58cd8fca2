#pragma once
#ifndef hm_rastersource_h
#define hm_rastersource_h

#include"Temporal.hpp"

namespace YAML {
	class Node;
}

namespace himal {

	//[start, end)
	struct DateRange {
		timestamp_t start;
		timestamp_t end;

		bool contains(timestamp_t t) const { return t >= start && t < end; }
	};

	//Supplies time-stamped images of a region
	//Implementations skip tiles that can't be read instead of failing, so the returned collection may have gaps
	class RasterSource {
	public:
		virtual ~RasterSource() = default;

		//the images with exactly the given bands, cropped to bounds, acquired within dates and passing the filter
		virtual RasterCollection fetchCollection(const std::vector<std::string>& bandSchema, const Extent& bounds,
			const DateRange& dates, const QualityFilter& filter) = 0;
	};

	struct ManifestImage {
		std::filesystem::path file;
		timestamp_t date;
		ImageQuality quality;
	};

	//A RasterSource over local GDAL-readable files listed in a YAML manifest:
	//
	//multiplier: 0.02     #optional, applied to every value as value*multiplier+offset
	//offset: -273.15      #optional
	//images:
	//  - file: lst_2023_001.tif   #relative to the manifest
	//    date: 2023-01-01
	//    cloud_cover: 3.5         #optional, in percent
	class ManifestRasterSource : public RasterSource {
	public:
		//throws InvalidConfigException if the manifest is missing or malformed
		explicit ManifestRasterSource(const std::filesystem::path& manifest);
		ManifestRasterSource(std::vector<ManifestImage> images, double multiplier = 1, double offset = 0);

		RasterCollection fetchCollection(const std::vector<std::string>& bandSchema, const Extent& bounds,
			const DateRange& dates, const QualityFilter& filter) override;

		const std::vector<ManifestImage>& images() const;
		double multiplier() const;
		double offset() const;

	private:
		std::vector<ManifestImage> _images;
		double _multiplier = 1;
		double _offset = 0;

		void _parseManifest(const YAML::Node& root, const std::filesystem::path& baseDir);
	};
}

#endif
