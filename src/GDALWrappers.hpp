#pragma once
#ifndef hm_gdalwrappers_h
#define hm_gdalwrappers_h

#include"gis_pch.hpp"

namespace himal {

	//GDALAllRegister isn't safe to call from several threads at once
	void gdalAllRegisterThreadSafe();

	struct GdalDatasetDeleter {
		void operator()(GDALDataset* d) const;
	};
	using UniqueGdalDataset = std::unique_ptr<GDALDataset, GdalDatasetDeleter>;
	UniqueGdalDataset makeUniqueGdalDataset(GDALDataset* d);

	//these return a null pointer if GDAL can't open the file
	UniqueGdalDataset rasterGDALWrapper(const std::string& filename);
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename);

	//pass nBands=0 and GDT_Unknown for vector drivers
	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, int nBands, GDALDataType gdt);

	struct GdalStringDeleter {
		void operator()(char* s) const;
	};
	using UniqueGdalString = std::unique_ptr<char, GdalStringDeleter>;
	UniqueGdalString exportToWktWrapper(const OGRSpatialReference& osr);

	struct OGRFeatureDeleter {
		void operator()(OGRFeature* f) const;
	};
	using UniqueOGRFeature = std::unique_ptr<OGRFeature, OGRFeatureDeleter>;
	UniqueOGRFeature createFeatureWrapper(OGRLayer* layer);

	//throws InvalidRasterFileException if the file has no geotransform
	std::array<double, 6> getGeoTrans(const UniqueGdalDataset& wgd, const std::string& filename);
}

#endif
