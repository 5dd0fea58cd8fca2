#include"GDALWrappers.hpp"
#include"GisExceptions.hpp"

namespace himal {

	void gdalAllRegisterThreadSafe()
	{
		static std::once_flag registered;
		std::call_once(registered, []() { GDALAllRegister(); });
	}

	void GdalDatasetDeleter::operator()(GDALDataset* d) const
	{
		if (d) {
			GDALClose(d);
		}
	}
	UniqueGdalDataset makeUniqueGdalDataset(GDALDataset* d)
	{
		return UniqueGdalDataset(d);
	}

	UniqueGdalDataset rasterGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return makeUniqueGdalDataset(GDALDataset::Open(filename.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
	}
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return makeUniqueGdalDataset(GDALDataset::Open(filename.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY));
	}

	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, int nBands, GDALDataType gdt)
	{
		gdalAllRegisterThreadSafe();
		GDALDriver* d = GetGDALDriverManager()->GetDriverByName(driver.c_str());
		if (!d) {
			return UniqueGdalDataset();
		}
		return makeUniqueGdalDataset(d->Create(file.c_str(), ncol, nrow, nBands, gdt, nullptr));
	}

	void GdalStringDeleter::operator()(char* s) const
	{
		CPLFree(s);
	}
	UniqueGdalString exportToWktWrapper(const OGRSpatialReference& osr)
	{
		char* wkt = nullptr;
		osr.exportToWkt(&wkt);
		return UniqueGdalString(wkt);
	}

	void OGRFeatureDeleter::operator()(OGRFeature* f) const
	{
		OGRFeature::DestroyFeature(f);
	}
	UniqueOGRFeature createFeatureWrapper(OGRLayer* layer)
	{
		return UniqueOGRFeature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
	}

	std::array<double, 6> getGeoTrans(const UniqueGdalDataset& wgd, const std::string& filename)
	{
		std::array<double, 6> gt;
		CPLErr e = wgd->GetGeoTransform(gt.data());
		if (e != CE_None) {
			throw InvalidRasterFileException("Unable to get geotransform for " + filename);
		}
		return gt;
	}
}
