#pragma once
#ifndef HM_MULTIBANDRASTER_H
#define HM_MULTIBANDRASTER_H

#include"Raster.hpp"


namespace himal {

	//A stack of same-aligned rasters, each with a name (e.g. "B3", "LST_Day_1km")
	//Bands are numbered from 1, as in GDAL
	template<typename T>
	class MultiBandRaster : public Alignment {
	public:
		MultiBandRaster() = default;

		//If bandNames is empty, names are taken from the band descriptions in the file, or B1...Bn if there are none
		//Otherwise, it must have one entry per band in the file
		MultiBandRaster(const std::string& filename, const std::vector<std::string>& bandNames = {});
		MultiBandRaster(const std::string& filename, const Extent& e, SnapType snap, const std::vector<std::string>& bandNames = {});

		//every band filled with nodata
		MultiBandRaster(const Alignment& a, const std::vector<std::string>& bandNames);

		band_t nBands() const;
		const std::vector<std::string>& bandNames() const;
		bool hasBand(const std::string& name) const;
		//throws std::out_of_range if there's no such band
		band_t bandIndex(const std::string& name) const;

		Raster<T>& bandAt(band_t band);
		Raster<T>& bandAtUnsafe(band_t band);
		const Raster<T>& bandAt(band_t band) const;
		const Raster<T>& bandAtUnsafe(band_t band) const;

		Raster<T>& bandByName(const std::string& name);
		const Raster<T>& bandByName(const std::string& name) const;

		//the raster must share this object's alignment
		void setBand(band_t band, Raster<T> r);

		auto atCellUnsafe(cell_t cell, band_t band);
		const auto atCell(cell_t cell, band_t band) const;
		const auto atCellUnsafe(cell_t cell, band_t band) const;
		const auto atXY(coord_t x, coord_t y, band_t band) const;

		void writeRaster(const std::string& fileName, const std::string driver = "GTiff", const T navalue = std::numeric_limits<T>::lowest(), GDALDataType gdt = GDT_Unknown) const;
	private:
		std::vector<Raster<T>> _bands;
		std::vector<std::string> _bandNames;

		void _checkBand(band_t band) const;
		void _initBandNames(const UniqueGdalDataset& wgd, const std::string& filename, const std::vector<std::string>& bandNames);
	};

	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(const std::string& filename, const std::vector<std::string>& bandNames) {
		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();
		_initBandNames(wgd, filename, bandNames);

		band_t nBand = wgd->GetRasterCount();
		_bands.resize(nBand);
		for (band_t i = 1; i <= nBand; ++i) {
			_bands[i - 1] = Raster<T>(filename, i);
		}
	}
	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(const std::string& filename, const Extent& e, SnapType snap, const std::vector<std::string>& bandNames)
	{
		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		_initBandNames(wgd, filename, bandNames);

		band_t nBand = wgd->GetRasterCount();
		_bands.resize(nBand);
		for (band_t i = 1; i <= nBand; ++i) {
			_bands[i - 1] = Raster<T>(filename, e, snap, i);
		}
		Alignment::operator=((Alignment)_bands.front());
	}
	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(const Alignment& a, const std::vector<std::string>& bandNames)
		: Alignment(a), _bandNames(bandNames)
	{
		for (size_t band = 0; band < bandNames.size(); ++band) {
			_bands.emplace_back(a);
		}
	}
	template<typename T>
	inline band_t MultiBandRaster<T>::nBands() const {
		return (band_t)_bands.size();
	}
	template<typename T>
	inline const std::vector<std::string>& MultiBandRaster<T>::bandNames() const {
		return _bandNames;
	}
	template<typename T>
	inline bool MultiBandRaster<T>::hasBand(const std::string& name) const {
		return std::find(_bandNames.begin(), _bandNames.end(), name) != _bandNames.end();
	}
	template<typename T>
	inline band_t MultiBandRaster<T>::bandIndex(const std::string& name) const {
		auto it = std::find(_bandNames.begin(), _bandNames.end(), name);
		if (it == _bandNames.end()) {
			throw std::out_of_range("No band named " + name);
		}
		return (band_t)(it - _bandNames.begin()) + 1;
	}
	template<typename T>
	inline Raster<T>& MultiBandRaster<T>::bandAt(band_t band) {
		_checkBand(band);
		return bandAtUnsafe(band);
	}
	template<typename T>
	inline Raster<T>& MultiBandRaster<T>::bandAtUnsafe(band_t band) {
		return _bands[band - 1];
	}
	template<typename T>
	inline const Raster<T>& MultiBandRaster<T>::bandAt(band_t band) const {
		_checkBand(band);
		return bandAtUnsafe(band);
	}
	template<typename T>
	inline const Raster<T>& MultiBandRaster<T>::bandAtUnsafe(band_t band) const {
		return _bands[band - 1];
	}
	template<typename T>
	inline Raster<T>& MultiBandRaster<T>::bandByName(const std::string& name) {
		return bandAtUnsafe(bandIndex(name));
	}
	template<typename T>
	inline const Raster<T>& MultiBandRaster<T>::bandByName(const std::string& name) const {
		return bandAtUnsafe(bandIndex(name));
	}
	template<typename T>
	inline void MultiBandRaster<T>::setBand(band_t band, Raster<T> r) {
		_checkBand(band);
		if (!isSameAlignment(r)) {
			throw AlignmentMismatchException("Alignment mismatch in setBand");
		}
		_bands[band - 1] = std::move(r);
	}
	template<typename T>
	inline auto MultiBandRaster<T>::atCellUnsafe(cell_t cell, band_t band) {
		return bandAtUnsafe(band).atCellUnsafe(cell);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atCell(cell_t cell, band_t band) const {
		return bandAt(band).atCell(cell);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atCellUnsafe(cell_t cell, band_t band) const {
		return bandAtUnsafe(band).atCellUnsafe(cell);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atXY(coord_t x, coord_t y, band_t band) const {
		return bandAt(band).atXY(x, y);
	}
	template<typename T>
	inline void MultiBandRaster<T>::writeRaster(const std::string& fileName, const std::string driver, const T navalue, GDALDataType gdt) const
	{
		if (gdt == GDT_Unknown) {
			gdt = Raster<T>::GDT();
		}
		UniqueGdalDataset ugd = gdalCreateWrapper(driver, fileName, ncol(), nrow(), nBands(), gdt);
		if (!ugd) {
			throw InvalidRasterFileException("Unable to create " + fileName + " as a raster");
		}
		std::array<double, 6> gt = { _xmin, _xres,0,_ymax,0,-(_yres) };
		ugd->SetGeoTransform(gt.data());
		ugd->SetProjection(_crs.getCompleteWKT().c_str());

		std::vector<T> buffer(ncell());
		for (band_t band = 1; band <= nBands(); ++band) {
			const Raster<T>& r = bandAtUnsafe(band);
			for (cell_t cell = 0; cell < ncell(); ++cell) {
				buffer[cell] = r[cell].has_value() ? r[cell].value() : navalue;
			}
			auto thisBand = ugd->GetRasterBand(band);
			thisBand->SetDescription(_bandNames[band - 1].c_str());
			thisBand->SetNoDataValue((double)navalue);
			CPLErr err = thisBand->RasterIO(GF_Write, 0, 0, _ncol, _nrow, buffer.data(), _ncol, _nrow, Raster<T>::GDT(), 0, 0);
			if (err != CE_None) {
				throw InvalidRasterFileException("Error writing " + fileName);
			}
		}
	}
	template<typename T>
	inline void MultiBandRaster<T>::_checkBand(band_t band) const {
		if (band < 1 || band > (band_t)_bands.size()) {
			throw std::out_of_range("Band out of range");
		}
	}
	template<typename T>
	inline void MultiBandRaster<T>::_initBandNames(const UniqueGdalDataset& wgd, const std::string& filename, const std::vector<std::string>& bandNames) {
		band_t nBand = wgd->GetRasterCount();
		if (bandNames.size()) {
			if ((band_t)bandNames.size() != nBand) {
				throw BandMismatchException(filename + " has " + std::to_string(nBand) + " bands, but " + std::to_string(bandNames.size()) + " names were given");
			}
			_bandNames = bandNames;
			return;
		}
		_bandNames.clear();
		for (band_t i = 1; i <= nBand; ++i) {
			std::string desc = wgd->GetRasterBand(i)->GetDescription();
			_bandNames.push_back(desc.size() ? desc : "B" + std::to_string(i));
		}
	}

}

#endif
