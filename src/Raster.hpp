#pragma once
#ifndef himal_raster_h
#define himal_raster_h

#include"gis_pch.hpp"
#include"Alignment.hpp"
#include"Geometry.hpp"
#include"GisExceptions.hpp"

namespace himal {

	template<class T>
	class MultiBandRaster;

	template<class T>
	using RastData = xtl::xoptional_vector<T>;

	//A single band of data on an Alignment. Every cell either has a value or is nodata.
	//xoptional_vector packs the has_value flags into a bitset, so two threads must never write to the same raster at once
	template<class T>
	class Raster : public Alignment {
	public:

		friend class MultiBandRaster<T>;

		Raster() : Alignment(), _data() {}
		virtual ~Raster() noexcept = default;

		//creates a raster from the given alignment, and fills it with missing values
		explicit Raster(const Alignment& a) : Alignment(a) {
			_data.resize(ncell());
		}

		//creates a raster from the given alignment where every cell has the given value
		Raster(const Alignment& a, const T fill) : Alignment(a) {
			_data.resize(ncell());
			for (cell_t cell = 0; cell < ncell(); ++cell) {
				_data[cell].value() = fill;
				_data[cell].has_value() = true;
			}
		}

		//Constructs a raster from a GDAL-readable file.
		Raster(const std::string& filename, const int band = 1);

		//Constructs a raster from a GDAL-readable file, while only reading data that falls within the specified extent
		Raster(const std::string& filename, const Extent& e, SnapType snap, const int band = 1);

		//disallow copy and move constructors from rasters with different templates. This will call the Raster(const Alignment& a) signature, which is very confusing
		//by deleting them, that just won't even compile--do an explicit cast to Alignment if you want that behavior
		template<class S>
		Raster(const Raster<S>& r) = delete;
		template<class S>
		Raster(Raster<S>&& r) = delete;
		template<class S>
		Raster<T>& operator=(const Raster<S>& r) = delete;
		template<class S>
		Raster<T>& operator=(Raster<S>&& r) = delete;

		Raster(const Raster<T>& r) = default;
		Raster(Raster<T>&& r) noexcept {
			*this = std::move(r);
		}
		Raster<T>& operator=(const Raster<T>& r) = default;
		Raster<T>& operator=(Raster<T>&& r) noexcept {
			_data = std::move(r._data);
			_crs = std::move(r._crs);
			_xmin = r._xmin; r._xmin = 0;
			_xmax = r._xmax; r._xmax = 0;
			_ymin = r._ymin; r._ymin = 0;
			_ymax = r._ymax; r._ymax = 0;
			_xres = r._xres; r._xres = 1;
			_yres = r._yres; r._yres = 1;
			_ncol = r._ncol; r._ncol = 0;
			_nrow = r._nrow; r._nrow = 0;
			return *this;
		}

		//Methods to access values. As usual, operator[] does no bounds checking. The other three do check.
		auto atCell(const cell_t cell) {
			_checkCell(cell);
			return (*this)[cell];
		}
		auto atRC(const rowcol_t row, const rowcol_t col) {
			return (*this)[cellFromRowCol(row, col)];
		}
		auto atXY(const coord_t x, const coord_t y) {
			return (*this)[cellFromXY(x, y)];
		}

		const auto atCell(const cell_t cell) const {
			_checkCell(cell);
			return (*this)[cell];
		}
		const auto atRC(const rowcol_t row, const rowcol_t col) const {
			return (*this)[cellFromRowCol(row, col)];
		}
		const auto atXY(const coord_t x, const coord_t y) const {
			return (*this)[cellFromXY(x, y)];
		}

		//Versions of atRC, and atXY that don't bother with bounds checking, and thus have minimal overhead
		//only use if you're completely confident that you don't need bounds checking
		auto atRCUnsafe(const rowcol_t row, const rowcol_t col) {
			return (*this)[cellFromRowColUnsafe(row, col)];
		}
		const auto atRCUnsafe(const rowcol_t row, const rowcol_t col) const {
			return (*this)[cellFromRowColUnsafe(row, col)];
		}
		const auto operator[](const cell_t cell) const {
			return _data[cell];
		}
		auto operator[](const cell_t cell) {
			return _data[cell];
		}
		auto atCellUnsafe(const cell_t cell) {
			return _data[cell];
		}
		const auto atCellUnsafe(const cell_t cell) const {
			return _data[cell];
		}

		//Nearest-neighbor extraction: the value of the cell containing (x,y), or nodata if the point is outside of the extent
		xtl::xoptional<T> extract(const coord_t x, const coord_t y) const {
			if (!contains(x, y)) {
				return xtl::missing<T>();
			}
			xtl::xoptional<T> out = atXY(x, y);
			return out;
		}

		//Writes the Raster object to the harddrive. Missing values will be written as naValue. It's up to the user to make sure the driver and the file extension correspond.
		//You can specify the datatype of the file, or leave it as GDT_Unknown to choose the one that corresponds to the template of the raster object.
		void writeRaster(const std::string& file, const std::string driver = "GTiff", const T navalue = std::numeric_limits<T>::lowest(), GDALDataType gdt = GDT_Unknown) const;

		//returns true if has_value is true for any cell; false otherwise
		bool hasAnyValue() const;
		cell_t countValues() const;

		//sets every cell to nodata where m is nodata
		template<class S>
		void mask(const Raster<S>& m);

		//sets every cell whose center is not inside the polygon to nodata
		void maskByPolygon(const MultiPolygon& poly);

		//basic element-wise arithmetic with a scalar; nodata cells stay nodata
		template<class S>
		Raster<T>& operator+=(const S rhs);
		template<class S>
		Raster<T>& operator*=(const S rhs);

		auto begin() { return _data.begin(); }
		auto end() { return _data.end(); }
		auto begin() const { return _data.begin(); }
		auto end() const { return _data.end(); }

	private:
		RastData<T> _data;

		static GDALDataType GDT() {
			if (std::is_same<T, double>::value) {
				return GDT_Float64;
			}
			if (std::is_same<T, float>::value) {
				return GDT_Float32;
			}
			if (std::is_same<T, std::uint8_t>::value) {
				return GDT_Byte;
			}
			if (std::is_same<T, std::int16_t>::value) {
				return GDT_Int16;
			}
			if (std::is_same<T, std::int32_t>::value) {
				return GDT_Int32;
			}
			if (std::is_same<T, std::int64_t>::value) {
				return GDT_Int64;
			}
			if (std::is_same<T, std::uint16_t>::value) {
				return GDT_UInt16;
			}
			if (std::is_same<T, std::uint32_t>::value) {
				return GDT_UInt32;
			}
			return GDT_Unknown;
		}

		void _readBand(GDALRasterBand* rBand, const RowColExtent& window);
	};

	template<class T>
	inline bool operator==(const Raster<T>& lhs, const Raster<T>& rhs) {
		if ((Alignment)lhs != (Alignment)rhs) {
			return false;
		}
		for (cell_t cell = 0; cell < lhs.ncell(); ++cell) {
			if (lhs[cell].has_value() != rhs[cell].has_value()) {
				return false;
			}
			if (lhs[cell].has_value() && lhs[cell].value() != rhs[cell].value()) {
				return false;
			}
		}
		return true;
	}
	template<class T>
	inline bool operator!=(const Raster<T>& lhs, const Raster<T>& rhs) {
		return !(lhs == rhs);
	}

	template<class T>
	inline std::ostream& operator<<(std::ostream& os, const Raster<T>& r) {
		os << "RASTER: " << typeid(T).name();
		os << (Alignment)r;
		return os;
	}

	template<class T>
	Raster<T>::Raster(const std::string& filename, const int band) {

		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();
		if (band < 1 || band > wgd->GetRasterCount()) {
			throw InvalidRasterFileException(filename + " has no band " + std::to_string(band));
		}

		_data.resize(ncell());
		_readBand(wgd->GetRasterBand(band), RowColExtent{ 0, _nrow - 1, 0, _ncol - 1 });
	}

	template<class T>
	Raster<T>::Raster(const std::string& filename, const Extent& e, SnapType snap, const int band) {

		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		Alignment full = Alignment(filename);
		if (band < 1 || band > wgd->GetRasterCount()) {
			throw InvalidRasterFileException(filename + " has no band " + std::to_string(band));
		}
		RowColExtent rc = full.rowColExtent(e, snap);
		if (rc.isEmpty()) {
			throw OutsideExtentException(filename + " does not overlap the requested extent");
		}
		Alignment::operator=(full.subAlignment(rc));

		_data.resize(ncell());
		_readBand(wgd->GetRasterBand(band), rc);
	}

	template<class T>
	void Raster<T>::_readBand(GDALRasterBand* rBand, const RowColExtent& window) {
		int hasNoData = 0;
		double naValue = rBand->GetNoDataValue(&hasNoData);
		CPLErr err = rBand->RasterIO(GF_Read, window.mincol, window.minrow, _ncol, _nrow, _data.value().data(), _ncol, _nrow, GDT(), 0, 0);
		if (err != CE_None) {
			throw InvalidRasterFileException("Error reading raster data");
		}
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			double asDouble = (double)_data.value()[cell];
			if (std::isnan(asDouble)) {
				continue;
			}
			if (hasNoData && asDouble == naValue) {
				continue;
			}
			_data.has_value()[cell] = true;
		}
	}

	template<class T>
	void Raster<T>::writeRaster(const std::string& file, const std::string driver, const T navalue, GDALDataType dataType) const {
		if (dataType == GDT_Unknown) {
			dataType = GDT();
		}
		UniqueGdalDataset wgd = gdalCreateWrapper(driver, file, ncol(), nrow(), 1, dataType);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to create " + file + " as a raster");
		}
		std::array<double, 6> gt = { _xmin, _xres,0,_ymax,0,-(_yres) };
		wgd->SetGeoTransform(gt.data());
		wgd->SetProjection(_crs.getCompleteWKT().c_str());

		std::vector<T> buffer(ncell());
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			buffer[cell] = _data[cell].has_value() ? _data[cell].value() : navalue;
		}
		auto band = wgd->GetRasterBand(1);
		band->SetNoDataValue((double)navalue);
		CPLErr err = band->RasterIO(GF_Write, 0, 0, _ncol, _nrow, buffer.data(), _ncol, _nrow, GDT(), 0, 0);
		if (err != CE_None) {
			throw InvalidRasterFileException("Error writing " + file);
		}
	}

	template<class T>
	bool Raster<T>::hasAnyValue() const {
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (atCellUnsafe(cell).has_value()) {
				return true;
			}
		}
		return false;
	}

	template<class T>
	cell_t Raster<T>::countValues() const {
		cell_t count = 0;
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (atCellUnsafe(cell).has_value()) {
				++count;
			}
		}
		return count;
	}

	template<class T>
	template<class S>
	void Raster<T>::mask(const Raster<S>& m) {
		if (!isSameAlignment(m)) {
			throw AlignmentMismatchException("Alignment mismatch in mask");
		}
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (!m[cell].has_value()) {
				atCellUnsafe(cell).has_value() = false;
			}
		}
	}

	template<class T>
	void Raster<T>::maskByPolygon(const MultiPolygon& poly) {
		if (!poly.crs().isConsistentHoriz(crs())) {
			throw CRSMismatchException("CRS mismatch in maskByPolygon");
		}
		//nothing outside of the bounding box can be inside the polygon, so only those cells need the full check
		std::vector<char> inside(ncell(), 0);
		if (poly.nPolygon() > 0) {
			Extent bbox = poly.boundingBox();
			if (overlaps(bbox)) {
				for (cell_t cell : CellIterator(*this, bbox, SnapType::near)) {
					inside[cell] = poly.containsPoint(xFromCellUnsafe(cell), yFromCellUnsafe(cell)) ? 1 : 0;
				}
			}
		}
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (!inside[cell]) {
				atCellUnsafe(cell).has_value() = false;
			}
		}
	}

	template<class T> template<class S>
	Raster<T>& Raster<T>::operator+=(const S rhs) {
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			_data[cell].value() += rhs;
		}
		return *this;
	}
	template<class T> template<class S>
	Raster<T>& Raster<T>::operator*=(const S rhs) {
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			_data[cell].value() *= rhs;
		}
		return *this;
	}
}

#endif
