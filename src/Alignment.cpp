#include"Alignment.hpp"
#include"GisExceptions.hpp"

namespace himal {

	Alignment::Alignment(const Extent& e, rowcol_t nrow, rowcol_t ncol)
		: Extent(e), _nrow(nrow), _ncol(ncol)
	{
		if (nrow <= 0 || ncol <= 0) {
			throw InvalidAlignmentException("Alignment must have at least one row and column");
		}
		_xres = (_xmax - _xmin) / ncol;
		_yres = (_ymax - _ymin) / nrow;
		checkValidAlignment();
	}
	Alignment::Alignment(coord_t xmin, coord_t ymin, rowcol_t nrow, rowcol_t ncol, coord_t xres, coord_t yres, const CoordRef& crs)
		: _nrow(nrow), _ncol(ncol), _xres(xres), _yres(yres)
	{
		_crs = crs;
		_xmin = xmin;
		_ymin = ymin;
		_xmax = xmin + ncol * xres;
		_ymax = ymin + nrow * yres;
		checkValidAlignment();
	}
	Alignment::Alignment(const std::string& filename)
	{
		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();
	}

	rowcol_t Alignment::nrow() const
	{
		return _nrow;
	}
	rowcol_t Alignment::ncol() const
	{
		return _ncol;
	}
	cell_t Alignment::ncell() const
	{
		return (cell_t)_nrow * (cell_t)_ncol;
	}
	coord_t Alignment::xres() const
	{
		return _xres;
	}
	coord_t Alignment::yres() const
	{
		return _yres;
	}

	cell_t Alignment::cellFromRowCol(rowcol_t row, rowcol_t col) const
	{
		if (row < 0 || col < 0 || row >= _nrow || col >= _ncol) {
			throw OutsideExtentException("Row/col outside of alignment");
		}
		return cellFromRowColUnsafe(row, col);
	}
	cell_t Alignment::cellFromRowColUnsafe(rowcol_t row, rowcol_t col) const
	{
		return (cell_t)row * _ncol + col;
	}
	cell_t Alignment::cellFromXY(coord_t x, coord_t y) const
	{
		return cellFromRowColUnsafe(rowFromY(y), colFromX(x));
	}
	cell_t Alignment::cellFromXYUnsafe(coord_t x, coord_t y) const
	{
		return cellFromRowColUnsafe(rowFromYUnsafe(y), colFromXUnsafe(x));
	}

	rowcol_t Alignment::rowFromY(coord_t y) const
	{
		if (y < _ymin || y > _ymax) {
			throw OutsideExtentException("Y outside of alignment");
		}
		//the bottom edge belongs to the last row
		return std::min(rowFromYUnsafe(y), _nrow - 1);
	}
	rowcol_t Alignment::rowFromYUnsafe(coord_t y) const
	{
		return (rowcol_t)std::floor((_ymax - y) / _yres);
	}
	rowcol_t Alignment::colFromX(coord_t x) const
	{
		if (x < _xmin || x > _xmax) {
			throw OutsideExtentException("X outside of alignment");
		}
		return std::min(colFromXUnsafe(x), _ncol - 1);
	}
	rowcol_t Alignment::colFromXUnsafe(coord_t x) const
	{
		return (rowcol_t)std::floor((x - _xmin) / _xres);
	}

	rowcol_t Alignment::rowFromCell(cell_t cell) const
	{
		_checkCell(cell);
		return rowFromCellUnsafe(cell);
	}
	rowcol_t Alignment::rowFromCellUnsafe(cell_t cell) const
	{
		return (rowcol_t)(cell / _ncol);
	}
	rowcol_t Alignment::colFromCell(cell_t cell) const
	{
		_checkCell(cell);
		return colFromCellUnsafe(cell);
	}
	rowcol_t Alignment::colFromCellUnsafe(cell_t cell) const
	{
		return (rowcol_t)(cell % _ncol);
	}

	coord_t Alignment::xFromCol(rowcol_t col) const
	{
		if (col < 0 || col >= _ncol) {
			throw OutsideExtentException("Column outside of alignment");
		}
		return xFromColUnsafe(col);
	}
	coord_t Alignment::xFromColUnsafe(rowcol_t col) const
	{
		return _xmin + _xres * (col + 0.5);
	}
	coord_t Alignment::yFromRow(rowcol_t row) const
	{
		if (row < 0 || row >= _nrow) {
			throw OutsideExtentException("Row outside of alignment");
		}
		return yFromRowUnsafe(row);
	}
	coord_t Alignment::yFromRowUnsafe(rowcol_t row) const
	{
		return _ymax - _yres * (row + 0.5);
	}
	coord_t Alignment::xFromCell(cell_t cell) const
	{
		_checkCell(cell);
		return xFromCellUnsafe(cell);
	}
	coord_t Alignment::xFromCellUnsafe(cell_t cell) const
	{
		return xFromColUnsafe(colFromCellUnsafe(cell));
	}
	coord_t Alignment::yFromCell(cell_t cell) const
	{
		_checkCell(cell);
		return yFromCellUnsafe(cell);
	}
	coord_t Alignment::yFromCellUnsafe(cell_t cell) const
	{
		return yFromRowUnsafe(rowFromCellUnsafe(cell));
	}

	Extent Alignment::extentFromCell(cell_t cell) const
	{
		_checkCell(cell);
		coord_t x = xFromCellUnsafe(cell);
		coord_t y = yFromCellUnsafe(cell);
		return Extent(x - _xres / 2, x + _xres / 2, y - _yres / 2, y + _yres / 2, _crs);
	}

	RowColExtent Alignment::rowColExtent(const Extent& e, SnapType snap) const
	{
		if (!_crs.isConsistentHoriz(e.crs())) {
			throw CRSMismatchException("CRS mismatch in rowColExtent");
		}
		//fractional positions of the extent's edges, in units of cells
		coord_t left = (e.xmin() - _xmin) / _xres;
		coord_t right = (e.xmax() - _xmin) / _xres;
		coord_t top = (_ymax - e.ymax()) / _yres;
		coord_t bottom = (_ymax - e.ymin()) / _yres;
		constexpr coord_t tolerance = 1e-6;

		RowColExtent rc;
		switch (snap) {
		case SnapType::near:
			rc.mincol = (rowcol_t)std::ceil(left - 0.5);
			rc.maxcol = (rowcol_t)std::ceil(right - 0.5) - 1;
			rc.minrow = (rowcol_t)std::ceil(top - 0.5);
			rc.maxrow = (rowcol_t)std::ceil(bottom - 0.5) - 1;
			break;
		case SnapType::out:
			rc.mincol = (rowcol_t)std::floor(left + tolerance);
			rc.maxcol = (rowcol_t)std::ceil(right - tolerance) - 1;
			rc.minrow = (rowcol_t)std::floor(top + tolerance);
			rc.maxrow = (rowcol_t)std::ceil(bottom - tolerance) - 1;
			break;
		case SnapType::in:
			rc.mincol = (rowcol_t)std::ceil(left - tolerance);
			rc.maxcol = (rowcol_t)std::floor(right + tolerance) - 1;
			rc.minrow = (rowcol_t)std::ceil(top - tolerance);
			rc.maxrow = (rowcol_t)std::floor(bottom + tolerance) - 1;
			break;
		}
		rc.mincol = std::max(rc.mincol, 0);
		rc.minrow = std::max(rc.minrow, 0);
		rc.maxcol = std::min(rc.maxcol, _ncol - 1);
		rc.maxrow = std::min(rc.maxrow, _nrow - 1);
		return rc;
	}

	Alignment Alignment::subAlignment(const RowColExtent& rc) const
	{
		if (rc.isEmpty()) {
			throw OutsideExtentException("Empty row/col range in subAlignment");
		}
		return Alignment(_xmin + rc.mincol * _xres, _ymax - (rc.maxrow + 1) * _yres,
			rc.maxrow - rc.minrow + 1, rc.maxcol - rc.mincol + 1, _xres, _yres, _crs);
	}

	bool Alignment::isSameAlignment(const Alignment& other) const
	{
		return (Extent)*this == (Extent)other && _nrow == other._nrow && _ncol == other._ncol;
	}

	void Alignment::checkValidAlignment() const
	{
		if (_nrow < 0 || _ncol < 0) {
			throw InvalidAlignmentException("Negative number of rows or columns");
		}
		if (_xres <= 0 || _yres <= 0) {
			throw InvalidAlignmentException("Resolution must be positive");
		}
	}
	void Alignment::_checkCell(cell_t cell) const
	{
		if (cell < 0 || cell >= ncell()) {
			throw OutsideExtentException("Cell outside of alignment");
		}
	}
	void Alignment::alignmentInitFromGDALRaster(const UniqueGdalDataset& wgd, const std::array<double, 6>& geotrans)
	{
		if (geotrans[2] != 0 || geotrans[4] != 0) {
			throw InvalidRasterFileException("Rotated rasters are not supported");
		}
		_ncol = wgd->GetRasterXSize();
		_nrow = wgd->GetRasterYSize();
		_xres = std::abs(geotrans[1]);
		_yres = std::abs(geotrans[5]);
		_xmin = geotrans[0];
		_xmax = _xmin + _ncol * _xres;
		_ymax = geotrans[3];
		_ymin = _ymax - _nrow * _yres;
		_crs = CoordRef(wgd->GetSpatialRef());
	}

	bool operator==(const Alignment& lhs, const Alignment& rhs)
	{
		return lhs.isSameAlignment(rhs);
	}
	bool operator!=(const Alignment& lhs, const Alignment& rhs)
	{
		return !(lhs == rhs);
	}
	std::ostream& operator<<(std::ostream& os, const Alignment& a)
	{
		os << (Extent)a << " nrow: " << a.nrow() << " ncol: " << a.ncol() << " xres: " << a.xres() << " yres: " << a.yres();
		return os;
	}

	CellIterator::CellIterator(const Alignment& a)
		: _a(&a), _rc{ 0, a.nrow() - 1, 0, a.ncol() - 1 }
	{
	}
	CellIterator::CellIterator(const Alignment& a, const Extent& e, SnapType snap)
		: _a(&a), _rc(a.rowColExtent(e, snap))
	{
	}
	CellIterator::iterator CellIterator::begin() const
	{
		if (_rc.isEmpty()) {
			return end();
		}
		return iterator(_a, _rc, _rc.minrow, _rc.mincol);
	}
	CellIterator::iterator CellIterator::end() const
	{
		//one past the last row, in the first column
		return iterator(_a, _rc, _rc.isEmpty() ? _rc.minrow : _rc.maxrow + 1, _rc.mincol);
	}
	CellIterator::iterator::iterator(const Alignment* a, const RowColExtent& rc, rowcol_t row, rowcol_t col)
		: _a(a), _rc(rc), _row(row), _col(col)
	{
	}
	CellIterator::iterator& CellIterator::iterator::operator++()
	{
		++_col;
		if (_col > _rc.maxcol) {
			_col = _rc.mincol;
			++_row;
		}
		return *this;
	}
	cell_t CellIterator::iterator::operator*() const
	{
		return _a->cellFromRowColUnsafe(_row, _col);
	}
	bool CellIterator::iterator::operator==(const iterator& other) const
	{
		return _row == other._row && _col == other._col;
	}
}
