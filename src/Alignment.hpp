#pragma once
#ifndef hm_alignment_h
#define hm_alignment_h

#include"gis_pch.hpp"
#include"Extent.hpp"
#include"GDALWrappers.hpp"

namespace himal {

	//how to turn an arbitrary extent into a set of cells
	//near: the cells whose centers fall within the extent (half-open on the max side)
	//out: every cell that touches the extent
	//in: only the cells entirely within the extent
	enum class SnapType {
		near, out, in
	};

	struct RowColExtent {
		rowcol_t minrow, maxrow, mincol, maxcol;
		bool isEmpty() const { return maxrow < minrow || maxcol < mincol; }
	};

	//An extent divided into a regular grid of square-ish cells
	//Cells are numbered in row-major order from the upper-left corner
	//Coordinates returned by the xFrom/yFrom functions are cell centers
	class Alignment : public Extent {
	public:
		Alignment() : Extent(), _nrow(0), _ncol(0), _xres(1), _yres(1) {}
		Alignment(const Extent& e, rowcol_t nrow, rowcol_t ncol);
		Alignment(coord_t xmin, coord_t ymin, rowcol_t nrow, rowcol_t ncol, coord_t xres, coord_t yres, const CoordRef& crs = CoordRef());

		//reads the alignment of a GDAL-readable raster, without reading its data
		explicit Alignment(const std::string& filename);

		virtual ~Alignment() = default;

		rowcol_t nrow() const;
		rowcol_t ncol() const;
		cell_t ncell() const;
		coord_t xres() const;
		coord_t yres() const;

		//the checked versions throw OutsideExtentException
		cell_t cellFromRowCol(rowcol_t row, rowcol_t col) const;
		cell_t cellFromRowColUnsafe(rowcol_t row, rowcol_t col) const;
		cell_t cellFromXY(coord_t x, coord_t y) const;
		cell_t cellFromXYUnsafe(coord_t x, coord_t y) const;

		rowcol_t rowFromY(coord_t y) const;
		rowcol_t rowFromYUnsafe(coord_t y) const;
		rowcol_t colFromX(coord_t x) const;
		rowcol_t colFromXUnsafe(coord_t x) const;

		rowcol_t rowFromCell(cell_t cell) const;
		rowcol_t rowFromCellUnsafe(cell_t cell) const;
		rowcol_t colFromCell(cell_t cell) const;
		rowcol_t colFromCellUnsafe(cell_t cell) const;

		coord_t xFromCol(rowcol_t col) const;
		coord_t xFromColUnsafe(rowcol_t col) const;
		coord_t yFromRow(rowcol_t row) const;
		coord_t yFromRowUnsafe(rowcol_t row) const;
		coord_t xFromCell(cell_t cell) const;
		coord_t xFromCellUnsafe(cell_t cell) const;
		coord_t yFromCell(cell_t cell) const;
		coord_t yFromCellUnsafe(cell_t cell) const;

		Extent extentFromCell(cell_t cell) const;

		//the rows and columns of this alignment selected by e; clipped to the alignment, and possibly empty
		RowColExtent rowColExtent(const Extent& e, SnapType snap) const;

		//an alignment covering only the given rows and columns of this one
		Alignment subAlignment(const RowColExtent& rc) const;

		//same grid, same extent, same CRS
		bool isSameAlignment(const Alignment& other) const;

	protected:
		rowcol_t _nrow, _ncol;
		coord_t _xres, _yres;

		void checkValidAlignment() const;
		void _checkCell(cell_t cell) const;
		void alignmentInitFromGDALRaster(const UniqueGdalDataset& wgd, const std::array<double, 6>& geotrans);
	};

	bool operator==(const Alignment& lhs, const Alignment& rhs);
	bool operator!=(const Alignment& lhs, const Alignment& rhs);
	std::ostream& operator<<(std::ostream& os, const Alignment& a);

	//iterates over cell indices of an alignment, optionally restricted to an extent
	class CellIterator {
	public:
		explicit CellIterator(const Alignment& a);
		CellIterator(const Alignment& a, const Extent& e, SnapType snap);

		class iterator {
		public:
			iterator(const Alignment* a, const RowColExtent& rc, rowcol_t row, rowcol_t col);
			iterator& operator++();
			cell_t operator*() const;
			bool operator==(const iterator& other) const;
		private:
			const Alignment* _a;
			RowColExtent _rc;
			rowcol_t _row, _col;
		};

		iterator begin() const;
		iterator end() const;

	private:
		const Alignment* _a;
		RowColExtent _rc;
	};
}

#endif
