#pragma once
#ifndef HM_COORDINATE_H
#define HM_COORDINATE_H

#include"HimalGisTypeDefs.hpp"

namespace himal {
	struct CoordXY {
		coord_t x, y;
		CoordXY() : x(0), y(0) {}
		CoordXY(coord_t x, coord_t y) : x(x), y(y) {}
		bool operator==(const CoordXY& other) const = default;
	};

	//a vertex on the corner lattice of a raster; row and col count cell edges, not cells
	struct LatticeVertex {
		rowcol_t row, col;
		LatticeVertex() : row(0), col(0) {}
		LatticeVertex(rowcol_t row, rowcol_t col) : row(row), col(col) {}
		bool operator==(const LatticeVertex& other) const = default;
	};
}

#endif
