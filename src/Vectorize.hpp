#pragma once
#ifndef hm_vectorize_h
#define hm_vectorize_h

#include"RasterAlgos.hpp"
#include"Vector.hpp"

namespace himal {

	//Converts the set cells (value 1) of a mask into one polygon per connected component
	//Rings follow cell edges, so every vertex is a cell corner; collinear vertices are removed
	//The outer ring of each polygon is counter-clockwise, holes are clockwise
	//Components are numbered in the order their first cell appears in a row-major scan, and each polygon's outer ring starts at the top edge of that cell
	//Where a hole reaches the outside of the component through a corner, the hole gets its own ring that meets the outer ring at that corner
	//Cells of a component that touch only at a corner (eight-connectivity) give an outer ring that passes through that corner twice
	//The output has an integer ID field (1-based, same order as the polygons) and an integer NCELL field with the number of cells in the component
	VectorDataset<Polygon> vectorizeMask(const Raster<label_t>& mask, Connectivity connectivity = Connectivity::eight);

	namespace detail {
		//the closed rings, in lattice coordinates, bounding a set of cells that make up one component
		//the first ring is the outer boundary
		std::vector<std::vector<LatticeVertex>> traceComponentRings(const Alignment& a, const std::vector<cell_t>& cells,
			const Raster<cell_t>& components, cell_t componentLabel, Connectivity connectivity);
	}
}

#endif
