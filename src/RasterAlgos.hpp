#pragma once
#ifndef hm_rasteralgos_h
#define hm_rasteralgos_h

#include"Raster.hpp"

namespace himal {

	enum class Connectivity {
		four, eight
	};

	//Produces a raster with alignment a, where each cell is the mean of the cells of r whose centers fall inside it
	//cells of a with no valued cells of r in them are nodata
	//the sums are done in double precision regardless of T
	template<class T>
	inline Raster<T> aggregateMean(const Raster<T>& r, const Alignment& a) {
		Raster<T> out{ a };
		if (!r.overlaps(a)) {
			return out;
		}
		for (cell_t bigCell : CellIterator(a, r, SnapType::out)) {
			Extent e = a.extentFromCell(bigCell);
			double numerator = 0;
			cell_t denominator = 0;
			for (cell_t smallCell : CellIterator(r, e, SnapType::near)) {
				if (r[smallCell].has_value()) {
					denominator++;
					numerator += r[smallCell].value();
				}
			}
			if (denominator != 0) {
				out[bigCell].has_value() = true;
				out[bigCell].value() = (T)(numerator / denominator);
			}
		}
		return out;
	}

	//returns a raster with the same dimensions as the input
	//each valued cell is labeled with a patch number; nodata cells stay nodata
	//connected cells with the same value in the input raster are given the same patch number in the output raster
	//patches are numbered 1...n in the order their first cell appears in a row-major scan
	template<class T>
	inline Raster<cell_t> connectedComponents(const Raster<T>& in, Connectivity connectivity) {
		//using union-find
		Raster<cell_t> parents{ (Alignment)in };
		std::vector<cell_t> clumpSizes(in.ncell(), 0);
		auto findAncestor = [&](cell_t startCell)->cell_t {
			std::vector<cell_t> toChange;
			cell_t current = startCell;
			while (true) {
				auto parentV = parents.atCellUnsafe(current);
				if (parentV.value() == current) {
					break;
				}
				toChange.push_back(current);
				current = parentV.value();
			}
			for (cell_t c : toChange) {
				parents.atCellUnsafe(c).value() = current;
			}
			return current;
			};
		auto doUnion = [&](cell_t cellA, cell_t cellB) {
			cell_t parentA = findAncestor(cellA);
			cell_t parentB = findAncestor(cellB);
			if (parentA == parentB) {
				return;
			}
			//union by size
			if (clumpSizes[parentA] >= clumpSizes[parentB]) {
				parents.atCellUnsafe(parentB).value() = parentA;
				clumpSizes[parentA] += clumpSizes[parentB];
			}
			else {
				parents.atCellUnsafe(parentA).value() = parentB;
				clumpSizes[parentB] += clumpSizes[parentA];
			}
			};
		auto tryUnion = [&](cell_t thisCell, rowcol_t otherRow, rowcol_t otherCol, const T& thisValue) {
			if (otherRow < 0 || otherCol < 0 || otherCol >= in.ncol()) {
				return;
			}
			cell_t otherCell = in.cellFromRowColUnsafe(otherRow, otherCol);
			auto otherV = in.atCellUnsafe(otherCell);
			if (otherV.has_value() && otherV.value() == thisValue) {
				doUnion(thisCell, otherCell);
			}
			};

		for (cell_t cell : CellIterator(in)) {
			auto parentv = parents.atCellUnsafe(cell);
			if (in.atCellUnsafe(cell).has_value()) {
				parentv.has_value() = true;
				parentv.value() = cell;
				clumpSizes[cell] = 1;
			}
		}

		for (rowcol_t row = 0; row < in.nrow(); ++row) {
			for (rowcol_t col = 0; col < in.ncol(); ++col) {
				cell_t thisCell = in.cellFromRowColUnsafe(row, col);
				auto thisV = in.atCellUnsafe(thisCell);
				if (!thisV.has_value()) {
					continue;
				}
				T thisValue = thisV.value();
				tryUnion(thisCell, row, col - 1, thisValue);
				tryUnion(thisCell, row - 1, col, thisValue);
				if (connectivity == Connectivity::eight) {
					tryUnion(thisCell, row - 1, col - 1, thisValue);
					tryUnion(thisCell, row - 1, col + 1, thisValue);
				}
			}
		}

		//replace the root cell indices with sequential labels
		//all roots have to be found before any cell is overwritten
		std::vector<cell_t> roots(in.ncell(), -1);
		for (cell_t cell : CellIterator(in)) {
			if (parents.atCellUnsafe(cell).has_value()) {
				roots[cell] = findAncestor(cell);
			}
		}
		std::unordered_map<cell_t, cell_t> labelForRoot;
		for (cell_t cell : CellIterator(in)) {
			if (roots[cell] < 0) {
				continue;
			}
			auto it = labelForRoot.find(roots[cell]);
			if (it == labelForRoot.end()) {
				it = labelForRoot.emplace(roots[cell], (cell_t)labelForRoot.size() + 1).first;
			}
			parents.atCellUnsafe(cell).value() = it->second;
		}

		return parents;
	}
}

#endif
