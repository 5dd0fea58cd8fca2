#include"Vectorize.hpp"

namespace himal {

	namespace detail {

		struct LatticeEdge {
			LatticeVertex from, to;
			bool used = false;
			rowcol_t dr() const { return to.row - from.row; }
			rowcol_t dc() const { return to.col - from.col; }
		};

		//twice the signed area, positive when the ring is counter-clockwise with the y axis pointing up
		int64_t latticeArea2(const std::vector<LatticeVertex>& ring) {
			int64_t sum = 0;
			for (size_t i = 0; i < ring.size(); ++i) {
				const LatticeVertex& here = ring[i];
				const LatticeVertex& next = ring[(i + 1) % ring.size()];
				sum += (int64_t)next.col * here.row - (int64_t)here.col * next.row;
			}
			return sum;
		}

		//cuts a ring into loops that don't revisit a vertex; the first loop is the one containing the ring's starting vertex
		std::vector<std::vector<LatticeVertex>> splitAtRepeatedVertices(const std::vector<LatticeVertex>& ring) {
			std::vector<std::vector<LatticeVertex>> loops;
			std::vector<LatticeVertex> path;
			std::map<std::pair<rowcol_t, rowcol_t>, size_t> position;
			for (const LatticeVertex& v : ring) {
				auto it = position.find(std::make_pair(v.row, v.col));
				if (it == position.end()) {
					position.emplace(std::make_pair(v.row, v.col), path.size());
					path.push_back(v);
					continue;
				}
				size_t start = it->second;
				loops.emplace_back(path.begin() + start, path.end());
				for (size_t i = start + 1; i < path.size(); ++i) {
					position.erase(std::make_pair(path[i].row, path[i].col));
				}
				path.resize(start + 1);
			}
			loops.insert(loops.begin(), std::move(path));
			return loops;
		}

		std::vector<LatticeVertex> dropStraightVertices(const std::vector<LatticeVertex>& ring) {
			std::vector<LatticeVertex> corners;
			size_t n = ring.size();
			for (size_t i = 0; i < n; ++i) {
				const LatticeVertex& prev = ring[(i + n - 1) % n];
				const LatticeVertex& here = ring[i];
				const LatticeVertex& next = ring[(i + 1) % n];
				bool straight = (here.row - prev.row == next.row - here.row) && (here.col - prev.col == next.col - here.col);
				if (!straight) {
					corners.push_back(here);
				}
			}
			return corners;
		}

		std::vector<std::vector<LatticeVertex>> traceComponentRings(const Alignment& a, const std::vector<cell_t>& cells,
			const Raster<cell_t>& components, cell_t componentLabel, Connectivity connectivity)
		{
			auto inComponent = [&](rowcol_t row, rowcol_t col) {
				if (row < 0 || col < 0 || row >= a.nrow() || col >= a.ncol()) {
					return false;
				}
				auto v = components.atRCUnsafe(row, col);
				return v.has_value() && v.value() == componentLabel;
				};

			//every cell edge with the component on one side and something else on the other
			//edges are directed so the component is on the left when the y axis points up
			std::vector<LatticeEdge> edges;
			for (cell_t cell : cells) {
				rowcol_t r = a.rowFromCellUnsafe(cell);
				rowcol_t c = a.colFromCellUnsafe(cell);
				if (!inComponent(r - 1, c)) {
					edges.push_back({ LatticeVertex(r, c + 1), LatticeVertex(r, c) });
				}
				if (!inComponent(r, c - 1)) {
					edges.push_back({ LatticeVertex(r, c), LatticeVertex(r + 1, c) });
				}
				if (!inComponent(r + 1, c)) {
					edges.push_back({ LatticeVertex(r + 1, c), LatticeVertex(r + 1, c + 1) });
				}
				if (!inComponent(r, c + 1)) {
					edges.push_back({ LatticeVertex(r + 1, c + 1), LatticeVertex(r, c + 1) });
				}
			}

			auto vertexKey = [&](const LatticeVertex& v) {
				return (int64_t)v.row * ((int64_t)a.ncol() + 1) + v.col;
				};
			std::unordered_map<int64_t, std::vector<size_t>> outgoing;
			for (size_t i = 0; i < edges.size(); ++i) {
				outgoing[vertexKey(edges[i].from)].push_back(i);
			}

			//at a corner with two outgoing edges, turning right keeps the diagonal cells in one ring, turning left separates them
			auto nextEdge = [&](const LatticeEdge& in)->size_t {
				const std::vector<size_t>& candidates = outgoing.at(vertexKey(in.to));
				if (candidates.size() == 1) {
					return candidates[0];
				}
				rowcol_t wantDr, wantDc;
				if (connectivity == Connectivity::eight) {
					wantDr = in.dc();
					wantDc = -in.dr();
				}
				else {
					wantDr = -in.dc();
					wantDc = in.dr();
				}
				for (size_t candidate : candidates) {
					if (edges[candidate].dr() == wantDr && edges[candidate].dc() == wantDc) {
						return candidate;
					}
				}
				throw std::logic_error("Inconsistent boundary while tracing a ring");
				};

			std::vector<std::vector<LatticeVertex>> traced;
			for (size_t start = 0; start < edges.size(); ++start) {
				if (edges[start].used) {
					continue;
				}
				std::vector<LatticeVertex> ring;
				size_t current = start;
				do {
					edges[current].used = true;
					ring.push_back(edges[current].from);
					current = nextEdge(edges[current]);
					if (ring.size() > edges.size()) {
						throw std::logic_error("Ring tracing did not close");
					}
				} while (current != start);
				traced.push_back(std::move(ring));
			}

			//a ring that touches itself is cut into an outer ring and holes where that's possible
			//the ring is kept whole where it would give several outer rings, as with cells joined at a corner under eight-connectivity
			std::vector<std::vector<LatticeVertex>> outer;
			std::vector<std::vector<LatticeVertex>> holes;
			for (size_t i = 0; i < traced.size(); ++i) {
				std::vector<std::vector<LatticeVertex>> loops = splitAtRepeatedVertices(traced[i]);
				auto isOuter = [](const std::vector<LatticeVertex>& loop) { return latticeArea2(loop) > 0; };
				std::stable_partition(loops.begin(), loops.end(), isOuter);
				size_t nOuter = std::count_if(loops.begin(), loops.end(), isOuter);
				if (nOuter != (i == 0 ? 1u : 0u)) {
					(i == 0 ? outer : holes).push_back(std::move(traced[i]));
					continue;
				}
				for (std::vector<LatticeVertex>& loop : loops) {
					(isOuter(loop) ? outer : holes).push_back(std::move(loop));
				}
			}

			std::vector<std::vector<LatticeVertex>> rings;
			for (const std::vector<LatticeVertex>& ring : outer) {
				rings.push_back(dropStraightVertices(ring));
			}
			for (const std::vector<LatticeVertex>& ring : holes) {
				rings.push_back(dropStraightVertices(ring));
			}
			return rings;
		}
	}

	VectorDataset<Polygon> vectorizeMask(const Raster<label_t>& mask, Connectivity connectivity)
	{
		VectorDataset<Polygon> out{ mask.crs() };
		out.addIntegerField("ID");
		out.addIntegerField("NCELL");

		Raster<label_t> setCells{ (Alignment)mask };
		for (cell_t cell = 0; cell < mask.ncell(); ++cell) {
			auto v = mask[cell];
			if (v.has_value() && v.value() == 1) {
				setCells[cell].has_value() = true;
				setCells[cell].value() = 1;
			}
		}

		Raster<cell_t> components = connectedComponents(setCells, connectivity);
		std::vector<std::vector<cell_t>> cellsByComponent;
		for (cell_t cell : CellIterator(components)) {
			auto v = components[cell];
			if (!v.has_value()) {
				continue;
			}
			if ((size_t)v.value() > cellsByComponent.size()) {
				cellsByComponent.resize(v.value());
			}
			cellsByComponent[v.value() - 1].push_back(cell);
		}

		auto toCoords = [&](const std::vector<LatticeVertex>& ring) {
			std::vector<CoordXY> coords;
			coords.reserve(ring.size() + 1);
			for (const LatticeVertex& v : ring) {
				coords.emplace_back(mask.xmin() + v.col * mask.xres(), mask.ymax() - v.row * mask.yres());
			}
			return coords;
			};

		for (size_t i = 0; i < cellsByComponent.size(); ++i) {
			cell_t label = (cell_t)i + 1;
			auto rings = detail::traceComponentRings(mask, cellsByComponent[i], components, label, connectivity);
			Polygon poly{ toCoords(rings[0]), mask.crs() };
			for (size_t r = 1; r < rings.size(); ++r) {
				poly.addInnerRing(toCoords(rings[r]));
			}
			out.addGeometry(poly);
			out.setIntegerField(i, "ID", label);
			out.setIntegerField(i, "NCELL", (int64_t)cellsByComponent[i].size());
		}

		spdlog::debug("[Vectorize] {} polygons from {} set cells", out.nFeature(), setCells.countValues());
		return out;
	}
}
