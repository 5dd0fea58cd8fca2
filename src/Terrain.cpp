#include"Terrain.hpp"

#include<omp.h>

namespace himal {

	SlopeAspect deriveSlopeAspect(const Raster<metric_t>& dem, const TerrainParams& params)
	{
		if (params.metersPerUnit <= 0) {
			throw std::invalid_argument("metersPerUnit must be positive");
		}
		const cell_t n = dem.ncell();

		//the rasters' nodata flags are packed bits, so each thread writes to plain buffers first
		std::vector<metric_t> slopeValues(n, 0);
		std::vector<metric_t> aspectValues(n, 0);
		std::vector<char> slopeValid(n, 0);
		std::vector<char> aspectValid(n, 0);

#pragma omp parallel for schedule(static)
		for (rowcol_t row = 0; row < dem.nrow(); ++row) {
			for (rowcol_t col = 0; col < dem.ncol(); ++col) {
				cell_t cell = dem.cellFromRowColUnsafe(row, col);
				if (!dem[cell].has_value()) {
					continue;
				}
				slopeComponents comp = getSlopeComponents(windowWithCenterFill(dem, row, col, params.metersPerUnit));
				slopeValues[cell] = (metric_t)slopeDegrees(comp);
				slopeValid[cell] = 1;
				xtl::xoptional<double> aspect = aspectDegrees(comp);
				if (aspect.has_value()) {
					aspectValues[cell] = (metric_t)aspect.value();
					aspectValid[cell] = 1;
				}
			}
		}

		SlopeAspect out{ Raster<metric_t>{ (Alignment)dem }, Raster<metric_t>{ (Alignment)dem } };
		for (cell_t cell = 0; cell < n; ++cell) {
			if (slopeValid[cell]) {
				out.slope[cell].has_value() = true;
				out.slope[cell].value() = slopeValues[cell];
			}
			if (aspectValid[cell]) {
				out.aspect[cell].has_value() = true;
				out.aspect[cell].value() = aspectValues[cell];
			}
		}
		return out;
	}

	GlacierProxy estimateThickness(const Raster<metric_t>& dem, const Raster<metric_t>& slope, double snowlineElevation, double velocityFactor)
	{
		if (!dem.isSameAlignment(slope)) {
			throw AlignmentMismatchException("Alignment mismatch in estimateThickness");
		}
		GlacierProxy out{ Raster<metric_t>{ (Alignment)dem }, Raster<metric_t>{ (Alignment)dem } };
		for (cell_t cell = 0; cell < dem.ncell(); ++cell) {
			auto elev = dem[cell];
			auto s = slope[cell];
			if (!elev.has_value() || !s.has_value() || elev.value() < snowlineElevation) {
				continue;
			}
			double thickness = s.value() * snowlineElevation / 100.;
			out.thickness[cell].has_value() = true;
			out.thickness[cell].value() = (metric_t)thickness;
			out.velocity[cell].has_value() = true;
			out.velocity[cell].value() = (metric_t)(thickness * velocityFactor);
		}
		return out;
	}

	Raster<label_t> snowlineMask(const Raster<metric_t>& dem, double snowlineElevation)
	{
		Raster<label_t> out{ (Alignment)dem };
		for (cell_t cell = 0; cell < dem.ncell(); ++cell) {
			auto elev = dem[cell];
			if (!elev.has_value()) {
				continue;
			}
			out[cell].has_value() = true;
			out[cell].value() = elev.value() >= snowlineElevation ? 1 : 0;
		}
		return out;
	}
}
