#pragma once
#ifndef hm_terrain_h
#define hm_terrain_h

#include"Raster.hpp"

namespace himal {

	struct TerrainParams {
		//the length of one horizontal CRS unit in the units of the elevation values
		//1 for a projected DEM in meters, roughly 111320 for a DEM in degrees near the equator
		coord_t metersPerUnit = 1;
	};

	struct SlopeAspect {
		Raster<metric_t> slope;
		Raster<metric_t> aspect;
	};

	//approximate proxies; they reproduce a fixed formula and make no physical claim
	struct GlacierProxy {
		Raster<metric_t> thickness;
		Raster<metric_t> velocity;
	};

	//a 3x3 neighborhood in row-major order, with the cell size in elevation units
	struct Window3x3 {
		std::array<double, 9> z;
		coord_t xres, yres;
	};

	//the neighborhood of the given cell; neighbors outside of the raster or with nodata take the value of the center
	//the center must have a value
	template<class T>
	inline Window3x3 windowWithCenterFill(const Raster<T>& r, rowcol_t row, rowcol_t col, coord_t metersPerUnit) {
		Window3x3 out;
		out.xres = r.xres() * metersPerUnit;
		out.yres = r.yres() * metersPerUnit;
		double center = (double)r.atRCUnsafe(row, col).value();
		int i = 0;
		for (rowcol_t nr = row - 1; nr <= row + 1; ++nr) {
			for (rowcol_t nc = col - 1; nc <= col + 1; ++nc) {
				out.z[i] = center;
				if (nr >= 0 && nc >= 0 && nr < r.nrow() && nc < r.ncol()) {
					auto v = r.atRCUnsafe(nr, nc);
					if (v.has_value()) {
						out.z[i] = (double)v.value();
					}
				}
				++i;
			}
		}
		return out;
	}

	//Horn's kernel
	//nsSlope is positive when elevation rises to the south, ewSlope is positive when it falls to the east
	struct slopeComponents {
		double nsSlope, ewSlope;
	};
	inline slopeComponents getSlopeComponents(const Window3x3& in) {
		slopeComponents out;
		const auto& z = in.z;
		out.nsSlope = (z[6] + 2 * z[7] + z[8] - z[0] - 2 * z[1] - z[2]) / (8. * in.yres);
		out.ewSlope = (z[0] + 2 * z[3] + z[6] - z[2] - 2 * z[5] - z[8]) / (8. * in.xres);
		return out;
	}

	inline double slopeDegrees(const slopeComponents& comp) {
		constexpr double toDegrees = 180. / M_PI;
		double slopeProp = std::sqrt(comp.nsSlope * comp.nsSlope + comp.ewSlope * comp.ewSlope);
		return std::clamp(std::atan(slopeProp) * toDegrees, 0., 90.);
	}

	//the compass bearing of the downslope direction, in [0,360)
	//nodata when the cell is flat
	inline xtl::xoptional<double> aspectDegrees(const slopeComponents& comp) {
		constexpr double toDegrees = 180. / M_PI;
		double ns = comp.nsSlope;
		double ew = comp.ewSlope;
		double radians;
		if (ns > 0) {
			if (ew > 0) {
				radians = std::atan(ew / ns);
			}
			else if (ew < 0) {
				radians = 2. * M_PI + std::atan(ew / ns);
			}
			else {
				radians = 0;
			}
		}
		else if (ns < 0) {
			radians = M_PI + std::atan(ew / ns);
		}
		else {
			if (ew > 0) {
				radians = M_PI / 2.;
			}
			else if (ew < 0) {
				radians = 3. * M_PI / 2.;
			}
			else {
				return xtl::missing<double>();
			}
		}
		double degrees = radians * toDegrees;
		if (degrees >= 360.) {
			degrees = 0;
		}
		return degrees;
	}

	//slope in degrees [0,90] and aspect in degrees [0,360) on the grid of the DEM
	//nodata DEM cells are nodata in both outputs
	SlopeAspect deriveSlopeAspect(const Raster<metric_t>& dem, const TerrainParams& params = TerrainParams());

	//thickness = slope * snowlineElevation / 100 where the DEM is at or above the snowline, nodata elsewhere
	//velocity = thickness * velocityFactor
	GlacierProxy estimateThickness(const Raster<metric_t>& dem, const Raster<metric_t>& slope, double snowlineElevation, double velocityFactor);

	//1 at or above the snowline, 0 below it, nodata where the DEM is nodata
	Raster<label_t> snowlineMask(const Raster<metric_t>& dem, double snowlineElevation);
}

#endif
