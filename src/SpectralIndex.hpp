#pragma once
#ifndef hm_spectralindex_h
#define hm_spectralindex_h

#include"MultiBandRaster.hpp"

namespace himal {

	//(a - b) / (a + b) per cell, e.g. NDWI from green and near-infrared
	//nodata where either input is nodata or where a + b is zero
	//for non-negative reflectances the result is within [-1,1]; it's clamped to that range to absorb rounding
	template<class T>
	inline Raster<metric_t> normalizedDifference(const Raster<T>& a, const Raster<T>& b) {
		if (!a.isSameAlignment(b)) {
			throw AlignmentMismatchException("Alignment mismatch in normalizedDifference");
		}
		Raster<metric_t> out{ (Alignment)a };
		for (cell_t cell = 0; cell < out.ncell(); ++cell) {
			auto va = a[cell];
			auto vb = b[cell];
			if (!va.has_value() || !vb.has_value()) {
				continue;
			}
			double sum = (double)va.value() + (double)vb.value();
			if (sum == 0) {
				continue;
			}
			double nd = ((double)va.value() - (double)vb.value()) / sum;
			out[cell].has_value() = true;
			out[cell].value() = (metric_t)std::clamp(nd, -1., 1.);
		}
		return out;
	}

	//throws std::out_of_range if either band isn't in the image
	template<class T>
	inline Raster<metric_t> normalizedDifference(const MultiBandRaster<T>& image, const std::string& bandA, const std::string& bandB) {
		return normalizedDifference(image.bandByName(bandA), image.bandByName(bandB));
	}

	//1 where the index is strictly greater than the threshold, 0 everywhere else
	//nodata index cells become 0: an unmeasured pixel is never counted as water
	//the output has a value in every cell
	template<class T>
	inline Raster<label_t> thresholdAbove(const Raster<T>& index, const double threshold) {
		Raster<label_t> out{ (Alignment)index, 0 };
		for (cell_t cell = 0; cell < out.ncell(); ++cell) {
			auto v = index[cell];
			if (v.has_value() && (double)v.value() > threshold) {
				out[cell].value() = 1;
			}
		}
		return out;
	}
}

#endif
