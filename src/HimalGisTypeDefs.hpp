#pragma once
#ifndef hm_himalgistypedefs_h
#define hm_himalgistypedefs_h

#include<cstdint>

namespace himal {

	using coord_t = double;
	using cell_t = int64_t;
	using rowcol_t = int32_t;
	using band_t = int32_t;
	constexpr coord_t HIMAL_EPSILON = 0.0001;
	using metric_t = float;

	//class codes in masks and hazard maps
	using label_t = int32_t;

	//an integer key identifying a month, a year, or a day
	using period_t = int64_t;
}

#endif
