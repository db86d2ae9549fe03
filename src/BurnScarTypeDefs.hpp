#pragma once
#ifndef bs_burnscartypedefs_h
#define bs_burnscartypedefs_h

#include<cstdint>

namespace burnscar {

	using coord_t = double;
	using cell_t = int64_t;
	using rowcol_t = int32_t;
	using band_t = int32_t;
	constexpr coord_t BS_EPSILON = 0.0001;

	//stored reflectances and quality words; 16-bit integers are exact in a float
	using reflectance_t = float;
	using index_t = double;
	using class_t = int16_t;
	//months per year with surface water, 0-12
	using seasonality_t = int16_t;

	struct CoordXY {
		coord_t x, y;
		CoordXY() : x(0), y(0) {}
		CoordXY(coord_t x, coord_t y) : x(x), y(y) {}
		bool operator==(const CoordXY& other) const = default;
	};
}

#endif
