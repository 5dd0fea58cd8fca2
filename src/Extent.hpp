#pragma once
#ifndef hm_extent_h
#define hm_extent_h

#include"gis_pch.hpp"
#include"CoordRef.hpp"
#include"Coordinate.hpp"

namespace himal {

	class Extent {
	public:
		Extent() = default;
		Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax);
		Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax, const CoordRef& crs);
		virtual ~Extent() = default;

		coord_t xmin() const;
		coord_t xmax() const;
		coord_t ymin() const;
		coord_t ymax() const;

		const CoordRef& crs() const;
		void defineCRS(const CoordRef& crs);

		//boundaries count as inside
		bool contains(coord_t x, coord_t y) const;
		bool overlaps(const Extent& e) const;

		coord_t area() const;

	protected:
		CoordRef _crs;
		coord_t _xmin = 0, _xmax = 0, _ymin = 0, _ymax = 0;

		void _checkValidExtent() const;
	};

	bool operator==(const Extent& lhs, const Extent& rhs);
	bool operator!=(const Extent& lhs, const Extent& rhs);
	std::ostream& operator<<(std::ostream& os, const Extent& e);

	//the smallest extent containing both
	Extent extendExtent(const Extent& base, const Extent& addition);
	//the intersection of the two; throws OutsideExtentException if they don't overlap
	Extent cropExtent(const Extent& base, const Extent& crop);
}

#endif
