#pragma once
#ifndef himal_geometry_h
#define himal_geometry_h

#include"gis_pch.hpp"
#include"CoordRef.hpp"
#include"Extent.hpp"
#include"GisExceptions.hpp"

namespace himal {

	class WrongGeometryTypeException : public std::runtime_error {
	public:
		WrongGeometryTypeException(const std::string& error);
	};

	//a closed ring; the last vertex repeats the first
	using Ring = std::vector<CoordXY>;

	class Geometry {
	public:
		virtual Extent boundingBox() const = 0;

		const CoordRef& crs() const;
		void setCrs(const CoordRef& crs);

		virtual ~Geometry() = default;

	protected:
		CoordRef _crs;
		Geometry() = default;
		Geometry(const Geometry&) = default;
		Geometry& operator=(const Geometry&) = default;
	};

	class Point : public Geometry {
	public:
		constexpr static OGRwkbGeometryType gdalGeometryTypeStatic = wkbPoint;
		using GdalEquivalent = OGRPoint;

		Point() = default;
		Point(const OGRGeometry& geom);
		Point(const OGRGeometry& geom, const CoordRef& crs);
		Point(coord_t x, coord_t y);
		Point(coord_t x, coord_t y, const CoordRef& crs);

		std::unique_ptr<OGRPoint> gdalGeometry() const;

		coord_t x() const;
		coord_t y() const;

		Extent boundingBox() const override;

	private:
		CoordXY _point;
	};

	//A polygon with one outer ring and any number of holes
	//The bounding box is computed once, so repeated containsPoint calls outside of it are cheap
	class Polygon : public Geometry {
	public:
		constexpr static OGRwkbGeometryType gdalGeometryTypeStatic = wkbPolygon;
		using GdalEquivalent = OGRPolygon;

		Polygon() = default;
		Polygon(const OGRGeometry& geom);
		Polygon(const OGRGeometry& geom, const CoordRef& crs);
		//the ring is closed if it isn't already; throws std::invalid_argument for fewer than three distinct vertices
		Polygon(const std::vector<CoordXY>& outerRing);
		Polygon(const std::vector<CoordXY>& outerRing, const CoordRef& crs);
		//counter-clockwise, starting from the lower left corner
		Polygon(const Extent& e);

		std::unique_ptr<OGRPolygon> gdalGeometry() const;

		void addInnerRing(const std::vector<CoordXY>& innerRing);

		const Ring& getOuterRing() const;
		int nInnerRings() const;
		const Ring& getInnerRing(int index) const;

		Extent boundingBox() const override;
		//crossing-number test; a point inside a hole is outside of the polygon
		bool containsPoint(coord_t x, coord_t y) const;

		coord_t area() const;

		//positive for counter-clockwise rings, negative for clockwise
		static coord_t signedRingArea(const Ring& ring);

	private:
		Ring _outerRing;
		std::vector<Ring> _innerRings;
		coord_t _xmin = 0, _xmax = 0, _ymin = 0, _ymax = 0;

		void _setOuterRing(Ring ring);
	};

	//A set of polygons treated as one region, such as a study area made of several parts
	class MultiPolygon : public Geometry {
	public:
		constexpr static OGRwkbGeometryType gdalGeometryTypeStatic = wkbMultiPolygon;
		using GdalEquivalent = OGRMultiPolygon;

		MultiPolygon() = default;
		//accepts both polygons and multipolygons
		MultiPolygon(const OGRGeometry& geom);
		MultiPolygon(const OGRGeometry& geom, const CoordRef& crs);
		explicit MultiPolygon(const Polygon& poly);

		size_t nPolygon() const;

		std::unique_ptr<OGRMultiPolygon> gdalGeometry() const;

		std::vector<Polygon>::const_iterator begin() const;
		std::vector<Polygon>::const_iterator end() const;

		//throws CRSMismatchException if the polygon's CRS is inconsistent with this one's
		void addPolygon(const Polygon& polygon);

		//an empty extent at the origin if there are no polygons
		Extent boundingBox() const override;
		bool containsPoint(coord_t x, coord_t y) const;

		coord_t area() const;

	private:
		std::vector<Polygon> _polygons;
		std::optional<Extent> _bbox;
	};
}

#endif
