#include"Geometry.hpp"

namespace himal {

	namespace {
		Ring closedRing(const std::vector<CoordXY>& coords) {
			Ring out = coords;
			if (out.size() && !(out.back() == out.front())) {
				out.push_back(out.front());
			}
			if (out.size() < 4) {
				throw std::invalid_argument("Rings must have at least 3 vertices");
			}
			return out;
		}

		Ring ringFromGdal(const OGRLinearRing& gdalRing) {
			Ring out;
			out.reserve(gdalRing.getNumPoints());
			for (const OGRPoint& p : gdalRing) {
				out.emplace_back(p.getX(), p.getY());
			}
			return out;
		}

		void addGdalRing(OGRPolygon& poly, const Ring& ring) {
			OGRLinearRing gdalRing;
			for (const CoordXY& xy : ring) {
				gdalRing.addPoint(xy.x, xy.y);
			}
			if (poly.addRing(&gdalRing) != OGRERR_NONE) {
				throw std::runtime_error("Unable to add a ring to a GDAL polygon");
			}
		}

		//odd number of edge crossings on a ray to the right of the point
		bool ringContains(const Ring& ring, coord_t x, coord_t y) {
			bool inside = false;
			for (size_t i = 1; i < ring.size(); ++i) {
				const CoordXY& a = ring[i - 1];
				const CoordXY& b = ring[i];
				if ((a.y > y) == (b.y > y)) {
					continue;
				}
				coord_t crossX = a.x + (y - a.y) * (b.x - a.x) / (b.y - a.y);
				if (x < crossX) {
					inside = !inside;
				}
			}
			return inside;
		}

		void checkGeometryType(const OGRGeometry& geom, OGRwkbGeometryType expected, const char* name) {
			if (wkbFlatten(geom.getGeometryType()) != expected) {
				throw WrongGeometryTypeException(std::string("Wrong geometry; expected ") + name);
			}
		}
	}

	WrongGeometryTypeException::WrongGeometryTypeException(const std::string& error) : std::runtime_error(error) {}

	const CoordRef& Geometry::crs() const
	{
		return _crs;
	}
	void Geometry::setCrs(const CoordRef& crs)
	{
		_crs = crs;
	}

	Point::Point(const OGRGeometry& geom)
		: Point(geom, CoordRef(geom.getSpatialReference()))
	{
	}
	Point::Point(const OGRGeometry& geom, const CoordRef& crs)
	{
		checkGeometryType(geom, wkbPoint, "Point");
		const OGRPoint* p = geom.toPoint();
		_point = CoordXY{ p->getX(), p->getY() };
		_crs = crs;
	}
	Point::Point(coord_t x, coord_t y)
		: _point(x, y)
	{
	}
	Point::Point(coord_t x, coord_t y, const CoordRef& crs)
		: _point(x, y)
	{
		_crs = crs;
	}
	std::unique_ptr<OGRPoint> Point::gdalGeometry() const
	{
		auto out = std::make_unique<OGRPoint>(_point.x, _point.y);
		out->assignSpatialReference(_crs.gdalSpatialRef().get());
		return out;
	}
	coord_t Point::x() const
	{
		return _point.x;
	}
	coord_t Point::y() const
	{
		return _point.y;
	}
	Extent Point::boundingBox() const
	{
		return Extent(_point.x, _point.x, _point.y, _point.y, _crs);
	}

	Polygon::Polygon(const OGRGeometry& geom)
		: Polygon(geom, CoordRef(geom.getSpatialReference()))
	{
	}
	Polygon::Polygon(const OGRGeometry& geom, const CoordRef& crs)
	{
		checkGeometryType(geom, wkbPolygon, "Polygon");
		const OGRPolygon* gdalPolygon = geom.toPolygon();
		_crs = crs;
		_setOuterRing(closedRing(ringFromGdal(*gdalPolygon->getExteriorRing())));
		for (int i = 0; i < gdalPolygon->getNumInteriorRings(); ++i) {
			addInnerRing(ringFromGdal(*gdalPolygon->getInteriorRing(i)));
		}
	}
	Polygon::Polygon(const std::vector<CoordXY>& outerRing)
	{
		_setOuterRing(closedRing(outerRing));
	}
	Polygon::Polygon(const std::vector<CoordXY>& outerRing, const CoordRef& crs)
		: Polygon(outerRing)
	{
		_crs = crs;
	}
	Polygon::Polygon(const Extent& e)
	{
		_crs = e.crs();
		_setOuterRing({ { e.xmin(), e.ymin() }, { e.xmax(), e.ymin() }, { e.xmax(), e.ymax() }, { e.xmin(), e.ymax() }, { e.xmin(), e.ymin() } });
	}
	std::unique_ptr<OGRPolygon> Polygon::gdalGeometry() const
	{
		auto out = std::make_unique<OGRPolygon>();
		addGdalRing(*out, _outerRing);
		for (const Ring& inner : _innerRings) {
			addGdalRing(*out, inner);
		}
		out->assignSpatialReference(_crs.gdalSpatialRef().get());
		return out;
	}
	void Polygon::addInnerRing(const std::vector<CoordXY>& innerRing)
	{
		_innerRings.push_back(closedRing(innerRing));
	}
	const Ring& Polygon::getOuterRing() const
	{
		return _outerRing;
	}
	int Polygon::nInnerRings() const
	{
		return (int)_innerRings.size();
	}
	const Ring& Polygon::getInnerRing(int index) const
	{
		return _innerRings.at(index);
	}
	Extent Polygon::boundingBox() const
	{
		return Extent(_xmin, _xmax, _ymin, _ymax, _crs);
	}
	bool Polygon::containsPoint(coord_t x, coord_t y) const
	{
		if (_outerRing.empty() || x < _xmin || x > _xmax || y < _ymin || y > _ymax) {
			return false;
		}
		if (!ringContains(_outerRing, x, y)) {
			return false;
		}
		for (const Ring& inner : _innerRings) {
			if (ringContains(inner, x, y)) {
				return false;
			}
		}
		return true;
	}
	coord_t Polygon::area() const
	{
		coord_t out = std::abs(signedRingArea(_outerRing));
		for (const Ring& inner : _innerRings) {
			out -= std::abs(signedRingArea(inner));
		}
		return out;
	}
	coord_t Polygon::signedRingArea(const Ring& ring)
	{
		if (ring.size() < 4) {
			return 0;
		}
		//shoelace
		coord_t twiceArea = 0;
		for (size_t i = 1; i < ring.size(); ++i) {
			twiceArea += ring[i - 1].x * ring[i].y - ring[i].x * ring[i - 1].y;
		}
		return twiceArea / 2.;
	}
	void Polygon::_setOuterRing(Ring ring)
	{
		_outerRing = std::move(ring);
		auto [xlo, xhi] = std::minmax_element(_outerRing.begin(), _outerRing.end(),
			[](const CoordXY& a, const CoordXY& b) { return a.x < b.x; });
		auto [ylo, yhi] = std::minmax_element(_outerRing.begin(), _outerRing.end(),
			[](const CoordXY& a, const CoordXY& b) { return a.y < b.y; });
		_xmin = xlo->x;
		_xmax = xhi->x;
		_ymin = ylo->y;
		_ymax = yhi->y;
	}

	MultiPolygon::MultiPolygon(const OGRGeometry& geom)
		: MultiPolygon(geom, CoordRef(geom.getSpatialReference()))
	{
	}
	MultiPolygon::MultiPolygon(const OGRGeometry& geom, const CoordRef& crs)
	{
		_crs = crs;
		OGRwkbGeometryType type = wkbFlatten(geom.getGeometryType());
		if (type == wkbPolygon) {
			addPolygon(Polygon(geom, crs));
			return;
		}
		checkGeometryType(geom, wkbMultiPolygon, "MultiPolygon");
		const OGRMultiPolygon* gdalMulti = geom.toMultiPolygon();
		for (int i = 0; i < gdalMulti->getNumGeometries(); ++i) {
			addPolygon(Polygon(*gdalMulti->getGeometryRef(i), crs));
		}
	}
	MultiPolygon::MultiPolygon(const Polygon& poly)
	{
		_crs = poly.crs();
		addPolygon(poly);
	}
	size_t MultiPolygon::nPolygon() const
	{
		return _polygons.size();
	}
	std::unique_ptr<OGRMultiPolygon> MultiPolygon::gdalGeometry() const
	{
		auto out = std::make_unique<OGRMultiPolygon>();
		for (const Polygon& poly : _polygons) {
			if (out->addGeometry(poly.gdalGeometry().get()) != OGRERR_NONE) {
				throw std::runtime_error("Unable to add a polygon to a GDAL multipolygon");
			}
		}
		out->assignSpatialReference(_crs.gdalSpatialRef().get());
		return out;
	}
	std::vector<Polygon>::const_iterator MultiPolygon::begin() const
	{
		return _polygons.begin();
	}
	std::vector<Polygon>::const_iterator MultiPolygon::end() const
	{
		return _polygons.end();
	}
	void MultiPolygon::addPolygon(const Polygon& polygon)
	{
		if (!polygon.crs().isConsistent(_crs)) {
			throw CRSMismatchException("Polygon CRS does not match MultiPolygon CRS");
		}
		if (_crs.isEmpty()) {
			_crs = polygon.crs();
		}
		_polygons.push_back(polygon);
		Extent box = polygon.boundingBox();
		_bbox = _bbox.has_value()
			? Extent(std::min(_bbox->xmin(), box.xmin()), std::max(_bbox->xmax(), box.xmax()),
				std::min(_bbox->ymin(), box.ymin()), std::max(_bbox->ymax(), box.ymax()))
			: Extent(box.xmin(), box.xmax(), box.ymin(), box.ymax());
	}
	Extent MultiPolygon::boundingBox() const
	{
		if (!_bbox.has_value()) {
			return Extent(0, 0, 0, 0, _crs);
		}
		return Extent(_bbox->xmin(), _bbox->xmax(), _bbox->ymin(), _bbox->ymax(), _crs);
	}
	bool MultiPolygon::containsPoint(coord_t x, coord_t y) const
	{
		return std::any_of(_polygons.begin(), _polygons.end(),
			[x, y](const Polygon& p) { return p.containsPoint(x, y); });
	}
	coord_t MultiPolygon::area() const
	{
		coord_t out = 0;
		for (const Polygon& poly : _polygons) {
			out += poly.area();
		}
		return out;
	}
}
