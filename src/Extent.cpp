#include"Extent.hpp"
#include"GisExceptions.hpp"

namespace himal {

	Extent::Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax)
		: _xmin(xmin), _xmax(xmax), _ymin(ymin), _ymax(ymax)
	{
		_checkValidExtent();
	}
	Extent::Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax, const CoordRef& crs)
		: _crs(crs), _xmin(xmin), _xmax(xmax), _ymin(ymin), _ymax(ymax)
	{
		_checkValidExtent();
	}

	coord_t Extent::xmin() const
	{
		return _xmin;
	}
	coord_t Extent::xmax() const
	{
		return _xmax;
	}
	coord_t Extent::ymin() const
	{
		return _ymin;
	}
	coord_t Extent::ymax() const
	{
		return _ymax;
	}
	const CoordRef& Extent::crs() const
	{
		return _crs;
	}
	void Extent::defineCRS(const CoordRef& crs)
	{
		_crs = crs;
	}

	bool Extent::contains(coord_t x, coord_t y) const
	{
		return x >= _xmin && x <= _xmax && y >= _ymin && y <= _ymax;
	}
	bool Extent::overlaps(const Extent& e) const
	{
		return _xmin < e._xmax && _xmax > e._xmin && _ymin < e._ymax && _ymax > e._ymin;
	}
	coord_t Extent::area() const
	{
		return (_xmax - _xmin) * (_ymax - _ymin);
	}

	void Extent::_checkValidExtent() const
	{
		if (_xmin > _xmax || _ymin > _ymax) {
			throw std::invalid_argument("Extent minimum is greater than its maximum");
		}
	}

	bool operator==(const Extent& lhs, const Extent& rhs)
	{
		return std::abs(lhs.xmin() - rhs.xmin()) < HIMAL_EPSILON
			&& std::abs(lhs.xmax() - rhs.xmax()) < HIMAL_EPSILON
			&& std::abs(lhs.ymin() - rhs.ymin()) < HIMAL_EPSILON
			&& std::abs(lhs.ymax() - rhs.ymax()) < HIMAL_EPSILON
			&& lhs.crs().isConsistent(rhs.crs());
	}
	bool operator!=(const Extent& lhs, const Extent& rhs)
	{
		return !(lhs == rhs);
	}
	std::ostream& operator<<(std::ostream& os, const Extent& e)
	{
		os << " xmin: " << e.xmin() << " xmax: " << e.xmax() << " ymin: " << e.ymin() << " ymax: " << e.ymax() << " crs: " << e.crs();
		return os;
	}

	Extent extendExtent(const Extent& base, const Extent& addition)
	{
		if (!base.crs().isConsistentHoriz(addition.crs())) {
			throw CRSMismatchException("CRS mismatch in extendExtent");
		}
		return Extent(std::min(base.xmin(), addition.xmin()), std::max(base.xmax(), addition.xmax()),
			std::min(base.ymin(), addition.ymin()), std::max(base.ymax(), addition.ymax()), base.crs());
	}
	Extent cropExtent(const Extent& base, const Extent& crop)
	{
		if (!base.crs().isConsistentHoriz(crop.crs())) {
			throw CRSMismatchException("CRS mismatch in cropExtent");
		}
		coord_t xmin = std::max(base.xmin(), crop.xmin());
		coord_t xmax = std::min(base.xmax(), crop.xmax());
		coord_t ymin = std::max(base.ymin(), crop.ymin());
		coord_t ymax = std::min(base.ymax(), crop.ymax());
		if (xmin > xmax || ymin > ymax) {
			throw OutsideExtentException("Extents do not overlap in cropExtent");
		}
		return Extent(xmin, xmax, ymin, ymax, base.crs());
	}
}
