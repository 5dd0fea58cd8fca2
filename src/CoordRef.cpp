#include"CoordRef.hpp"
#include"GisExceptions.hpp"

namespace himal {

	void OSRReleaser::operator()(OGRSpatialReference* osr) const
	{
		if (osr) {
			osr->Release();
		}
	}

	CoordRef::CoordRef(const std::string& s)
	{
		_crsFromString(s);
	}
	CoordRef::CoordRef(const char* s)
	{
		_crsFromString(std::string(s));
	}
	CoordRef::CoordRef(const OGRSpatialReference* osr)
	{
		if (osr) {
			_p = crsFromOSR(*osr);
		}
	}

	std::string CoordRef::getCompleteWKT() const
	{
		if (!_p) {
			return "";
		}
		const char* wkt = proj_as_wkt(threadProjContext(), _p.get(), PJ_WKT2_2019, nullptr);
		return wkt ? std::string(wkt) : std::string();
	}
	std::string CoordRef::getShortName() const
	{
		if (!_p) {
			return "Unknown CRS";
		}
		const char* name = proj_get_name(_p.get());
		return name ? std::string(name) : std::string("Unnamed CRS");
	}

	bool CoordRef::isEmpty() const
	{
		return !_p;
	}
	bool CoordRef::isProjected() const
	{
		SharedPJ horiz = horizontalPart(_p);
		if (!horiz) {
			return false;
		}
		return proj_get_type(horiz.get()) == PJ_TYPE_PROJECTED_CRS;
	}

	bool CoordRef::isConsistent(const CoordRef& other) const
	{
		if (isEmpty() || other.isEmpty()) {
			return true;
		}
		return _equivalent(_p, other._p);
	}
	bool CoordRef::isConsistentHoriz(const CoordRef& other) const
	{
		if (isEmpty() || other.isEmpty()) {
			return true;
		}
		SharedPJ thisHoriz = horizontalPart(_p);
		SharedPJ otherHoriz = horizontalPart(other._p);
		if (!thisHoriz || !otherHoriz) {
			return true;
		}
		return _equivalent(thisHoriz, otherHoriz);
	}

	UniqueOSR CoordRef::gdalSpatialRef() const
	{
		if (isEmpty()) {
			return UniqueOSR();
		}
		UniqueOSR osr{ new OGRSpatialReference() };
		osr->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		std::string wkt = getCompleteWKT();
		if (osr->importFromWkt(wkt.c_str()) != OGRERR_NONE) {
			return UniqueOSR();
		}
		return osr;
	}

	const SharedPJ& CoordRef::getSharedPtr() const
	{
		return _p;
	}

	void CoordRef::_crsFromString(const std::string& s)
	{
		if (s.empty()) {
			return;
		}
		std::string def = s;
		if (std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit((unsigned char)c); })) {
			def = "EPSG:" + s;
		}
		_p = crsFromDefinition(def);
		if (!_p) {
			throw UnableToDeduceCRSException("Unable to interpret '" + s + "' as a CRS");
		}
	}
	bool CoordRef::_equivalent(const SharedPJ& a, const SharedPJ& b)
	{
		return proj_is_equivalent_to_with_ctx(threadProjContext(), a.get(), b.get(),
			PJ_COMP_EQUIVALENT_EXCEPT_AXIS_ORDER_GEOGCRS);
	}

	std::ostream& operator<<(std::ostream& os, const CoordRef& crs)
	{
		os << crs.getShortName();
		return os;
	}
}
