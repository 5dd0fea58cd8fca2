#pragma once
#ifndef hm_coordref_h
#define hm_coordref_h

#include"gis_pch.hpp"
#include"projwrappers.hpp"

namespace himal {

	struct OSRReleaser {
		void operator()(OGRSpatialReference* osr) const;
	};
	using UniqueOSR = std::unique_ptr<OGRSpatialReference, OSRReleaser>;

	//A thin layer over a PROJ crs object.
	//A default-constructed CoordRef is 'unknown', and is considered consistent with every other CRS
	class CoordRef {
	public:
		CoordRef() = default;

		//accepts anything proj_create does (EPSG:xxxx, WKT, proj strings), as well as bare EPSG codes
		CoordRef(const std::string& s);
		CoordRef(const char* s);
		CoordRef(const OGRSpatialReference* osr);

		std::string getCompleteWKT() const;
		std::string getShortName() const;

		bool isEmpty() const;
		bool isProjected() const;

		bool isConsistent(const CoordRef& other) const;
		bool isConsistentHoriz(const CoordRef& other) const;

		//null if the CRS is empty; the caller's reference is released when the pointer dies
		UniqueOSR gdalSpatialRef() const;

		const SharedPJ& getSharedPtr() const;

	private:
		SharedPJ _p;

		void _crsFromString(const std::string& s);
		static bool _equivalent(const SharedPJ& a, const SharedPJ& b);
	};

	std::ostream& operator<<(std::ostream& os, const CoordRef& crs);
}

#endif
