#pragma once
#ifndef himal_projwrappers_h
#define himal_projwrappers_h

#include"gis_pch.hpp"
#include"HimalGisTypeDefs.hpp"


namespace himal {

	using SharedPJ = std::shared_ptr<PJ>;

	//wraps a PJ* so that proj_destroy is called when the last copy goes away. Null stays null.
	SharedPJ adoptPJ(PJ* pj);

	//PROJ objects must not be used from two threads through one context.
	//The returned context belongs to the calling thread and lives until the program exits.
	PJ_CONTEXT* threadProjContext();

	//null if PROJ can't make sense of the string
	SharedPJ crsFromDefinition(const std::string& def);
	SharedPJ crsFromOSR(const OGRSpatialReference& osr);

	//the 2D part of crs: vertical components, bound transformations, and the height axis of
	//geographic 3D CRSs are removed. Null if crs has no horizontal part.
	SharedPJ horizontalPart(const SharedPJ& crs);
}

#endif
