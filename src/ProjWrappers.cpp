#include"gis_pch.hpp"
#include"projwrappers.hpp"
#include"GDALWrappers.hpp"

namespace himal {

	namespace {
		struct ContextRegistry {
			std::mutex mut;
			std::vector<PJ_CONTEXT*> contexts;

			~ContextRegistry() {
				for (PJ_CONTEXT* c : contexts) {
					proj_context_destroy(c);
				}
			}
		};

		ContextRegistry& registry() {
			static ContextRegistry r;
			return r;
		}

		PJ_CONTEXT* newRegisteredContext() {
			ContextRegistry& r = registry();
			PJ_CONTEXT* ctx = proj_context_create();
			if (!ctx) {
				throw std::runtime_error("Unable to create a PROJ context");
			}
			std::scoped_lock<std::mutex> lock{ r.mut };
			r.contexts.push_back(ctx);
			return ctx;
		}
	}

	SharedPJ adoptPJ(PJ* pj)
	{
		if (!pj) {
			return SharedPJ();
		}
		return SharedPJ(pj, [](PJ* p) { proj_destroy(p); });
	}

	PJ_CONTEXT* threadProjContext()
	{
		thread_local PJ_CONTEXT* ctx = newRegisteredContext();
		return ctx;
	}

	SharedPJ crsFromDefinition(const std::string& def)
	{
		return adoptPJ(proj_create(threadProjContext(), def.c_str()));
	}

	SharedPJ crsFromOSR(const OGRSpatialReference& osr)
	{
		UniqueGdalString wkt = exportToWktWrapper(osr);
		if (!wkt) {
			return SharedPJ();
		}
		return crsFromDefinition(wkt.get());
	}

	SharedPJ horizontalPart(const SharedPJ& crs)
	{
		if (!crs || !proj_is_crs(crs.get())) {
			return SharedPJ();
		}
		PJ_CONTEXT* ctx = threadProjContext();

		switch (proj_get_type(crs.get())) {
		case PJ_TYPE_VERTICAL_CRS:
			return SharedPJ();
		case PJ_TYPE_GEOGRAPHIC_3D_CRS:
			return adoptPJ(proj_crs_demote_to_2D(ctx, nullptr, crs.get()));
		case PJ_TYPE_BOUND_CRS:
		case PJ_TYPE_DERIVED_PROJECTED_CRS:
			return horizontalPart(adoptPJ(proj_get_source_crs(ctx, crs.get())));
		case PJ_TYPE_COMPOUND_CRS:
			for (int i = 0; i < 2; ++i) {
				SharedPJ part = horizontalPart(adoptPJ(proj_crs_get_sub_crs(ctx, crs.get(), i)));
				if (part) {
					return part;
				}
			}
			return SharedPJ();
		default:
			return crs;
		}
	}
}
