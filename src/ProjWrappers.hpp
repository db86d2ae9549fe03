#pragma once
#ifndef bs_projwrappers_h
#define bs_projwrappers_h

#include"bs_pch.hpp"


namespace burnscar {

	using SharedPJ = std::shared_ptr<PJ>;
	SharedPJ makeSharedPJ(PJ* pj);

	using SharedPJCtx = std::shared_ptr<PJ_CONTEXT>;
	SharedPJCtx getNewPJContext();

	//PJ_CONTEXT is not thread-safe, so each thread gets its own
	class ProjContextByThread {
	private:
		inline static std::unordered_map<std::thread::id, SharedPJCtx> _ctxs;
	public:
		static PJ_CONTEXT* get();
	};

	//returns a null pointer if proj can't make sense of s
	SharedPJ projCreateWrapper(const std::string& s);

	//ignores axis order for geographic CRSes, since GDAL and PROJ disagree on it
	bool projIsEquivalent(const SharedPJ& a, const SharedPJ& b);

	std::string projAsWkt(const SharedPJ& p);
}

#endif
