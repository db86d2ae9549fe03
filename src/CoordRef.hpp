#pragma once
#ifndef bs_coordref_h
#define bs_coordref_h

#include"ProjWrappers.hpp"

namespace burnscar {

	//A thin wrapper around a PROJ CRS object. Only identity matters here: the pipeline never reprojects.
	//A default-constructed CoordRef is 'unknown', and is treated as consistent with everything
	class CoordRef {
	public:
		CoordRef() = default;

		//accepts anything proj_create does: EPSG codes like "EPSG:32759", WKT, PROJJSON
		//throws InvalidConfigurationException if the string can't be interpreted
		CoordRef(const std::string& s);
		CoordRef(const char* s);
		CoordRef(const OGRSpatialReference* osr);

		bool isEmpty() const;
		bool isConsistent(const CoordRef& other) const;

		std::string getCompleteWKT() const;
		const std::string& getShortName() const;

	private:
		SharedPJ _p;
		std::string _name;
	};
}

#endif
