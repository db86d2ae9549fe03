#include"CoordRef.hpp"
#include"BurnScarExceptions.hpp"

namespace burnscar {

	CoordRef::CoordRef(const std::string& s)
	{
		if (s.empty()) {
			return;
		}
		_p = projCreateWrapper(s);
		if (!_p) {
			throw InvalidConfigurationException("Unable to interpret " + s + " as a CRS");
		}
		const char* name = proj_get_name(_p.get());
		_name = name ? name : s;
	}
	CoordRef::CoordRef(const char* s) : CoordRef(std::string(s))
	{
	}
	CoordRef::CoordRef(const OGRSpatialReference* osr)
	{
		if (!osr || osr->IsEmpty()) {
			return;
		}
		char* wkt = nullptr;
		const char* options[] = { "FORMAT=WKT2_2019", nullptr };
		if (osr->exportToWkt(&wkt, options) != OGRERR_NONE || !wkt) {
			CPLFree(wkt);
			return;
		}
		std::string asString{ wkt };
		CPLFree(wkt);
		*this = CoordRef(asString);
	}
	bool CoordRef::isEmpty() const
	{
		return !_p;
	}
	bool CoordRef::isConsistent(const CoordRef& other) const
	{
		if (isEmpty() || other.isEmpty()) {
			return true;
		}
		return projIsEquivalent(_p, other._p);
	}
	std::string CoordRef::getCompleteWKT() const
	{
		return projAsWkt(_p);
	}
	const std::string& CoordRef::getShortName() const
	{
		return _name;
	}
}
