#include"Extent.hpp"
#include"BurnScarExceptions.hpp"

namespace burnscar {

	Extent::Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax)
		: _xmin(xmin), _xmax(xmax), _ymin(ymin), _ymax(ymax)
	{
		if (xmin > xmax || ymin > ymax) {
			throw InvalidConfigurationException("Extent has its minimum greater than its maximum");
		}
	}
	Extent::Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax, const CoordRef& crs)
		: Extent(xmin, xmax, ymin, ymax)
	{
		_crs = crs;
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
	void Extent::setCrs(const CoordRef& crs)
	{
		_crs = crs;
	}
	bool Extent::contains(coord_t x, coord_t y) const
	{
		return x >= _xmin && x < _xmax && y > _ymin && y <= _ymax;
	}
	bool Extent::overlaps(const Extent& e) const
	{
		return _xmin < e._xmax && e._xmin < _xmax && _ymin < e._ymax && e._ymin < _ymax;
	}
	bool operator==(const Extent& lhs, const Extent& rhs)
	{
		bool equal = std::abs(lhs.xmin() - rhs.xmin()) < BS_EPSILON;
		equal = equal && std::abs(lhs.xmax() - rhs.xmax()) < BS_EPSILON;
		equal = equal && std::abs(lhs.ymin() - rhs.ymin()) < BS_EPSILON;
		equal = equal && std::abs(lhs.ymax() - rhs.ymax()) < BS_EPSILON;
		return equal && lhs.crs().isConsistent(rhs.crs());
	}
	std::ostream& operator<<(std::ostream& os, const Extent& e)
	{
		os << "xmin: " << e.xmin() << " xmax: " << e.xmax() << " ymin: " << e.ymin() << " ymax: " << e.ymax();
		if (!e.crs().isEmpty()) {
			os << " crs: " << e.crs().getShortName();
		}
		return os;
	}
}
