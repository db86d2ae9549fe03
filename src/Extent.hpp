#pragma once
#ifndef bs_extent_h
#define bs_extent_h

#include"CoordRef.hpp"

namespace burnscar {

	class Extent {
	public:
		Extent() = default;
		Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax);
		Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax, const CoordRef& crs);
		virtual ~Extent() = default;

		coord_t xmin() const;
		coord_t xmax() const;
		coord_t ymin() const;
		coord_t ymax() const;
		const CoordRef& crs() const;
		void setCrs(const CoordRef& crs);

		//edges are inclusive on the left and top, exclusive on the right and bottom
		bool contains(coord_t x, coord_t y) const;
		//touching edges don't count as overlap
		bool overlaps(const Extent& e) const;

	protected:
		CoordRef _crs;
		coord_t _xmin = 0, _xmax = 0, _ymin = 0, _ymax = 0;
	};

	bool operator==(const Extent& lhs, const Extent& rhs);
	std::ostream& operator<<(std::ostream& os, const Extent& e);
}

#endif
