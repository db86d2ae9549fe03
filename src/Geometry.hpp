#pragma once
#ifndef bs_geometry_h
#define bs_geometry_h

#include"bs_pch.hpp"
#include"CoordRef.hpp"
#include"Extent.hpp"

namespace burnscar {

	//A polygon with one outer ring and any number of holes. Rings are stored closed (the first point is repeated at the end).
	class Polygon {
	public:
		Polygon() = default;
		Polygon(const OGRGeometry& geom);
		Polygon(const OGRGeometry& geom, const CoordRef& crs);
		Polygon(const std::vector<CoordXY>& outerRing);
		Polygon(const std::vector<CoordXY>& outerRing, const CoordRef& crs);
		Polygon(const Extent& e);

		const CoordRef& crs() const;
		void setCrs(const CoordRef& crs);

		void addInnerRing(const std::vector<CoordXY>& innerRing);

		const std::vector<CoordXY>& getOuterRing() const;
		int nInnerRings() const;
		const std::vector<CoordXY>& getInnerRing(int index) const;

		Extent boundingBox() const;
		bool containsPoint(coord_t x, coord_t y) const;
		bool containsPoint(CoordXY xy) const;

		coord_t area() const;

		//number of vertices in the outer ring, ignoring consecutive duplicates and the closing point
		int nDistinctVertices() const;
		//true if no two non-adjacent edges of any ring touch or cross
		bool isSimple() const;

		//throws InvalidConfigurationException unless the polygon has at least three distinct vertices,
		//no self-intersections, and a non-zero area
		void validateAsAreaOfInterest() const;

	private:
		CoordRef _crs;
		std::vector<CoordXY> _outerRing;
		std::vector<std::vector<CoordXY>> _innerRings;

		static coord_t _areaFromRing(const std::vector<CoordXY>& ring);
		static bool _ringIsSimple(const std::vector<CoordXY>& ring);
		static void _closeRing(std::vector<CoordXY>& ring);
		void _sharedConstructorFromGdal(const OGRGeometry& geom);
	};

	//reads the first polygon of the first layer of an OGR-readable file
	//a multipolygon is accepted if it contains exactly one polygon
	Polygon readPolygonFile(const std::string& filename);
}

#endif
