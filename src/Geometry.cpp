#include"Geometry.hpp"
#include"BurnScarExceptions.hpp"
#include"GDALWrappers.hpp"

namespace burnscar {

    namespace {
        //removes consecutive duplicates and the closing point
        std::vector<CoordXY> distinctVertices(const std::vector<CoordXY>& ring) {
            std::vector<CoordXY> out;
            for (const CoordXY& xy : ring) {
                if (out.size() && std::abs(out.back().x - xy.x) < BS_EPSILON && std::abs(out.back().y - xy.y) < BS_EPSILON) {
                    continue;
                }
                out.push_back(xy);
            }
            while (out.size() > 1 && std::abs(out.back().x - out.front().x) < BS_EPSILON && std::abs(out.back().y - out.front().y) < BS_EPSILON) {
                out.pop_back();
            }
            return out;
        }

        //sign of the cross product (b-a)x(c-a)
        int orientation(const CoordXY& a, const CoordXY& b, const CoordXY& c) {
            coord_t cross = (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
            if (std::abs(cross) < BS_EPSILON * BS_EPSILON) {
                return 0;
            }
            return cross > 0 ? 1 : -1;
        }

        //assumes a, b, c are collinear
        bool onSegment(const CoordXY& a, const CoordXY& b, const CoordXY& c) {
            return c.x <= std::max(a.x, b.x) + BS_EPSILON && c.x >= std::min(a.x, b.x) - BS_EPSILON
                && c.y <= std::max(a.y, b.y) + BS_EPSILON && c.y >= std::min(a.y, b.y) - BS_EPSILON;
        }

        bool segmentsIntersect(const CoordXY& p1, const CoordXY& p2, const CoordXY& q1, const CoordXY& q2) {
            int o1 = orientation(p1, p2, q1);
            int o2 = orientation(p1, p2, q2);
            int o3 = orientation(q1, q2, p1);
            int o4 = orientation(q1, q2, p2);
            if (o1 != o2 && o3 != o4) {
                return true;
            }
            if (o1 == 0 && onSegment(p1, p2, q1)) return true;
            if (o2 == 0 && onSegment(p1, p2, q2)) return true;
            if (o3 == 0 && onSegment(q1, q2, p1)) return true;
            if (o4 == 0 && onSegment(q1, q2, p2)) return true;
            return false;
        }
    }

    Polygon::Polygon(const OGRGeometry& geom)
    {
        _sharedConstructorFromGdal(geom);
        setCrs(CoordRef(geom.getSpatialReference()));
    }
    Polygon::Polygon(const OGRGeometry& geom, const CoordRef& crs)
    {
        _sharedConstructorFromGdal(geom);
        setCrs(crs);
    }
    Polygon::Polygon(const std::vector<CoordXY>& outerRing)
    {
        _outerRing = outerRing;
        if (_outerRing.empty()) {
            throw InvalidConfigurationException("Rings must have at least 3 points");
        }
        _closeRing(_outerRing);
        if (_outerRing.size() < 4) {
            throw InvalidConfigurationException("Rings must have at least 3 points");
        }
    }
    Polygon::Polygon(const std::vector<CoordXY>& outerRing, const CoordRef& crs)
        : Polygon(outerRing)
    {
        setCrs(crs);
    }
    Polygon::Polygon(const Extent& e)
    {
        setCrs(e.crs());

        _outerRing.reserve(5);
        _outerRing.emplace_back(e.xmin(), e.ymax());
        _outerRing.emplace_back(e.xmin(), e.ymin());
        _outerRing.emplace_back(e.xmax(), e.ymin());
        _outerRing.emplace_back(e.xmax(), e.ymax());
        _outerRing.push_back(_outerRing.front());
    }
    const CoordRef& Polygon::crs() const
    {
        return _crs;
    }
    void Polygon::setCrs(const CoordRef& crs)
    {
        _crs = crs;
    }
    void Polygon::addInnerRing(const std::vector<CoordXY>& innerRing)
    {
        std::vector<CoordXY> ring = innerRing;
        _closeRing(ring);
        _innerRings.push_back(std::move(ring));
    }
    const std::vector<CoordXY>& Polygon::getOuterRing() const {
        return _outerRing;
    }
    int Polygon::nInnerRings() const
    {
        return (int)_innerRings.size();
    }
    const std::vector<CoordXY>& Polygon::getInnerRing(int index) const
    {
        return _innerRings.at(index);
    }
    Extent Polygon::boundingBox() const
    {
        coord_t xmin = std::numeric_limits<coord_t>::max();
        coord_t xmax = std::numeric_limits<coord_t>::lowest();
        coord_t ymin = std::numeric_limits<coord_t>::max();
        coord_t ymax = std::numeric_limits<coord_t>::lowest();
        if (_outerRing.empty()) {
            return Extent{ 0, 0, 0, 0, _crs };
        }
        for (const CoordXY& xy : _outerRing) {
            if (xy.x < xmin) xmin = xy.x;
            if (xy.x > xmax) xmax = xy.x;
            if (xy.y < ymin) ymin = xy.y;
            if (xy.y > ymax) ymax = xy.y;
        }
        return Extent{ xmin, xmax, ymin, ymax, _crs };
    }
    bool Polygon::containsPoint(coord_t x, coord_t y) const
    {
        auto pointInRing = [](const std::vector<CoordXY>& ring, coord_t x, coord_t y) {
            int nvert = (int)(ring.size() - 1);
            bool within = false;
            for (int i = 0, j = nvert - 1; i < nvert; j = i++) {
                coord_t ix = ring[i].x;
                coord_t iy = ring[i].y;
                coord_t jx = ring[j].x;
                coord_t jy = ring[j].y;
                if (((iy > y) != (jy > y)) &&
                    (x < (jx - ix) * (y - iy) / (jy - iy) + ix)) {
                    within = !within;
                }
            }
            return within;
            };

        if (_outerRing.size() < 4) {
            return false;
        }
        if (!pointInRing(_outerRing, x, y)) {
            return false;
        }
        for (const std::vector<CoordXY>& innerRing : _innerRings) {
            if (pointInRing(innerRing, x, y)) {
                return false;
            }
        }
        return true;
    }
    bool Polygon::containsPoint(CoordXY xy) const
    {
        return containsPoint(xy.x, xy.y);
    }
    coord_t Polygon::area() const
    {
        coord_t totalArea = _areaFromRing(_outerRing);
        for (const std::vector<CoordXY>& innerRing : _innerRings) {
            totalArea -= _areaFromRing(innerRing);
        }
        return totalArea;
    }
    int Polygon::nDistinctVertices() const
    {
        std::vector<CoordXY> unique;
        for (const CoordXY& xy : distinctVertices(_outerRing)) {
            bool seen = false;
            for (const CoordXY& u : unique) {
                if (std::abs(u.x - xy.x) < BS_EPSILON && std::abs(u.y - xy.y) < BS_EPSILON) {
                    seen = true;
                    break;
                }
            }
            if (!seen) {
                unique.push_back(xy);
            }
        }
        return (int)unique.size();
    }
    bool Polygon::isSimple() const
    {
        if (!_ringIsSimple(_outerRing)) {
            return false;
        }
        for (const std::vector<CoordXY>& innerRing : _innerRings) {
            if (!_ringIsSimple(innerRing)) {
                return false;
            }
        }
        return true;
    }
    void Polygon::validateAsAreaOfInterest() const
    {
        if (nDistinctVertices() < 3) {
            throw InvalidConfigurationException("Area of interest must have at least 3 distinct vertices");
        }
        if (!isSimple()) {
            throw InvalidConfigurationException("Area of interest polygon intersects itself");
        }
        if (area() < BS_EPSILON * BS_EPSILON) {
            throw InvalidConfigurationException("Area of interest polygon has no area");
        }
    }
    void Polygon::_sharedConstructorFromGdal(const OGRGeometry& geom) {
        if (wkbFlatten(geom.getGeometryType()) != wkbPolygon) {
            throw WrongGeometryTypeException("Wrong geometry; expected Polygon");
        }
        const OGRPolygon* gdalPolygon = geom.toPolygon();

        const OGRLinearRing* exteriorRing = gdalPolygon->getExteriorRing();
        if (!exteriorRing) {
            throw WrongGeometryTypeException("Polygon has no exterior ring");
        }
        for (const OGRPoint& point : *exteriorRing) {
            _outerRing.emplace_back(point.getX(), point.getY());
        }
        _closeRing(_outerRing);
        for (int i = 0; i < gdalPolygon->getNumInteriorRings(); i++) {
            const OGRLinearRing* innerRing = gdalPolygon->getInteriorRing(i);
            std::vector<CoordXY> innerCoords;
            for (const OGRPoint& point : *innerRing) {
                innerCoords.emplace_back(point.getX(), point.getY());
            }
            addInnerRing(innerCoords);
        }
    }

    coord_t Polygon::_areaFromRing(const std::vector<CoordXY>& ring)
    {
        int nPoints = (int)ring.size();
        if (nPoints < 4) { //3 for a triangle, plus the duplicated point
            return 0; 
        }
        CoordXY pointOne, pointTwo;
        coord_t area = 0;
        pointOne = ring[0];

        //this is the shoelace formula
        for (int i = 1; i < nPoints; ++i) {
            pointTwo = ring[i];
            area += (pointOne.x * pointTwo.y) - (pointTwo.x * pointOne.y);
            pointOne = pointTwo;
        }

        return std::abs(area) / 2.0;
    }

    bool Polygon::_ringIsSimple(const std::vector<CoordXY>& ring)
    {
        std::vector<CoordXY> verts = distinctVertices(ring);
        size_t n = verts.size();
        if (n < 3) {
            return false;
        }
        for (size_t i = 0; i < n; ++i) {
            const CoordXY& a1 = verts[i];
            const CoordXY& a2 = verts[(i + 1) % n];
            for (size_t j = i + 1; j < n; ++j) {
                //adjacent edges share a vertex by construction
                if (j == i + 1 || (i == 0 && j == n - 1)) {
                    continue;
                }
                const CoordXY& b1 = verts[j];
                const CoordXY& b2 = verts[(j + 1) % n];
                if (segmentsIntersect(a1, a2, b1, b2)) {
                    return false;
                }
            }
        }
        return true;
    }

    void Polygon::_closeRing(std::vector<CoordXY>& ring)
    {
        if (ring.size() && ring.back() != ring.front()) {
            ring.push_back(ring.front());
        }
    }

    Polygon readPolygonFile(const std::string& filename)
    {
        UniqueGdalDataset wgd = vectorGDALWrapper(filename);
        if (!wgd) {
            throw InvalidVectorFileException("Unable to open " + filename + " as a vector file");
        }
        if (wgd->GetLayerCount() < 1) {
            throw InvalidVectorFileException(filename + " has no layers");
        }
        OGRLayer* layer = wgd->GetLayer(0);
        layer->ResetReading();
        OGRFeatureUniquePtr feature{ layer->GetNextFeature() };
        if (!feature || !feature->GetGeometryRef()) {
            throw InvalidVectorFileException(filename + " has no features with geometry");
        }
        const OGRGeometry* geom = feature->GetGeometryRef();
        CoordRef crs{ layer->GetSpatialRef() };
        if (wkbFlatten(geom->getGeometryType()) == wkbMultiPolygon) {
            const OGRMultiPolygon* multi = geom->toMultiPolygon();
            if (multi->getNumGeometries() != 1) {
                throw WrongGeometryTypeException(filename + " contains a multipolygon with more than one part");
            }
            return Polygon(*multi->getGeometryRef(0), crs);
        }
        return Polygon(*geom, crs);
    }
}
