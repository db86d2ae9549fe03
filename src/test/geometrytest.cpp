#include"test_pch.hpp"

namespace burnscar {

	class GeometryTest : public ::testing::Test {
	public:
		Polygon square;

		void SetUp() override {
			square = Polygon(std::vector<CoordXY>{ {0, 0}, {10, 0}, {10, 10}, {0, 10} });
		}
	};

	TEST_F(GeometryTest, RingIsClosed) {
		const auto& ring = square.getOuterRing();
		ASSERT_EQ(ring.size(), 5);
		EXPECT_EQ(ring.front(), ring.back());
		EXPECT_EQ(square.nDistinctVertices(), 4);
	}

	TEST_F(GeometryTest, ContainsPoint) {
		EXPECT_TRUE(square.containsPoint(5, 5));
		EXPECT_TRUE(square.containsPoint(CoordXY(0.1, 9.9)));
		EXPECT_FALSE(square.containsPoint(-1, 5));
		EXPECT_FALSE(square.containsPoint(5, 11));

		square.addInnerRing({ {4, 4}, {6, 4}, {6, 6}, {4, 6} });
		EXPECT_EQ(square.nInnerRings(), 1);
		EXPECT_FALSE(square.containsPoint(5, 5));
		EXPECT_TRUE(square.containsPoint(2, 2));
	}

	TEST_F(GeometryTest, Area) {
		EXPECT_NEAR(square.area(), 100, BS_EPSILON);
		square.addInnerRing({ {4, 4}, {6, 4}, {6, 6}, {4, 6} });
		EXPECT_NEAR(square.area(), 96, BS_EPSILON);

		Polygon clockwise{ std::vector<CoordXY>{ {0, 0}, {0, 2}, {3, 2}, {3, 0} } };
		EXPECT_NEAR(clockwise.area(), 6, BS_EPSILON);
	}

	TEST_F(GeometryTest, BoundingBox) {
		Polygon tri{ std::vector<CoordXY>{ {1, 2}, {5, 3}, {2, 8} } };
		Extent e = tri.boundingBox();
		EXPECT_EQ(e.xmin(), 1);
		EXPECT_EQ(e.xmax(), 5);
		EXPECT_EQ(e.ymin(), 2);
		EXPECT_EQ(e.ymax(), 8);

		Polygon fromExtent{ Extent(0, 4, 0, 2) };
		EXPECT_NEAR(fromExtent.area(), 8, BS_EPSILON);
	}

	TEST_F(GeometryTest, ValidAreaOfInterest) {
		EXPECT_NO_THROW(square.validateAsAreaOfInterest());
		Polygon tri{ std::vector<CoordXY>{ {0, 0}, {1, 0}, {0, 1} } };
		EXPECT_NO_THROW(tri.validateAsAreaOfInterest());
	}

	TEST_F(GeometryTest, TooFewVertices) {
		Polygon line{ std::vector<CoordXY>{ {0, 0}, {1, 1} } };
		EXPECT_THROW(line.validateAsAreaOfInterest(), InvalidConfigurationException);

		//repeated points don't count
		Polygon repeated{ std::vector<CoordXY>{ {0, 0}, {1, 1}, {1, 1}, {0, 0} } };
		EXPECT_EQ(repeated.nDistinctVertices(), 2);
		EXPECT_THROW(repeated.validateAsAreaOfInterest(), InvalidConfigurationException);

		EXPECT_THROW(Polygon().validateAsAreaOfInterest(), InvalidConfigurationException);
	}

	TEST_F(GeometryTest, SelfIntersecting) {
		Polygon bowtie{ std::vector<CoordXY>{ {0, 0}, {2, 2}, {2, 0}, {0, 2} } };
		EXPECT_FALSE(bowtie.isSimple());
		EXPECT_THROW(bowtie.validateAsAreaOfInterest(), InvalidConfigurationException);
		EXPECT_TRUE(square.isSimple());
	}

	TEST_F(GeometryTest, ZeroArea) {
		Polygon collinear{ std::vector<CoordXY>{ {0, 0}, {1, 0}, {2, 0} } };
		EXPECT_THROW(collinear.validateAsAreaOfInterest(), InvalidConfigurationException);
	}

	TEST_F(GeometryTest, FromOgrPolygon) {
		OGRLinearRing outer;
		outer.addPoint(0, 0);
		outer.addPoint(8, 0);
		outer.addPoint(8, 8);
		outer.addPoint(0, 8);
		outer.closeRings();
		OGRLinearRing hole;
		hole.addPoint(2, 2);
		hole.addPoint(4, 2);
		hole.addPoint(4, 4);
		hole.addPoint(2, 4);
		hole.closeRings();
		OGRPolygon ogr;
		ogr.addRing(&outer);
		ogr.addRing(&hole);

		Polygon p{ ogr };
		EXPECT_TRUE(p.crs().isEmpty());
		ASSERT_EQ(p.nInnerRings(), 1);
		EXPECT_EQ(p.getInnerRing(0).size(), 5);
		EXPECT_EQ(p.getInnerRing(0).front(), CoordXY(2, 2));
		EXPECT_THROW(p.getInnerRing(1), std::out_of_range);
		EXPECT_NEAR(p.area(), 60, BS_EPSILON);
		EXPECT_FALSE(p.containsPoint(3, 3));
		EXPECT_TRUE(p.containsPoint(6, 6));

		OGRPoint point{ 1, 1 };
		EXPECT_THROW(Polygon{ point }, WrongGeometryTypeException);
	}

	TEST_F(GeometryTest, ReadPolygonFile) {
		TempDir dir{ "geometry" };
		std::string file = dir.file("aoi.geojson");
		{
			std::ofstream os{ file };
			os << R"({"type": "FeatureCollection", "features": [{"type": "Feature", "properties": {},
				"geometry": {"type": "Polygon", "coordinates": [[[0, 0], [4, 0], [4, 3], [0, 3], [0, 0]]]}}]})";
		}
		Polygon p = readPolygonFile(file);
		EXPECT_EQ(p.nDistinctVertices(), 4);
		EXPECT_NEAR(p.area(), 12, BS_EPSILON);
		EXPECT_TRUE(p.containsPoint(2, 1));

		std::string points = dir.file("points.geojson");
		{
			std::ofstream os{ points };
			os << R"({"type": "FeatureCollection", "features": [{"type": "Feature", "properties": {},
				"geometry": {"type": "Point", "coordinates": [1, 1]}}]})";
		}
		EXPECT_THROW(readPolygonFile(points), WrongGeometryTypeException);
		EXPECT_THROW(readPolygonFile(dir.file("missing.shp")), InvalidVectorFileException);
	}
}
