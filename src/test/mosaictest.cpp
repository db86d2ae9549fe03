#include"test_pch.hpp"

namespace burnscar {

	class MosaicTest : public ::testing::Test {
	public:
		Alignment a;
		Polygon everywhere;
		DateRange range;

		void SetUp() override {
			a = Alignment(Extent(0, 2, 0, 2), 2, 2);
			everywhere = Polygon(Extent(0, 2, 0, 2));
			range = DateRange{ ymd(2019, 10, 1), ymd(2019, 11, 1) };
		}

		//a masked-looking scene: only the listed cells have data
		Image scene(reflectance_t nir, const std::vector<cell_t>& validCells) {
			Image out{ a, { "B8", "B12" } };
			for (cell_t cell : validCells) {
				setCell(out.bandAt("B8"), cell, nir);
				setCell(out.bandAt("B12"), cell, nir / 2);
			}
			return out;
		}
	};

	TEST_F(MosaicTest, FirstValidWins) {
		ImageCollection c{ "S2", range };
		c.add(AcquiredImage{ "first", ymd(2019, 10, 2), scene(10, { 0 }) });
		c.add(AcquiredImage{ "second", ymd(2019, 10, 12), scene(20, { 0, 1 }) });
		c.add(AcquiredImage{ "third", ymd(2019, 10, 22), scene(30, { 0, 1, 2 }) });

		Image m = mosaicFirstValid(c, everywhere);
		EXPECT_EQ(m.bandAt("B8")[0].value(), 10);
		EXPECT_EQ(m.bandAt("B8")[1].value(), 20);
		EXPECT_EQ(m.bandAt("B8")[2].value(), 30);
		EXPECT_FALSE(m.isValidUnsafe(3));
		EXPECT_EQ(m.countValid(), 3);

		//all bands come from the same image
		EXPECT_EQ(m.bandAt("B12")[1].value(), 10);
	}

	TEST_F(MosaicTest, AcquisitionOrderNotInsertionOrder) {
		ImageCollection c{ "S2", range };
		c.add(AcquiredImage{ "late", ymd(2019, 10, 25), scene(30, { 0, 1, 2, 3 }) });
		c.add(AcquiredImage{ "early", ymd(2019, 10, 3), scene(10, { 0, 1 }) });

		EXPECT_EQ(c.at(0).id, "early");
		Image m = mosaicFirstValid(c, everywhere);
		EXPECT_EQ(m.bandAt("B8")[0].value(), 10);
		EXPECT_EQ(m.bandAt("B8")[3].value(), 30);
	}

	TEST_F(MosaicTest, SameDateOrderedById) {
		ImageCollection c{ "S2", range };
		c.add(AcquiredImage{ "b", ymd(2019, 10, 5), scene(2, { 0 }) });
		c.add(AcquiredImage{ "a", ymd(2019, 10, 5), scene(1, { 0 }) });
		EXPECT_EQ(c.at(0).id, "a");
		EXPECT_EQ(mosaicFirstValid(c, everywhere).bandAt("B8")[0].value(), 1);
	}

	TEST_F(MosaicTest, AreaOfInterest) {
		ImageCollection c{ "S2", range };
		c.add(AcquiredImage{ "only", ymd(2019, 10, 5), scene(10, { 0, 1, 2, 3 }) });

		//covers the center of the lower-left cell only
		Polygon corner{ std::vector<CoordXY>{ {0, 0}, {0.9, 0}, {0.9, 0.9}, {0, 0.9} } };
		Image m = mosaicFirstValid(c, corner);
		EXPECT_EQ(m.countValid(), 1);
		EXPECT_TRUE(m.isValidUnsafe(2));
	}

	TEST_F(MosaicTest, Deterministic) {
		ImageCollection c{ "S2", range };
		c.add(AcquiredImage{ "first", ymd(2019, 10, 2), scene(10, { 0, 3 }) });
		c.add(AcquiredImage{ "second", ymd(2019, 10, 12), scene(20, { 1, 3 }) });
		EXPECT_EQ(mosaicFirstValid(c, everywhere), mosaicFirstValid(c, everywhere));
	}

	TEST_F(MosaicTest, EmptyCollection) {
		ImageCollection c{ "S2", range };
		c.setEpoch("post-fire");
		try {
			mosaicFirstValid(c, everywhere);
			FAIL() << "expected EmptyCollectionException";
		}
		catch (const EmptyCollectionException& e) {
			std::string msg = e.what();
			EXPECT_NE(msg.find("post-fire"), std::string::npos);
			EXPECT_NE(msg.find("2019-10-01"), std::string::npos);
		}
	}

	TEST_F(MosaicTest, Mismatch) {
		ImageCollection c{ "S2", range };
		c.add(AcquiredImage{ "a", ymd(2019, 10, 2), scene(10, { 0 }) });
		c.add(AcquiredImage{ "b", ymd(2019, 10, 3), Image{ Alignment(Extent(0, 2, 0, 2), 4, 4), { "B8", "B12" } } });
		EXPECT_THROW(mosaicFirstValid(c, everywhere), DimensionMismatchException);

		ImageCollection bands{ "S2", range };
		bands.add(AcquiredImage{ "a", ymd(2019, 10, 2), scene(10, { 0 }) });
		bands.add(AcquiredImage{ "b", ymd(2019, 10, 3), Image{ a, { "B8", "B11" } } });
		EXPECT_THROW(mosaicFirstValid(bands, everywhere), DimensionMismatchException);
	}

	TEST(DateTest, ParseAndFormat) {
		Date d = parseDate("2019-11-08");
		EXPECT_EQ(d, ymd(2019, 11, 8));
		EXPECT_EQ(formatDate(d), "2019-11-08");
		EXPECT_THROW(parseDate("2019/11/08"), InvalidConfigurationException);
		EXPECT_THROW(parseDate("2019-02-30"), InvalidConfigurationException);
		EXPECT_THROW(parseDate("2019-11-08x"), InvalidConfigurationException);
		EXPECT_THROW(parseDate(""), InvalidConfigurationException);
	}

	TEST(DateTest, RangeIsHalfOpen) {
		DateRange r{ ymd(2019, 10, 10), ymd(2019, 11, 30) };
		EXPECT_TRUE(r.contains(ymd(2019, 10, 10)));
		EXPECT_TRUE(r.contains(ymd(2019, 11, 29)));
		EXPECT_FALSE(r.contains(ymd(2019, 11, 30)));
		EXPECT_FALSE(r.contains(ymd(2019, 10, 9)));
		EXPECT_NO_THROW(r.validate());
		EXPECT_EQ(r.toString(), "2019-10-10 to 2019-11-30");

		DateRange backwards{ ymd(2019, 11, 30), ymd(2019, 10, 10) };
		EXPECT_THROW(backwards.validate(), InvalidConfigurationException);
		DateRange empty{ ymd(2019, 11, 30), ymd(2019, 11, 30) };
		EXPECT_THROW(empty.validate(), InvalidConfigurationException);
	}
}
