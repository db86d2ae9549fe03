#include"test_pch.hpp"

namespace burnscar {

	TEST(SensorTest, BuiltinProfiles) {
		SensorRegistry reg = SensorRegistry::withBuiltins();
		const SensorProfile& s2 = reg.lookup("S2");
		EXPECT_EQ(s2.nirBand, "B8");
		EXPECT_EQ(s2.swir2Band, "B12");
		EXPECT_EQ(s2.qualityBand, "QA60");
		EXPECT_EQ(s2.bits.bitFor(QualityFlag::cloud), 10);
		EXPECT_EQ(s2.bits.bitFor(QualityFlag::cirrus), 11);

		const SensorProfile& l8 = reg.lookup("L8");
		EXPECT_EQ(l8.nirBand, "B5");
		EXPECT_EQ(l8.swir2Band, "B7");
		EXPECT_EQ(l8.qualityBand, "pixel_qa");
		EXPECT_EQ(l8.bits.bitFor(QualityFlag::cloudShadow), 3);
		EXPECT_EQ(l8.bits.bitFor(QualityFlag::snow), 4);
		EXPECT_EQ(l8.bits.bitFor(QualityFlag::cloud), 5);
	}

	TEST(SensorTest, LookupIgnoresCase) {
		SensorRegistry reg = SensorRegistry::withBuiltins();
		EXPECT_EQ(reg.lookup("s2").id, "S2");
		EXPECT_EQ(reg.lookup("l8").id, "L8");
		EXPECT_TRUE(reg.contains("L8"));
		EXPECT_FALSE(reg.contains("MODIS"));
		EXPECT_THROW(reg.lookup("MODIS"), InvalidConfigurationException);
	}

	TEST(SensorTest, AddReplaces) {
		SensorRegistry reg = SensorRegistry::withBuiltins();
		SensorProfile custom = sentinel2Profile();
		custom.name = "Sentinel-2 SR";
		reg.add(custom);
		EXPECT_EQ(reg.ids().size(), 2);
		EXPECT_EQ(reg.lookup("S2").name, "Sentinel-2 SR");
	}

	TEST(SensorTest, InvalidProfile) {
		SensorProfile p = sentinel2Profile();
		p.nirBand = "B99";
		EXPECT_THROW(p.validate(), InvalidConfigurationException);

		p = sentinel2Profile();
		p.swir2Band = p.nirBand;
		EXPECT_THROW(p.validate(), InvalidConfigurationException);

		p = landsat8Profile();
		p.bits.setBit(QualityFlag::snow, -1);
		EXPECT_THROW(p.validate(), InvalidConfigurationException);

		SensorRegistry reg;
		p = sentinel2Profile();
		p.id = "";
		EXPECT_THROW(reg.add(p), InvalidConfigurationException);

		//bits are checked even for flags the sensor doesn't mask
		p = sentinel2Profile();
		p.bits.setBit(QualityFlag::snow, 40);
		EXPECT_THROW(p.validate(), InvalidConfigurationException);
		p.bits.setBit(QualityFlag::snow, -2);
		EXPECT_THROW(p.validate(), InvalidConfigurationException);
		p.bits.setBit(QualityFlag::snow, 31);
		EXPECT_NO_THROW(p.validate());
	}

	TEST(SensorTest, OutOfRangeBitIsNeverRaised) {
		QualityBitLayout layout;
		layout.setBit(QualityFlag::cloud, 10);
		layout.setBit(QualityFlag::snow, 40);
		QualityFlags f = decodeQualityWord(0xFFFFFFFFu, layout);
		EXPECT_TRUE(f.has(QualityFlag::cloud));
		EXPECT_FALSE(f.has(QualityFlag::snow));
	}

	TEST(SensorTest, DecodeQualityWord) {
		QualityBitLayout s2 = sentinel2Profile().bits;
		QualityFlags f = decodeQualityWord(1u << 10, s2);
		EXPECT_TRUE(f.has(QualityFlag::cloud));
		EXPECT_FALSE(f.has(QualityFlag::cirrus));

		f = decodeQualityWord((1u << 10) | (1u << 11), s2);
		EXPECT_TRUE(f.has(QualityFlag::cloud));
		EXPECT_TRUE(f.has(QualityFlag::cirrus));

		//bits the sensor doesn't assign are ignored
		EXPECT_EQ(decodeQualityWord(0xFF, s2), QualityFlags());

		QualityBitLayout l8 = landsat8Profile().bits;
		f = decodeQualityWord(1u << 3, l8);
		EXPECT_TRUE(f.has(QualityFlag::cloudShadow));
		EXPECT_FALSE(f.has(QualityFlag::cloud));
		f = decodeQualityWord(1u << 4, l8);
		EXPECT_TRUE(f.has(QualityFlag::snow));
	}

	TEST(SensorTest, FlagNames) {
		EXPECT_EQ(qualityFlagFromString("cloud"), QualityFlag::cloud);
		EXPECT_EQ(qualityFlagFromString("shadow"), QualityFlag::cloudShadow);
		EXPECT_EQ(qualityFlagFromString("cloud_shadow"), QualityFlag::cloudShadow);
		EXPECT_EQ(qualityFlagToString(QualityFlag::snow), "snow");
		EXPECT_THROW(qualityFlagFromString("haze"), InvalidConfigurationException);
	}

	TEST(SensorTest, MaskPolicy) {
		SharedPredicate policy = makeMaskPolicy({ QualityFlag::cloud, QualityFlag::cirrus });
		QualityFlags clear;
		EXPECT_TRUE(policy->isValid(clear));

		QualityFlags cirrus;
		cirrus.raise(QualityFlag::cirrus);
		EXPECT_FALSE(policy->isValid(cirrus));

		QualityFlags snow;
		snow.raise(QualityFlag::snow);
		EXPECT_TRUE(policy->isValid(snow));

		EXPECT_TRUE(makeMaskPolicy({})->isValid(cirrus));
	}

	TEST(SensorTest, PolicyDescription) {
		EXPECT_EQ(makeMaskPolicy({ QualityFlag::cloud, QualityFlag::cirrus })->describe(), "no cloud and no cirrus");
		EXPECT_EQ(makeMaskPolicy({})->describe(), "always valid");

		QualityBandCloudDetector l8{ landsat8Profile() };
		EXPECT_EQ(l8.policy().describe(), "no cloud_shadow and no cloud and no snow");
	}
}
