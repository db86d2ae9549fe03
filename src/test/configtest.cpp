#include"test_pch.hpp"

namespace burnscar {

	class ConfigTest : public ::testing::Test {
	public:
		std::string minimal = R"(
pre_fire: { start: 2019-10-10, end: 2019-11-30 }
post_fire: { start: 2020-01-10, end: 2020-03-20 }
area_of_interest:
  vertices: [[0, 0], [10, 0], [10, 10], [0, 10]]
)";

		BurnScarConfig parse(const std::string& yaml) {
			return configFromYaml(YAML::Load(yaml), "/data/fires");
		}
	};

	TEST_F(ConfigTest, Defaults) {
		BurnScarConfig cfg = parse(minimal);
		EXPECT_EQ(cfg.sensor, "S2");
		EXPECT_EQ(cfg.preFire.name, "pre-fire");
		EXPECT_EQ(cfg.preFire.range.start, ymd(2019, 10, 10));
		EXPECT_EQ(cfg.postFire.range.end, ymd(2020, 3, 20));
		EXPECT_EQ(cfg.water.threshold, 10);
		EXPECT_TRUE(cfg.water.seasonalityFile.empty());
		EXPECT_EQ(cfg.scale, 1000);
		EXPECT_EQ(cfg.scheme.nClasses(), 8);
		EXPECT_EQ(cfg.logLevel, "info");
		EXPECT_EQ(cfg.areaOfInterest.nDistinctVertices(), 4);
		EXPECT_TRUE(cfg.sensors.contains("L8"));
	}

	TEST_F(ConfigTest, FullConfig) {
		BurnScarConfig cfg = parse(minimal + R"(
sensor: l8
catalog: catalog.yaml
water: { seasonality: /gsw/seasonality.tif, threshold: 6 }
classification:
  scale: 1
  breaks: [-1, 0.1, 0.5]
  classes:
    - { label: unburned, color: "#00ff00" }
    - { label: burned, color: "#ff0000" }
    - { label: severe }
output: { dnbr: out/dnbr.tif, classified: out/classes.tif }
log_level: debug
)");
		EXPECT_EQ(cfg.sensor, "l8");
		EXPECT_EQ(std::filesystem::path(cfg.catalogFile), std::filesystem::path("/data/fires") / "catalog.yaml");
		EXPECT_EQ(cfg.water.seasonalityFile, "/gsw/seasonality.tif");
		EXPECT_EQ(cfg.water.threshold, 6);
		EXPECT_EQ(cfg.scale, 1);
		EXPECT_EQ(cfg.scheme.nClasses(), 3);
		EXPECT_EQ(cfg.scheme.classAt(1).label, "burned");
		EXPECT_EQ(cfg.scheme.classAt(2).color, "#ffffff");
		EXPECT_EQ(std::filesystem::path(cfg.output.dnbrFile), std::filesystem::path("/data/fires") / "out/dnbr.tif");
		EXPECT_EQ(cfg.logLevel, "debug");
	}

	TEST_F(ConfigTest, CustomSensor) {
		BurnScarConfig cfg = parse(minimal + R"(
sensor: planet
sensors:
  - id: planet
    name: PlanetScope
    bands: [blue, green, red, nir, swir2, qa]
    nir: nir
    swir2: swir2
    quality_band: qa
    bits: { cloud: 1, shadow: 2 }
    mask: [cloud, shadow]
)");
		const SensorProfile& p = cfg.sensors.lookup("planet");
		EXPECT_EQ(p.name, "PlanetScope");
		EXPECT_EQ(p.bits.bitFor(QualityFlag::cloudShadow), 2);
		EXPECT_EQ(p.maskFlags.size(), 2);
	}

	TEST_F(ConfigTest, CustomSensorBitOutOfRange) {
		EXPECT_THROW(parse(minimal + R"(
sensor: planet
sensors:
  - id: planet
    bands: [nir, swir2, qa]
    nir: nir
    swir2: swir2
    quality_band: qa
    bits: { cloud: 10, snow: 40 }
    mask: [cloud]
)"), InvalidConfigurationException);
	}

	TEST_F(ConfigTest, MissingKeys) {
		EXPECT_THROW(parse("sensor: S2"), InvalidConfigurationException);
		EXPECT_THROW(parse(R"(
pre_fire: { start: 2019-10-10 }
post_fire: { start: 2020-01-10, end: 2020-03-20 }
area_of_interest: { vertices: [[0, 0], [10, 0], [10, 10]] }
)"), InvalidConfigurationException);
		EXPECT_THROW(parse("[1, 2, 3]"), InvalidConfigurationException);
	}

	TEST_F(ConfigTest, InvalidValues) {
		EXPECT_THROW(parse(minimal + "sensor: MODIS\n"), InvalidConfigurationException);
		EXPECT_THROW(parse(minimal + "water: { threshold: 13 }\n"), InvalidConfigurationException);
		EXPECT_THROW(parse(minimal + "water: { threshold: many }\n"), InvalidConfigurationException);
		EXPECT_THROW(parse(minimal + "classification: { breaks: [5, 1] }\n"), InvalidConfigurationException);
		EXPECT_THROW(parse(minimal + "classification: { scale: 0 }\n"), InvalidConfigurationException);

		std::string backwards = R"(
pre_fire: { start: 2019-11-30, end: 2019-10-10 }
post_fire: { start: 2020-01-10, end: 2020-03-20 }
area_of_interest: { vertices: [[0, 0], [10, 0], [10, 10]] }
)";
		EXPECT_THROW(parse(backwards), InvalidConfigurationException);

		std::string badDate = R"(
pre_fire: { start: 10/10/2019, end: 2019-11-30 }
post_fire: { start: 2020-01-10, end: 2020-03-20 }
area_of_interest: { vertices: [[0, 0], [10, 0], [10, 10]] }
)";
		EXPECT_THROW(parse(badDate), InvalidConfigurationException);
	}

	TEST_F(ConfigTest, InvalidAreaOfInterest) {
		std::string twoPoints = R"(
pre_fire: { start: 2019-10-10, end: 2019-11-30 }
post_fire: { start: 2020-01-10, end: 2020-03-20 }
area_of_interest: { vertices: [[0, 0], [10, 10]] }
)";
		EXPECT_THROW(parse(twoPoints), InvalidConfigurationException);

		std::string bowtie = R"(
pre_fire: { start: 2019-10-10, end: 2019-11-30 }
post_fire: { start: 2020-01-10, end: 2020-03-20 }
area_of_interest: { vertices: [[0, 0], [2, 2], [2, 0], [0, 2]] }
)";
		EXPECT_THROW(parse(bowtie), InvalidConfigurationException);

		std::string triple = R"(
pre_fire: { start: 2019-10-10, end: 2019-11-30 }
post_fire: { start: 2020-01-10, end: 2020-03-20 }
area_of_interest: { vertices: [[0, 0, 0], [2, 2, 0], [2, 0, 0]] }
)";
		EXPECT_THROW(parse(triple), InvalidConfigurationException);
	}

	TEST_F(ConfigTest, LoadFile) {
		TempDir dir{ "config" };
		std::string file = dir.file("fire.yaml");
		{
			std::ofstream os{ file };
			os << minimal << "catalog: scenes.yaml\n";
		}
		BurnScarConfig cfg = loadConfig(file);
		EXPECT_EQ(std::filesystem::path(cfg.catalogFile), dir.path() / "scenes.yaml");

		EXPECT_THROW(loadConfig(dir.file("missing.yaml")), InvalidConfigurationException);

		std::string broken = dir.file("broken.yaml");
		{
			std::ofstream os{ broken };
			os << "pre_fire: { start: [\n";
		}
		EXPECT_THROW(loadConfig(broken), InvalidConfigurationException);
	}

	TEST(LogTest, Levels) {
		EXPECT_NO_THROW(setLogLevel("debug"));
		EXPECT_EQ(logger()->level(), spdlog::level::debug);
		EXPECT_NO_THROW(setLogLevel("off"));
		EXPECT_THROW(setLogLevel("loud"), InvalidConfigurationException);
		setLogLevel("warn");
		EXPECT_EQ(logger()->level(), spdlog::level::warn);
	}
}
