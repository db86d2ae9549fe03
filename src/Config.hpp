#pragma once
#ifndef bs_config_h
#define bs_config_h

#include"ImageCollection.hpp"
#include"MaskCompositor.hpp"
#include"SensorProfile.hpp"
#include"Severity.hpp"
#include<yaml-cpp/yaml.h>

namespace burnscar {

	struct EpochConfig {
		std::string name;
		DateRange range;
	};

	struct WaterConfig {
		//empty means no persistent water masking
		std::string seasonalityFile;
		int threshold = DEFAULT_WATER_SEASONALITY_THRESHOLD;
	};

	struct OutputConfig {
		//either may be empty to skip that output
		std::string dnbrFile;
		std::string classifiedFile;
	};

	//Everything needed for one run. Relative paths in the YAML file are resolved against the directory holding it.
	struct BurnScarConfig {
		std::string sensor = "S2";
		EpochConfig preFire{ "pre-fire", {} };
		EpochConfig postFire{ "post-fire", {} };
		Polygon areaOfInterest;
		std::string catalogFile;
		WaterConfig water;
		SeverityScheme scheme;
		index_t scale = DEFAULT_DNBR_SCALE;
		SensorRegistry sensors = SensorRegistry::withBuiltins();
		OutputConfig output;
		std::string logLevel = "info";

		//checks everything that can be checked before touching any imagery; throws InvalidConfigurationException
		void validate() const;
	};

	//both throw InvalidConfigurationException for missing files, YAML syntax errors, and invalid values
	BurnScarConfig loadConfig(const std::filesystem::path& path);
	BurnScarConfig configFromYaml(const YAML::Node& node, const std::filesystem::path& baseDir);

	SensorProfile sensorProfileFromYaml(const YAML::Node& node);
}

#endif
