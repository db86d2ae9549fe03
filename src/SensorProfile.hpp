#pragma once
#ifndef bs_sensorprofile_h
#define bs_sensorprofile_h

#include"QualityFlags.hpp"

namespace burnscar {

	//Everything that differs between sensors: band naming, which bands feed the burn ratio, and how the quality band is read.
	struct SensorProfile {
		std::string id;
		std::string name;
		//names assigned to the bands of a scene file, in file order
		std::vector<std::string> bands;
		std::string nirBand;
		std::string swir2Band;
		std::string qualityBand;
		bool keepQualityBand = false;
		QualityBitLayout bits;
		std::vector<QualityFlag> maskFlags;

		//throws InvalidConfigurationException if the referenced bands don't exist, or a masked flag has no bit
		void validate() const;
	};

	SensorProfile sentinel2Profile();
	SensorProfile landsat8Profile();

	//Sensor ids are matched case-insensitively, so "s2" finds "S2".
	class SensorRegistry {
	public:
		SensorRegistry() = default;

		//a registry holding the Sentinel-2 and Landsat 8 profiles
		static SensorRegistry withBuiltins();

		//replaces any profile with the same id
		void add(const SensorProfile& profile);
		bool contains(const std::string& id) const;
		//throws InvalidConfigurationException for unknown ids
		const SensorProfile& lookup(const std::string& id) const;
		std::vector<std::string> ids() const;

	private:
		std::vector<SensorProfile> _profiles;
		static std::string _normalize(const std::string& id);
	};
}

#endif
