#pragma once
#ifndef bs_bandindex_h
#define bs_bandindex_h

#include"SensorProfile.hpp"

namespace burnscar {

	//(A - B) / (A + B) for every valid cell. Cells invalid in the image, or where A + B == 0, are missing;
	//no NaN or infinity ever reaches the output. Values are not clamped to [-1, 1].
	//Throws InvalidConfigurationException if either band isn't in the image.
	Raster<index_t> normalizedDifference(const Image& image, const std::string& bandA, const std::string& bandB);

	//the normalized difference of the sensor's NIR and SWIR2 bands
	Raster<index_t> normalizedBurnRatio(const Image& image, const SensorProfile& sensor);
}

#endif
