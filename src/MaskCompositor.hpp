#pragma once
#ifndef bs_maskcompositor_h
#define bs_maskcompositor_h

#include"CloudDetector.hpp"
#include"ImageCollection.hpp"

namespace burnscar {

	constexpr int DEFAULT_WATER_SEASONALITY_THRESHOLD = 10;

	//Cells with water for at least threshold months per year are invalid. Missing seasonality counts as dry.
	//Throws InvalidConfigurationException if the threshold isn't in [1, 12]
	ValidityMask persistentWaterMask(const Raster<seasonality_t>& seasonality, int threshold = DEFAULT_WATER_SEASONALITY_THRESHOLD);

	//Produces the masked version of each raw scene: the cloud detector's mask, ANDed with the persistent water mask if there is one.
	//The quality band is dropped from the output unless keepQualityBand is set. Inputs are never modified.
	class MaskCompositor {
	public:
		MaskCompositor(std::shared_ptr<const CloudDetector> detector, const std::string& qualityBand, bool keepQualityBand = false);

		//water is always applied after the cloud mask
		void setPersistentWater(const Raster<seasonality_t>& seasonality, int threshold = DEFAULT_WATER_SEASONALITY_THRESHOLD);
		bool hasPersistentWater() const;

		//throws DimensionMismatchException if the image doesn't share the seasonality raster's alignment
		Image apply(const Image& image) const;
		ImageCollection apply(const ImageCollection& collection) const;

	private:
		std::shared_ptr<const CloudDetector> _detector;
		std::string _qualityBand;
		bool _keepQualityBand;
		std::optional<ValidityMask> _water;
	};
}

#endif
