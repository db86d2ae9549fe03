#pragma once
#ifndef bs_clouddetector_h
#define bs_clouddetector_h

#include"SensorProfile.hpp"

namespace burnscar {

	//Decides which pixels of a raw scene are clear enough to use. Implementations must return a mask with the image's alignment.
	class CloudDetector {
	public:
		virtual ~CloudDetector() = default;
		virtual ValidityMask detectCloudMask(const Image& image) const = 0;
	};

	//The default detector: decodes the sensor's quality band and applies a validity predicate to the flags.
	//Pixels with no quality value, or with no data in any band, are never valid. With no quality band, only missing data is masked.
	class QualityBandCloudDetector : public CloudDetector {
	public:
		QualityBandCloudDetector(const std::string& qualityBand, const QualityBitLayout& layout, SharedPredicate policy);
		explicit QualityBandCloudDetector(const SensorProfile& profile);

		ValidityMask detectCloudMask(const Image& image) const override;

		const ValidityPredicate& policy() const;
	private:
		std::string _qualityBand;
		QualityBitLayout _layout;
		SharedPredicate _policy;
	};
}

#endif
