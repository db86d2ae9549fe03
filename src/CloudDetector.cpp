#include"CloudDetector.hpp"

namespace burnscar {

	QualityBandCloudDetector::QualityBandCloudDetector(const std::string& qualityBand, const QualityBitLayout& layout, SharedPredicate policy)
		: _qualityBand(qualityBand), _layout(layout), _policy(std::move(policy))
	{
		if (!_policy) {
			throw InvalidConfigurationException("Cloud detector needs a validity predicate");
		}
	}
	QualityBandCloudDetector::QualityBandCloudDetector(const SensorProfile& profile)
		: QualityBandCloudDetector(profile.qualityBand, profile.bits, makeMaskPolicy(profile.maskFlags))
	{
	}
	ValidityMask QualityBandCloudDetector::detectCloudMask(const Image& image) const
	{
		ValidityMask out = image.validity();
		if (_qualityBand.empty()) {
			return out;
		}
		Raster<QualityFlags> flags = decodeQualityBand(image, _qualityBand, _layout);
		for (cell_t cell = 0; cell < flags.ncell(); ++cell) {
			if (!out.isValidUnsafe(cell)) {
				continue;
			}
			const auto f = flags.atCellUnsafe(cell);
			out.setValidUnsafe(cell, f.has_value() && _policy->isValid(f.value()));
		}
		return out;
	}
	const ValidityPredicate& QualityBandCloudDetector::policy() const
	{
		return *_policy;
	}
}
