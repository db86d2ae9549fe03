#include"MaskCompositor.hpp"
#include"Log.hpp"

namespace burnscar {

	ValidityMask persistentWaterMask(const Raster<seasonality_t>& seasonality, int threshold)
	{
		if (threshold < 1 || threshold > 12) {
			throw InvalidConfigurationException("Water seasonality threshold must be between 1 and 12 months, got " + std::to_string(threshold));
		}
		ValidityMask out{ (Alignment)seasonality };
		for (cell_t cell = 0; cell < seasonality.ncell(); ++cell) {
			const auto v = seasonality.atCellUnsafe(cell);
			if (v.has_value() && v.value() >= threshold) {
				out.setValidUnsafe(cell, false);
			}
		}
		return out;
	}

	MaskCompositor::MaskCompositor(std::shared_ptr<const CloudDetector> detector, const std::string& qualityBand, bool keepQualityBand)
		: _detector(std::move(detector)), _qualityBand(qualityBand), _keepQualityBand(keepQualityBand)
	{
		if (!_detector) {
			throw InvalidConfigurationException("Mask compositor needs a cloud detector");
		}
	}
	void MaskCompositor::setPersistentWater(const Raster<seasonality_t>& seasonality, int threshold)
	{
		_water = persistentWaterMask(seasonality, threshold);
		logger()->debug("Persistent water mask: {} of {} cells flagged at >= {} months",
			_water->ncell() - _water->countValid(), _water->ncell(), threshold);
	}
	bool MaskCompositor::hasPersistentWater() const
	{
		return _water.has_value();
	}
	Image MaskCompositor::apply(const Image& image) const
	{
		ValidityMask keep = _detector->detectCloudMask(image);
		if (!keep.isSameAlignment(image)) {
			throw DimensionMismatchException("Cloud detector returned a mask that doesn't match the image");
		}
		if (_water) {
			if (!_water->isSameAlignment(image)) {
				throw DimensionMismatchException("Water seasonality raster does not match the image grid");
			}
			keep &= *_water;
		}

		Image out = (!_keepQualityBand && image.hasBand(_qualityBand)) ? image.withoutBand(_qualityBand) : image;
		out.mask(keep);
		return out;
	}
	ImageCollection MaskCompositor::apply(const ImageCollection& collection) const
	{
		ImageCollection out{ collection.sensorId(), collection.range() };
		out.setEpoch(collection.epoch());
		for (const AcquiredImage& a : collection) {
			AcquiredImage masked{ a.id, a.date, apply(a.image) };
			logger()->debug("{} ({}): {} of {} cells clear after masking",
				a.id, formatDate(a.date), masked.image.countValid(), masked.image.ncell());
			out.add(std::move(masked));
		}
		return out;
	}
}
