#include"Pipeline.hpp"
#include"Log.hpp"

namespace burnscar {

	PipelineSettings PipelineSettings::fromConfig(const BurnScarConfig& cfg)
	{
		PipelineSettings out;
		out.sensorId = cfg.sensor;
		out.preFire = cfg.preFire;
		out.postFire = cfg.postFire;
		out.areaOfInterest = cfg.areaOfInterest;
		out.scheme = cfg.scheme;
		out.scale = cfg.scale;
		out.waterThreshold = cfg.water.threshold;
		return out;
	}

	BurnSeverityPipeline::BurnSeverityPipeline(const SensorRegistry& sensors, const ImageryProvider& provider)
		: _sensors(sensors), _provider(provider)
	{
	}
	void BurnSeverityPipeline::setCloudDetector(std::shared_ptr<const CloudDetector> detector)
	{
		_detector = std::move(detector);
	}
	void BurnSeverityPipeline::setSeasonality(const Raster<seasonality_t>& seasonality)
	{
		_seasonality = seasonality;
	}
	void BurnSeverityPipeline::_validate(const PipelineSettings& settings) const
	{
		_sensors.lookup(settings.sensorId);
		settings.preFire.range.validate();
		settings.postFire.range.validate();
		if (!(settings.preFire.range.start < settings.postFire.range.end)) {
			throw InvalidConfigurationException("The pre-fire epoch must start before the post-fire epoch ends");
		}
		settings.areaOfInterest.validateAsAreaOfInterest();
		if (!std::isfinite(settings.scale) || settings.scale == 0) {
			throw InvalidConfigurationException("The dNBR scale must be finite and non-zero");
		}
		if (settings.waterThreshold < 1 || settings.waterThreshold > 12) {
			throw InvalidConfigurationException("Water seasonality threshold must be between 1 and 12 months");
		}
	}

	EpochComposite BurnSeverityPipeline::buildEpoch(const EpochConfig& epoch, const PipelineSettings& settings, const MaskCompositor& masker) const
	{
		const SensorProfile& sensor = _sensors.lookup(settings.sensorId);

		ImageCollection raw = _provider.fetchCollection(sensor.id, epoch.range, settings.areaOfInterest);
		raw.setEpoch(epoch.name);
		logger()->info("Found {} images for the {}", raw.size(), raw.describe());
		if (raw.empty()) {
			throw EmptyCollectionException("No images found for the " + raw.describe()
				+ "; widen the date range or check the area of interest");
		}

		ImageCollection masked = masker.apply(raw);

		EpochComposite out;
		out.name = epoch.name;
		out.nImages = masked.size();
		out.mosaic = mosaicFirstValid(masked, settings.areaOfInterest);
		out.nbr = normalizedBurnRatio(out.mosaic, sensor);
		logger()->info("{} NBR: {} valid cells", epoch.name, out.nbr.countValid());
		return out;
	}

	BurnSeverityResult BurnSeverityPipeline::run(const PipelineSettings& settings) const
	{
		_validate(settings);
		const SensorProfile& sensor = _sensors.lookup(settings.sensorId);
		logger()->info("Computing burn severity from {} imagery", sensor.name);
		logger()->info("Fire occurred between {} and {}", formatDate(settings.preFire.range.end), formatDate(settings.postFire.range.start));

		std::shared_ptr<const CloudDetector> detector = _detector;
		if (!detector) {
			auto qualityDetector = std::make_shared<QualityBandCloudDetector>(sensor);
			logger()->debug("Masking {} pixels unless: {}", sensor.name, qualityDetector->policy().describe());
			detector = qualityDetector;
		}
		MaskCompositor masker{ detector, sensor.qualityBand, sensor.keepQualityBand };
		if (_seasonality) {
			masker.setPersistentWater(*_seasonality, settings.waterThreshold);
		}

		BurnSeverityResult out;
		out.preFire = buildEpoch(settings.preFire, settings, masker);
		out.postFire = buildEpoch(settings.postFire, settings, masker);

		out.dnbr = differenceIndex(out.preFire.nbr, out.postFire.nbr, settings.scale);
		out.classified = classify(out.dnbr, settings.scheme);
		out.summary = summarizeClasses(out.classified, settings.scheme);
		logger()->info("dNBR: {} valid cells; {} cells without data", out.dnbr.countValid(), out.summary.nNoData);
		return out;
	}
}
