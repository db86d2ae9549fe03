#pragma once
#ifndef bs_pipeline_h
#define bs_pipeline_h

#include"BandIndex.hpp"
#include"Config.hpp"
#include"MaskCompositor.hpp"
#include"Mosaic.hpp"
#include"Severity.hpp"

namespace burnscar {

	struct PipelineSettings {
		std::string sensorId = "S2";
		EpochConfig preFire{ "pre-fire", {} };
		EpochConfig postFire{ "post-fire", {} };
		Polygon areaOfInterest;
		SeverityScheme scheme;
		index_t scale = DEFAULT_DNBR_SCALE;
		int waterThreshold = DEFAULT_WATER_SEASONALITY_THRESHOLD;

		static PipelineSettings fromConfig(const BurnScarConfig& cfg);
	};

	struct EpochComposite {
		std::string name;
		size_t nImages = 0;
		Image mosaic;
		Raster<index_t> nbr;
	};

	struct BurnSeverityResult {
		EpochComposite preFire;
		EpochComposite postFire;
		//(pre NBR - post NBR) * scale
		Raster<index_t> dnbr;
		Raster<class_t> classified;
		ClassificationSummary summary;
	};

	//Runs mask -> mosaic -> NBR for both epochs, then difference -> classify.
	//Every stage takes its inputs by value or const reference and returns a new raster, so a pipeline object
	//can be run any number of times and identical inputs always give identical output.
	class BurnSeverityPipeline {
	public:
		//the provider is held by reference and must outlive the pipeline
		BurnSeverityPipeline(const SensorRegistry& sensors, const ImageryProvider& provider);
		BurnSeverityPipeline(const SensorRegistry& sensors, ImageryProvider&& provider) = delete;

		//replaces the quality-band detector built from the sensor profile
		void setCloudDetector(std::shared_ptr<const CloudDetector> detector);
		void setSeasonality(const Raster<seasonality_t>& seasonality);

		//all configuration checks happen before any imagery is requested
		//throws EmptyCollectionException if either epoch has no imagery
		BurnSeverityResult run(const PipelineSettings& settings) const;

		EpochComposite buildEpoch(const EpochConfig& epoch, const PipelineSettings& settings, const MaskCompositor& masker) const;

	private:
		SensorRegistry _sensors;
		const ImageryProvider& _provider;
		std::shared_ptr<const CloudDetector> _detector;
		std::optional<Raster<seasonality_t>> _seasonality;

		void _validate(const PipelineSettings& settings) const;
	};
}

#endif
