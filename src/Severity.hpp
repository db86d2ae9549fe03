#pragma once
#ifndef bs_severity_h
#define bs_severity_h

#include"Raster.hpp"

namespace burnscar {

	constexpr index_t DEFAULT_DNBR_SCALE = 1000;

	struct SeverityClass {
		std::string label;
		//"#rrggbb"
		std::string color;
	};

	//An ordered classification of dNBR values.
	//breaks[0] is the floor of the reporting scale; breaks[1..k] are the class boundaries, giving k+1 classes.
	//A value v falls in class i when boundary[i-1] <= v < boundary[i], so a value exactly on a boundary
	//goes to the higher class. Values below the floor still land in class 0.
	class SeverityScheme {
	public:
		//the standard eight USGS-style classes over [-1000, -251, -101, 99, 269, 439, 659, 2000]
		SeverityScheme();
		//throws InvalidConfigurationException unless there are at least two finite, strictly increasing breaks
		//and exactly one class per break
		SeverityScheme(const std::vector<index_t>& breaks, const std::vector<SeverityClass>& classes);
		//generic labels "class 0", "class 1", ...
		explicit SeverityScheme(const std::vector<index_t>& breaks);

		const std::vector<index_t>& breaks() const;
		size_t nClasses() const;
		const SeverityClass& classAt(size_t i) const;

		//number of boundaries <= v
		class_t classify(index_t v) const;

	private:
		std::vector<index_t> _breaks;
		std::vector<SeverityClass> _classes;

		void _validate() const;
	};

	//(pre - post) * scale for cells valid in both; throws DimensionMismatchException unless the rasters share an alignment
	Raster<index_t> differenceIndex(const Raster<index_t>& pre, const Raster<index_t>& post, index_t scale = DEFAULT_DNBR_SCALE);

	//missing cells stay missing; they are never assigned a class
	Raster<class_t> classify(const Raster<index_t>& values, const SeverityScheme& scheme);

	struct ClassSummary {
		class_t classId = 0;
		std::string label;
		std::string color;
		cell_t nCells = 0;
		//in squared CRS units
		coord_t area = 0;
	};

	struct ClassificationSummary {
		std::vector<ClassSummary> classes;
		cell_t nNoData = 0;
	};

	ClassificationSummary summarizeClasses(const Raster<class_t>& classified, const SeverityScheme& scheme);
}

#endif
