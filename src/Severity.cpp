#include"Severity.hpp"

namespace burnscar {

	SeverityScheme::SeverityScheme()
		: SeverityScheme(
			{ -1000, -251, -101, 99, 269, 439, 659, 2000 },
			{
				{ "Enhanced Regrowth, High", "#7a8737" },
				{ "Enhanced Regrowth, Low", "#acbe4d" },
				{ "Unburned", "#0ae042" },
				{ "Low Severity", "#fff70b" },
				{ "Moderate-low Severity", "#ffaf38" },
				{ "Moderate-high Severity", "#ff641b" },
				//[659, 2000) is High Severity in the USGS legend; Moderate-high stops at 659
				{ "High Severity", "#a41fd6" },
				{ "NA", "#ffffff" }
			})
	{
	}
	SeverityScheme::SeverityScheme(const std::vector<index_t>& breaks, const std::vector<SeverityClass>& classes)
		: _breaks(breaks), _classes(classes)
	{
		_validate();
	}
	SeverityScheme::SeverityScheme(const std::vector<index_t>& breaks)
		: _breaks(breaks)
	{
		for (size_t i = 0; i < breaks.size(); ++i) {
			_classes.push_back({ "class " + std::to_string(i), "#ffffff" });
		}
		_validate();
	}
	const std::vector<index_t>& SeverityScheme::breaks() const
	{
		return _breaks;
	}
	size_t SeverityScheme::nClasses() const
	{
		return _classes.size();
	}
	const SeverityClass& SeverityScheme::classAt(size_t i) const
	{
		return _classes.at(i);
	}
	class_t SeverityScheme::classify(index_t v) const
	{
		auto firstBoundary = _breaks.begin() + 1;
		return (class_t)(std::upper_bound(firstBoundary, _breaks.end(), v) - firstBoundary);
	}
	void SeverityScheme::_validate() const
	{
		if (_breaks.size() < 2) {
			throw InvalidConfigurationException("A severity scheme needs at least two breaks");
		}
		if (_breaks.size() > (size_t)std::numeric_limits<class_t>::max()) {
			throw InvalidConfigurationException("Too many severity breaks");
		}
		for (size_t i = 0; i < _breaks.size(); ++i) {
			if (!std::isfinite(_breaks[i])) {
				throw InvalidConfigurationException("Severity breaks must be finite");
			}
			if (i > 0 && !(_breaks[i - 1] < _breaks[i])) {
				throw InvalidConfigurationException("Severity breaks must be strictly increasing, but " + std::to_string(_breaks[i - 1])
					+ " is followed by " + std::to_string(_breaks[i]));
			}
		}
		if (_classes.size() != _breaks.size()) {
			throw InvalidConfigurationException(std::to_string(_breaks.size()) + " severity breaks need "
				+ std::to_string(_breaks.size()) + " class descriptions, but " + std::to_string(_classes.size()) + " were given");
		}
	}

	Raster<index_t> differenceIndex(const Raster<index_t>& pre, const Raster<index_t>& post, index_t scale)
	{
		if (!pre.isSameAlignment(post)) {
			throw DimensionMismatchException("Pre-fire and post-fire index rasters do not share a grid");
		}
		Raster<index_t> out = (pre - post) * scale;
		return out;
	}

	Raster<class_t> classify(const Raster<index_t>& values, const SeverityScheme& scheme)
	{
		Raster<class_t> out{ (Alignment)values };
		for (cell_t cell = 0; cell < values.ncell(); ++cell) {
			const auto v = values.atCellUnsafe(cell);
			if (!v.has_value() || !std::isfinite(v.value())) {
				continue;
			}
			auto o = out.atCellUnsafe(cell);
			o.value() = scheme.classify(v.value());
			o.has_value() = true;
		}
		return out;
	}

	ClassificationSummary summarizeClasses(const Raster<class_t>& classified, const SeverityScheme& scheme)
	{
		ClassificationSummary out;
		for (size_t i = 0; i < scheme.nClasses(); ++i) {
			ClassSummary c;
			c.classId = (class_t)i;
			c.label = scheme.classAt(i).label;
			c.color = scheme.classAt(i).color;
			out.classes.push_back(c);
		}
		for (cell_t cell = 0; cell < classified.ncell(); ++cell) {
			const auto v = classified.atCellUnsafe(cell);
			if (!v.has_value() || v.value() < 0 || (size_t)v.value() >= out.classes.size()) {
				++out.nNoData;
				continue;
			}
			++out.classes[v.value()].nCells;
		}
		for (ClassSummary& c : out.classes) {
			c.area = c.nCells * classified.cellArea();
		}
		return out;
	}
}
