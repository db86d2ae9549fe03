#include"CatalogImageryProvider.hpp"
#include"Log.hpp"
#include<yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace burnscar {

	CatalogImageryProvider::CatalogImageryProvider(const fs::path& catalogFile, const SensorRegistry& sensors)
		: _sensors(sensors)
	{
		if (!fs::exists(catalogFile)) {
			throw InvalidConfigurationException("Catalog file not found: " + catalogFile.string());
		}
		try {
			YAML::Node node = YAML::LoadFile(catalogFile.string());
			if (!node["scenes"] || !node["scenes"].IsSequence()) {
				throw InvalidConfigurationException("Catalog " + catalogFile.string() + " has no 'scenes' list");
			}
			for (const YAML::Node& s : node["scenes"]) {
				if (!s["path"] || !s["date"] || !s["sensor"]) {
					throw InvalidConfigurationException("Every scene in " + catalogFile.string() + " needs a path, a date, and a sensor");
				}
				CatalogEntry e;
				e.path = s["path"].as<std::string>();
				if (fs::path(e.path).is_relative()) {
					e.path = (catalogFile.parent_path() / e.path).string();
				}
				e.id = s["id"] ? s["id"].as<std::string>() : fs::path(e.path).stem().string();
				e.date = parseDate(s["date"].as<std::string>());
				e.sensor = s["sensor"].as<std::string>();
				_entries.push_back(std::move(e));
			}
		}
		catch (const YAML::Exception& e) {
			throw InvalidConfigurationException("Unable to parse catalog " + catalogFile.string() + ": " + e.what());
		}
		logger()->debug("Read {} scenes from {}", _entries.size(), catalogFile.string());
	}
	CatalogImageryProvider::CatalogImageryProvider(std::vector<CatalogEntry> entries, const SensorRegistry& sensors)
		: _entries(std::move(entries)), _sensors(sensors)
	{
	}
	ImageCollection CatalogImageryProvider::fetchCollection(const std::string& sensorId, const DateRange& range, const Polygon& areaOfInterest) const
	{
		const SensorProfile& profile = _sensors.lookup(sensorId);
		ImageCollection out{ profile.id, range };
		Extent aoiBox = areaOfInterest.boundingBox();

		for (const CatalogEntry& e : _entries) {
			if (!_sensors.contains(e.sensor) || _sensors.lookup(e.sensor).id != profile.id) {
				continue;
			}
			if (!range.contains(e.date)) {
				continue;
			}
			Alignment header{ e.path };
			if (header.crs().isConsistent(aoiBox.crs()) && !header.overlaps(aoiBox)) {
				logger()->debug("Skipping {}: it doesn't overlap the area of interest", e.id);
				continue;
			}
			band_t nBands = nBandsForFile(e.path);
			if (nBands != (band_t)profile.bands.size()) {
				throw InvalidRasterFileException("Scene " + e.id + " has " + std::to_string(nBands) + " bands, but sensor "
					+ profile.id + " expects " + std::to_string(profile.bands.size()));
			}
			logger()->debug("Reading {} ({}) from {}", e.id, formatDate(e.date), e.path);
			out.add(AcquiredImage{ e.id, e.date, Image(e.path, profile.bands) });
		}
		return out;
	}
	const std::vector<CatalogEntry>& CatalogImageryProvider::entries() const
	{
		return _entries;
	}
}
