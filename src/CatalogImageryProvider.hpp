#pragma once
#ifndef bs_catalogimageryprovider_h
#define bs_catalogimageryprovider_h

#include"ImageCollection.hpp"
#include"SensorProfile.hpp"

namespace burnscar {

	struct CatalogEntry {
		std::string id;
		std::string path;
		Date date{};
		std::string sensor;
	};

	//Serves imagery from scene files listed in a YAML catalog:
	//  scenes:
	//    - { id: S2A_20191012, path: scenes/s2_20191012.tif, date: 2019-10-12, sensor: S2 }
	//Each file must have one band per name in the sensor's profile, in that order.
	class CatalogImageryProvider : public ImageryProvider {
	public:
		//throws InvalidConfigurationException if the catalog can't be read or an entry is malformed
		CatalogImageryProvider(const std::filesystem::path& catalogFile, const SensorRegistry& sensors);
		CatalogImageryProvider(std::vector<CatalogEntry> entries, const SensorRegistry& sensors);

		//scenes of the given sensor, acquired in [start, end), whose extent overlaps the area of interest's bounding box
		ImageCollection fetchCollection(const std::string& sensorId, const DateRange& range, const Polygon& areaOfInterest) const override;

		const std::vector<CatalogEntry>& entries() const;

	private:
		std::vector<CatalogEntry> _entries;
		SensorRegistry _sensors;
	};
}

#endif
