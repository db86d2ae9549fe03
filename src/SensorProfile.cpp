#include"SensorProfile.hpp"

namespace burnscar {

	void SensorProfile::validate() const
	{
		if (id.empty()) {
			throw InvalidConfigurationException("Sensor profile has no id");
		}
		auto hasBand = [&](const std::string& b) {
			return std::find(bands.begin(), bands.end(), b) != bands.end();
			};
		for (size_t i = 0; i < bands.size(); ++i) {
			for (size_t j = 0; j < i; ++j) {
				if (bands[i] == bands[j]) {
					throw InvalidConfigurationException("Sensor " + id + " lists band " + bands[i] + " twice");
				}
			}
		}
		if (!hasBand(nirBand)) {
			throw InvalidConfigurationException("Sensor " + id + " has no NIR band named '" + nirBand + "'");
		}
		if (!hasBand(swir2Band)) {
			throw InvalidConfigurationException("Sensor " + id + " has no SWIR2 band named '" + swir2Band + "'");
		}
		if (nirBand == swir2Band) {
			throw InvalidConfigurationException("Sensor " + id + " uses the same band for NIR and SWIR2");
		}
		if (maskFlags.size() && !hasBand(qualityBand)) {
			throw InvalidConfigurationException("Sensor " + id + " has no quality band named '" + qualityBand + "'");
		}
		for (int i = 0; i < N_QUALITY_FLAGS; ++i) {
			int bit = bits.bits[i];
			if (bit < -1 || bit > 31) {
				throw InvalidConfigurationException("Sensor " + id + " puts " + qualityFlagToString((QualityFlag)i)
					+ " at bit " + std::to_string(bit) + "; quality bits must be between 0 and 31");
			}
		}
		for (QualityFlag f : maskFlags) {
			int bit = bits.bitFor(f);
			if (bit < 0) {
				throw InvalidConfigurationException("Sensor " + id + " masks " + qualityFlagToString(f) + " but has no valid bit position for it");
			}
		}
	}

	SensorProfile sentinel2Profile()
	{
		SensorProfile p;
		p.id = "S2";
		p.name = "Sentinel-2";
		p.bands = { "B1","B2","B3","B4","B5","B6","B7","B8","B8A","B9","B10","B11","B12","QA60" };
		p.nirBand = "B8";
		p.swir2Band = "B12";
		p.qualityBand = "QA60";
		p.bits.setBit(QualityFlag::cloud, 10);
		p.bits.setBit(QualityFlag::cirrus, 11);
		p.maskFlags = { QualityFlag::cloud, QualityFlag::cirrus };
		return p;
	}

	SensorProfile landsat8Profile()
	{
		SensorProfile p;
		p.id = "L8";
		p.name = "Landsat 8";
		p.bands = { "B1","B2","B3","B4","B5","B6","B7","B10","B11","pixel_qa" };
		p.nirBand = "B5";
		p.swir2Band = "B7";
		p.qualityBand = "pixel_qa";
		p.bits.setBit(QualityFlag::cloudShadow, 3);
		p.bits.setBit(QualityFlag::snow, 4);
		p.bits.setBit(QualityFlag::cloud, 5);
		p.maskFlags = { QualityFlag::cloudShadow, QualityFlag::cloud, QualityFlag::snow };
		return p;
	}

	SensorRegistry SensorRegistry::withBuiltins()
	{
		SensorRegistry out;
		out.add(sentinel2Profile());
		out.add(landsat8Profile());
		return out;
	}
	void SensorRegistry::add(const SensorProfile& profile)
	{
		profile.validate();
		std::string key = _normalize(profile.id);
		for (SensorProfile& p : _profiles) {
			if (_normalize(p.id) == key) {
				p = profile;
				return;
			}
		}
		_profiles.push_back(profile);
	}
	bool SensorRegistry::contains(const std::string& id) const
	{
		std::string key = _normalize(id);
		for (const SensorProfile& p : _profiles) {
			if (_normalize(p.id) == key) {
				return true;
			}
		}
		return false;
	}
	const SensorProfile& SensorRegistry::lookup(const std::string& id) const
	{
		std::string key = _normalize(id);
		for (const SensorProfile& p : _profiles) {
			if (_normalize(p.id) == key) {
				return p;
			}
		}
		std::string known;
		for (const std::string& s : ids()) {
			known += (known.size() ? ", " : "") + s;
		}
		throw InvalidConfigurationException("Unknown sensor '" + id + "' (known sensors: " + known + ")");
	}
	std::vector<std::string> SensorRegistry::ids() const
	{
		std::vector<std::string> out;
		for (const SensorProfile& p : _profiles) {
			out.push_back(p.id);
		}
		return out;
	}
	std::string SensorRegistry::_normalize(const std::string& id)
	{
		std::string out = id;
		std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)std::toupper(c); });
		return out;
	}
}
