#include"Config.hpp"

namespace fs = std::filesystem;

namespace burnscar {

	namespace {
		std::string resolvePath(const std::string& p, const fs::path& baseDir) {
			if (p.empty()) {
				return p;
			}
			fs::path asPath{ p };
			if (asPath.is_relative() && !baseDir.empty()) {
				asPath = baseDir / asPath;
			}
			return asPath.string();
		}

		EpochConfig readEpoch(const YAML::Node& node, const std::string& key) {
			if (!node[key]) {
				throw InvalidConfigurationException("Missing required key '" + key + "'");
			}
			const YAML::Node e = node[key];
			if (!e["start"] || !e["end"]) {
				throw InvalidConfigurationException("'" + key + "' needs both a start and an end date");
			}
			EpochConfig out;
			out.name = key == "pre_fire" ? "pre-fire" : "post-fire";
			out.range.start = parseDate(e["start"].as<std::string>());
			out.range.end = parseDate(e["end"].as<std::string>());
			return out;
		}

		Polygon readAreaOfInterest(const YAML::Node& node, const fs::path& baseDir) {
			if (!node["area_of_interest"]) {
				throw InvalidConfigurationException("Missing required key 'area_of_interest'");
			}
			const YAML::Node a = node["area_of_interest"];
			CoordRef crs;
			if (a["crs"]) {
				crs = CoordRef(a["crs"].as<std::string>());
			}
			if (a["vertices"] && a["file"]) {
				throw InvalidConfigurationException("'area_of_interest' takes either 'vertices' or 'file', not both");
			}
			if (a["file"]) {
				Polygon poly = readPolygonFile(resolvePath(a["file"].as<std::string>(), baseDir));
				if (a["crs"]) {
					poly.setCrs(crs);
				}
				return poly;
			}
			if (!a["vertices"] || !a["vertices"].IsSequence()) {
				throw InvalidConfigurationException("'area_of_interest' needs a 'vertices' list or a 'file'");
			}
			std::vector<CoordXY> ring;
			for (const YAML::Node& v : a["vertices"]) {
				if (!v.IsSequence() || v.size() != 2) {
					throw InvalidConfigurationException("Each area of interest vertex must be an [x, y] pair");
				}
				ring.emplace_back(v[0].as<coord_t>(), v[1].as<coord_t>());
			}
			return Polygon(ring, crs);
		}

		SeverityScheme readScheme(const YAML::Node& node) {
			const YAML::Node c = node["classification"];
			if (!c || !c["breaks"]) {
				if (c && c["classes"]) {
					throw InvalidConfigurationException("'classification.classes' requires 'classification.breaks'");
				}
				return SeverityScheme();
			}
			std::vector<index_t> breaks = c["breaks"].as<std::vector<index_t>>();
			if (!c["classes"]) {
				//the default labels still apply if the number of classes matches
				SeverityScheme standard;
				if (breaks.size() == standard.nClasses()) {
					std::vector<SeverityClass> classes;
					for (size_t i = 0; i < standard.nClasses(); ++i) {
						classes.push_back(standard.classAt(i));
					}
					return SeverityScheme(breaks, classes);
				}
				return SeverityScheme(breaks);
			}
			std::vector<SeverityClass> classes;
			for (const YAML::Node& cl : c["classes"]) {
				SeverityClass sc;
				sc.label = cl["label"] ? cl["label"].as<std::string>() : "class " + std::to_string(classes.size());
				sc.color = cl["color"] ? cl["color"].as<std::string>() : "#ffffff";
				classes.push_back(sc);
			}
			return SeverityScheme(breaks, classes);
		}
	}

	SensorProfile sensorProfileFromYaml(const YAML::Node& node)
	{
		SensorProfile p;
		if (!node["id"]) {
			throw InvalidConfigurationException("Each sensor needs an 'id'");
		}
		p.id = node["id"].as<std::string>();
		p.name = node["name"] ? node["name"].as<std::string>() : p.id;
		if (node["bands"]) p.bands = node["bands"].as<std::vector<std::string>>();
		if (node["nir"]) p.nirBand = node["nir"].as<std::string>();
		if (node["swir2"]) p.swir2Band = node["swir2"].as<std::string>();
		if (node["quality_band"]) p.qualityBand = node["quality_band"].as<std::string>();
		if (node["keep_quality_band"]) p.keepQualityBand = node["keep_quality_band"].as<bool>();
		if (node["bits"]) {
			for (const auto& kv : node["bits"]) {
				p.bits.setBit(qualityFlagFromString(kv.first.as<std::string>()), kv.second.as<int>());
			}
		}
		if (node["mask"]) {
			for (const YAML::Node& f : node["mask"]) {
				p.maskFlags.push_back(qualityFlagFromString(f.as<std::string>()));
			}
		}
		p.validate();
		return p;
	}

	void BurnScarConfig::validate() const
	{
		sensors.lookup(sensor);
		preFire.range.validate();
		postFire.range.validate();
		if (!(preFire.range.start < postFire.range.end)) {
			throw InvalidConfigurationException("The pre-fire epoch must start before the post-fire epoch ends");
		}
		areaOfInterest.validateAsAreaOfInterest();
		if (!std::isfinite(scale) || scale == 0) {
			throw InvalidConfigurationException("The dNBR scale must be finite and non-zero");
		}
		if (water.threshold < 1 || water.threshold > 12) {
			throw InvalidConfigurationException("Water seasonality threshold must be between 1 and 12 months, got " + std::to_string(water.threshold));
		}
	}

	BurnScarConfig configFromYaml(const YAML::Node& node, const fs::path& baseDir)
	{
		BurnScarConfig cfg;
		try {
			if (!node.IsMap()) {
				throw InvalidConfigurationException("The configuration must be a YAML map");
			}
			if (node["sensors"]) {
				for (const YAML::Node& s : node["sensors"]) {
					cfg.sensors.add(sensorProfileFromYaml(s));
				}
			}
			if (node["sensor"]) cfg.sensor = node["sensor"].as<std::string>();
			cfg.preFire = readEpoch(node, "pre_fire");
			cfg.postFire = readEpoch(node, "post_fire");
			cfg.areaOfInterest = readAreaOfInterest(node, baseDir);
			if (node["catalog"]) cfg.catalogFile = resolvePath(node["catalog"].as<std::string>(), baseDir);
			if (node["water"]) {
				const YAML::Node w = node["water"];
				if (w["seasonality"]) cfg.water.seasonalityFile = resolvePath(w["seasonality"].as<std::string>(), baseDir);
				if (w["threshold"]) cfg.water.threshold = w["threshold"].as<int>();
			}
			cfg.scheme = readScheme(node);
			if (node["classification"] && node["classification"]["scale"]) {
				cfg.scale = node["classification"]["scale"].as<index_t>();
			}
			if (node["output"]) {
				const YAML::Node o = node["output"];
				if (o["dnbr"]) cfg.output.dnbrFile = resolvePath(o["dnbr"].as<std::string>(), baseDir);
				if (o["classified"]) cfg.output.classifiedFile = resolvePath(o["classified"].as<std::string>(), baseDir);
			}
			if (node["log_level"]) cfg.logLevel = node["log_level"].as<std::string>();
		}
		catch (const YAML::Exception& e) {
			throw InvalidConfigurationException(std::string("Malformed configuration: ") + e.what());
		}
		cfg.validate();
		return cfg;
	}

	BurnScarConfig loadConfig(const fs::path& path)
	{
		if (!fs::exists(path)) {
			throw InvalidConfigurationException("Config file not found: " + path.string());
		}
		YAML::Node node;
		try {
			node = YAML::LoadFile(path.string());
		}
		catch (const YAML::Exception& e) {
			throw InvalidConfigurationException("Unable to parse " + path.string() + ": " + e.what());
		}
		return configFromYaml(node, path.parent_path());
	}
}
