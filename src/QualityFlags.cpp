#include"QualityFlags.hpp"

namespace burnscar {

	QualityFlag qualityFlagFromString(const std::string& s)
	{
		std::string lower = s;
		std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });
		if (lower == "cloud") {
			return QualityFlag::cloud;
		}
		if (lower == "cirrus") {
			return QualityFlag::cirrus;
		}
		if (lower == "shadow" || lower == "cloud_shadow") {
			return QualityFlag::cloudShadow;
		}
		if (lower == "snow") {
			return QualityFlag::snow;
		}
		throw InvalidConfigurationException("Unknown quality flag: " + s);
	}
	std::string qualityFlagToString(QualityFlag f)
	{
		switch (f) {
		case QualityFlag::cloud:
			return "cloud";
		case QualityFlag::cirrus:
			return "cirrus";
		case QualityFlag::cloudShadow:
			return "cloud_shadow";
		case QualityFlag::snow:
			return "snow";
		}
		return "unknown";
	}

	QualityFlags decodeQualityWord(std::uint32_t word, const QualityBitLayout& layout)
	{
		QualityFlags out;
		for (int i = 0; i < N_QUALITY_FLAGS; ++i) {
			int bit = layout.bits[i];
			if (bit < 0 || bit > 31) {
				continue;
			}
			if (word & (std::uint32_t{ 1 } << bit)) {
				out.set[i] = true;
			}
		}
		return out;
	}

	Raster<QualityFlags> decodeQualityBand(const MultiBandRaster<reflectance_t>& image, const std::string& qualityBand, const QualityBitLayout& layout)
	{
		if (!image.hasBand(qualityBand)) {
			throw InvalidConfigurationException("Image has no quality band named " + qualityBand);
		}
		const Raster<reflectance_t>& qa = image.bandAt(qualityBand);
		Raster<QualityFlags> out{ (Alignment)qa };
		for (cell_t cell = 0; cell < qa.ncell(); ++cell) {
			const auto v = qa.atCellUnsafe(cell);
			if (!v.has_value() || v.value() < 0) {
				continue;
			}
			auto o = out.atCellUnsafe(cell);
			o.value() = decodeQualityWord((std::uint32_t)v.value(), layout);
			o.has_value() = true;
		}
		return out;
	}

	FlagClearPredicate::FlagClearPredicate(QualityFlag flag) : _flag(flag)
	{
	}
	bool FlagClearPredicate::isValid(const QualityFlags& flags) const
	{
		return !flags.has(_flag);
	}
	std::string FlagClearPredicate::describe() const
	{
		return "no " + qualityFlagToString(_flag);
	}

	AllOfPredicate::AllOfPredicate(std::vector<SharedPredicate> children) : _children(std::move(children))
	{
	}
	bool AllOfPredicate::isValid(const QualityFlags& flags) const
	{
		for (const SharedPredicate& p : _children) {
			if (!p->isValid(flags)) {
				return false;
			}
		}
		return true;
	}
	std::string AllOfPredicate::describe() const
	{
		std::string out;
		for (const SharedPredicate& p : _children) {
			if (out.size()) {
				out += " and ";
			}
			out += p->describe();
		}
		return out.size() ? out : "always valid";
	}

	SharedPredicate makeMaskPolicy(const std::vector<QualityFlag>& flags)
	{
		std::vector<SharedPredicate> children;
		for (QualityFlag f : flags) {
			children.push_back(std::make_shared<FlagClearPredicate>(f));
		}
		return std::make_shared<AllOfPredicate>(std::move(children));
	}
}
