#pragma once
#ifndef bs_qualityflags_h
#define bs_qualityflags_h

#include"MultiBandRaster.hpp"

namespace burnscar {

	enum class QualityFlag {
		cloud, cirrus, cloudShadow, snow
	};
	constexpr int N_QUALITY_FLAGS = 4;

	//accepts "cloud", "cirrus", "shadow" or "cloud_shadow", and "snow"; throws InvalidConfigurationException otherwise
	QualityFlag qualityFlagFromString(const std::string& s);
	std::string qualityFlagToString(QualityFlag f);

	//The decoded form of a quality word. Stages test these instead of doing bit arithmetic on the raw band.
	struct QualityFlags {
		std::array<bool, N_QUALITY_FLAGS> set = { false,false,false,false };

		bool has(QualityFlag f) const { return set[(size_t)f]; }
		void raise(QualityFlag f) { set[(size_t)f] = true; }
		bool operator==(const QualityFlags& other) const = default;
	};

	//Bit position of each flag within the sensor's quality band. -1 means the sensor doesn't report that flag.
	struct QualityBitLayout {
		std::array<int, N_QUALITY_FLAGS> bits = { -1,-1,-1,-1 };

		int bitFor(QualityFlag f) const { return bits[(size_t)f]; }
		void setBit(QualityFlag f, int bit) { bits[(size_t)f] = bit; }
	};

	//flags whose bit is outside 0-31 are never raised
	QualityFlags decodeQualityWord(std::uint32_t word, const QualityBitLayout& layout);

	//decodes the named band once for the whole image. Cells where the quality band is missing are missing in the output
	Raster<QualityFlags> decodeQualityBand(const MultiBandRaster<reflectance_t>& image, const std::string& qualityBand, const QualityBitLayout& layout);

	class ValidityPredicate {
	public:
		virtual ~ValidityPredicate() = default;
		virtual bool isValid(const QualityFlags& flags) const = 0;
		virtual std::string describe() const = 0;
	};
	using SharedPredicate = std::shared_ptr<const ValidityPredicate>;

	//valid when the given flag is not raised
	class FlagClearPredicate : public ValidityPredicate {
	public:
		explicit FlagClearPredicate(QualityFlag flag);
		bool isValid(const QualityFlags& flags) const override;
		std::string describe() const override;
	private:
		QualityFlag _flag;
	};

	//valid when every child is valid; an empty AllOf accepts everything
	class AllOfPredicate : public ValidityPredicate {
	public:
		explicit AllOfPredicate(std::vector<SharedPredicate> children);
		bool isValid(const QualityFlags& flags) const override;
		std::string describe() const override;
	private:
		std::vector<SharedPredicate> _children;
	};

	//the usual mask policy: a pixel is clear when none of the listed flags is raised
	SharedPredicate makeMaskPolicy(const std::vector<QualityFlag>& flags);
}

#endif
