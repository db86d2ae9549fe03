#pragma once
#ifndef bs_burnscarexceptions_h
#define bs_burnscarexceptions_h

#include<stdexcept>
#include<string>

namespace burnscar {

	class BurnScarException : public std::runtime_error {
	public:
		BurnScarException(const std::string& error);
	};

	//no images were found for an epoch; the pipeline cannot continue
	class EmptyCollectionException : public BurnScarException {
	public:
		EmptyCollectionException(const std::string& error);
	};

	//two rasters in a binary operation don't share grid geometry or CRS
	class DimensionMismatchException : public BurnScarException {
	public:
		DimensionMismatchException(const std::string& error);
	};

	class InvalidConfigurationException : public BurnScarException {
	public:
		InvalidConfigurationException(const std::string& error);
	};

	class InvalidRasterFileException : public BurnScarException {
	public:
		InvalidRasterFileException(const std::string& error);
	};

	class InvalidVectorFileException : public BurnScarException {
	public:
		InvalidVectorFileException(const std::string& error);
	};

	class WrongGeometryTypeException : public BurnScarException {
	public:
		WrongGeometryTypeException(const std::string& error);
	};
}

#endif
