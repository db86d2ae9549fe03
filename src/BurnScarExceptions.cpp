#include"BurnScarExceptions.hpp"

namespace burnscar {
	BurnScarException::BurnScarException(const std::string& error) : std::runtime_error(error) {}
	EmptyCollectionException::EmptyCollectionException(const std::string& error) : BurnScarException(error) {}
	DimensionMismatchException::DimensionMismatchException(const std::string& error) : BurnScarException(error) {}
	InvalidConfigurationException::InvalidConfigurationException(const std::string& error) : BurnScarException(error) {}
	InvalidRasterFileException::InvalidRasterFileException(const std::string& error) : BurnScarException(error) {}
	InvalidVectorFileException::InvalidVectorFileException(const std::string& error) : BurnScarException(error) {}
	WrongGeometryTypeException::WrongGeometryTypeException(const std::string& error) : BurnScarException(error) {}
}
