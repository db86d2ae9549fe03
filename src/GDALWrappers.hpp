#pragma once
#ifndef bs_gdalwrappers_h
#define bs_gdalwrappers_h

#include"bs_pch.hpp"

namespace burnscar {

	struct GdalDatasetDeleter {
		void operator()(GDALDataset* d) const;
	};
	using UniqueGdalDataset = std::unique_ptr<GDALDataset, GdalDatasetDeleter>;
	UniqueGdalDataset makeUniqueGdalDataset(GDALDatasetH d);

	//GDALAllRegister is cheap after the first call but not safe to race
	void gdalAllRegisterThreadSafe();

	//these return a null pointer on failure instead of throwing
	UniqueGdalDataset rasterGDALWrapper(const std::string& filename);
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename);
	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, int nband, GDALDataType gdt);

	//reads the six-element geotransform, throwing InvalidRasterFileException for rotated or missing transforms
	std::array<double, 6> getGeoTrans(const UniqueGdalDataset& wgd, const std::string& errorFileName);

	//opens only the header; 0 if the file isn't a readable raster
	band_t nBandsForFile(const std::string& file);
}

#endif
