#include"GDALWrappers.hpp"
#include"BurnScarExceptions.hpp"

namespace burnscar {

	void GdalDatasetDeleter::operator()(GDALDataset* d) const
	{
		if (d) {
			GDALClose(GDALDataset::ToHandle(d));
		}
	}
	UniqueGdalDataset makeUniqueGdalDataset(GDALDatasetH d)
	{
		return UniqueGdalDataset(GDALDataset::FromHandle(d));
	}
	void gdalAllRegisterThreadSafe()
	{
		static std::once_flag flag;
		std::call_once(flag, []() { GDALAllRegister(); });
	}
	UniqueGdalDataset rasterGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return makeUniqueGdalDataset(GDALOpenEx(filename.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
	}
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return makeUniqueGdalDataset(GDALOpenEx(filename.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
	}
	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, int nband, GDALDataType gdt)
	{
		gdalAllRegisterThreadSafe();
		GDALDriver* d = GetGDALDriverManager()->GetDriverByName(driver.c_str());
		if (!d) {
			return UniqueGdalDataset();
		}
		return UniqueGdalDataset(d->Create(file.c_str(), ncol, nrow, nband, gdt, nullptr));
	}
	std::array<double, 6> getGeoTrans(const UniqueGdalDataset& wgd, const std::string& errorFileName)
	{
		std::array<double, 6> gt{};
		if (wgd->GetGeoTransform(gt.data()) != CE_None) {
			throw InvalidRasterFileException("Unable to get geotransform for " + errorFileName);
		}
		if (gt[2] != 0 || gt[4] != 0) {
			throw InvalidRasterFileException("Rotated rasters are not supported: " + errorFileName);
		}
		return gt;
	}
	band_t nBandsForFile(const std::string& file)
	{
		UniqueGdalDataset wgd = rasterGDALWrapper(file);
		return wgd ? (band_t)wgd->GetRasterCount() : 0;
	}
}
