#pragma once
#ifndef BS_MULTIBANDRASTER_H
#define BS_MULTIBANDRASTER_H

#include"Raster.hpp"


namespace burnscar {

	//A stack of co-registered bands, addressed by name. A pixel is valid only if every band has a value there,
	//so masking a pixel clears it in all bands at once.
	template<typename T>
	class MultiBandRaster : public Alignment {
	public:
		MultiBandRaster() = default;
		//reads every band of the file; names are assigned in band order and must match the band count
		MultiBandRaster(const std::string& filename, const std::vector<std::string>& bandNames);
		//creates all bands filled with missing values
		MultiBandRaster(const Alignment& a, const std::vector<std::string>& bandNames);

		band_t nBands() const;
		const std::vector<std::string>& bandNames() const;
		bool hasBand(const std::string& name) const;

		//throws std::out_of_range for unknown names
		Raster<T>& bandAt(const std::string& name);
		const Raster<T>& bandAt(const std::string& name) const;
		Raster<T>& bandAt(band_t band);
		const Raster<T>& bandAt(band_t band) const;

		bool isValidUnsafe(cell_t cell) const;
		ValidityMask validity() const;
		cell_t countValid() const;

		//sets every cell which is invalid in m to missing, in every band
		void mask(const ValidityMask& m);
		void maskByPolygon(const Polygon& poly);

		//a new raster with the named band removed. The remaining bands keep their order
		MultiBandRaster<T> withoutBand(const std::string& name) const;

		void writeRaster(const std::string& fileName, const std::string driver = "GTiff", const T navalue = std::numeric_limits<T>::lowest(), GDALDataType gdt = GDT_Unknown) const;
	private:
		std::vector<std::string> _names;
		std::vector<Raster<T>> _bands;

		band_t _bandIndex(const std::string& name) const;
		void _checkBand(band_t band) const;
	};

	//a scene or composite: reflectance bands plus, before masking, the sensor's quality band
	using Image = MultiBandRaster<reflectance_t>;

	template<typename T>
	inline bool operator==(const MultiBandRaster<T>& lhs, const MultiBandRaster<T>& rhs) {
		if (lhs.bandNames() != rhs.bandNames()) {
			return false;
		}
		for (band_t band = 0; band < lhs.nBands(); ++band) {
			if (lhs.bandAt(band) != rhs.bandAt(band)) {
				return false;
			}
		}
		return true;
	}

	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(const std::string& filename, const std::vector<std::string>& bandNames) {
		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();

		band_t nBand = wgd->GetRasterCount();
		if (nBand != (band_t)bandNames.size()) {
			throw InvalidRasterFileException(filename + " has " + std::to_string(nBand) + " bands but " + std::to_string(bandNames.size()) + " band names were given");
		}
		_names = bandNames;
		_bands.resize(nBand);
		for (band_t i = 0; i < nBand; ++i) {
			_bands[i] = Raster<T>((Alignment)*this);
			_bands[i]._readBand(wgd->GetRasterBand(i + 1));
		}
	}
	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(const Alignment& a, const std::vector<std::string>& bandNames)
		: Alignment(a), _names(bandNames)
	{
		for (size_t i = 0; i < bandNames.size(); ++i) {
			for (size_t j = 0; j < i; ++j) {
				if (bandNames[i] == bandNames[j]) {
					throw InvalidConfigurationException("Duplicate band name " + bandNames[i]);
				}
			}
			_bands.emplace_back(a);
		}
	}
	template<typename T>
	inline band_t MultiBandRaster<T>::nBands() const {
		return (band_t)_bands.size();
	}
	template<typename T>
	inline const std::vector<std::string>& MultiBandRaster<T>::bandNames() const {
		return _names;
	}
	template<typename T>
	inline bool MultiBandRaster<T>::hasBand(const std::string& name) const {
		return std::find(_names.begin(), _names.end(), name) != _names.end();
	}
	template<typename T>
	inline Raster<T>& MultiBandRaster<T>::bandAt(const std::string& name) {
		return _bands[_bandIndex(name)];
	}
	template<typename T>
	inline const Raster<T>& MultiBandRaster<T>::bandAt(const std::string& name) const {
		return _bands[_bandIndex(name)];
	}
	template<typename T>
	inline Raster<T>& MultiBandRaster<T>::bandAt(band_t band) {
		_checkBand(band);
		return _bands[band];
	}
	template<typename T>
	inline const Raster<T>& MultiBandRaster<T>::bandAt(band_t band) const {
		_checkBand(band);
		return _bands[band];
	}
	template<typename T>
	inline bool MultiBandRaster<T>::isValidUnsafe(cell_t cell) const {
		if (_bands.empty()) {
			return false;
		}
		for (const Raster<T>& b : _bands) {
			if (!b.atCellUnsafe(cell).has_value()) {
				return false;
			}
		}
		return true;
	}
	template<typename T>
	inline ValidityMask MultiBandRaster<T>::validity() const {
		ValidityMask out{ (Alignment)*this };
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			out.setValidUnsafe(cell, isValidUnsafe(cell));
		}
		return out;
	}
	template<typename T>
	inline cell_t MultiBandRaster<T>::countValid() const {
		cell_t count = 0;
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (isValidUnsafe(cell)) {
				++count;
			}
		}
		return count;
	}
	template<typename T>
	inline void MultiBandRaster<T>::mask(const ValidityMask& m) {
		if (!isSameAlignment(m)) {
			throw DimensionMismatchException("Alignment mismatch in mask");
		}
		for (Raster<T>& b : _bands) {
			b.mask(m);
		}
	}
	template<typename T>
	inline void MultiBandRaster<T>::maskByPolygon(const Polygon& poly) {
		for (Raster<T>& b : _bands) {
			b.maskByPolygon(poly);
		}
	}
	template<typename T>
	inline MultiBandRaster<T> MultiBandRaster<T>::withoutBand(const std::string& name) const {
		band_t drop = _bandIndex(name);
		MultiBandRaster<T> out;
		(Alignment&)out = (const Alignment&)*this;
		for (band_t band = 0; band < nBands(); ++band) {
			if (band == drop) {
				continue;
			}
			out._names.push_back(_names[band]);
			out._bands.push_back(_bands[band]);
		}
		return out;
	}
	template<typename T>
	inline void MultiBandRaster<T>::writeRaster(const std::string& fileName, const std::string driver, const T navalue, GDALDataType gdt) const
	{
		if (gdt == GDT_Unknown) {
			gdt = Raster<T>::GDT();
		}
		UniqueGdalDataset ugd = gdalCreateWrapper(driver, fileName, ncol(), nrow(), nBands(), gdt);
		if (!ugd) {
			throw InvalidRasterFileException("Unable to create " + fileName + " as a raster");
		}
		std::array<double, 6> gt = { _xmin, _xres,0,_ymax,0,-(_yres) };
		ugd->SetGeoTransform(gt.data());
		if (!_crs.isEmpty()) {
			ugd->SetProjection(_crs.getCompleteWKT().c_str());
		}
		for (band_t band = 0; band < nBands(); ++band) {
			std::vector<T> outValues(ncell());
			for (cell_t cell = 0; cell < ncell(); ++cell) {
				outValues[cell] = isValidUnsafe(cell) ? (T)_bands[band][cell].value() : navalue;
			}
			auto thisBand = ugd->GetRasterBand(band + 1);
			thisBand->SetNoDataValue((double)navalue);
			thisBand->SetDescription(_names[band].c_str());
			CPLErr err = thisBand->RasterIO(GF_Write, 0, 0, _ncol, _nrow, outValues.data(), _ncol, _nrow, Raster<T>::GDT(), 0, 0);
			if (err != CE_None) {
				throw InvalidRasterFileException("Error writing " + fileName + ": " + std::string(CPLGetLastErrorMsg()));
			}
		}
	}
	template<typename T>
	inline band_t MultiBandRaster<T>::_bandIndex(const std::string& name) const {
		auto it = std::find(_names.begin(), _names.end(), name);
		if (it == _names.end()) {
			throw std::out_of_range("No band named " + name);
		}
		return (band_t)(it - _names.begin());
	}
	template<typename T>
	inline void MultiBandRaster<T>::_checkBand(band_t band) const {
		if (band < 0 || band >= (band_t)_bands.size()) {
			throw std::out_of_range("Band out of range");
		}
	}

}

#endif
