#pragma once
#ifndef bs_raster_h
#define bs_raster_h

#include"bs_pch.hpp"
#include"Alignment.hpp"
#include"BurnScarExceptions.hpp"
#include"Geometry.hpp"
#include"ValidityMask.hpp"

namespace burnscar {

	template<class T>
	class MultiBandRaster;

	template<class T>
	using RastData = xtl::xoptional_vector<T>;

	template<class T>
	class Raster : public Alignment {
	public:

		friend class MultiBandRaster<T>;

		Raster() : Alignment(), _data() {}
		virtual ~Raster() noexcept = default;

		//creates a raster from the given alignment, and fills it with missing values
		explicit Raster(const Alignment& a) : Alignment(a) {
			_data.resize(ncell());
		}

		//Constructs a raster from a GDAL-readable file. Cells equal to the band's nodata value, or NaN, are missing.
		Raster(const std::string& filename, const int band = 1);

		//disallow copy and move constructors from rasters with different templates. This will call the Raster(const Alignment& a) signature, which is very confusing
		template<class S>
		Raster(const Raster<S>& r) = delete;
		template<class S>
		Raster(Raster<S>&& r) = delete;
		template<class S>
		Raster<T>& operator=(const Raster<S>& r) = delete;
		template<class S>
		Raster<T>& operator=(Raster<S>&& r) = delete;

		Raster(const Raster<T>& r) = default;
		Raster(Raster<T>&& r) noexcept {
			*this = std::move(r);
		}
		Raster<T>& operator=(const Raster<T>& r) = default;
		Raster<T>& operator=(Raster<T>&& r) noexcept {
			_data = std::move(r._data);
			_crs = std::move(r._crs);
			_xmin = r._xmin; r._xmin = 0;
			_xmax = r._xmax; r._xmax = 0;
			_ymin = r._ymin; r._ymin = 0;
			_ymax = r._ymax; r._ymax = 0;
			_xres = r._xres; r._xres = 1;
			_yres = r._yres; r._yres = 1;
			_ncol = r._ncol; r._ncol = 0;
			_nrow = r._nrow; r._nrow = 0;
			return *this;
		}

		//As usual, operator[] does no bounds checking. atCell and atRC do.
		auto atCell(const cell_t cell) {
			_checkCell(cell);
			return (*this)[cell];
		}
		auto atRC(const rowcol_t row, const rowcol_t col) {
			return (*this)[cellFromRowCol(row, col)];
		}
		const auto atCell(const cell_t cell) const {
			_checkCell(cell);
			return (*this)[cell];
		}
		const auto atRC(const rowcol_t row, const rowcol_t col) const {
			return (*this)[cellFromRowCol(row, col)];
		}
		auto atRCUnsafe(const rowcol_t row, const rowcol_t col) {
			return (*this)[cellFromRowColUnsafe(row, col)];
		}
		const auto atRCUnsafe(const rowcol_t row, const rowcol_t col) const {
			return (*this)[cellFromRowColUnsafe(row, col)];
		}
		const auto operator[](const cell_t cell) const {
			return _data[cell];
		}
		auto operator[](const cell_t cell) {
			return _data[cell];
		}
		auto atCellUnsafe(const cell_t cell) {
			return _data[cell];
		}
		const auto atCellUnsafe(const cell_t cell) const {
			return _data[cell];
		}

		//Writes the Raster object to the harddrive. Missing values will be written as naValue. It's up to the user to make sure the driver and the file extension correspond.
		//You can specify the datatype of the file, or leave it as GDT_Unknown to choose the one that corresponds to the template of the raster object.
		void writeRaster(const std::string& file, const std::string driver = "GTiff", const T navalue = std::numeric_limits<T>::lowest(), GDALDataType gdt = GDT_Unknown) const;

		//returns true if has_value is true for any cell; false otherwise
		bool hasAnyValue() const;
		cell_t countValid() const;

		//sets every cell which is invalid in m to missing
		void mask(const ValidityMask& m);

		//sets every cell whose center is outside the polygon to missing
		void maskByPolygon(const Polygon& poly);

		ValidityMask validity() const;

		//basic element-wise artihmetic
		template<class S>
		Raster<T>& operator-=(const Raster<S>& rhs);
		template<class S>
		Raster<T>& operator*=(const S rhs);

		auto begin() { return _data.begin(); }
		auto end() { return _data.end(); }
		auto begin() const { return _data.begin(); }
		auto end() const { return _data.end(); }

		static GDALDataType GDT() {
			if (std::is_same<T, double>::value) {
				return GDT_Float64;
			}
			if (std::is_same<T, float>::value) {
				return GDT_Float32;
			}
			if (std::is_same<T, std::uint8_t>::value) {
				return GDT_Byte;
			}
			if (std::is_same<T, std::int16_t>::value) {
				return GDT_Int16;
			}
			if (std::is_same<T, std::int32_t>::value) {
				return GDT_Int32;
			}
			if (std::is_same<T, std::uint16_t>::value) {
				return GDT_UInt16;
			}
			if (std::is_same<T, std::uint32_t>::value) {
				return GDT_UInt32;
			}
			return GDT_Unknown;
		}

	private:
		RastData<T> _data;

		void _readBand(GDALRasterBand* rBand);
	};

	template<class T>
	inline bool operator==(const Raster<T>& lhs, const Raster<T>& rhs) {
		bool equal = true;
		equal = equal && ((Alignment)lhs == (Alignment)rhs);
		if (!equal) {
			return false;
		}
		for (cell_t cell = 0; cell < lhs.ncell(); ++cell) {
			equal = equal && (lhs[cell].has_value() == rhs[cell].has_value());
			if (lhs[cell].has_value() && rhs[cell].has_value()) {
				equal = equal && (lhs[cell].value() == rhs[cell].value());
			}
			if (!equal) {
				return false;
			}
		}
		return true;
	}
	template<class T>
	inline bool operator!=(const Raster<T>& lhs, const Raster<T>& rhs) {
		return !(lhs == rhs);
	}

	template<class T, class S>
	inline Raster<T> operator*(Raster<T> lhs, const S rhs) {
		lhs *= rhs; return lhs;
	}
	template<class T, class S>
	inline auto operator-(const Raster<T>& lhs, const Raster<S>& rhs)->Raster<decltype(T() - S())>
	{
		if (!lhs.isSameAlignment(rhs)) {
			throw DimensionMismatchException("Alignment mismatch in operator-");
		}
		using outtype = decltype(T() - S());
		Raster<outtype> out{ (Alignment)lhs };
		for (cell_t cell = 0; cell < out.ncell(); ++cell) {
			out[cell].has_value() = lhs[cell].has_value() && rhs[cell].has_value();
			out[cell].value() = lhs[cell].value() - rhs[cell].value();
		}
		return out;
	}

	template<class T>
	inline std::ostream& operator<<(std::ostream& os, const Raster<T>& r) {
		os << "RASTER: " << typeid(T).name() << " ";
		os << (Alignment)r;
		return os;
	}

	template<class T>
	Raster<T>::Raster(const std::string& filename, const int band) {

		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();
		if (band < 1 || band > wgd->GetRasterCount()) {
			throw InvalidRasterFileException(filename + " has no band " + std::to_string(band));
		}
		_data.resize(ncell());
		_readBand(wgd->GetRasterBand(band));
	}

	template<class T>
	void Raster<T>::_readBand(GDALRasterBand* rBand) {
		int hasNoData = 0;
		double naValue = rBand->GetNoDataValue(&hasNoData);
		CPLErr err = rBand->RasterIO(GF_Read, 0, 0, _ncol, _nrow, _data.value().data(), _ncol, _nrow, GDT(), 0, 0);
		if (err != CE_None) {
			throw InvalidRasterFileException("Error reading raster band: " + std::string(CPLGetLastErrorMsg()));
		}
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			double asDouble = (double)_data.value()[cell];
			if (std::isnan(asDouble)) {
				continue;
			}
			if (hasNoData && asDouble == (double)(T)naValue) {
				continue;
			}
			_data.has_value()[cell] = true;
		}
	}

	template<class T>
	void Raster<T>::writeRaster(const std::string& file, const std::string driver, const T navalue, GDALDataType dataType) const {
		if (dataType == GDT_Unknown) {
			dataType = GDT();
		}
		UniqueGdalDataset wgd = gdalCreateWrapper(driver, file, ncol(), nrow(), 1, dataType);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to create " + file + " as a raster");
		}
		std::array<double, 6> gt = { _xmin, _xres,0,_ymax,0,-(_yres) };
		wgd->SetGeoTransform(gt.data());
		if (!_crs.isEmpty()) {
			wgd->SetProjection(_crs.getCompleteWKT().c_str());
		}

		//the stored values of missing cells are arbitrary, so write from a copy
		std::vector<T> outValues(_data.value().begin(), _data.value().end());
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (!_data[cell].has_value()) {
				outValues[cell] = navalue;
			}
		}
		auto band = wgd->GetRasterBand(1);
		band->SetNoDataValue((double)navalue);
		CPLErr err = band->RasterIO(GF_Write, 0, 0, _ncol, _nrow, outValues.data(), _ncol, _nrow, GDT(), 0, 0);
		if (err != CE_None) {
			throw InvalidRasterFileException("Error writing " + file + ": " + std::string(CPLGetLastErrorMsg()));
		}
	}

	template<class T>
	bool Raster<T>::hasAnyValue() const {
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (atCellUnsafe(cell).has_value()) {
				return true;
			}
		}
		return false;
	}

	template<class T>
	cell_t Raster<T>::countValid() const {
		cell_t count = 0;
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (atCellUnsafe(cell).has_value()) {
				++count;
			}
		}
		return count;
	}

	template<class T>
	void Raster<T>::mask(const ValidityMask& m) {
		if (!isSameAlignment(m)) {
			throw DimensionMismatchException("Alignment mismatch in mask");
		}
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (!m.isValidUnsafe(cell)) {
				atCellUnsafe(cell).has_value() = false;
			}
		}
	}

	template<class T>
	void Raster<T>::maskByPolygon(const Polygon& poly) {
		if (!poly.crs().isConsistent(crs())) {
			throw DimensionMismatchException("CRS mismatch in maskByPolygon");
		}
		Extent bbox = poly.boundingBox();
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			auto v = atCellUnsafe(cell);
			if (!v.has_value()) {
				continue;
			}
			coord_t x = xFromCellUnsafe(cell);
			coord_t y = yFromCellUnsafe(cell);
			//cheap rejection before the ray-casting test
			if (x < bbox.xmin() || x > bbox.xmax() || y < bbox.ymin() || y > bbox.ymax()) {
				v.has_value() = false;
				continue;
			}
			if (!poly.containsPoint(x, y)) {
				v.has_value() = false;
			}
		}
	}

	template<class T>
	ValidityMask Raster<T>::validity() const {
		ValidityMask out{ (Alignment)*this };
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			out.setValidUnsafe(cell, atCellUnsafe(cell).has_value());
		}
		return out;
	}

	template<class T> template<class S>
	Raster<T>& Raster<T>::operator-=(const Raster<S>& rhs) {
		if (!isSameAlignment(rhs)) {
			throw DimensionMismatchException("Alignment mismatch in operator-=");
		}
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			_data[cell].has_value() = _data[cell].has_value() && rhs[cell].has_value();
			_data[cell].value() -= rhs[cell].value();
		}
		return *this;
	}
	template<class T> template<class S>
	Raster<T>& Raster<T>::operator*=(const S rhs) {
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			_data[cell].value() *= rhs;
		}
		return *this;
	}
}

#endif
