#include"Alignment.hpp"
#include"BurnScarExceptions.hpp"

namespace burnscar {

	Alignment::Alignment(const Extent& e, rowcol_t nrow, rowcol_t ncol)
		: Extent(e), _nrow(nrow), _ncol(ncol)
	{
		if (nrow <= 0 || ncol <= 0) {
			throw InvalidConfigurationException("An alignment built from an extent needs at least one row and column");
		}
		_xres = (_xmax - _xmin) / _ncol;
		_yres = (_ymax - _ymin) / _nrow;
		checkValidAlignment();
	}
	Alignment::Alignment(coord_t xmin, coord_t ymin, rowcol_t nrow, rowcol_t ncol, coord_t xres, coord_t yres)
	{
		_xmin = xmin;
		_ymin = ymin;
		_nrow = nrow;
		_ncol = ncol;
		_xres = xres;
		_yres = yres;
		_xmax = xmin + ncol * xres;
		_ymax = ymin + nrow * yres;
		checkValidAlignment();
	}
	Alignment::Alignment(coord_t xmin, coord_t ymin, rowcol_t nrow, rowcol_t ncol, coord_t xres, coord_t yres, const CoordRef& crs)
		: Alignment(xmin, ymin, nrow, ncol, xres, yres)
	{
		_crs = crs;
	}
	Alignment::Alignment(const std::string& filename)
	{
		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw InvalidRasterFileException("Unable to open " + filename + " as a raster");
		}
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();
	}
	rowcol_t Alignment::nrow() const
	{
		return _nrow;
	}
	rowcol_t Alignment::ncol() const
	{
		return _ncol;
	}
	cell_t Alignment::ncell() const
	{
		return (cell_t)_nrow * _ncol;
	}
	coord_t Alignment::xres() const
	{
		return _xres;
	}
	coord_t Alignment::yres() const
	{
		return _yres;
	}
	coord_t Alignment::cellArea() const
	{
		return _xres * _yres;
	}
	cell_t Alignment::cellFromRowCol(rowcol_t row, rowcol_t col) const
	{
		if (row < 0 || col < 0 || row >= _nrow || col >= _ncol) {
			throw std::out_of_range("Row or column out of range");
		}
		return cellFromRowColUnsafe(row, col);
	}
	cell_t Alignment::cellFromRowColUnsafe(rowcol_t row, rowcol_t col) const
	{
		return (cell_t)row * _ncol + col;
	}
	rowcol_t Alignment::rowFromCellUnsafe(cell_t cell) const
	{
		return (rowcol_t)(cell / _ncol);
	}
	rowcol_t Alignment::colFromCellUnsafe(cell_t cell) const
	{
		return (rowcol_t)(cell % _ncol);
	}
	coord_t Alignment::xFromColUnsafe(rowcol_t col) const
	{
		return _xmin + _xres * col + _xres / 2;
	}
	coord_t Alignment::yFromRowUnsafe(rowcol_t row) const
	{
		return _ymax - _yres * row - _yres / 2;
	}
	coord_t Alignment::xFromCellUnsafe(cell_t cell) const
	{
		return xFromColUnsafe(colFromCellUnsafe(cell));
	}
	coord_t Alignment::yFromCellUnsafe(cell_t cell) const
	{
		return yFromRowUnsafe(rowFromCellUnsafe(cell));
	}
	cell_t Alignment::cellFromXY(coord_t x, coord_t y) const
	{
		if (!contains(x, y)) {
			return -1;
		}
		rowcol_t row = (rowcol_t)std::floor((_ymax - y) / _yres);
		rowcol_t col = (rowcol_t)std::floor((x - _xmin) / _xres);
		row = std::min(row, _nrow - 1);
		col = std::min(col, _ncol - 1);
		return cellFromRowColUnsafe(row, col);
	}
	bool Alignment::isSameAlignment(const Alignment& other) const
	{
		bool same = _nrow == other._nrow && _ncol == other._ncol;
		same = same && std::abs(_xmin - other._xmin) < BS_EPSILON;
		same = same && std::abs(_ymax - other._ymax) < BS_EPSILON;
		same = same && std::abs(_xres - other._xres) < BS_EPSILON;
		same = same && std::abs(_yres - other._yres) < BS_EPSILON;
		return same && _crs.isConsistent(other._crs);
	}
	void Alignment::checkValidAlignment() const
	{
		if (_nrow < 0 || _ncol < 0) {
			throw InvalidConfigurationException("Alignment has a negative number of rows or columns");
		}
		if (_xres <= 0 || _yres <= 0) {
			throw InvalidConfigurationException("Alignment has a non-positive cell size");
		}
	}
	void Alignment::_checkCell(cell_t cell) const
	{
		if (cell < 0 || cell >= ncell()) {
			throw std::out_of_range("Cell out of range");
		}
	}
	void Alignment::alignmentInitFromGDALRaster(const UniqueGdalDataset& wgd, const std::array<double, 6>& geotrans)
	{
		_ncol = wgd->GetRasterXSize();
		_nrow = wgd->GetRasterYSize();
		_xres = geotrans[1];
		_yres = std::abs(geotrans[5]);
		_xmin = geotrans[0];
		_xmax = _xmin + _ncol * _xres;
		//north-up rasters have a negative y pixel size
		if (geotrans[5] < 0) {
			_ymax = geotrans[3];
			_ymin = _ymax - _nrow * _yres;
		}
		else {
			_ymin = geotrans[3];
			_ymax = _ymin + _nrow * _yres;
		}
		_crs = CoordRef(wgd->GetSpatialRef());
	}
	bool operator==(const Alignment& lhs, const Alignment& rhs)
	{
		return lhs.isSameAlignment(rhs);
	}
	std::ostream& operator<<(std::ostream& os, const Alignment& a)
	{
		os << (Extent)a << " nrow: " << a.nrow() << " ncol: " << a.ncol() << " xres: " << a.xres() << " yres: " << a.yres();
		return os;
	}
}
