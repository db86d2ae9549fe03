#pragma once
#ifndef bs_alignment_h
#define bs_alignment_h

#include"Extent.hpp"
#include"GDALWrappers.hpp"

namespace burnscar {

	//An Alignment is the grid geometry shared by every raster in one operation: an extent, a cell size, and a number of rows and columns.
	//Cells are numbered row-major starting at the upper-left corner.
	class Alignment : public Extent {
	public:
		Alignment() = default;
		Alignment(const Extent& e, rowcol_t nrow, rowcol_t ncol);
		Alignment(coord_t xmin, coord_t ymin, rowcol_t nrow, rowcol_t ncol, coord_t xres, coord_t yres);
		Alignment(coord_t xmin, coord_t ymin, rowcol_t nrow, rowcol_t ncol, coord_t xres, coord_t yres, const CoordRef& crs);

		//reads only the header of a GDAL-readable raster
		Alignment(const std::string& filename);

		rowcol_t nrow() const;
		rowcol_t ncol() const;
		cell_t ncell() const;
		coord_t xres() const;
		coord_t yres() const;
		coord_t cellArea() const;

		//checked versions throw std::out_of_range
		cell_t cellFromRowCol(rowcol_t row, rowcol_t col) const;
		cell_t cellFromRowColUnsafe(rowcol_t row, rowcol_t col) const;
		rowcol_t rowFromCellUnsafe(cell_t cell) const;
		rowcol_t colFromCellUnsafe(cell_t cell) const;

		//coordinates are of the cell center
		coord_t xFromColUnsafe(rowcol_t col) const;
		coord_t yFromRowUnsafe(rowcol_t row) const;
		coord_t xFromCellUnsafe(cell_t cell) const;
		coord_t yFromCellUnsafe(cell_t cell) const;

		//returns -1 if the point is outside the extent
		cell_t cellFromXY(coord_t x, coord_t y) const;

		//true if the origin, cell size, dimensions, and CRS all match
		bool isSameAlignment(const Alignment& other) const;

	protected:
		coord_t _xres = 1, _yres = 1;
		rowcol_t _nrow = 0, _ncol = 0;

		void checkValidAlignment() const;
		void _checkCell(cell_t cell) const;
		void alignmentInitFromGDALRaster(const UniqueGdalDataset& wgd, const std::array<double, 6>& geotrans);
	};

	bool operator==(const Alignment& lhs, const Alignment& rhs);
	std::ostream& operator<<(std::ostream& os, const Alignment& a);
}

#endif
