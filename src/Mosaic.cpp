#include"Mosaic.hpp"
#include"Log.hpp"

namespace burnscar {

	Image mosaicFirstValid(const ImageCollection& collection, const Polygon& areaOfInterest)
	{
		if (collection.empty()) {
			throw EmptyCollectionException("No images found for the " + collection.describe()
				+ "; widen the date range or check the area of interest");
		}
		const Image& first = collection.at(0).image;
		for (const AcquiredImage& a : collection) {
			if (!a.image.isSameAlignment(first)) {
				throw DimensionMismatchException("Image " + a.id + " does not share the grid of image " + collection.at(0).id);
			}
			if (a.image.bandNames() != first.bandNames()) {
				throw DimensionMismatchException("Image " + a.id + " does not have the same bands as image " + collection.at(0).id);
			}
		}

		Image out{ (Alignment)first, first.bandNames() };
		cell_t nFilled = 0;
		for (cell_t cell = 0; cell < out.ncell(); ++cell) {
			for (const AcquiredImage& a : collection) {
				if (!a.image.isValidUnsafe(cell)) {
					continue;
				}
				for (band_t band = 0; band < out.nBands(); ++band) {
					auto outV = out.bandAt(band).atCellUnsafe(cell);
					outV.value() = a.image.bandAt(band).atCellUnsafe(cell).value();
					outV.has_value() = true;
				}
				++nFilled;
				break;
			}
		}
		out.maskByPolygon(areaOfInterest);

		logger()->info("Mosaicked {} images for the {}: {} of {} cells filled, {} inside the area of interest",
			collection.size(), collection.describe(), nFilled, out.ncell(), out.countValid());
		return out;
	}
}
