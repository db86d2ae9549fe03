#pragma once
#ifndef bs_mosaic_h
#define bs_mosaic_h

#include"ImageCollection.hpp"

namespace burnscar {

	//Builds one composite from a masked collection. Images are scanned in acquisition order, and each cell takes every band
	//from the first image valid there, so cloud gaps in early scenes are filled by later ones. Cells with no valid
	//observation, or whose center lies outside the area of interest, are missing.
	//The result depends only on the collection's order, so repeated calls give identical rasters.
	//Throws EmptyCollectionException for an empty collection, and DimensionMismatchException unless all images
	//share one alignment and one set of band names.
	Image mosaicFirstValid(const ImageCollection& collection, const Polygon& areaOfInterest);
}

#endif
