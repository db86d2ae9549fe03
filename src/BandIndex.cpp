#include"BandIndex.hpp"

namespace burnscar {

	Raster<index_t> normalizedDifference(const Image& image, const std::string& bandA, const std::string& bandB)
	{
		for (const std::string& name : { bandA, bandB }) {
			if (!image.hasBand(name)) {
				throw InvalidConfigurationException("Cannot compute a normalized difference: image has no band named " + name);
			}
		}
		const Raster<reflectance_t>& a = image.bandAt(bandA);
		const Raster<reflectance_t>& b = image.bandAt(bandB);

		Raster<index_t> out{ (Alignment)image };
		for (cell_t cell = 0; cell < out.ncell(); ++cell) {
			if (!image.isValidUnsafe(cell)) {
				continue;
			}
			index_t va = a.atCellUnsafe(cell).value();
			index_t vb = b.atCellUnsafe(cell).value();
			index_t sum = va + vb;
			if (sum == 0) {
				continue;
			}
			index_t v = (va - vb) / sum;
			if (!std::isfinite(v)) {
				continue;
			}
			auto o = out.atCellUnsafe(cell);
			o.value() = v;
			o.has_value() = true;
		}
		return out;
	}

	Raster<index_t> normalizedBurnRatio(const Image& image, const SensorProfile& sensor)
	{
		return normalizedDifference(image, sensor.nirBand, sensor.swir2Band);
	}
}
