#pragma once
#ifndef bs_validitymask_h
#define bs_validitymask_h

#include"Alignment.hpp"

namespace burnscar {

	//A boolean grid marking which cells hold a usable observation.
	//Kept separate from Raster<bool> so masks can be built and combined without touching any band data.
	class ValidityMask : public Alignment {
	public:
		ValidityMask() = default;
		//every cell starts valid
		explicit ValidityMask(const Alignment& a);
		ValidityMask(const Alignment& a, bool initial);

		bool isValid(cell_t cell) const;
		bool isValidUnsafe(cell_t cell) const;
		void setValidUnsafe(cell_t cell, bool valid);

		cell_t countValid() const;

		//logical AND with another mask of the same alignment; throws DimensionMismatchException otherwise
		ValidityMask& operator&=(const ValidityMask& other);

	private:
		std::vector<std::uint8_t> _valid;
	};

	ValidityMask operator&(ValidityMask lhs, const ValidityMask& rhs);
}

#endif
