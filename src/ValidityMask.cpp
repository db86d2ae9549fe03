#include"ValidityMask.hpp"
#include"BurnScarExceptions.hpp"

namespace burnscar {

	ValidityMask::ValidityMask(const Alignment& a)
		: ValidityMask(a, true)
	{
	}
	ValidityMask::ValidityMask(const Alignment& a, bool initial)
		: Alignment(a), _valid((size_t)a.ncell(), initial ? 1 : 0)
	{
	}
	bool ValidityMask::isValid(cell_t cell) const
	{
		_checkCell(cell);
		return isValidUnsafe(cell);
	}
	bool ValidityMask::isValidUnsafe(cell_t cell) const
	{
		return _valid[cell] != 0;
	}
	void ValidityMask::setValidUnsafe(cell_t cell, bool valid)
	{
		_valid[cell] = valid ? 1 : 0;
	}
	cell_t ValidityMask::countValid() const
	{
		return (cell_t)std::count(_valid.begin(), _valid.end(), (std::uint8_t)1);
	}
	ValidityMask& ValidityMask::operator&=(const ValidityMask& other)
	{
		if (!isSameAlignment(other)) {
			throw DimensionMismatchException("Alignment mismatch when combining validity masks");
		}
		for (size_t i = 0; i < _valid.size(); ++i) {
			_valid[i] = _valid[i] & other._valid[i];
		}
		return *this;
	}
	ValidityMask operator&(ValidityMask lhs, const ValidityMask& rhs)
	{
		lhs &= rhs;
		return lhs;
	}
}
