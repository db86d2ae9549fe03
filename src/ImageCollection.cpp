#include"ImageCollection.hpp"

namespace burnscar {

	Date parseDate(const std::string& s)
	{
		int y = 0;
		unsigned m = 0, d = 0;
		char dash1 = 0, dash2 = 0;
		char extra = 0;
		int nRead = std::sscanf(s.c_str(), "%d%c%u%c%u%c", &y, &dash1, &m, &dash2, &d, &extra);
		if (nRead != 5 || dash1 != '-' || dash2 != '-') {
			throw InvalidConfigurationException("Unable to parse '" + s + "' as a YYYY-MM-DD date");
		}
		Date out{ std::chrono::year{ y }, std::chrono::month{ m }, std::chrono::day{ d } };
		if (!out.ok()) {
			throw InvalidConfigurationException("'" + s + "' is not a valid calendar date");
		}
		return out;
	}
	std::string formatDate(const Date& d)
	{
		char buffer[16];
		std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", (int)d.year(), (unsigned)d.month(), (unsigned)d.day());
		return std::string(buffer);
	}

	bool DateRange::contains(const Date& d) const
	{
		return d >= start && d < end;
	}
	void DateRange::validate() const
	{
		if (!start.ok() || !end.ok()) {
			throw InvalidConfigurationException("Date range has an invalid date");
		}
		if (!(start < end)) {
			throw InvalidConfigurationException("Date range " + toString() + " is empty; the start must be before the end");
		}
	}
	std::string DateRange::toString() const
	{
		return formatDate(start) + " to " + formatDate(end);
	}

	ImageCollection::ImageCollection(const std::string& sensorId, const DateRange& range)
		: _sensorId(sensorId), _range(range)
	{
	}
	void ImageCollection::add(AcquiredImage image)
	{
		auto it = std::upper_bound(_images.begin(), _images.end(), image,
			[](const AcquiredImage& lhs, const AcquiredImage& rhs) {
				if (lhs.date != rhs.date) {
					return lhs.date < rhs.date;
				}
				return lhs.id < rhs.id;
			});
		_images.insert(it, std::move(image));
	}
	size_t ImageCollection::size() const
	{
		return _images.size();
	}
	bool ImageCollection::empty() const
	{
		return _images.empty();
	}
	const AcquiredImage& ImageCollection::at(size_t i) const
	{
		return _images.at(i);
	}
	std::vector<AcquiredImage>::const_iterator ImageCollection::begin() const
	{
		return _images.begin();
	}
	std::vector<AcquiredImage>::const_iterator ImageCollection::end() const
	{
		return _images.end();
	}
	const std::string& ImageCollection::epoch() const
	{
		return _epoch;
	}
	void ImageCollection::setEpoch(const std::string& epoch)
	{
		_epoch = epoch;
	}
	const std::string& ImageCollection::sensorId() const
	{
		return _sensorId;
	}
	const DateRange& ImageCollection::range() const
	{
		return _range;
	}
	std::string ImageCollection::describe() const
	{
		std::string name = _epoch.size() ? _epoch : std::string("unnamed");
		return name + " epoch (sensor " + _sensorId + ", " + _range.toString() + ")";
	}
}
