#pragma once
#ifndef bs_imagecollection_h
#define bs_imagecollection_h

#include"MultiBandRaster.hpp"

namespace burnscar {

	using Date = std::chrono::year_month_day;

	//parses YYYY-MM-DD, throwing InvalidConfigurationException on anything else
	Date parseDate(const std::string& s);
	std::string formatDate(const Date& d);

	//a half-open interval [start, end)
	struct DateRange {
		Date start{};
		Date end{};

		bool contains(const Date& d) const;
		//throws InvalidConfigurationException unless start < end
		void validate() const;
		std::string toString() const;
	};

	struct AcquiredImage {
		std::string id;
		Date date{};
		Image image;
	};

	//The images of one epoch over one footprint, always ordered by acquisition date. Images with the same date are ordered by id, then by the order they were added in.
	class ImageCollection {
	public:
		ImageCollection() = default;
		ImageCollection(const std::string& sensorId, const DateRange& range);

		//inserts in (date, id) order
		void add(AcquiredImage image);

		size_t size() const;
		bool empty() const;
		const AcquiredImage& at(size_t i) const;

		std::vector<AcquiredImage>::const_iterator begin() const;
		std::vector<AcquiredImage>::const_iterator end() const;

		const std::string& epoch() const;
		void setEpoch(const std::string& epoch);
		const std::string& sensorId() const;
		const DateRange& range() const;

		//"pre-fire epoch (sensor S2, 2019-10-10 to 2019-11-30)"
		std::string describe() const;

	private:
		std::string _epoch;
		std::string _sensorId;
		DateRange _range;
		std::vector<AcquiredImage> _images;
	};

	//The source of raw imagery. Implementations may return an empty collection; deciding whether that's an error is left to the caller.
	class ImageryProvider {
	public:
		virtual ~ImageryProvider() = default;
		virtual ImageCollection fetchCollection(const std::string& sensorId, const DateRange& range, const Polygon& areaOfInterest) const = 0;
	};
}

#endif
