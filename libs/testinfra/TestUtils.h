#ifndef __REBALANCER_TEST_UTILS_H
#define __REBALANCER_TEST_UTILS_H 1

#include <memory>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian.hpp>
#include "number.h"
#include "PriceBar.h"
#include "PriceSeries.h"

typedef num::DefaultNumber DecimalType;
typedef rebalancer::PriceBar<DecimalType> EntryType;

DecimalType createDecimal(const std::string& valueString);

// Each value rounded to the decimal resolution.
std::vector<DecimalType> createDecimalVector(const std::vector<double>& values);

boost::gregorian::date createDate (const std::string& dateString);

std::shared_ptr<EntryType>
createPriceBar (const std::string& dateString,
		const std::string& openPrice,
		const std::string& highPrice,
		const std::string& lowPrice,
		const std::string& closePrice,
		const std::string& vol);

// Consecutive weekdays starting on (or after) the given date.
std::vector<boost::gregorian::date>
weekdaysFrom (const boost::gregorian::date& firstDate, std::size_t count);

// One bar per weekday starting at firstDate. Each bar opens at its close,
// with high and low one percent either side.
std::shared_ptr<rebalancer::PriceSeries<DecimalType>>
createSeriesFromCloses (const boost::gregorian::date& firstDate,
			const std::vector<DecimalType>& closes,
			const std::vector<DecimalType>& volumes);

std::shared_ptr<rebalancer::PriceSeries<DecimalType>>
createSeriesFromCloses (const boost::gregorian::date& firstDate,
			const std::vector<DecimalType>& closes,
			DecimalType volume = DecimalType(1000000));

// numBars closes starting at startClose and growing by dailyReturn per bar.
std::shared_ptr<rebalancer::PriceSeries<DecimalType>>
createGeometricSeries (const boost::gregorian::date& firstDate,
		       std::size_t numBars,
		       DecimalType startClose,
		       DecimalType dailyReturn,
		       DecimalType volume = DecimalType(1000000));

// numBars bars all closing at price.
std::shared_ptr<rebalancer::PriceSeries<DecimalType>>
createFlatSeries (const boost::gregorian::date& firstDate,
		  std::size_t numBars,
		  DecimalType price,
		  DecimalType volume = DecimalType(1000000));

#endif
