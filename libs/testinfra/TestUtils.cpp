#include <cmath>
#include <stdexcept>
#include "TestUtils.h"
#include "BoostDateHelper.h"
#include "DecimalConstants.h"

using namespace boost::gregorian;
using namespace rebalancer;

DecimalType createDecimal(const std::string& valueString)
{
  return DecimalConstants<DecimalType>::createDecimal(valueString);
}

std::vector<DecimalType> createDecimalVector(const std::vector<double>& values)
{
  std::vector<DecimalType> out;
  out.reserve(values.size());
  for (double v : values)
    out.push_back(DecimalType(v));

  return out;
}

date createDate (const std::string& dateString)
{
  return parseDateString(dateString);
}

std::shared_ptr<EntryType>
createPriceBar (const std::string& dateString,
		const std::string& openPrice,
		const std::string& highPrice,
		const std::string& lowPrice,
		const std::string& closePrice,
		const std::string& vol)
{
  return std::make_shared<EntryType>(createDate(dateString),
				     createDecimal(openPrice),
				     createDecimal(highPrice),
				     createDecimal(lowPrice),
				     createDecimal(closePrice),
				     createDecimal(vol));
}

std::vector<date>
weekdaysFrom (const date& firstDate, std::size_t count)
{
  std::vector<date> dates;
  dates.reserve(count);

  date current(firstDate);
  while (dates.size() < count)
    {
      if (isWeekday(current))
	dates.push_back(current);
      current = current + date_duration(1);
    }

  return dates;
}

std::shared_ptr<PriceSeries<DecimalType>>
createSeriesFromCloses (const date& firstDate,
			const std::vector<DecimalType>& closes,
			const std::vector<DecimalType>& volumes)
{
  if (closes.size() != volumes.size())
    throw std::invalid_argument("createSeriesFromCloses: closes and volumes differ in length");

  auto series = std::make_shared<PriceSeries<DecimalType>>(closes.size());
  std::vector<date> dates(weekdaysFrom(firstDate, closes.size()));

  for (std::size_t i = 0; i < closes.size(); ++i)
    series->addEntry(EntryType(dates[i],
			       closes[i],
			       closes[i] * DecimalType(1.01),
			       closes[i] * DecimalType(0.99),
			       closes[i],
			       volumes[i]));

  return series;
}

std::shared_ptr<PriceSeries<DecimalType>>
createSeriesFromCloses (const date& firstDate,
			const std::vector<DecimalType>& closes,
			DecimalType volume)
{
  return createSeriesFromCloses(firstDate, closes,
				std::vector<DecimalType>(closes.size(), volume));
}

std::shared_ptr<PriceSeries<DecimalType>>
createGeometricSeries (const date& firstDate,
		       std::size_t numBars,
		       DecimalType startClose,
		       DecimalType dailyReturn,
		       DecimalType volume)
{
  std::vector<DecimalType> closes;
  closes.reserve(numBars);
  for (std::size_t i = 0; i < numBars; ++i)
    closes.push_back(DecimalType(num::to_double(startClose) *
				 std::pow(1.0 + num::to_double(dailyReturn), static_cast<double>(i))));

  return createSeriesFromCloses(firstDate, closes, volume);
}

std::shared_ptr<PriceSeries<DecimalType>>
createFlatSeries (const date& firstDate,
		  std::size_t numBars,
		  DecimalType price,
		  DecimalType volume)
{
  return createSeriesFromCloses(firstDate, std::vector<DecimalType>(numBars, price), volume);
}
