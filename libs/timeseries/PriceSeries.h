// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_PRICE_SERIES_H
#define __REBALANCER_PRICE_SERIES_H 1

#include <algorithm>
#include <optional>
#include <string>
#include <type_traits>
#include <iterator>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceBar.h"
#include "TimeFrame.h"
#include "TimeSeriesException.h"
#include "BoostDateHelper.h"

namespace rebalancer
{
  using boost::gregorian::date;

  /**
   * @brief Ordered daily price history for a single instrument.
   * @tparam Decimal The numeric type used for prices and volume.
   *
   * Maintains a single sorted-invariant vector of bars (`mData`).
   * - Insertion via `addEntry(...)` keeps the data sorted by date.
   * - Duplicate dates are rejected with TimeSeriesDuplicateDateException.
   *
   * A series is loaded once by a market data source and is read-only while a
   * simulation runs, so concurrent readers need no synchronisation.
   */
  template <class Decimal>
  class PriceSeries
  {
  public:
    using Entry = PriceBar<Decimal>;
    using ConstSortedIterator = typename std::vector<Entry>::const_iterator;

    PriceSeries()
      : mData(),
	mTimeFrame(TimeFrame::DAILY)
    {}

    explicit PriceSeries(unsigned long reserveCount)
      : mData(),
	mTimeFrame(TimeFrame::DAILY)
    {
      mData.reserve(reserveCount);
    }

    /**
     * @brief Constructs a series from a range of bars.
     *
     * The bars are sorted by date after insertion.
     *
     * @throws TimeSeriesDuplicateDateException if two bars share a date.
     */
    template<
    class InputIt,
    class = typename std::enable_if<
        std::is_same<typename std::iterator_traits<InputIt>::value_type,
		     PriceBar<Decimal>>::value>::type>
    PriceSeries(InputIt first, InputIt last)
      : mData(first, last),
	mTimeFrame(TimeFrame::DAILY)
    {
      std::stable_sort(mData.begin(), mData.end(),
		       [](auto const &a, auto const &b)
		       {
			 return a.getDate() < b.getDate();
		       });

      auto dup = std::adjacent_find(mData.begin(), mData.end(),
				    [](auto const &a, auto const &b)
				    {
				      return a.getDate() == b.getDate();
				    });
      if (dup != mData.end())
	throw TimeSeriesDuplicateDateException("PriceSeries constructor: duplicate date " + toDateString (dup->getDate()));
    }

    PriceSeries(const PriceSeries& rhs) = default;
    PriceSeries& operator=(const PriceSeries& rhs) = default;
    PriceSeries(PriceSeries&& rhs) noexcept = default;
    PriceSeries& operator=(PriceSeries&& rhs) noexcept = default;

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    unsigned long getNumEntries() const
    {
      return static_cast<unsigned long>(mData.size());
    }

    bool isEmpty() const
    {
      return mData.empty();
    }

    /**
     * @brief Inserts a bar, keeping the series sorted by date.
     * @throws TimeSeriesDuplicateDateException if a bar already exists on that date.
     */
    void addEntry(Entry entry)
    {
      auto it = std::lower_bound(mData.begin(), mData.end(), entry.getDate(),
				 [](const Entry& e, const date& d)
				 {
				   return e.getDate() < d;
				 });

      if (it != mData.end() && it->getDate() == entry.getDate())
	throw TimeSeriesDuplicateDateException("PriceSeries::addEntry: duplicate date " + toDateString (entry.getDate()));

      mData.insert(it, std::move(entry));
    }

    /**
     * @brief Retrieves the bar for an exact date.
     * @throws TimeSeriesDataNotFoundException if no bar exists on that date.
     */
    const Entry& getTimeSeriesEntry(const date& d) const
    {
      auto it = lowerBound(d);
      if (it == mData.end() || it->getDate() != d)
	throw TimeSeriesDataNotFoundException("PriceSeries::getTimeSeriesEntry: no bar on " + toDateString (d));

      return *it;
    }

    bool isDateFound(const date& d) const
    {
      auto it = lowerBound(d);
      return (it != mData.end() && it->getDate() == d);
    }

    /**
     * @brief Latest bar dated on or before the given date.
     * @return The bar, or std::nullopt when every bar is dated after `d`.
     */
    std::optional<Entry> getLatestEntryOnOrBefore(const date& d) const
    {
      auto it = upperBound(d);
      if (it == mData.begin())
	return std::nullopt;

      return *std::prev(it);
    }

    /**
     * @brief Number of bars dated on or before the given date.
     */
    unsigned long getNumEntriesOnOrBefore(const date& d) const
    {
      return static_cast<unsigned long>(std::distance(mData.begin(), upperBound(d)));
    }

    const date& getFirstDate() const
    {
      if (mData.empty())
	throw TimeSeriesDataNotFoundException("PriceSeries::getFirstDate: no entries in time series");

      return mData.front().getDate();
    }

    const date& getLastDate() const
    {
      if (mData.empty())
	throw TimeSeriesDataNotFoundException("PriceSeries::getLastDate: no entries in time series");

      return mData.back().getDate();
    }

    std::vector<Entry> getEntriesCopy() const
    {
      return mData;
    }

    ConstSortedIterator beginSortedAccess() const
    {
      return mData.begin();
    }

    ConstSortedIterator endSortedAccess() const
    {
      return mData.end();
    }

    /**
     * @brief Iterator one past the last bar dated on or before `d`.
     */
    ConstSortedIterator endSortedAccessOnOrBefore(const date& d) const
    {
      return upperBound(d);
    }

  private:
    ConstSortedIterator lowerBound(const date& d) const
    {
      return std::lower_bound(mData.begin(), mData.end(), d,
			      [](const Entry& e, const date& target)
			      {
				return e.getDate() < target;
			      });
    }

    ConstSortedIterator upperBound(const date& d) const
    {
      return std::upper_bound(mData.begin(), mData.end(), d,
			      [](const date& target, const Entry& e)
			      {
				return target < e.getDate();
			      });
    }

  private:
    std::vector<Entry> mData;
    TimeFrame::Duration mTimeFrame;
  };

  template <class Decimal>
  bool operator==(const PriceSeries<Decimal>& lhs, const PriceSeries<Decimal>& rhs)
  {
    if (lhs.getNumEntries() != rhs.getNumEntries())
      return false;

    return std::equal(lhs.beginSortedAccess(), lhs.endSortedAccess(),
		      rhs.beginSortedAccess());
  }

  template <class Decimal>
  bool operator!=(const PriceSeries<Decimal>& lhs, const PriceSeries<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @brief Copy of the series holding only bars dated on or before `asOfDate`.
   *
   * This is the only view of history given to indicator computation, so no
   * bar after the as-of date can influence a snapshot.
   */
  template <class Decimal>
  PriceSeries<Decimal> TruncateSeries (const PriceSeries<Decimal>& series,
				       const date& asOfDate)
  {
    PriceSeries<Decimal> out(series.getNumEntriesOnOrBefore(asOfDate));
    for (auto it = series.beginSortedAccess(); it != series.endSortedAccessOnOrBefore(asOfDate); ++it)
      out.addEntry(*it);

    return out;
  }
}

#endif
