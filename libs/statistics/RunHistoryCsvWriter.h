// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_RUN_HISTORY_CSV_WRITER_H
#define __REBALANCER_RUN_HISTORY_CSV_WRITER_H 1

#include <fstream>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "RebalanceBackTester.h"
#include "Trade.h"
#include "number.h"

namespace rebalancer
{
  /**
   * @brief Writes the snapshot history or the trade log of a run as CSV.
   *
   * Snapshot rows are date,value,cash,positions. Trade rows are
   * date,action,code,shares,price,amount,cost.
   */
  template <class Decimal>
  class RunHistoryCsvWriter
  {
  public:
    enum Contents { Snapshots, Trades };

    /**
     * @throws std::runtime_error if fileName cannot be opened for writing.
     */
    RunHistoryCsvWriter(const std::string& fileName,
			const RunResult<Decimal>& run,
			Contents contents)
      : mCsvFile(fileName),
	mRun(run),
	mContents(contents)
    {
      if (!mCsvFile)
	throw std::runtime_error("RunHistoryCsvWriter: unable to open " + fileName);
    }

    RunHistoryCsvWriter(const RunHistoryCsvWriter& rhs) = delete;
    RunHistoryCsvWriter& operator=(const RunHistoryCsvWriter& rhs) = delete;

    ~RunHistoryCsvWriter() = default;

    void writeFile()
    {
      if (mContents == Snapshots)
	writeSnapshots();
      else
	writeTrades();

      mCsvFile.flush();
    }

  private:
    void writeSnapshots()
    {
      mCsvFile << "date,value,cash,positions" << std::endl;
      for (const auto& s : mRun.snapshots)
	mCsvFile << boost::gregorian::to_iso_extended_string(s.date) << ","
		 << num::toString(s.totalValue, 2) << ","
		 << num::toString(s.cash, 2) << ","
		 << s.numPositions << std::endl;
    }

    void writeTrades()
    {
      mCsvFile << "date,action,code,shares,price,amount,cost" << std::endl;
      for (const auto& t : mRun.trades)
	mCsvFile << boost::gregorian::to_iso_extended_string(t.date) << ","
		 << tradeActionToString(t.action) << ","
		 << t.code << ","
		 << t.shares << ","
		 << num::toString(t.price, 4) << ","
		 << num::toString(t.getAmount(), 2) << ","
		 << num::toString(t.cost, 2) << std::endl;
    }

    std::ofstream mCsvFile;
    const RunResult<Decimal>& mRun;
    Contents mContents;
  };
}

#endif
