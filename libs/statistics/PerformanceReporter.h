// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_PERFORMANCE_REPORTER_H
#define __REBALANCER_PERFORMANCE_REPORTER_H 1

#include <ostream>
#include <string>
#include <vector>
#include "PerformanceMetrics.h"
#include "RebalanceBackTester.h"
#include "number.h"

namespace rebalancer
{
  /**
   * @brief Human readable report of a finished run.
   */
  class PerformanceReporter
  {
  public:
    typedef num::DefaultNumber Decimal;

    explicit PerformanceReporter(std::ostream& os);

    // Capital, returns, risk ratios, trade count and the strategy rating.
    void writeSummary(const PerformanceMetrics<Decimal>& metrics);

    // Buy/sell counts, total costs, average amounts and the last maxTrades trades.
    void writeTradeAnalysis(const RunResult<Decimal>& run,
			    const PerformanceMetrics<Decimal>& metrics,
			    std::size_t maxTrades = 10);

    void writeFinalPositions(const RunResult<Decimal>& run);

    void writeBenchmarkComparison(const PerformanceMetrics<Decimal>& metrics);

    // All of the above.
    void writeReport(const RunResult<Decimal>& run,
		     const PerformanceMetrics<Decimal>& metrics);

  private:
    void writeRule(char c = '=');
    static std::string percent(const Decimal& fraction);
    static std::string money(const Decimal& amount);

    std::ostream& mOut;
  };
}

#endif
