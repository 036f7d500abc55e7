// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_REBALANCE_CONFIGURATION_FILE_READER_H
#define __REBALANCER_REBALANCE_CONFIGURATION_FILE_READER_H 1

#include <string>
#include "RebalanceConfiguration.h"
#include "number.h"

namespace rebalancer
{
  /**
   * @brief Reads simulation settings from a two column CSV file.
   *
   * Each row is "key,value" with no header row. Keys not present in the file
   * keep their value from the configuration passed in. List values such as
   * ma_periods are separated by ';' (for example "5;10;20;60").
   *
   * Recognised keys: initial_capital, max_positions, commission_rate,
   * min_commission, stamp_tax_rate, lot_size, cash_reserve, min_data_days,
   * lookback_days, ma_periods, momentum_horizons, rsi_period, macd_fast,
   * macd_slow, macd_signal, bb_period, bb_std, roc_period, volatility_window,
   * atr_period, volume_window, price_position_window, range_window,
   * rebalance_frequency, start_date, end_date, risk_free_rate,
   * benchmark_return.
   */
  class RebalanceConfigurationFileReader
  {
  public:
    typedef num::DefaultNumber Decimal;

    explicit RebalanceConfigurationFileReader (const std::string& configFileName);
    ~RebalanceConfigurationFileReader()
    {}

    /**
     * @brief Apply the file on top of a starting configuration.
     * @throws RebalanceConfigurationException for a missing file, an unknown
     *         key or a value that cannot be parsed.
     */
    RebalanceConfiguration<Decimal>
    readConfigurationFile (const RebalanceConfiguration<Decimal>& defaults = RebalanceConfiguration<Decimal>()) const;

    // Applies one key/value pair; exposed for command line overrides.
    static void applySetting (RebalanceConfiguration<Decimal>& config,
			      const std::string& key,
			      const std::string& value);

  private:
    std::string mConfigFileName;
  };
}

#endif
