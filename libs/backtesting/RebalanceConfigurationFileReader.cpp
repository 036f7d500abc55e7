// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <limits>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "RebalanceConfigurationFileReader.h"
#include "BoostDateHelper.h"
#include "TimeFrameUtility.h"
#include "csv.h"

namespace rebalancer
{
  using Decimal = RebalanceConfigurationFileReader::Decimal;

  static Decimal parseDecimal (const std::string& key, const std::string& value)
  {
    try
      {
	return num::fromString<Decimal> (value);
      }
    catch (const std::domain_error&)
      {
	throw RebalanceConfigurationException ("RebalanceConfigurationFileReader - " + key + ": '" + value + "' is not a number");
      }
  }

  static unsigned int parseCount (const std::string& key, const std::string& value)
  {
    try
      {
	long parsed = boost::lexical_cast<long> (value);
	if (parsed < 0)
	  throw RebalanceConfigurationException ("RebalanceConfigurationFileReader - " + key + " cannot be negative");

	if (static_cast<unsigned long>(parsed) > std::numeric_limits<unsigned int>::max())
	  throw RebalanceConfigurationException ("RebalanceConfigurationFileReader - " + key + ": '" + value + "' is too large");

	return static_cast<unsigned int>(parsed);
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw RebalanceConfigurationException ("RebalanceConfigurationFileReader - " + key + ": '" + value + "' is not a whole number");
      }
  }

  static std::vector<unsigned int> parseCountList (const std::string& key, const std::string& value)
  {
    std::vector<std::string> fields;
    boost::split (fields, value, boost::is_any_of (";"), boost::token_compress_on);

    std::vector<unsigned int> counts;
    for (auto& field : fields)
      {
	boost::trim (field);
	if (!field.empty())
	  counts.push_back (parseCount (key, field));
      }

    return counts;
  }

  static boost::gregorian::date parseDate (const std::string& key, const std::string& value)
  {
    try
      {
	return parseDateString (value);
      }
    catch (const std::domain_error& e)
      {
	throw RebalanceConfigurationException ("RebalanceConfigurationFileReader - " + key + ": " + e.what());
      }
  }

  RebalanceConfigurationFileReader::RebalanceConfigurationFileReader (const std::string& configFileName)
    : mConfigFileName(configFileName)
  {}

  RebalanceConfiguration<Decimal>
  RebalanceConfigurationFileReader::readConfigurationFile (const RebalanceConfiguration<Decimal>& defaults) const
  {
    if (!boost::filesystem::exists (mConfigFileName))
      throw RebalanceConfigurationException ("RebalanceConfigurationFileReader - configuration file " + mConfigFileName + " does not exist");

    RebalanceConfiguration<Decimal> config (defaults);

    io::CSVReader<2, io::trim_chars<' ', '\t'>, io::no_quote_escape<','>, io::throw_on_overflow, io::single_line_comment<'#'>>
      csvConfigFile (mConfigFileName.c_str());
    csvConfigFile.set_header ("Key", "Value");

    std::string key, value;
    while (csvConfigFile.read_row (key, value))
      applySetting (config, key, value);

    return config;
  }

  void RebalanceConfigurationFileReader::applySetting (RebalanceConfiguration<Decimal>& config,
							const std::string& rawKey,
							const std::string& rawValue)
  {
    const std::string key = boost::to_lower_copy (boost::trim_copy (rawKey));
    const std::string value = boost::trim_copy (rawValue);
    IndicatorParameters& ind = config.indicators;

    if (key == "initial_capital")
      config.initialCapital = parseDecimal (key, value);
    else if (key == "max_positions")
      config.maxPositions = parseCount (key, value);
    else if (key == "commission_rate")
      config.commissionRate = parseDecimal (key, value);
    else if (key == "min_commission")
      config.minCommission = parseDecimal (key, value);
    else if (key == "stamp_tax_rate")
      config.stampTaxRate = parseDecimal (key, value);
    else if (key == "lot_size")
      config.lotSize = parseCount (key, value);
    else if (key == "cash_reserve")
      config.cashReserve = parseDecimal (key, value);
    else if (key == "min_data_days")
      config.minDataDays = parseCount (key, value);
    else if (key == "lookback_days")
      ind.lookbackBars = parseCount (key, value);
    else if (key == "ma_periods")
      ind.movingAveragePeriods = parseCountList (key, value);
    else if (key == "momentum_horizons")
      ind.momentumHorizons = parseCountList (key, value);
    else if (key == "rsi_period")
      ind.rsiPeriod = parseCount (key, value);
    else if (key == "macd_fast")
      ind.macdFastSpan = parseCount (key, value);
    else if (key == "macd_slow")
      ind.macdSlowSpan = parseCount (key, value);
    else if (key == "macd_signal")
      ind.macdSignalSpan = parseCount (key, value);
    else if (key == "bb_period")
      ind.bollingerPeriod = parseCount (key, value);
    else if (key == "bb_std")
      ind.bollingerWidth = num::to_double (parseDecimal (key, value));
    else if (key == "roc_period")
      ind.rateOfChangePeriod = parseCount (key, value);
    else if (key == "volatility_window")
      ind.volatilityWindow = parseCount (key, value);
    else if (key == "atr_period")
      ind.atrPeriod = parseCount (key, value);
    else if (key == "volume_window")
      ind.volumeWindow = parseCount (key, value);
    else if (key == "price_position_window")
      ind.pricePositionWindow = parseCount (key, value);
    else if (key == "range_window")
      ind.rangeWindow = parseCount (key, value);
    else if (key == "rebalance_frequency")
      {
	try
	  {
	    config.rebalanceFrequency = getTimeFrameFromString (value);
	  }
	catch (const TimeFrameException& e)
	  {
	    throw RebalanceConfigurationException ("RebalanceConfigurationFileReader - " + key + ": " + e.what());
	  }
      }
    else if (key == "start_date")
      config.startDate = parseDate (key, value);
    else if (key == "end_date")
      config.endDate = parseDate (key, value);
    else if (key == "risk_free_rate")
      config.riskFreeRate = parseDecimal (key, value);
    else if (key == "benchmark_return")
      config.benchmarkReturn = parseDecimal (key, value);
    else
      throw RebalanceConfigurationException ("RebalanceConfigurationFileReader - unknown key '" + rawKey + "'");
  }
}
