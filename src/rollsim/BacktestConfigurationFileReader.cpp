// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/lexical_cast/bad_lexical_cast.hpp>
#include "csv.h"
#include "BacktestConfigurationFileReader.h"
#include "FuturesContractAttributes.h"
#include "DecimalConstants.h"
#include "number.h"

using Decimal = num::DefaultNumber;

namespace rollsim
{
  static std::optional<boost::gregorian::date> parseOptionalDate (const std::string& fieldName,
								  const std::string& value);
  static Decimal parseDecimal (const std::string& fieldName,
			       const std::string& value,
			       const Decimal& defaultValue);
  static unsigned int parseLots (const std::string& value);

  BacktestConfigurationFileReader::BacktestConfigurationFileReader (const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<BacktestConfiguration<Decimal>> BacktestConfigurationFileReader::readConfigurationFile()
  {
    boost::filesystem::path configPath (mConfigurationFileName);
    if (!boost::filesystem::exists (configPath))
      throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - configuration file "
					   + configPath.string() + " does not exist");

    std::string startDateStr, endDateStr, initialLotsStr, marginStr, costStr;
    std::string compoundingFactorStr, compoundingStr, multiplierStr, expiryGuardStr;

    try
      {
	// Check if the file has a header row by reading the first line
	io::CSVReader<9> csvConfigFileCheck(mConfigurationFileName.c_str());
	char* firstLine = csvConfigFileCheck.next_line();
	bool hasHeader = false;
	if (firstLine) {
	  std::string firstLineStr(firstLine);
	  hasHeader = (firstLineStr.find("InitialLots") != std::string::npos &&
		       firstLineStr.find("TransactionCost") != std::string::npos);
	}

	io::CSVReader<9> csvConfigFile(mConfigurationFileName.c_str());

	if (hasHeader) {
	  csvConfigFile.read_header(io::ignore_missing_column, "StartDate", "EndDate", "InitialLots",
				    "InitialMarginPercent", "TransactionCost", "CompoundingFactor",
				    "Compounding", "ContractMultiplier", "ExpiryGuard");
	} else {
	  csvConfigFile.set_header("StartDate", "EndDate", "InitialLots",
				   "InitialMarginPercent", "TransactionCost", "CompoundingFactor",
				   "Compounding", "ContractMultiplier", "ExpiryGuard");
	}

	if (!csvConfigFile.read_row (startDateStr, endDateStr, initialLotsStr, marginStr, costStr,
				     compoundingFactorStr, compoundingStr, multiplierStr, expiryGuardStr))
	  throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - "
					       + mConfigurationFileName + " has no configuration row");
      }
    catch (const io::error::base& e)
      {
	throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - "
					     + std::string (e.what()));
      }

    std::optional<boost::gregorian::date> startDate = parseOptionalDate ("StartDate", startDateStr);
    std::optional<boost::gregorian::date> endDate = parseOptionalDate ("EndDate", endDateStr);

    unsigned int initialLots = parseLots (initialLotsStr);
    Decimal margin = parseDecimal ("InitialMarginPercent", marginStr,
				   DecimalConstants<Decimal>::DefaultInitialMarginPercent);
    Decimal cost = parseDecimal ("TransactionCost", costStr,
				 DecimalConstants<Decimal>::DefaultTransactionCost);
    Decimal compoundingFactor = parseDecimal ("CompoundingFactor", compoundingFactorStr,
					      DecimalConstants<Decimal>::DefaultCompoundingFactor);
    Decimal multiplier = parseDecimal ("ContractMultiplier", multiplierStr,
				       DecimalConstants<Decimal>::McxGoldBigPointValue);

    bool compounding = compoundingStr.empty() ? true : parseConfigurationFlag ("Compounding", compoundingStr);
    bool expiryGuard = expiryGuardStr.empty() ? true : parseConfigurationFlag ("ExpiryGuard", expiryGuardStr);

    try
      {
	return std::make_shared<BacktestConfiguration<Decimal>> (startDate,
								 endDate,
								 initialLots,
								 margin,
								 cost,
								 compoundingFactor,
								 compounding,
								 false,
								 createMcxGoldAttributes<Decimal> (multiplier),
								 expiryGuard,
								 StaleRolloverHandling::Flag,
								 BacktestConfiguration<Decimal>::kDefaultMaxSimulationDays);
      }
    catch (const FuturesContractAttributesException& e)
      {
	throw BacktestConfigurationException("BacktestConfigurationFileReader::readConfigurationFile - "
					     + std::string (e.what()));
      }
  }

  bool parseConfigurationFlag (const std::string& fieldName, const std::string& value)
  {
    std::string flag = boost::algorithm::to_lower_copy (boost::algorithm::trim_copy (value));

    if (flag == "true" || flag == "yes" || flag == "1")
      return true;

    if (flag == "false" || flag == "no" || flag == "0")
      return false;

    throw BacktestConfigurationException("parseConfigurationFlag - " + fieldName
					 + " must be true/false, yes/no or 1/0, found '" + value + "'");
  }

  static std::optional<boost::gregorian::date> parseOptionalDate (const std::string& fieldName,
								  const std::string& value)
  {
    if (value.empty())
      return std::nullopt;

    try
      {
	boost::gregorian::date d = boost::gregorian::from_undelimited_string (value);
	if (d.is_special())
	  throw BacktestConfigurationException("BacktestConfigurationFileReader - " + fieldName
					       + " is not a calendar date: " + value);
	return d;
      }
    catch (const std::out_of_range& e)
      {
	throw BacktestConfigurationException("BacktestConfigurationFileReader - invalid " + fieldName
					     + " '" + value + "': " + e.what());
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw BacktestConfigurationException("BacktestConfigurationFileReader - invalid " + fieldName
					     + " '" + value + "', expected YYYYMMDD");
      }
  }

  static Decimal parseDecimal (const std::string& fieldName,
			       const std::string& value,
			       const Decimal& defaultValue)
  {
    if (value.empty())
      return defaultValue;

    if (!num::isDecimalString (value))
      throw BacktestConfigurationException("BacktestConfigurationFileReader - " + fieldName
					   + " is not a number: '" + value + "'");

    return num::fromString<Decimal> (value);
  }

  static unsigned int parseLots (const std::string& value)
  {
    if (value.empty())
      return BacktestConfiguration<Decimal>::kDefaultInitialLots;

    if (value.find_first_not_of ("0123456789") != std::string::npos || value.size() > 9)
      throw BacktestConfigurationException("BacktestConfigurationFileReader - InitialLots must be a whole number: '"
					   + value + "'");

    return static_cast<unsigned int>(std::stoul (value));
  }
}
