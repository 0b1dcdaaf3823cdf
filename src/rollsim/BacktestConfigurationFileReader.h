// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <string>
#include <memory>
#include "number.h"
#include "BacktestConfiguration.h"

namespace rollsim
{
  //
  // Reads a one row CSV configuration file. The header row is optional;
  // without it the columns are expected in this order:
  //
  // StartDate,EndDate,InitialLots,InitialMarginPercent,TransactionCost,
  // CompoundingFactor,Compounding,ContractMultiplier,ExpiryGuard
  //
  // Dates are YYYYMMDD. An empty field keeps the default for that setting,
  // so an empty StartDate or EndDate spans the data.
  //

  class BacktestConfigurationFileReader
  {
  public:
    BacktestConfigurationFileReader (const std::string& configurationFileName);
    ~BacktestConfigurationFileReader()
      {}

    std::shared_ptr<BacktestConfiguration<num::DefaultNumber>> readConfigurationFile();

    const std::string& getConfigurationFileName() const
    {
      return mConfigurationFileName;
    }

  private:
    std::string mConfigurationFileName;
  };

  /**
   * @brief Parse a configuration flag; accepts true/false, yes/no and 1/0 in any case.
   * @throws BacktestConfigurationException for anything else.
   */
  bool parseConfigurationFlag (const std::string& fieldName, const std::string& value);
}
