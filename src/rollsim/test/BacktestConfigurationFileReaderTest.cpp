#define CATCH_CONFIG_MAIN

#include <fstream>
#include <catch2/catch.hpp>
#include <boost/filesystem.hpp>
#include "BacktestConfigurationFileReader.h"
#include "TestUtils.h"

using namespace rollsim;
using namespace boost::gregorian;

static std::string writeConfigFile (const std::string& contents)
{
  boost::filesystem::path p = boost::filesystem::temp_directory_path()
    / boost::filesystem::unique_path ("rollsim_config_%%%%-%%%%.csv");

  std::ofstream configFile (p.string());
  configFile << contents;
  configFile.close();

  return p.string();
}

TEST_CASE ("BacktestConfigurationFileReader reads a file with a header", "[BacktestConfigurationFileReader]")
{
  std::string fileName = writeConfigFile
    ("StartDate,EndDate,InitialLots,InitialMarginPercent,TransactionCost,CompoundingFactor,Compounding,ContractMultiplier,ExpiryGuard\n"
     "20220103,20231229,2,12.5,250,150,no,10,false\n");

  BacktestConfigurationFileReader reader (fileName);
  auto config = reader.readConfigurationFile();

  REQUIRE (reader.getConfigurationFileName() == fileName);
  REQUIRE (config->getStartDate().value() == createDate ("20220103"));
  REQUIRE (config->getEndDate().value() == createDate ("20231229"));
  REQUIRE (config->getInitialLots() == 2);
  REQUIRE (config->getInitialMarginPercent() == createDecimal ("12.5"));
  REQUIRE (config->getTransactionCost() == createDecimal ("250"));
  REQUIRE (config->getCompoundingFactor() == createDecimal ("150"));
  REQUIRE_FALSE (config->isCompounding());
  REQUIRE (config->getContractMultiplier() == createDecimal ("10"));
  REQUIRE_FALSE (config->isExpiryGuardEnforced());
  REQUIRE (config->getStaleRolloverHandling() == StaleRolloverHandling::Flag);

  boost::filesystem::remove (fileName);
}

TEST_CASE ("BacktestConfigurationFileReader reads a file without a header", "[BacktestConfigurationFileReader]")
{
  std::string fileName = writeConfigFile ("20240101,20241231,1,10,100,200,true,100,yes\n");

  BacktestConfigurationFileReader reader (fileName);
  auto config = reader.readConfigurationFile();

  REQUIRE (config->getStartDate().value() == createDate ("20240101"));
  REQUIRE (config->getEndDate().value() == createDate ("20241231"));
  REQUIRE (config->getInitialLots() == 1);
  REQUIRE (config->isCompounding());
  REQUIRE (config->isExpiryGuardEnforced());
  REQUIRE (config->getContractMultiplier() == createDecimal ("100"));

  boost::filesystem::remove (fileName);
}

TEST_CASE ("BacktestConfigurationFileReader uses defaults for empty fields", "[BacktestConfigurationFileReader]")
{
  std::string fileName = writeConfigFile
    ("StartDate,EndDate,InitialLots,InitialMarginPercent,TransactionCost,CompoundingFactor,Compounding,ContractMultiplier,ExpiryGuard\n"
     ",,,,,,,,\n");

  auto config = BacktestConfigurationFileReader (fileName).readConfigurationFile();
  BacktestConfiguration<DecimalType> defaults;

  REQUIRE_FALSE (config->getStartDate().has_value());
  REQUIRE_FALSE (config->getEndDate().has_value());
  REQUIRE (config->getInitialLots() == defaults.getInitialLots());
  REQUIRE (config->getInitialMarginPercent() == defaults.getInitialMarginPercent());
  REQUIRE (config->getTransactionCost() == defaults.getTransactionCost());
  REQUIRE (config->getCompoundingFactor() == defaults.getCompoundingFactor());
  REQUIRE (config->isCompounding() == defaults.isCompounding());
  REQUIRE (config->getContractAttributes().getBigPointValue() == defaults.getContractMultiplier());
  REQUIRE (config->isExpiryGuardEnforced() == defaults.isExpiryGuardEnforced());

  boost::filesystem::remove (fileName);
}

TEST_CASE ("BacktestConfigurationFileReader rejects bad input", "[BacktestConfigurationFileReader]")
{
  SECTION ("Missing file")
    {
      BacktestConfigurationFileReader reader ("/nonexistent/rollsim_config.csv");
      REQUIRE_THROWS_AS (reader.readConfigurationFile(), BacktestConfigurationException);
    }

  SECTION ("Unknown flag value")
    {
      std::string fileName = writeConfigFile ("20240101,20241231,1,10,100,200,maybe,100,yes\n");
      REQUIRE_THROWS_AS (BacktestConfigurationFileReader (fileName).readConfigurationFile(),
			 BacktestConfigurationException);
      boost::filesystem::remove (fileName);
    }

  SECTION ("Number in exponent notation")
    {
      std::string fileName = writeConfigFile ("20240101,20241231,1,1e1,100,200,true,100,yes\n");
      REQUIRE_THROWS_AS (BacktestConfigurationFileReader (fileName).readConfigurationFile(),
			 BacktestConfigurationException);
      boost::filesystem::remove (fileName);
    }

  SECTION ("Fractional lots")
    {
      std::string fileName = writeConfigFile ("20240101,20241231,1.5,10,100,200,true,100,yes\n");
      REQUIRE_THROWS_AS (BacktestConfigurationFileReader (fileName).readConfigurationFile(),
			 BacktestConfigurationException);
      boost::filesystem::remove (fileName);
    }

  SECTION ("Zero lots")
    {
      std::string fileName = writeConfigFile ("20240101,20241231,0,10,100,200,true,100,yes\n");
      REQUIRE_THROWS_AS (BacktestConfigurationFileReader (fileName).readConfigurationFile(),
			 BacktestConfigurationException);
      boost::filesystem::remove (fileName);
    }

  SECTION ("End date before start date")
    {
      std::string fileName = writeConfigFile ("20241231,20240101,1,10,100,200,true,100,yes\n");
      REQUIRE_THROWS_AS (BacktestConfigurationFileReader (fileName).readConfigurationFile(),
			 BacktestConfigurationException);
      boost::filesystem::remove (fileName);
    }

  SECTION ("Invalid calendar date")
    {
      std::string fileName = writeConfigFile ("20240231,20241231,1,10,100,200,true,100,yes\n");
      REQUIRE_THROWS_AS (BacktestConfigurationFileReader (fileName).readConfigurationFile(),
			 BacktestConfigurationException);
      boost::filesystem::remove (fileName);
    }

  SECTION ("Zero contract multiplier")
    {
      std::string fileName = writeConfigFile ("20240101,20241231,1,10,100,200,true,0,yes\n");
      REQUIRE_THROWS_AS (BacktestConfigurationFileReader (fileName).readConfigurationFile(),
			 BacktestConfigurationException);
      boost::filesystem::remove (fileName);
    }

  SECTION ("Header without a configuration row")
    {
      std::string fileName = writeConfigFile
	("StartDate,EndDate,InitialLots,InitialMarginPercent,TransactionCost,CompoundingFactor,Compounding,ContractMultiplier,ExpiryGuard\n");
      REQUIRE_THROWS_AS (BacktestConfigurationFileReader (fileName).readConfigurationFile(),
			 BacktestConfigurationException);
      boost::filesystem::remove (fileName);
    }
}

TEST_CASE ("parseConfigurationFlag accepts the usual spellings", "[BacktestConfigurationFileReader]")
{
  REQUIRE (parseConfigurationFlag ("Compounding", "true"));
  REQUIRE (parseConfigurationFlag ("Compounding", "YES"));
  REQUIRE (parseConfigurationFlag ("Compounding", "1"));
  REQUIRE_FALSE (parseConfigurationFlag ("Compounding", "False"));
  REQUIRE_FALSE (parseConfigurationFlag ("Compounding", "no"));
  REQUIRE_FALSE (parseConfigurationFlag ("Compounding", " 0 "));
  REQUIRE_THROWS_AS (parseConfigurationFlag ("Compounding", "on"), BacktestConfigurationException);
}
