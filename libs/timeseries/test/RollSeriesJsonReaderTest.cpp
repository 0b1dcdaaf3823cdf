#define CATCH_CONFIG_MAIN

#include <cstdio>
#include <fstream>
#include <iterator>
#include <catch2/catch.hpp>
#include "TestUtils.h"
#include "../RollSeriesJsonReader.h"

using namespace rollsim;

static const char *kTwoDays = R"([
  { "date": "2024-01-03", "premium": 6.25,
    "price_near": 63210.5, "price_far": 63800,
    "expiry_near": "05Feb2024", "expiry_far": "05Apr2024",
    "expiry_near_date": "2024-02-05", "expiry_far_date": "2024-04-05" },
  { "date": "2024-01-02", "premium": null,
    "price_near": 63120, "price_far": 63710,
    "expiry_near": "05Feb2024", "expiry_far": "05Apr2024" }
])";

TEST_CASE ("RollSeriesJsonReader operations", "[RollSeriesJsonReader]")
{
  SECTION ("Read from string")
    {
      auto series = RollSeriesJsonReader<DecimalType>::readString (kTwoDays);
      REQUIRE (series->getNumEntries() == 2);

      const ObservationType& first = *series->beginSortedAccess();
      REQUIRE (first.getDate() == createDate ("20240102"));
      REQUIRE (first.getNearPrice() == createDecimal ("63120"));
      REQUIRE_FALSE (first.getPremium().has_value());
      REQUIRE_FALSE (first.getNearExpiryDate().has_value());

      const ObservationType& second = *std::next (series->beginSortedAccess());
      REQUIRE (second.getNearPrice() == createDecimal ("63210.5"));
      REQUIRE (second.getFarPrice() == createDecimal ("63800"));
      REQUIRE (second.getPremium().value() == createDecimal ("6.25"));
      REQUIRE (second.getNearExpiryDate().value() == createDate ("20240205"));
      REQUIRE (second.getFarExpiryDate().value() == createDate ("20240405"));
      REQUIRE (second.getNearContract() == "05Feb2024");
    }

  SECTION ("Read from file")
    {
      const std::string fileName ("RollSeriesJsonReaderTest_data.json");
      {
	std::ofstream out (fileName);
	out << kTwoDays;
      }

      RollSeriesJsonReader<DecimalType> reader (fileName);
      reader.readFile();
      REQUIRE (reader.getTimeSeries()->getNumEntries() == 2);
      REQUIRE (reader.getTimeSeries()->getLastDate() == createDate ("20240103"));
      std::remove (fileName.c_str());
    }

  SECTION ("Missing file")
    {
      RollSeriesJsonReader<DecimalType> reader ("does_not_exist.json");
      REQUIRE_THROWS_AS (reader.readFile(), RollSeriesJsonReaderException);
    }

  SECTION ("Malformed documents")
    {
      typedef RollSeriesJsonReader<DecimalType> Reader;

      REQUIRE_THROWS_AS (Reader::readString ("[ { "), RollSeriesJsonReaderException);
      REQUIRE_THROWS_AS (Reader::readString ("{ \"date\": \"2024-01-02\" }"), RollSeriesJsonReaderException);

      // missing price_far
      REQUIRE_THROWS_AS (Reader::readString (R"([{ "date": "2024-01-02", "price_near": 1,
                                                    "expiry_near": "05Feb2024", "expiry_far": "05Apr2024" }])"),
			 RollSeriesJsonReaderException);

      // bad date
      REQUIRE_THROWS_AS (Reader::readString (R"([{ "date": "2024-13-02", "price_near": 1, "price_far": 2,
                                                    "expiry_near": "05Feb2024", "expiry_far": "05Apr2024" }])"),
			 RollSeriesJsonReaderException);

      // exponent notation
      REQUIRE_THROWS_AS (Reader::readString (R"([{ "date": "2024-01-02", "price_near": 1e3, "price_far": 2,
                                                    "expiry_near": "05Feb2024", "expiry_far": "05Apr2024" }])"),
			 RollSeriesJsonReaderException);

      // empty contract label
      REQUIRE_THROWS_AS (Reader::readString (R"([{ "date": "2024-01-02", "price_near": 1, "price_far": 2,
                                                    "expiry_near": "", "expiry_far": "05Apr2024" }])"),
			 RollSeriesJsonReaderException);

      // duplicate date
      REQUIRE_THROWS_AS (Reader::readString (R"([
          { "date": "2024-01-02", "price_near": 1, "price_far": 2, "expiry_near": "05Feb2024", "expiry_far": "05Apr2024" },
          { "date": "2024-01-02", "price_near": 1, "price_far": 2, "expiry_near": "05Feb2024", "expiry_far": "05Apr2024" }
        ])"), RollSeriesJsonReaderException);
    }
}
