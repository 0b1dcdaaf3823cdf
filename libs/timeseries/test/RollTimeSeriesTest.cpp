#define CATCH_CONFIG_MAIN

#include <iterator>
#include <vector>
#include <catch2/catch.hpp>
#include "TestUtils.h"
#include "../RollTimeSeries.h"

using namespace rollsim;
using boost::gregorian::date;

TEST_CASE ("RollObservation operations", "[RollObservation]")
{
  ObservationType obs = createObservation ("20240102", "63120", "63710.5", "05Feb2024", "05Apr2024",
					   "20240205");

  REQUIRE (obs.getDate() == date (2024, 1, 2));
  REQUIRE (obs.getNearPrice() == createDecimal ("63120"));
  REQUIRE (obs.getFarPrice() == createDecimal ("63710.5"));
  REQUIRE (obs.getNearContract() == "05Feb2024");
  REQUIRE (obs.getFarContract() == "05Apr2024");
  REQUIRE (obs.getNearExpiryDate().value() == date (2024, 2, 5));
  REQUIRE_FALSE (obs.getFarExpiryDate().has_value());
  REQUIRE_FALSE (obs.getPremium().has_value());

  ObservationType same (obs);
  REQUIRE (same == obs);
  REQUIRE (obs != createObservation ("20240102", "63120", "63710.5", "05Feb2024", "05Apr2024"));

  REQUIRE_THROWS_AS (createObservation ("20240102", "1", "2", "", "05Apr2024"), RollObservationException);
  REQUIRE_THROWS_AS (createObservation ("20240102", "1", "2", "05Feb2024", ""), RollObservationException);
}

TEST_CASE ("RollTimeSeries operations", "[RollTimeSeries]")
{
  SeriesType series;
  REQUIRE (series.isEmpty());
  REQUIRE_THROWS_AS (series.getFirstDate(), RollSeriesDataAccessException);

  // Inserted out of order on purpose
  series.addEntry (createObservation ("20240104", "1020", "1030", "05Feb2024", "05Apr2024"));
  series.addEntry (createObservation ("20240102", "1000", "1010", "05Feb2024", "05Apr2024"));
  series.addEntry (createObservation ("20240103", "1010", "1020", "05Feb2024", "05Apr2024"));

  SECTION ("Entries are kept in date order")
    {
      REQUIRE (series.getNumEntries() == 3);
      REQUIRE (series.getFirstDate() == createDate ("20240102"));
      REQUIRE (series.getLastDate() == createDate ("20240104"));

      date previous (boost::gregorian::min_date_time);
      for (auto it = series.beginSortedAccess(); it != series.endSortedAccess(); it++)
	{
	  REQUIRE (it->getDate() > previous);
	  previous = it->getDate();
	}

      REQUIRE (std::next (series.beginSortedAccess())->getNearPrice() == createDecimal ("1010"));
    }

  SECTION ("Duplicate date is rejected")
    {
      REQUIRE_THROWS_AS (series.addEntry (createObservation ("20240103", "1", "2", "05Feb2024", "05Apr2024")),
			 RollSeriesException);
      REQUIRE (series.getNumEntries() == 3);
    }

  SECTION ("Range constructor sorts and rejects duplicates")
    {
      std::vector<ObservationType> entries {
	createObservation ("20240103", "1010", "1020", "05Feb2024", "05Apr2024"),
	createObservation ("20240102", "1000", "1010", "05Feb2024", "05Apr2024") };

      SeriesType fromRange (entries.begin(), entries.end());
      REQUIRE (fromRange.getFirstDate() == createDate ("20240102"));

      entries.push_back (createObservation ("20240102", "999", "1009", "05Feb2024", "05Apr2024"));
      REQUIRE_THROWS_AS (SeriesType (entries.begin(), entries.end()), RollSeriesException);
    }

  SECTION ("FilterRollTimeSeries keeps the inclusive window")
    {
      SeriesType subset = FilterRollTimeSeries (series, DateRange (createDate ("20240103"),
								   createDate ("20240110")));
      REQUIRE (subset.getNumEntries() == 2);
      REQUIRE (subset.getFirstDate() == createDate ("20240103"));
      REQUIRE (subset.getLastDate() == createDate ("20240104"));

      SeriesType all = FilterRollTimeSeries (series, DateRange (createDate ("20231201"),
								createDate ("20240301")));
      REQUIRE (all == series);

      SeriesType none = FilterRollTimeSeries (series, DateRange (createDate ("20240201"),
								 createDate ("20240301")));
      REQUIRE (none.isEmpty());
    }
}
