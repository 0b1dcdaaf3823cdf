#define CATCH_CONFIG_MAIN

#include <vector>
#include <boost/thread/thread.hpp>
#include <catch2/catch.hpp>
#include "BacktestResultsPublisher.h"
#include "PerpetualRollBacktester.h"
#include "TestUtils.h"

using namespace rollsim;

typedef BacktestConfiguration<DecimalType> ConfigType;

static SeriesType createSeries()
{
  SeriesType series;
  series.addEntry (createObservation ("20240101", "100", "101", "A", "B"));
  series.addEntry (createObservation ("20240102", "102", "103", "A", "B"));
  series.addEntry (createObservation ("20240103", "102", "104", "B", "C"));
  return series;
}

static ConfigType createConfiguration (unsigned int lots)
{
  return ConfigType (std::nullopt, std::nullopt, lots,
		     createDecimal ("10"), createDecimal ("50"), createDecimal ("200"),
		     true, false, createMcxGoldAttributes<DecimalType>(),
		     true, StaleRolloverHandling::Flag, 200000);
}

TEST_CASE ("BacktestResultsPublisher operations", "[BacktestResultsPublisher]")
{
  BacktestResultsPublisher<DecimalType> publisher;
  PerpetualRollBacktester<DecimalType> backtester;
  SeriesType series = createSeries();

  REQUIRE (publisher.getLatest() == nullptr);

  SECTION ("Newest run wins even when an older run finishes last")
    {
      unsigned long older = publisher.beginRun();
      unsigned long newer = publisher.beginRun();
      REQUIRE (newer > older);

      REQUIRE (publisher.publish (newer, backtester.run (series, createConfiguration (2))));
      REQUIRE_FALSE (publisher.publish (older, backtester.run (series, createConfiguration (1))));

      auto latest = publisher.getLatest();
      REQUIRE (latest != nullptr);
      REQUIRE (latest->getSummaryStats().getInitialCapital() == createDecimal ("2000"));
    }

  SECTION ("Readers keep their snapshot after a newer publish")
    {
      unsigned long first = publisher.beginRun();
      REQUIRE (publisher.publish (first, backtester.run (series, createConfiguration (1))));
      auto snapshot = publisher.getLatest();

      unsigned long second = publisher.beginRun();
      REQUIRE (publisher.publish (second, backtester.run (series, createConfiguration (3))));

      REQUIRE (snapshot->getSummaryStats().getInitialCapital() == createDecimal ("1000"));
      REQUIRE (publisher.getLatest()->getSummaryStats().getInitialCapital() == createDecimal ("3000"));
    }

  SECTION ("A run without results clears the display")
    {
      unsigned long first = publisher.beginRun();
      REQUIRE (publisher.publish (first, backtester.run (series, createConfiguration (1))));

      unsigned long second = publisher.beginRun();
      REQUIRE (publisher.publish (second, std::nullopt));
      REQUIRE (publisher.getLatest() == nullptr);
    }

  SECTION ("Unknown tickets are rejected")
    {
      REQUIRE_THROWS_AS (publisher.publish (0, std::nullopt), BacktestResultsPublisherException);
      REQUIRE_THROWS_AS (publisher.publish (5, std::nullopt), BacktestResultsPublisherException);
    }

  SECTION ("Concurrent runs publish the highest ticket")
    {
      const unsigned int numRuns = 8;
      std::vector<unsigned long> tickets;
      for (unsigned int i = 0; i < numRuns; i++)
	tickets.push_back (publisher.beginRun());

      boost::thread_group group;
      for (unsigned int i = 0; i < numRuns; i++)
	{
	  unsigned long ticket = tickets[i];
	  unsigned int lots = i + 1;
	  group.create_thread ([&publisher, &backtester, &series, ticket, lots]()
			       {
				 publisher.publish (ticket, backtester.run (series, createConfiguration (lots)));
			       });
	}
      group.join_all();

      REQUIRE (publisher.getLatest()->getSummaryStats().getInitialCapital() == createDecimal ("8000"));
    }
}
