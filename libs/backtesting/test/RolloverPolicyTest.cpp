#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>
#include "RolloverPolicy.h"
#include "TestUtils.h"

using namespace rollsim;

TEST_CASE ("RolloverPolicy operations", "[RolloverPolicy]")
{
  ObservationType feb1 = createObservation ("20240129", "1000", "1010", "05Feb2024", "05Apr2024", "20240205");
  ObservationType feb2 = createObservation ("20240130", "1001", "1011", "05Feb2024", "05Apr2024", "20240205");
  ObservationType aprInTime = createObservation ("20240131", "1002", "1012", "05Apr2024", "05Jun2024", "20240405");
  ObservationType aprOnExpiry = createObservation ("20240205", "1002", "1012", "05Apr2024", "05Jun2024", "20240405");
  ObservationType aprLate = createObservation ("20240306", "1002", "1012", "05Apr2024", "05Jun2024", "20240405");
  ObservationType feb2NoExpiry = createObservation ("20240130", "1001", "1011", "05Feb2024", "05Apr2024");

  SECTION ("Label change policy ignores expiry dates")
    {
      LabelChangeRolloverPolicy<DecimalType> policy;
      REQUIRE (policy.decide (feb1, feb2) == RolloverDecision::None);
      REQUIRE (policy.decide (feb2, aprInTime) == RolloverDecision::Execute);
      REQUIRE (policy.decide (feb2, aprLate) == RolloverDecision::Execute);
    }

  SECTION ("Expiry gated policy blocks changes after expiry")
    {
      ExpiryGatedRolloverPolicy<DecimalType> policy;
      REQUIRE (policy.decide (feb1, feb2) == RolloverDecision::None);
      REQUIRE (policy.decide (feb2, aprInTime) == RolloverDecision::Execute);
      REQUIRE (policy.decide (feb2, aprOnExpiry) == RolloverDecision::Execute);
      REQUIRE (policy.decide (feb2, aprLate) == RolloverDecision::Stale);
    }

  SECTION ("Unknown expiry never blocks")
    {
      ExpiryGatedRolloverPolicy<DecimalType> policy;
      REQUIRE (policy.decide (feb2NoExpiry, aprLate) == RolloverDecision::Execute);
    }

  SECTION ("Factory follows the expiry guard setting")
    {
      BacktestConfiguration<DecimalType> guarded;
      auto policy = createRolloverPolicy (guarded);
      REQUIRE (policy->decide (feb2, aprLate) == RolloverDecision::Stale);

      BacktestConfiguration<DecimalType> unguarded (std::nullopt, std::nullopt, 1,
						    createDecimal ("12"), createDecimal ("1800"),
						    createDecimal ("200"), true, false,
						    createMcxGoldAttributes<DecimalType>(),
						    false, StaleRolloverHandling::Flag, 200000);
      REQUIRE (createRolloverPolicy (unguarded)->decide (feb2, aprLate) == RolloverDecision::Execute);
    }
}
