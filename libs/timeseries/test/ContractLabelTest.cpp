#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>
#include "TestUtils.h"
#include "../ContractLabel.h"

using namespace rollsim;
using boost::gregorian::date;

TEST_CASE ("ContractLabel operations", "[ContractLabel]")
{
  SECTION ("Parse mixed case label")
    {
      ContractLabel label ("05Dec2025");
      REQUIRE (label.getExpiryDate() == date (2025, 12, 5));
    }

  SECTION ("Parse bhavcopy upper case label")
    {
      ContractLabel label ("05FEB2024");
      REQUIRE (label.getExpiryDate() == date (2024, 2, 5));
    }

  SECTION ("Format from date pads the day")
    {
      REQUIRE (ContractLabel::formatLabel (date (2024, 6, 5)) == "05Jun2024");
      REQUIRE (ContractLabel::formatLabel (date (2023, 10, 27)) == "27Oct2023");
    }

  SECTION ("Malformed labels throw")
    {
      REQUIRE_THROWS_AS (ContractLabel ("05Feb24"), ContractLabelException);
      REQUIRE_THROWS_AS (ContractLabel::parseExpiryDate ("5Dec2025"), ContractLabelException);
      REQUIRE_THROWS_AS (ContractLabel::parseExpiryDate ("05Xyz2025"), ContractLabelException);
      REQUIRE_THROWS_AS (ContractLabel::parseExpiryDate ("AADec2025"), ContractLabelException);
      REQUIRE_THROWS_AS (ContractLabel::parseExpiryDate ("31Feb2025"), ContractLabelException);
      REQUIRE_THROWS_AS (ContractLabel::parseExpiryDate (""), ContractLabelException);
    }

  SECTION ("Label matches date")
    {
      REQUIRE (ContractLabel::labelMatchesDate ("05Feb2024", date (2024, 2, 5)));
      REQUIRE_FALSE (ContractLabel::labelMatchesDate ("05Feb2024", date (2024, 2, 6)));
      REQUIRE_FALSE (ContractLabel::labelMatchesDate ("garbage", date (2024, 2, 5)));
    }
}
