#include "TestUtils.h"

using namespace rollsim;
using namespace boost::gregorian;

DecimalType createDecimal(const std::string& valueString)
{
  return DecimalConstants<DecimalType>::createDecimal(valueString);
}

date createDate (const std::string& dateString)
{
  return from_undelimited_string(dateString);
}

ObservationType
createObservation (const std::string& dateString,
		   const std::string& nearPrice,
		   const std::string& farPrice,
		   const std::string& nearContract,
		   const std::string& farContract)
{
  return ObservationType (createDate (dateString),
			  createDecimal (nearPrice),
			  createDecimal (farPrice),
			  nearContract,
			  farContract);
}

ObservationType
createObservation (const std::string& dateString,
		   const std::string& nearPrice,
		   const std::string& farPrice,
		   const std::string& nearContract,
		   const std::string& farContract,
		   const std::string& nearExpiryDateString)
{
  return ObservationType (createDate (dateString),
			  createDecimal (nearPrice),
			  createDecimal (farPrice),
			  nearContract,
			  farContract,
			  createDate (nearExpiryDateString));
}
