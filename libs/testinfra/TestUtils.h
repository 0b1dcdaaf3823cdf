#ifndef __ROLLSIM_TEST_UTILS_H
#define __ROLLSIM_TEST_UTILS_H 1

#include <string>
#include <memory>

#include <boost/date_time.hpp>
#include "BoostDateHelper.h"
#include "DecimalConstants.h"
#include "RollObservation.h"
#include "RollTimeSeries.h"

typedef dec::decimal<7> DecimalType;
typedef rollsim::RollObservation<DecimalType> ObservationType;
typedef rollsim::RollTimeSeries<DecimalType> SeriesType;

DecimalType createDecimal(const std::string& valueString);

// Dates in test tables are written YYYYMMDD
boost::gregorian::date createDate (const std::string& dateString);

ObservationType
createObservation (const std::string& dateString,
		   const std::string& nearPrice,
		   const std::string& farPrice,
		   const std::string& nearContract,
		   const std::string& farContract);

ObservationType
createObservation (const std::string& dateString,
		   const std::string& nearPrice,
		   const std::string& farPrice,
		   const std::string& nearContract,
		   const std::string& farContract,
		   const std::string& nearExpiryDateString);

#endif
