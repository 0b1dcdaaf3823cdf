// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_ROLL_SERIES_JSON_READER_H
#define __ROLLSIM_ROLL_SERIES_JSON_READER_H 1

#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast/bad_lexical_cast.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include "RollTimeSeries.h"
#include "DecimalConstants.h"
#include "number.h"
#include "BoostDateHelper.h"

namespace rollsim
{
  class RollSeriesJsonReaderException : public std::runtime_error
  {
  public:
    RollSeriesJsonReaderException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~RollSeriesJsonReaderException()
    {}
  };

  /**
   * @class RollSeriesJsonReader
   * @brief Reads the daily near/far analysis file into a RollTimeSeries.
   *
   * The file is a JSON array of objects:
   * @code
   * [ { "date": "2024-01-02", "premium": 6.12,
   *     "price_near": 63120, "price_far": 63710,
   *     "expiry_near": "05Feb2024", "expiry_far": "05Apr2024",
   *     "expiry_near_date": "2024-02-05", "expiry_far_date": "2024-04-05" }, ... ]
   * @endcode
   * Numbers are parsed as strings so prices reach the decimal type without a
   * trip through binary floating point. The expiry dates and the premium may
   * be absent or null; every other member is required.
   */
  template <class Decimal>
  class RollSeriesJsonReader
  {
  public:
    explicit RollSeriesJsonReader (const std::string& fileName)
      : mFileName(fileName),
	mTimeSeries(std::make_shared<RollTimeSeries<Decimal>>())
    {}

    RollSeriesJsonReader (const RollSeriesJsonReader<Decimal>& rhs) = default;
    RollSeriesJsonReader<Decimal>& operator=(const RollSeriesJsonReader<Decimal>& rhs) = default;
    ~RollSeriesJsonReader() = default;

    void readFile()
    {
      std::ifstream file (mFileName);
      if (!file.is_open())
	throw RollSeriesJsonReaderException ("RollSeriesJsonReader::readFile - cannot open " + mFileName);

      std::stringstream buffer;
      buffer << file.rdbuf();
      mTimeSeries = parse (buffer.str(), mFileName);
    }

    // Parses an in-memory document; the source name only labels error messages
    static std::shared_ptr<RollTimeSeries<Decimal>> readString (const std::string& jsonText)
    {
      return parse (jsonText, "<string>");
    }

    const std::string& getFileName() const
    {
      return mFileName;
    }

    std::shared_ptr<RollTimeSeries<Decimal>> getTimeSeries() const
    {
      return mTimeSeries;
    }

  private:
    static std::shared_ptr<RollTimeSeries<Decimal>> parse (const std::string& jsonText,
							   const std::string& sourceName)
    {
      rapidjson::Document doc;
      doc.Parse<rapidjson::kParseNumbersAsStringsFlag>(jsonText.c_str());

      if (doc.HasParseError())
	throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + sourceName + ": parse error at offset "
					     + std::to_string (doc.GetErrorOffset()) + ": "
					     + rapidjson::GetParseError_En (doc.GetParseError()));

      if (!doc.IsArray())
	throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + sourceName
					     + ": top level value must be an array of observations");

      auto series = std::make_shared<RollTimeSeries<Decimal>>();

      for (rapidjson::SizeType idx = 0; idx != doc.Size(); idx++)
	{
	  const rapidjson::Value& record = doc[idx];
	  const std::string where = sourceName + " record " + std::to_string (idx);

	  if (!record.IsObject())
	    throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where + " is not an object");

	  TimeSeriesDate observationDate = getDate (record, "date", where);
	  Decimal nearPrice = getNumber (record, "price_near", where);
	  Decimal farPrice = getNumber (record, "price_far", where);
	  std::string nearLabel = getString (record, "expiry_near", where);
	  std::string farLabel = getString (record, "expiry_far", where);

	  std::optional<TimeSeriesDate> nearExpiry;
	  if (isPresent (record, "expiry_near_date"))
	    nearExpiry = getDate (record, "expiry_near_date", where);

	  std::optional<TimeSeriesDate> farExpiry;
	  if (isPresent (record, "expiry_far_date"))
	    farExpiry = getDate (record, "expiry_far_date", where);

	  std::optional<Decimal> premium;
	  if (isPresent (record, "premium"))
	    premium = getNumber (record, "premium", where);

	  try
	    {
	      series->addEntry (RollObservation<Decimal> (observationDate, nearPrice, farPrice,
							  nearLabel, farLabel,
							  nearExpiry, farExpiry, premium));
	    }
	  catch (const RollSeriesException& e)
	    {
	      throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where + ": " + e.what());
	    }
	  catch (const RollObservationException& e)
	    {
	      throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where + ": " + e.what());
	    }
	}

      return series;
    }

    static bool isPresent (const rapidjson::Value& record, const char *name)
    {
      return record.HasMember (name) && !record[name].IsNull();
    }

    static const rapidjson::Value& getMember (const rapidjson::Value& record, const char *name,
					      const std::string& where)
    {
      if (!isPresent (record, name))
	throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where
					     + ": missing member '" + name + "'");
      return record[name];
    }

    static std::string getString (const rapidjson::Value& record, const char *name,
				  const std::string& where)
    {
      const rapidjson::Value& value = getMember (record, name, where);
      if (!value.IsString())
	throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where
					     + ": member '" + name + "' must be a string");

      return boost::algorithm::trim_copy (std::string (value.GetString(), value.GetStringLength()));
    }

    static TimeSeriesDate getDate (const rapidjson::Value& record, const char *name,
				   const std::string& where)
    {
      std::string dateString = getString (record, name, where);

      try
	{
	  TimeSeriesDate d = parseIsoDate (dateString);
	  if (d.is_special())
	    throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where + ": member '" + name
						 + "' is not a calendar date: " + dateString);
	  return d;
	}
      catch (const std::out_of_range& e)
	{
	  throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where + ": member '" + name
					       + "' has an invalid date " + dateString + " (" + e.what() + ")");
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where + ": member '" + name
					       + "' has an invalid date " + dateString);
	}
    }

    // Numbers arrive as strings (kParseNumbersAsStringsFlag); quoted numbers are accepted too
    static Decimal getNumber (const rapidjson::Value& record, const char *name,
			      const std::string& where)
    {
      const rapidjson::Value& value = getMember (record, name, where);
      if (!value.IsString())
	throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where
					     + ": member '" + name + "' must be a number");

      std::string numString = boost::algorithm::trim_copy (std::string (value.GetString(),
									value.GetStringLength()));
      if (!num::isDecimalString (numString))
	throw RollSeriesJsonReaderException ("RollSeriesJsonReader - " + where + ": member '" + name
					     + "' is not a plain decimal number: " + numString);

      return createADecimal<Decimal> (numString);
    }

  private:
    std::string mFileName;
    std::shared_ptr<RollTimeSeries<Decimal>> mTimeSeries;
  };
}

#endif
