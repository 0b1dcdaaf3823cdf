// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ContractLabel.h"
#include <array>
#include <cctype>
#include <boost/algorithm/string.hpp>

namespace rollsim
{
  static const std::array<std::string, 12> kMonthAbbreviations =
    { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
      "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };

  static bool allDigits (const std::string& s)
  {
    for (char c : s)
      if (!std::isdigit (static_cast<unsigned char>(c)))
	return false;

    return !s.empty();
  }

  ContractLabel::ContractLabel (const std::string& label)
    : mExpiryDate(parseExpiryDate (label))
  {}

  boost::gregorian::date ContractLabel::parseExpiryDate (const std::string& label)
  {
    std::string trimmed = boost::algorithm::trim_copy (label);

    if (trimmed.size() != 9)
      throw ContractLabelException ("ContractLabel::parseExpiryDate - label '" + label
				    + "' is not of the form DDMmmYYYY");

    std::string dayStr = trimmed.substr (0, 2);
    std::string monthStr = trimmed.substr (2, 3);
    std::string yearStr = trimmed.substr (5, 4);

    if (!allDigits (dayStr) || !allDigits (yearStr))
      throw ContractLabelException ("ContractLabel::parseExpiryDate - label '" + label
				    + "' has a non numeric day or year");

    unsigned short month = 0;
    for (std::size_t i = 0; i < kMonthAbbreviations.size(); ++i)
      {
	if (boost::iequals (monthStr, kMonthAbbreviations[i]))
	  {
	    month = static_cast<unsigned short>(i + 1);
	    break;
	  }
      }

    if (month == 0)
      throw ContractLabelException ("ContractLabel::parseExpiryDate - unknown month '" + monthStr
				    + "' in label '" + label + "'");

    try
      {
	return boost::gregorian::date (static_cast<unsigned short>(std::stoi (yearStr)),
				       month,
				       static_cast<unsigned short>(std::stoi (dayStr)));
      }
    catch (const std::out_of_range& e)
      {
	throw ContractLabelException ("ContractLabel::parseExpiryDate - label '" + label
				      + "' is not a calendar date: " + e.what());
      }
  }

  std::string ContractLabel::formatLabel (const boost::gregorian::date& expiryDate)
  {
    if (expiryDate.is_special())
      throw ContractLabelException ("ContractLabel::formatLabel - expiry date is not a calendar date");

    const unsigned short day = expiryDate.day();
    std::string result;

    if (day < 10)
      result += "0";

    result += std::to_string (day);
    result += kMonthAbbreviations[expiryDate.month() - 1];
    result += std::to_string (static_cast<int>(expiryDate.year()));
    return result;
  }

  bool ContractLabel::labelMatchesDate (const std::string& label, const boost::gregorian::date& expiryDate)
  {
    try
      {
	return parseExpiryDate (label) == expiryDate;
      }
    catch (const ContractLabelException&)
      {
	return false;
      }
  }
}
