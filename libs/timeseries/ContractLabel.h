// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_CONTRACT_LABEL_H
#define __ROLLSIM_CONTRACT_LABEL_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace rollsim
{
  class ContractLabelException : public std::domain_error
  {
  public:
    ContractLabelException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~ContractLabelException()
    {}
  };

  /**
   * @brief Futures contract identifier of the form DDMmmYYYY (e.g. 05Dec2025).
   *
   * The exchange names contracts after their expiry day. Month abbreviations are
   * accepted in any case (bhavcopy files use 05DEC2025, the analytics feed uses
   * 05Dec2025); formatting always produces the mixed case form.
   */
  class ContractLabel
  {
  public:
    explicit ContractLabel (const std::string& label);

    ContractLabel (const ContractLabel&) = default;
    ContractLabel& operator=(const ContractLabel&) = default;
    ~ContractLabel() = default;

    const boost::gregorian::date& getExpiryDate() const
    {
      return mExpiryDate;
    }

    static boost::gregorian::date parseExpiryDate (const std::string& label);
    static std::string formatLabel (const boost::gregorian::date& expiryDate);

    // True when label parses and its encoded date equals expiryDate
    static bool labelMatchesDate (const std::string& label, const boost::gregorian::date& expiryDate);

  private:
    boost::gregorian::date mExpiryDate;
  };
}

#endif
