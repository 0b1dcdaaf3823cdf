// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_TIMESERIES_EXCEPTION_H
#define __ROLLSIM_TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace rollsim
{
  class RollSeriesException : public std::runtime_error
  {
  public:
    RollSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~RollSeriesException() = default;
  };

  class RollSeriesDataAccessException : public RollSeriesException
  {
  public:
      explicit RollSeriesDataAccessException(const std::string& msg)
        : RollSeriesException(msg) {}
  };

} // namespace rollsim

#endif // __ROLLSIM_TIMESERIES_EXCEPTION_H
