// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __GRID_BACKTEST_EXCEPTION_H
#define __GRID_BACKTEST_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_gridbacktest
{
  // Base class for all errors raised by the grid backtest engine library
  class GridBacktestException : public std::runtime_error
  {
  public:
    GridBacktestException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~GridBacktestException() = default;
  };

  // Raised when the engine is handed an empty series, a non-positive
  // price or parameters outside their bounds. No partial result exists
  // when this is thrown.
  class InvalidInputException : public GridBacktestException
  {
  public:
    explicit InvalidInputException(const std::string& msg)
      : GridBacktestException(msg) {}
  };

  class PriceSeriesException : public GridBacktestException
  {
  public:
    explicit PriceSeriesException(const std::string& msg)
      : GridBacktestException(msg) {}
  };

} // namespace mkc_gridbacktest

#endif // __GRID_BACKTEST_EXCEPTION_H
