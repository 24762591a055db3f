// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DATA_UNAVAILABLE_EXCEPTION_H
#define __DATA_UNAVAILABLE_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_gridbacktest
{
  // A price source could not deliver a series. Callers skip the period.
  class DataUnavailableException : public std::runtime_error
  {
  public:
    DataUnavailableException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~DataUnavailableException() = default;

    // Short category name used in log messages
    virtual std::string getCategory() const
    {
      return "DataUnavailable";
    }
  };

  // The source does not know the symbol at all
  class SymbolNotFoundException : public DataUnavailableException
  {
  public:
    explicit SymbolNotFoundException(const std::string& msg)
      : DataUnavailableException(msg) {}

    std::string getCategory() const override
    {
      return "SymbolNotFound";
    }
  };

  // The symbol exists but has no observation inside the requested range
  class NoDataInRangeException : public DataUnavailableException
  {
  public:
    explicit NoDataInRangeException(const std::string& msg)
      : DataUnavailableException(msg) {}

    std::string getCategory() const override
    {
      return "NoDataInRange";
    }
  };

  // Transport level failure: DNS, TCP, TLS, timeouts, unexpected HTTP status
  class DataSourceConnectionException : public DataUnavailableException
  {
  public:
    explicit DataSourceConnectionException(const std::string& msg)
      : DataUnavailableException(msg) {}

    std::string getCategory() const override
    {
      return "ConnectionError";
    }
  };

  // The source answered with content that could not be parsed
  class DataSourceFormatException : public DataUnavailableException
  {
  public:
    explicit DataSourceFormatException(const std::string& msg)
      : DataUnavailableException(msg) {}

    std::string getCategory() const override
    {
      return "FormatError";
    }
  };

} // namespace mkc_gridbacktest

#endif // __DATA_UNAVAILABLE_EXCEPTION_H
