// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_DATA_SOURCE_H
#define __PRICE_DATA_SOURCE_H 1

#include <memory>
#include <string>
#include "DateRange.h"
#include "PriceSeries.h"
#include "DataUnavailableException.h"

namespace mkc_gridbacktest
{
  /**
   * @class PriceDataSource
   * @brief Supplier of daily closing prices for a symbol and date range.
   *
   * Implementations return a non-empty series whose dates all fall inside
   * the requested closed range, or throw one of the DataUnavailableException
   * subclasses. They never return an empty series.
   */
  template <class Decimal> class PriceDataSource
  {
  public:
    PriceDataSource()
    {}

    virtual ~PriceDataSource()
    {}

    virtual std::shared_ptr<const PriceSeries<Decimal>>
    getPriceSeries (const std::string& symbol, const DateRange& range) = 0;

    // Name used in log output, e.g. "csv" or "yahoo"
    virtual std::string getSourceName() const = 0;
  };
}

#endif
