// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DECIMAL_CONSTANT_H
#define __DECIMAL_CONSTANT_H 1

#include <string>
#include <boost/lexical_cast.hpp>

namespace mkc_gridbacktest
{
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static Decimal DecimalZero;
      static Decimal DecimalOne;
      static Decimal DecimalOneHundred;
      static Decimal DefaultBuyDropPercent;
      static Decimal DefaultSellRisePercent;
      static Decimal DefaultTradeAmount;
      static Decimal RecommendedMinThresholdPercent;
      static Decimal RecommendedMaxThresholdPercent;

      static Decimal createDecimal (const std::string& valueString)
      {
        return boost::lexical_cast<Decimal>(valueString);
      }
    };

  // ---------------------------------------------------------------------------
  // Static member definitions
  //
  // Values are created from their string form so that every Decimal type
  // gets the closest representable value of the literal.
  // ---------------------------------------------------------------------------

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalZero(
      DecimalConstants<Decimal>::createDecimal("0.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOne(
      DecimalConstants<Decimal>::createDecimal("1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOneHundred(
      DecimalConstants<Decimal>::createDecimal("100.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultBuyDropPercent(
      DecimalConstants<Decimal>::createDecimal("1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultSellRisePercent(
      DecimalConstants<Decimal>::createDecimal("1.5"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultTradeAmount(
      DecimalConstants<Decimal>::createDecimal("1000.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::RecommendedMinThresholdPercent(
      DecimalConstants<Decimal>::createDecimal("0.1"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::RecommendedMaxThresholdPercent(
      DecimalConstants<Decimal>::createDecimal("5.0"));
}

#endif
