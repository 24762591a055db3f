// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PORTFOLIO_STATE_H
#define __PORTFOLIO_STATE_H 1

#include "DecimalConstants.h"

namespace mkc_gridbacktest
{
  /**
   * @class PortfolioState
   * @brief Running cash balance and share count of a single grid backtest.
   *
   * Cash starts at zero and goes negative as capital is deployed; it models
   * capital put to work, not a funded account, so a buy is never refused.
   * Shares start at zero and can never become negative: a sell is capped at
   * the market value of the current holding and a negative remainder is
   * clamped to zero.
   *
   * Not thread-safe. Each backtest run owns its own instance.
   */
  template <class Decimal> class PortfolioState
  {
  public:
    PortfolioState()
      : mCash(DecimalConstants<Decimal>::DecimalZero),
	mShares(DecimalConstants<Decimal>::DecimalZero)
    {}

    PortfolioState (const PortfolioState<Decimal>& rhs) = default;
    PortfolioState<Decimal>& operator=(const PortfolioState<Decimal>& rhs) = default;

    ~PortfolioState()
    {}

    const Decimal& getCash() const
    {
      return mCash;
    }

    const Decimal& getShares() const
    {
      return mShares;
    }

    bool hasShares() const
    {
      return mShares > DecimalConstants<Decimal>::DecimalZero;
    }

    Decimal getMarketValue (const Decimal& price) const
    {
      return mShares * price;
    }

    // Mark-to-market equity: shares at price plus (possibly negative) cash
    Decimal getEquity (const Decimal& price) const
    {
      return mShares * price + mCash;
    }

    /**
     * @brief Deploy amount of capital at price.
     *
     * Adds amount / price units and debits amount from cash.
     */
    void buy (const Decimal& price, const Decimal& amount)
    {
      mShares += amount / price;
      mCash -= amount;
    }

    /**
     * @brief Sell up to amount worth of the holding at price.
     *
     * The sale value is min(amount, shares * price) and the share count is
     * reduced by sale value / price. A full liquidation therefore leaves
     * whatever residue the division rounds to; only a negative result is
     * clamped to zero.
     *
     * @return the currency value credited to cash
     */
    Decimal sell (const Decimal& price, const Decimal& amount)
    {
      Decimal holdingValue (mShares * price);
      Decimal saleValue ((holdingValue < amount) ? holdingValue : amount);

      mShares -= saleValue / price;
      if (mShares < DecimalConstants<Decimal>::DecimalZero)
	mShares = DecimalConstants<Decimal>::DecimalZero;

      mCash += saleValue;
      return saleValue;
    }

  private:
    Decimal mCash;
    Decimal mShares;
  };
}

#endif
