// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, February 2026
//

#ifndef __TRADE_ACTION_H
#define __TRADE_ACTION_H 1

#include <string>

namespace mkc_gridbacktest
{
  /**
   * @enum TradeAction
   * @brief Decision taken by the grid rule on a single day.
   */
  enum class TradeAction {
    NONE,   ///< No threshold crossed, or a sell signal with nothing held
    BUY,    ///< Daily change at or below the negative buy trigger
    SELL    ///< Daily change at or above the sell trigger while holding shares
  };

  std::string tradeActionToString(TradeAction action);

  /**
   * @brief Parse the string form produced by tradeActionToString.
   * @throws std::invalid_argument for any other string
   */
  TradeAction tradeActionFromString(const std::string& actionString);
}

#endif
