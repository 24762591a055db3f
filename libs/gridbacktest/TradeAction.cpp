// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, February 2026
//

#include "TradeAction.h"
#include <stdexcept>

namespace mkc_gridbacktest
{
  std::string tradeActionToString(TradeAction action)
  {
    switch (action) {
      case TradeAction::BUY:
        return "BUY";
      case TradeAction::SELL:
        return "SELL";
      case TradeAction::NONE:
        return "NONE";
      default:
        return "NONE";
    }
  }

  TradeAction tradeActionFromString(const std::string& actionString)
  {
    if (actionString == "BUY")
      return TradeAction::BUY;
    else if (actionString == "SELL")
      return TradeAction::SELL;
    else if (actionString == "NONE")
      return TradeAction::NONE;

    throw std::invalid_argument("tradeActionFromString: unknown trade action " + actionString);
  }
}
