// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, February 2026
//

#include "SymbolDirectory.h"
#include <stdexcept>
#include <boost/algorithm/string/predicate.hpp>

namespace mkc_gridbacktest
{
  SymbolDirectory::SymbolDirectory()
    : mEntries()
  {}

  SymbolDirectory SymbolDirectory::createDefault()
  {
    SymbolDirectory directory;

    directory.addEntry ("沪深300ETF", "510300.SS");
    directory.addEntry ("贵州茅台", "600519.SS");
    directory.addEntry ("宁德时代", "300750.SZ");
    directory.addEntry ("招商银行", "600036.SS");
    directory.addEntry ("中国平安", "601318.SS");
    directory.addEntry ("五粮液", "000858.SZ");
    directory.addEntry ("中芯国际", "688981.SS");
    directory.addEntry ("比亚迪", "002594.SZ");
    directory.addEntry ("东方财富", "300059.SZ");
    directory.addEntry ("上证指数", "000001.SS");

    return directory;
  }

  void SymbolDirectory::addEntry (const std::string& name, const std::string& code)
  {
    if (name.empty() || code.empty())
      throw std::invalid_argument ("SymbolDirectory::addEntry: name and code must not be empty");

    for (const auto& entry : mEntries)
      {
	if (entry.first == name)
	  throw std::invalid_argument ("SymbolDirectory::addEntry: duplicate name " + name);
      }

    mEntries.push_back (std::make_pair (name, code));
  }

  boost::optional<std::string> SymbolDirectory::findSymbol (const std::string& query) const
  {
    if (query.empty())
      return boost::none;

    // Byte level match is enough for UTF-8 names
    for (const auto& entry : mEntries)
      {
	if (entry.first.find (query) != std::string::npos)
	  return entry.second;
      }

    return boost::none;
  }

  bool SymbolDirectory::hasExchangeSuffix (const std::string& code)
  {
    return boost::algorithm::ends_with (code, ".SS") || boost::algorithm::ends_with (code, ".SZ");
  }
}
