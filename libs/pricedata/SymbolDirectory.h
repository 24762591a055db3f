// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, February 2026
//

#ifndef __SYMBOL_DIRECTORY_H
#define __SYMBOL_DIRECTORY_H 1

#include <string>
#include <utility>
#include <vector>
#include <boost/optional.hpp>

namespace mkc_gridbacktest
{
  /**
   * @class SymbolDirectory
   * @brief Ordered table of display names and exchange codes.
   *
   * Lookups are substring matches against the display name and return the
   * first entry in table order, so the order entries are added in matters.
   */
  class SymbolDirectory
  {
  public:
    typedef std::pair<std::string, std::string> SymbolEntry;
    typedef std::vector<SymbolEntry>::const_iterator ConstSymbolIterator;

    SymbolDirectory();

    // Directory pre-loaded with the default A-share names
    static SymbolDirectory createDefault();

    // @throws std::invalid_argument when name is already present or either string is empty
    void addEntry (const std::string& name, const std::string& code);

    boost::optional<std::string> findSymbol (const std::string& query) const;

    size_t getNumEntries() const
    {
      return mEntries.size();
    }

    ConstSymbolIterator beginEntries() const
    {
      return mEntries.begin();
    }

    ConstSymbolIterator endEntries() const
    {
      return mEntries.end();
    }

    // True for Shanghai (.SS) and Shenzhen (.SZ) codes
    static bool hasExchangeSuffix (const std::string& code);

  private:
    std::vector<SymbolEntry> mEntries;
  };
}

#endif
