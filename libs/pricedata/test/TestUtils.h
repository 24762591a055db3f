#include <memory>
#include <string>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/filesystem.hpp>
#include "PriceSeries.h"

typedef double DecimalType;
typedef mkc_gridbacktest::PriceSeries<DecimalType> PriceSeriesType;

// Date from an undelimited string, e.g. "20160104"
boost::gregorian::date createDate (const std::string& dateString);

// Unique directory under the system temp path, removed with its contents on destruction
class ScopedTempDirectory
{
public:
  ScopedTempDirectory();
  ~ScopedTempDirectory();

  ScopedTempDirectory (const ScopedTempDirectory&) = delete;
  ScopedTempDirectory& operator= (const ScopedTempDirectory&) = delete;

  const boost::filesystem::path& getPath() const
  {
    return mPath;
  }

  // Writes contents to <path>/fileName and returns the full path
  boost::filesystem::path writeFile (const std::string& fileName, const std::string& contents) const;

private:
  boost::filesystem::path mPath;
};
