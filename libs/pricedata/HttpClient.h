// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __HTTP_CLIENT_H
#define __HTTP_CLIENT_H 1

#include <string>

namespace mkc_gridbacktest
{
  struct HttpResponse
  {
    long statusCode;
    std::string body;
  };

  /**
   * @class HttpClient
   * @brief Minimal blocking HTTP GET used by the remote price sources.
   *
   * Implementations throw DataSourceConnectionException when no response
   * could be obtained at all. Any response that arrived, whatever its
   * status, is returned to the caller for interpretation.
   */
  class HttpClient
  {
  public:
    virtual ~HttpClient()
    {}

    virtual HttpResponse get (const std::string& uri) = 0;

    /**
     * @brief Percent-encode text for use as one path segment or query value.
     *
     * Every byte outside the unreserved set [A-Za-z0-9-._~] is encoded, so
     * index symbols such as ^GSPC become %5EGSPC.
     *
     * @throws DataSourceConnectionException if the encoder is unavailable
     */
    virtual std::string escapeUrlComponent (const std::string& text) const;
  };

  // libcurl backed client
  class CurlHttpClient : public HttpClient
  {
  public:
    explicit CurlHttpClient (long timeoutSeconds = 30);
    ~CurlHttpClient();

    CurlHttpClient (const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get (const std::string& uri) override;

  private:
    static size_t writeCallback (void *ptr, size_t size, size_t nmemb, std::string* data);

  private:
    long mTimeoutSeconds;
  };
}

#endif
