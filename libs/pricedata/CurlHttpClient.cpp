// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <curl/curl.h>
#include "HttpClient.h"
#include "DataUnavailableException.h"

namespace mkc_gridbacktest
{
  std::string HttpClient::escapeUrlComponent (const std::string& text) const
  {
    CURL *curl = curl_easy_init();
    if (!curl)
      throw DataSourceConnectionException ("HttpClient: curl_easy_init failed");

    char *escaped = curl_easy_escape (curl, text.c_str(), static_cast<int>(text.size()));
    if (!escaped)
      {
	curl_easy_cleanup (curl);
	throw DataSourceConnectionException ("HttpClient: could not escape '" + text + "'");
      }

    std::string result (escaped);
    curl_free (escaped);
    curl_easy_cleanup (curl);

    return result;
  }

  CurlHttpClient::CurlHttpClient (long timeoutSeconds)
    : mTimeoutSeconds(timeoutSeconds)
  {
    curl_global_init (CURL_GLOBAL_DEFAULT);
  }

  CurlHttpClient::~CurlHttpClient()
  {
    curl_global_cleanup();
  }

  size_t CurlHttpClient::writeCallback (void *ptr, size_t size, size_t nmemb, std::string* data)
  {
    data->append ((char*) ptr, size * nmemb);
    return size * nmemb;
  }

  HttpResponse CurlHttpClient::get (const std::string& uri)
  {
    CURL *curl = curl_easy_init();
    if (!curl)
      throw DataSourceConnectionException ("CurlHttpClient: curl_easy_init failed");

    HttpResponse response {0, std::string()};

    curl_easy_setopt (curl, CURLOPT_URL, uri.c_str());
    curl_easy_setopt (curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt (curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt (curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt (curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt (curl, CURLOPT_TIMEOUT, mTimeoutSeconds);
    // the chart endpoint rejects requests without a browser-like agent
    curl_easy_setopt (curl, CURLOPT_USERAGENT, "Mozilla/5.0 (X11; Linux x86_64)");

    CURLcode result = curl_easy_perform (curl);
    if (result != CURLE_OK)
      {
	std::string reason (curl_easy_strerror (result));
	curl_easy_cleanup (curl);
	throw DataSourceConnectionException ("Request to " + uri + " failed: " + reason);
      }

    curl_easy_getinfo (curl, CURLINFO_RESPONSE_CODE, &response.statusCode);
    curl_easy_cleanup (curl);

    return response;
  }
}
