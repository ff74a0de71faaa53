#pragma once

#include "lookup_result.hpp"

#include <curl/curl.h>

#include <optional>
#include <string>

// RAII for curl global init/cleanup. Must outlive every worker thread that fetches.
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

// Maps a finished transfer to an error, or nullopt on success. Timeouts are
// Timeout, unusable URLs are InvalidUrl, other curl failures are Transport,
// a 404 is NotFound and any other non-2xx status is HttpStatus. file:// reports status 0.
std::optional<LookupError> classify_transfer(CURLcode res, long status, const std::string& url);

// Percent-encodes one URL path segment.
std::string escape_url_component(const std::string& text);

// GETs `url` into memory. A 404 is NotFound, other non-2xx codes are HttpStatus.
LookupResult<std::string> fetch_url(const std::string& url, long timeout_seconds);
// Makes up to max(1, max_retries) attempts. Only timeouts and transport errors are retried.
LookupResult<std::string> fetch_with_retries(const std::string& url, long timeout_seconds, int max_retries = 2);
