#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <memory>

namespace {

// HTTP body callback, appends into a std::string
size_t write_data_cpp(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    out->append(static_cast<char*>(ptr), bytes);
    return bytes;
}

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

} // anonymous namespace

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

std::optional<LookupError> classify_transfer(CURLcode res, long status, const std::string& url) {
    switch (res) {
        case CURLE_OK:
            break;
        case CURLE_OPERATION_TIMEDOUT:
            return LookupError{LookupErrorCode::Timeout, string_format("error.download_failed", url) + ": " + curl_easy_strerror(res)};
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return LookupError{LookupErrorCode::InvalidUrl, string_format("error.download_failed", url) + ": " + curl_easy_strerror(res)};
        default:
            return LookupError{LookupErrorCode::Transport, string_format("error.download_failed", url) + ": " + curl_easy_strerror(res)};
    }

    if (status == 404) {
        return LookupError{LookupErrorCode::NotFound, string_format("error.http_status", url, status)};
    }
    if (status != 0 && (status < 200 || status >= 300)) {
        return LookupError{LookupErrorCode::HttpStatus, string_format("error.http_status", url, status)};
    }
    return std::nullopt;
}

std::string escape_url_component(const std::string& text) {
    CurlHandle curl(curl_easy_init());
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(curl.get(), text.data(), static_cast<int>(text.size())), &curl_free);
    if (!curl || !escaped) {
        throw DepsizeException(string_format("error.url_escape_failed", text));
    }
    return std::string(escaped.get());
}

LookupResult<std::string> fetch_url(const std::string& url, long timeout_seconds) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return LookupResult<std::string>::Err(LookupErrorCode::Transport, string_format("error.download_failed", url));
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data_cpp);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // called from worker threads
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "depsize/" DEPSIZE_VERSION);

    CURLcode res = curl_easy_perform(curl.get());
    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    }
    if (auto error = classify_transfer(res, status, url)) {
        return {std::nullopt, std::move(error)};
    }
    return LookupResult<std::string>::Ok(std::move(body));
}

LookupResult<std::string> fetch_with_retries(const std::string& url, long timeout_seconds, int max_retries) {
    const int attempts = std::max(1, max_retries);
    LookupResult<std::string> result;
    for (int i = 0; i < attempts; ++i) {
        result = fetch_url(url, timeout_seconds);
        if (result) {
            return result;
        }
        const auto code = result.error->code;
        if (code != LookupErrorCode::Timeout && code != LookupErrorCode::Transport) {
            return result;
        }
        if (i < attempts - 1) {
            log_warning(string_format("warning.retrying", result.error->message, i + 2, attempts));
        }
    }
    return result;
}
