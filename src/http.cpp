#include "http.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>

namespace Repodex {

namespace {

/**
 * @brief libcurl write callback. Appends downloaded data into a std::string.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize      = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);

    try {
        response->append(static_cast<char*>(contents), totalSize);
    } catch (const std::exception& e) {
        log_error(std::string("Error appending data to response: ") + e.what());
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

/**
 * @brief libcurl header callback. Captures the ETag response header.
 */
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp)
{
    size_t totalSize  = size * nitems;
    std::string* etag = static_cast<std::string*>(userp);
    std::string line(buffer, totalSize);

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return totalSize;
    }
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name != "etag") {
        return totalSize;
    }

    std::string value = line.substr(colon + 1);
    size_t start = value.find_first_not_of(" \t");
    size_t end   = value.find_last_not_of(" \t\r\n");
    *etag = (start == std::string::npos) ? "" : value.substr(start, end - start + 1);
    return totalSize;
}

} // namespace

CurlHttpClient::CurlHttpClient()
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient()
{
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(const std::string& url, const std::string& etag)
{
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("Failed to initialize libcurl");
    }

    std::string body;
    std::string newEtag;
    struct curl_slist* headers = nullptr;
    if (!etag.empty()) {
        headers = curl_slist_append(headers, ("If-None-Match: " + etag).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &newEtag);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 300L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "Repodex/1.0");

    CURLcode res = curl_easy_perform(curl);
    long response_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw TransportError("Failed to download " + url + ": " + curl_easy_strerror(res));
    }

    if (response_code == 304) {
        return HttpResponse{std::nullopt, newEtag.empty() ? etag : newEtag};
    }
    if (response_code >= 400) {
        throw TransportError("Failed to download " + url + ": server responded with code "
                             + std::to_string(response_code));
    }

    return HttpResponse{std::move(body), newEtag};
}

} // namespace Repodex
