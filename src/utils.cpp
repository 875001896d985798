#include "utils.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include <cerrno>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Repodex {

/**
 * @brief Splits a URL with libcurl's URL API (CURLU). Throws if the URL is
 *        not absolute or otherwise unparsable.
 */
UrlParts parseUrl(const std::string& url)
{
    CURLU* handle = curl_url();
    if (!handle) {
        throw std::runtime_error("Failed to initialize libcurl URL handle");
    }

    CURLUcode rc = curl_url_set(handle, CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        curl_url_cleanup(handle);
        throw std::invalid_argument("Invalid URL '" + url + "': " + curl_url_strerror(rc));
    }

    auto part = [handle](CURLUPart which) {
        char* value = nullptr;
        std::string out;
        if (curl_url_get(handle, which, &value, 0) == CURLUE_OK && value) {
            out = value;
        }
        curl_free(value);
        return out;
    };

    UrlParts parts;
    parts.scheme = part(CURLUPART_SCHEME);
    parts.host   = part(CURLUPART_HOST);
    parts.port   = part(CURLUPART_PORT);
    parts.path   = part(CURLUPART_PATH);
    parts.query  = part(CURLUPART_QUERY);

    curl_url_cleanup(handle);
    return parts;
}

std::string buildUrl(const UrlParts& parts)
{
    std::string url = parts.scheme + "://" + parts.host;
    if (!parts.port.empty()) {
        url += ":" + parts.port;
    }
    url += parts.path.empty() ? "/" : parts.path;
    if (!parts.query.empty()) {
        url += "?" + parts.query;
    }
    return url;
}

std::string queryParameter(const std::string& query, const std::string& key)
{
    for (const auto& pair : split(query, '&')) {
        size_t eq = pair.find('=');
        std::string name = pair.substr(0, eq);
        if (name != key) {
            continue;
        }
        if (eq == std::string::npos) {
            return "";
        }
        std::string raw = pair.substr(eq + 1);
        std::replace(raw.begin(), raw.end(), '+', ' ');

        CURL* curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        int length = 0;
        char* decoded = curl_easy_unescape(curl, raw.c_str(), static_cast<int>(raw.size()), &length);
        std::string value = decoded ? std::string(decoded, static_cast<size_t>(length)) : raw;
        curl_free(decoded);
        curl_easy_cleanup(curl);
        return value;
    }
    return "";
}

std::string join(const std::vector<std::string>& items, const std::string& separator)
{
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += items[i];
    }
    return out;
}

std::vector<std::string> split(const std::string& input, char separator)
{
    std::vector<std::string> pieces;
    std::istringstream iss(input);
    std::string token;

    while (std::getline(iss, token, separator)) {
        if (!token.empty()) {
            pieces.push_back(token);
        }
    }
    return pieces;
}

std::string toUpper(std::string input)
{
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return input;
}

std::string hexEncode(const std::string& bytes)
{
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out += digits[c >> 4];
        out += digits[c & 0x0f];
    }
    return out;
}

std::string hexDecode(const std::string& hex)
{
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length");
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument(std::string("Invalid hex character '") + c + "'");
    };

    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        out += static_cast<char>((nibble(hex[i]) << 4) | nibble(hex[i + 1]));
    }
    return out;
}

std::string formatDate(std::time_t time)
{
    std::tm tm_info{};
    gmtime_r(&time, &tm_info);

    char buffer[11]; // "YYYY-MM-DD" plus null terminator
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm_info);
    return std::string(buffer);
}

std::time_t parseDate(const std::string& date)
{
    std::tm tm_info{};
    std::istringstream iss(date);
    iss >> std::get_time(&tm_info, "%Y-%m-%d");
    if (iss.fail()) {
        throw std::invalid_argument("Invalid date '" + date + "', expected YYYY-MM-DD");
    }
    return timegm(&tm_info);
}

std::string fileExtension(const std::string& fileName)
{
    size_t dot = fileName.rfind('.');
    if (dot == std::string::npos || dot + 1 == fileName.size()) {
        return "";
    }
    std::string ext = fileName.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string sanitizeFileName(const std::string& name)
{
    static const std::string unsafe = " '\"&%?+=/";
    std::string out;
    for (char c : name) {
        if (unsafe.find(c) == std::string::npos) {
            out += c;
        }
    }
    return out;
}

std::string readFile(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Unable to open file for reading: " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

void writeFile(const fs::path& path, const std::string& content)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Unable to open file for writing: " + path.string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

void replaceSymlink(const fs::path& target, const fs::path& link)
{
    // Remove existing symlink/file first
    std::error_code ec;
    if (fs::is_symlink(link, ec) || fs::exists(link, ec)) {
        fs::remove(link);
    }
    fs::create_symlink(target, link);
}

// ============================================================================
// ScopedTempFile
// ============================================================================

ScopedTempFile::ScopedTempFile(const std::string& suffix)
{
    std::string pattern = (fs::temp_directory_path() / "repodex-XXXXXX").string() + suffix;
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "Failed to create temporary file " + pattern);
    }
    close(fd);
    path_ = buffer.data();
}

ScopedTempFile::~ScopedTempFile()
{
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        log_warning("Failed to remove temporary file " + path_.string() + ": " + ec.message());
    }
}

} // namespace Repodex
