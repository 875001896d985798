#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <ostream>
#include <iostream>
#include <ctime>
#include <filesystem>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Repodex {

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << COLOR_INFO << "[INFO] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << COLOR_WARN << "[WARN] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << COLOR_ERROR << "[ERROR] " << COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief Pieces of a URL as split by libcurl's URL API.
 */
struct UrlParts
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
};

/**
 * @brief Splits an absolute URL into its parts. Throws std::invalid_argument
 *        if libcurl cannot parse it.
 */
UrlParts parseUrl(const std::string& url);

/**
 * @brief Reassembles a URL from its parts, omitting an empty query.
 */
std::string buildUrl(const UrlParts& parts);

/**
 * @brief Returns the first value of `key` in an URL query string, decoded,
 *        or an empty string if it is absent.
 */
std::string queryParameter(const std::string& query, const std::string& key);

/**
 * @brief Joins strings with a separator.
 */
std::string join(const std::vector<std::string>& items, const std::string& separator);

/**
 * @brief Splits on a separator character, dropping empty pieces.
 */
std::vector<std::string> split(const std::string& input, char separator);

std::string toUpper(std::string input);

/**
 * @brief Lower-case hex encoding of arbitrary bytes.
 */
std::string hexEncode(const std::string& bytes);

/**
 * @brief Decodes a hex string. Throws std::invalid_argument on odd length or
 *        non-hex characters.
 */
std::string hexDecode(const std::string& hex);

/**
 * @brief Formats a time as "YYYY-MM-DD" in UTC.
 */
std::string formatDate(std::time_t time);

/**
 * @brief Parses "YYYY-MM-DD" (UTC midnight). Throws std::invalid_argument.
 */
std::time_t parseDate(const std::string& date);

/**
 * @brief Returns the lower-cased extension of a file name without the dot.
 */
std::string fileExtension(const std::string& fileName);

/**
 * @brief Strips the characters that are unsafe in link file names:
 *        space, quotes, '&', '%', '?', '+', '=' and '/'.
 */
std::string sanitizeFileName(const std::string& name);

std::string readFile(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Replaces `link` (if present) with a symbolic link to `target`.
 */
void replaceSymlink(const std::filesystem::path& target, const std::filesystem::path& link);

/**
 * @class ScopedTempFile
 * @brief Creates a unique file under the system temp directory and removes
 *        it when the object goes out of scope.
 */
class ScopedTempFile
{
public:
    explicit ScopedTempFile(const std::string& suffix = "");
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace Repodex

#endif // UTILS_HPP
