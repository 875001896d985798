#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Repodex {

/**
 * @brief Invalid or incomplete configuration (signing credentials, request
 *        lists, mirrors). Raised before any index file is written.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The catalog violates an integrity rule, e.g. two packages of one
 *        app share a version code.
 */
class CatalogError : public std::runtime_error
{
public:
    explicit CatalogError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A downloaded index could not be trusted. Nothing from the
 *        offending download may be used.
 */
class VerificationError : public std::runtime_error
{
public:
    explicit VerificationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Network or HTTP failure while fetching an index.
 */
class TransportError : public std::runtime_error
{
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The signing gateway failed to export the certificate or sign a JAR.
 */
class SigningError : public std::runtime_error
{
public:
    explicit SigningError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace Repodex

#endif // ERRORS_HPP
