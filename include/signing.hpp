#ifndef SIGNING_HPP
#define SIGNING_HPP

#include "config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Repodex {

/**
 * @class SigningGateway
 * @brief Access to the repository signing key.
 */
class SigningGateway
{
public:
    virtual ~SigningGateway() = default;

    /**
     * @return The DER encoded certificate of the repository key.
     * @throws SigningError if it cannot be obtained.
     */
    virtual std::string publicCertificate() = 0;

    /**
     * @brief Signs the JAR at `jarPath` in place.
     * @throws SigningError if signing fails.
     */
    virtual void signJar(const std::string& jarPath) = 0;
};

/**
 * @class KeystoreSigner
 * @brief SigningGateway that drives the JDK `keytool` and `jarsigner`
 *        programs against the configured keystore.
 *
 * Passwords are handed to the tools through environment variables so they
 * never show up on a command line.
 */
class KeystoreSigner : public SigningGateway
{
public:
    explicit KeystoreSigner(const Config& config);

    std::string publicCertificate() override;
    void signJar(const std::string& jarPath) override;

private:
    std::vector<std::string> keystoreArguments() const;

    const Config& config_;
    std::optional<std::string> certificate_;
};

} // namespace Repodex

#endif // SIGNING_HPP
