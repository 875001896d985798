#ifndef VERIFY_HPP
#define VERIFY_HPP

#include "catalog.hpp"
#include "http.hpp"

#include <optional>
#include <string>

namespace Repodex {

/**
 * @brief Outcome of a download. `index` is empty when the server reported
 *        the index as unchanged since `etag`.
 */
struct FetchResult
{
    std::optional<RepoIndex> index;
    std::string etag;
};

/**
 * @class TrustVerifier
 * @brief Downloads a signed flat index and only returns it after the JAR
 *        signature and the pinned signer fingerprint have been checked.
 */
class TrustVerifier
{
public:
    explicit TrustVerifier(HttpClient& client);

    /**
     * @param url               Repository address, carrying the pinned
     *                          certificate as the `fingerprint` query parameter.
     * @param etag              ETag of the copy the caller already has, or "".
     * @param verifyFingerprint Require and compare the pin.
     * @throws VerificationError when the index cannot be trusted.
     * @throws TransportError when it cannot be downloaded.
     */
    FetchResult downloadRepoIndex(const std::string& url,
                                  const std::string& etag,
                                  bool verifyFingerprint = true);

    /**
     * @brief Checks a JAR file already on disk: exactly one signer, a valid
     *        signature and, when `pin` is not empty, a matching fingerprint.
     *
     * @return The DER certificate of the signer.
     */
    static std::string verifyJar(const std::string& jarPath, const std::string& pin);

private:
    HttpClient& client_;
};

} // namespace Repodex

#endif // VERIFY_HPP
