#ifndef JAR_HPP
#define JAR_HPP

#include <ctime>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Repodex {

/**
 * @class Jar
 * @brief Reading, writing and signature checking of JAR (signed ZIP) files.
 *
 * All read operations raise VerificationError when the file is not a
 * readable archive, since a JAR is only ever read to decide whether to
 * trust it.
 */
class Jar
{
public:
    /**
     * @brief Writes a new JAR containing a default manifest followed by
     *        `entries` (name, content). Any existing file is replaced.
     *
     * @param mtime Modification time stored for every entry.
     */
    static void create(const std::string& jarPath,
                       const std::vector<std::pair<std::string, std::string>>& entries,
                       std::time_t mtime);

    /**
     * @return Every regular file in the archive, keyed by entry name.
     */
    static std::map<std::string, std::string> readEntries(const std::string& jarPath);

    /**
     * @return The content of one entry.
     * @throws VerificationError if the entry does not exist.
     */
    static std::string readEntry(const std::string& jarPath, const std::string& name);

    /**
     * @brief Names of the signature block files (META-INF/*.RSA, *.DSA,
     *        *.EC). Each one carries one signer's certificate.
     */
    static std::vector<std::string> listEmbeddedSigners(const std::string& jarPath);

    /**
     * @brief Returns the DER encoded certificate of the one signer of a
     *        PKCS#7 signature block. Other certificates bundled in the
     *        block are ignored.
     *
     * @throws VerificationError if the block has no signer or several.
     */
    static std::string certificateFromSignatureBlock(const std::string& block);

    /**
     * @brief SHA-256 of a DER certificate as upper-case hex without
     *        separators, the form used for fingerprint pins.
     */
    static std::string certificateFingerprint(const std::string& certificate);

    /**
     * @brief Checks every signature of the JAR: the PKCS#7 signature over
     *        each .SF file, the manifest digest recorded in the .SF file,
     *        and the digest of every entry listed in the manifest. Entries
     *        outside META-INF that the manifest does not cover are rejected.
     *
     * @throws VerificationError on the first failure.
     */
    static void verifySignature(const std::string& jarPath);

private:
    static void verifyEntries(const std::map<std::string, std::string>& entries,
                              const std::string& manifest);
};

} // namespace Repodex

#endif // JAR_HPP
