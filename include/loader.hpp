#ifndef LOADER_HPP
#define LOADER_HPP

#include "catalog.hpp"

#include <string>

namespace Repodex {

/**
 * @class IndexLoader
 * @brief Turns a verified index-v1.json payload back into catalog objects.
 */
class IndexLoader
{
public:
    /**
     * @param jsonText     Content of the index-v1.json entry.
     * @param pubkeyDer    DER certificate the index was signed with.
     * @param fingerprint  Fingerprint of that certificate.
     * @throws VerificationError if the payload is not a valid index.
     */
    static RepoIndex load(const std::string& jsonText,
                          const std::string& pubkeyDer,
                          const std::string& fingerprint);
};

} // namespace Repodex

#endif // LOADER_HPP
