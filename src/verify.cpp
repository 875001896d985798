#include "verify.hpp"
#include "errors.hpp"
#include "jar.hpp"
#include "loader.hpp"
#include "utils.hpp"

#include <stdexcept>

namespace Repodex {

namespace {

const char* const indexJarName  = "index-v1.jar";
const char* const indexJsonName = "index-v1.json";

} // namespace

TrustVerifier::TrustVerifier(HttpClient& client) : client_(client) {}

std::string TrustVerifier::verifyJar(const std::string& jarPath, const std::string& pin)
{
    auto signers = Jar::listEmbeddedSigners(jarPath);
    if (signers.empty()) {
        throw VerificationError("Found no signing certificates for repository.");
    }
    if (signers.size() > 1) {
        throw VerificationError("Found multiple signing certificates for repository.");
    }

    Jar::verifySignature(jarPath);

    std::string certificate = Jar::certificateFromSignatureBlock(Jar::readEntry(jarPath, signers.front()));
    std::string fingerprint = Jar::certificateFingerprint(certificate);
    if (!pin.empty() && toUpper(pin) != fingerprint) {
        throw VerificationError("The repository is not signed by the expected key. Expected "
                                + toUpper(pin) + " but got " + fingerprint);
    }
    return certificate;
}

FetchResult TrustVerifier::downloadRepoIndex(const std::string& url,
                                             const std::string& etag,
                                             bool verifyFingerprint)
{
    UrlParts parts;
    try {
        parts = parseUrl(url);
    } catch (const std::invalid_argument& e) {
        throw VerificationError(std::string("Invalid repository URL: ") + e.what());
    }

    std::string pin;
    if (verifyFingerprint) {
        pin = queryParameter(parts.query, "fingerprint");
        if (pin.empty()) {
            throw VerificationError("No fingerprint in URL.");
        }
    }

    parts.query.clear();
    if (parts.path.empty() || parts.path.back() != '/') {
        parts.path += '/';
    }
    parts.path += indexJarName;
    std::string indexUrl = buildUrl(parts);

    log_message("Downloading " + indexUrl);
    HttpResponse response = client_.get(indexUrl, etag);
    if (!response.body) {
        log_message("Index at " + indexUrl + " has not changed");
        return FetchResult{std::nullopt, response.etag};
    }

    ScopedTempFile jar(".jar");
    writeFile(jar.path(), *response.body);

    std::string certificate = verifyJar(jar.path().string(), pin);
    std::string json        = Jar::readEntry(jar.path().string(), indexJsonName);

    return FetchResult{IndexLoader::load(json, certificate, Jar::certificateFingerprint(certificate)),
                       response.etag};
}

} // namespace Repodex
