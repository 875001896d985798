#include "jar.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <memory>
#include <regex>
#include <set>
#include <sstream>
#include <archive.h>
#include <archive_entry.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pkcs7.h>
#include <openssl/x509.h>

namespace Repodex {

namespace {

// Global constant for the libarchive read block size.
const int archiveBufferSize = 65536; // 64 KB

const std::regex signatureBlockPattern("^META-INF/.*\\.(DSA|EC|RSA)$");
const char* const manifestName = "META-INF/MANIFEST.MF";

using BioPtr   = std::unique_ptr<BIO, decltype(&BIO_free_all)>;
using Pkcs7Ptr = std::unique_ptr<PKCS7, decltype(&PKCS7_free)>;

using ManifestSection = std::map<std::string, std::string>;

std::string archiveError(struct archive* a)
{
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

std::string opensslError()
{
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

Pkcs7Ptr parsePkcs7(const std::string& block)
{
    BioPtr in(BIO_new_mem_buf(block.data(), static_cast<int>(block.size())), &BIO_free_all);
    if (!in) {
        throw std::runtime_error("Failed to allocate OpenSSL BIO");
    }
    Pkcs7Ptr p7(d2i_PKCS7_bio(in.get(), nullptr), &PKCS7_free);
    if (!p7 || !PKCS7_type_is_signed(p7.get())) {
        throw VerificationError("Signature block is not a PKCS#7 signed-data structure: " + opensslError());
    }
    return p7;
}

std::string digest(const std::string& data, const EVP_MD* md)
{
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), out, &length, md, nullptr) != 1) {
        throw std::runtime_error("Digest computation failed: " + opensslError());
    }
    return std::string(reinterpret_cast<const char*>(out), length);
}

std::string base64(const std::string& bytes)
{
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                 reinterpret_cast<const unsigned char*>(bytes.data()),
                                 static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(length));
    return out;
}

/**
 * @brief Splits a manifest or signature file into its sections. Lines that
 *        start with a space continue the previous value.
 */
std::vector<ManifestSection> parseManifest(const std::string& text)
{
    std::vector<ManifestSection> sections;
    ManifestSection current;
    std::string lastKey;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            if (!current.empty()) {
                sections.push_back(current);
                current.clear();
            }
            lastKey.clear();
            continue;
        }
        if (line[0] == ' ') {
            if (lastKey.empty()) {
                throw VerificationError("Malformed manifest continuation line");
            }
            current[lastKey] += line.substr(1);
            continue;
        }
        size_t colon = line.find(": ");
        if (colon == std::string::npos) {
            throw VerificationError("Malformed manifest line: " + line);
        }
        lastKey = line.substr(0, colon);
        current[lastKey] = line.substr(colon + 2);
    }
    if (!current.empty()) {
        sections.push_back(current);
    }
    return sections;
}

/**
 * @brief Finds a "<algorithm><suffix>" attribute (e.g. "SHA-256-Digest")
 *        and checks it against `data`. Returns false if none is present.
 */
bool checkDigest(const ManifestSection& section, const std::string& suffix,
                 const std::string& data, const std::string& what)
{
    static const std::vector<std::pair<std::string, const EVP_MD* (*)()>> algorithms = {
        {"SHA-256", &EVP_sha256},
        {"SHA-1", &EVP_sha1},
        {"SHA1", &EVP_sha1},
    };

    for (const auto& [name, md] : algorithms) {
        auto it = section.find(name + suffix);
        if (it == section.end()) {
            continue;
        }
        if (it->second != base64(digest(data, md()))) {
            throw VerificationError(name + " digest mismatch for " + what);
        }
        return true;
    }
    return false;
}

} // namespace

void Jar::create(const std::string& jarPath,
                 const std::vector<std::pair<std::string, std::string>>& entries,
                 std::time_t mtime)
{
    struct archive* a = archive_write_new();
    if (!a) {
        throw std::runtime_error("Failed to initialize libarchive write handle");
    }
    archive_write_set_format_zip(a);

    if (archive_write_open_filename(a, jarPath.c_str()) != ARCHIVE_OK) {
        std::string message = "Could not create archive " + jarPath + ": " + archiveError(a);
        archive_write_free(a);
        throw std::runtime_error(message);
    }

    std::vector<std::pair<std::string, std::string>> all;
    all.emplace_back(manifestName, "Manifest-Version: 1.0\r\nCreated-By: repodex\r\n\r\n");
    all.insert(all.end(), entries.begin(), entries.end());

    for (const auto& [name, content] : all) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_size(entry, static_cast<la_int64_t>(content.size()));
        archive_entry_set_mtime(entry, mtime, 0);

        bool ok = archive_write_header(a, entry) == ARCHIVE_OK
                  && archive_write_data(a, content.data(), content.size())
                         == static_cast<la_ssize_t>(content.size());
        archive_entry_free(entry);
        if (!ok) {
            std::string message = "Failed to write " + name + " to " + jarPath + ": " + archiveError(a);
            archive_write_free(a);
            throw std::runtime_error(message);
        }
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        std::string message = "Failed to finish archive " + jarPath + ": " + archiveError(a);
        archive_write_free(a);
        throw std::runtime_error(message);
    }
    archive_write_free(a);
}

std::map<std::string, std::string> Jar::readEntries(const std::string& jarPath)
{
    struct archive* a = archive_read_new();
    if (!a) {
        throw std::runtime_error("Failed to initialize libarchive read handle");
    }
    archive_read_support_filter_all(a);
    archive_read_support_format_zip(a);

    if (archive_read_open_filename(a, jarPath.c_str(), archiveBufferSize) != ARCHIVE_OK) {
        std::string message = "Could not open archive " + jarPath + ": " + archiveError(a);
        archive_read_free(a);
        throw VerificationError(message);
    }

    std::map<std::string, std::string> entries;
    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        if (archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(a);
            continue;
        }

        std::string name = archive_entry_pathname(entry);
        std::string content;
        char buffer[archiveBufferSize];
        la_ssize_t size;
        while ((size = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
            content.append(buffer, static_cast<size_t>(size));
        }
        if (size < 0) {
            std::string message = "Failed to read " + name + " from " + jarPath + ": " + archiveError(a);
            archive_read_free(a);
            throw VerificationError(message);
        }
        entries[name] = std::move(content);
    }

    if (r != ARCHIVE_EOF) {
        std::string message = "Corrupt archive " + jarPath + ": " + archiveError(a);
        archive_read_free(a);
        throw VerificationError(message);
    }

    archive_read_close(a);
    archive_read_free(a);
    return entries;
}

std::string Jar::readEntry(const std::string& jarPath, const std::string& name)
{
    auto entries = readEntries(jarPath);
    auto it = entries.find(name);
    if (it == entries.end()) {
        throw VerificationError(jarPath + " does not contain " + name);
    }
    return it->second;
}

std::vector<std::string> Jar::listEmbeddedSigners(const std::string& jarPath)
{
    std::vector<std::string> signers;
    for (const auto& [name, content] : readEntries(jarPath)) {
        if (std::regex_match(name, signatureBlockPattern)) {
            signers.push_back(name);
        }
    }
    return signers;
}

std::string Jar::certificateFromSignatureBlock(const std::string& block)
{
    Pkcs7Ptr p7 = parsePkcs7(block);

    // The signer is matched by issuer and serial, not by position in the
    // certificate set, which may carry unrelated certificates
    std::unique_ptr<STACK_OF(X509), void (*)(STACK_OF(X509)*)> signers(
        PKCS7_get0_signers(p7.get(), nullptr, 0), [](STACK_OF(X509)* stack) { sk_X509_free(stack); });
    if (!signers || sk_X509_num(signers.get()) < 1) {
        throw VerificationError("Signature block contains no signing certificate: " + opensslError());
    }
    if (sk_X509_num(signers.get()) > 1) {
        throw VerificationError("Signature block has more than one signer");
    }

    unsigned char* der = nullptr;
    int length = i2d_X509(sk_X509_value(signers.get(), 0), &der);
    if (length <= 0) {
        throw VerificationError("Failed to encode signing certificate: " + opensslError());
    }
    std::string out(reinterpret_cast<const char*>(der), static_cast<size_t>(length));
    OPENSSL_free(der);
    return out;
}

std::string Jar::certificateFingerprint(const std::string& certificate)
{
    return toUpper(hexEncode(digest(certificate, EVP_sha256())));
}

void Jar::verifySignature(const std::string& jarPath)
{
    auto entries = readEntries(jarPath);

    auto manifest = entries.find(manifestName);
    if (manifest == entries.end()) {
        throw VerificationError(jarPath + " has no manifest");
    }

    std::vector<std::string> blocks;
    for (const auto& [name, content] : entries) {
        if (std::regex_match(name, signatureBlockPattern)) {
            blocks.push_back(name);
        }
    }
    if (blocks.empty()) {
        throw VerificationError(jarPath + " is not signed");
    }

    for (const auto& blockName : blocks) {
        std::string sfName = blockName.substr(0, blockName.rfind('.')) + ".SF";
        auto sf = entries.find(sfName);
        if (sf == entries.end()) {
            throw VerificationError("Signature block " + blockName + " has no matching " + sfName);
        }

        Pkcs7Ptr p7 = parsePkcs7(entries[blockName]);
        BioPtr content(BIO_new_mem_buf(sf->second.data(), static_cast<int>(sf->second.size())), &BIO_free_all);
        // The certificate is pinned by fingerprint, so no chain is checked here
        if (PKCS7_verify(p7.get(), nullptr, nullptr, content.get(), nullptr,
                         PKCS7_NOVERIFY | PKCS7_BINARY) != 1) {
            throw VerificationError("Invalid signature in " + blockName + ": " + opensslError());
        }

        auto sfSections = parseManifest(sf->second);
        if (sfSections.empty()
            || !checkDigest(sfSections.front(), "-Digest-Manifest", manifest->second, sfName)) {
            throw VerificationError(sfName + " does not record a manifest digest");
        }
    }

    verifyEntries(entries, manifest->second);
}

void Jar::verifyEntries(const std::map<std::string, std::string>& entries,
                        const std::string& manifest)
{
    std::set<std::string> covered;
    for (const auto& section : parseManifest(manifest)) {
        auto name = section.find("Name");
        if (name == section.end()) {
            continue;
        }
        auto entry = entries.find(name->second);
        if (entry == entries.end()) {
            throw VerificationError("Manifest lists missing entry " + name->second);
        }
        if (!checkDigest(section, "-Digest", entry->second, name->second)) {
            throw VerificationError("Manifest has no digest for " + name->second);
        }
        covered.insert(name->second);
    }

    for (const auto& [name, content] : entries) {
        if (name.rfind("META-INF/", 0) == 0) {
            continue;
        }
        if (covered.find(name) == covered.end()) {
            throw VerificationError("Unsigned entry in JAR: " + name);
        }
    }
}

} // namespace Repodex
