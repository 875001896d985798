#include "errors.hpp"
#include "jar.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"
#include "verify.hpp"

#include <algorithm>
#include <cctype>
#include <gtest/gtest.h>

using namespace Repodex;
using namespace Repodex::Testing;

namespace {

const char* const indexUrl = "https://repo.example.org/fdroid/repo/index-v1.jar";

const char* const indexJson = R"({
  "repo": {"name": "Example Repo", "address": "https://repo.example.org/fdroid/repo",
           "timestamp": 1500000000000, "version": 19},
  "requests": {"install": [], "uninstall": []},
  "apps": [{"packageName": "org.example.app", "name": "Example App",
            "suggestedVersionCode": "5"}],
  "packages": {"org.example.app": [{"packageName": "org.example.app", "versionCode": 5,
                                    "apkName": "app-5.apk", "size": 1005}]}
})";

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

class TrustVerifierTest : public ::testing::Test
{
protected:
    void serve(const std::vector<const TestKey*>& keys,
               const std::map<std::string, std::string>& replaced = {})
    {
        ScopedTempFile jar(".jar");
        writeSignedJar(jar.path(), {{"index-v1.json", indexJson}}, keys, replaced);
        client.responses[indexUrl] = HttpResponse{readFile(jar.path()), "\"etag-1\""};
    }

    std::string pinnedUrl(const std::string& fingerprint) const
    {
        return "https://repo.example.org/fdroid/repo?fingerprint=" + fingerprint;
    }

    FakeHttpClient client;
    TrustVerifier verifier{client};
};

} // namespace

TEST_F(TrustVerifierTest, MatchingPinReturnsIndex)
{
    serve({&primaryKey()});
    FetchResult result = verifier.downloadRepoIndex(pinnedUrl(primaryKey().fingerprint()), "");

    ASSERT_TRUE(result.index.has_value());
    EXPECT_EQ(result.etag, "\"etag-1\"");
    EXPECT_EQ(result.index->repo.name, "Example Repo");
    EXPECT_EQ(result.index->repo.fingerprint, primaryKey().fingerprint());
    EXPECT_EQ(result.index->repo.pubkey, hexEncode(primaryKey().certificateDer()));
    ASSERT_EQ(result.index->apps.size(), 1u);
    EXPECT_EQ(result.index->apps[0].CurrentVersionCode, 5);

    ASSERT_EQ(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0].first, indexUrl);
}

TEST_F(TrustVerifierTest, PinIsCaseInsensitive)
{
    serve({&primaryKey()});
    EXPECT_NO_THROW(verifier.downloadRepoIndex(pinnedUrl(toLower(primaryKey().fingerprint())), ""));
}

TEST_F(TrustVerifierTest, MismatchedPinFails)
{
    serve({&primaryKey()});
    try {
        verifier.downloadRepoIndex(pinnedUrl(secondaryKey().fingerprint()), "");
        FAIL() << "expected VerificationError";
    } catch (const VerificationError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find(secondaryKey().fingerprint()), std::string::npos);
        EXPECT_NE(message.find(primaryKey().fingerprint()), std::string::npos);
    }
}

TEST_F(TrustVerifierTest, MultipleSignersAreAmbiguous)
{
    serve({&primaryKey(), &secondaryKey()});
    try {
        verifier.downloadRepoIndex(pinnedUrl(primaryKey().fingerprint()), "");
        FAIL() << "expected VerificationError";
    } catch (const VerificationError& e) {
        EXPECT_STREQ(e.what(), "Found multiple signing certificates for repository.");
    }
}

TEST_F(TrustVerifierTest, NoSignersFails)
{
    serve({});
    try {
        verifier.downloadRepoIndex(pinnedUrl(primaryKey().fingerprint()), "");
        FAIL() << "expected VerificationError";
    } catch (const VerificationError& e) {
        EXPECT_STREQ(e.what(), "Found no signing certificates for repository.");
    }
}

TEST_F(TrustVerifierTest, TamperedIndexFails)
{
    serve({&primaryKey()}, {{"index-v1.json", "{\"repo\": {\"name\": \"Evil\"}}"}});
    EXPECT_THROW(verifier.downloadRepoIndex(pinnedUrl(primaryKey().fingerprint()), ""),
                 VerificationError);
}

TEST_F(TrustVerifierTest, MissingFingerprintFails)
{
    serve({&primaryKey()});
    try {
        verifier.downloadRepoIndex("https://repo.example.org/fdroid/repo", "");
        FAIL() << "expected VerificationError";
    } catch (const VerificationError& e) {
        EXPECT_STREQ(e.what(), "No fingerprint in URL.");
    }
    EXPECT_TRUE(client.requests.empty());
}

TEST_F(TrustVerifierTest, WithoutVerificationPinIsNotRequired)
{
    serve({&primaryKey()});
    FetchResult result = verifier.downloadRepoIndex("https://repo.example.org/fdroid/repo", "", false);
    EXPECT_TRUE(result.index.has_value());
}

TEST_F(TrustVerifierTest, NotModifiedYieldsNoIndex)
{
    serve({&primaryKey()});
    FetchResult result = verifier.downloadRepoIndex(pinnedUrl(primaryKey().fingerprint()), "\"etag-1\"");
    EXPECT_FALSE(result.index.has_value());
    EXPECT_EQ(result.etag, "\"etag-1\"");
    ASSERT_EQ(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0].second, "\"etag-1\"");
}

TEST_F(TrustVerifierTest, TransportErrorsPropagate)
{
    EXPECT_THROW(verifier.downloadRepoIndex(pinnedUrl(primaryKey().fingerprint()), ""), TransportError);
}

TEST_F(TrustVerifierTest, MalformedPayloadFails)
{
    ScopedTempFile jar(".jar");
    writeSignedJar(jar.path(), {{"index-v1.json", "{not json"}}, {&primaryKey()});
    client.responses[indexUrl] = HttpResponse{readFile(jar.path()), ""};
    EXPECT_THROW(verifier.downloadRepoIndex(pinnedUrl(primaryKey().fingerprint()), ""),
                 VerificationError);
}

TEST_F(TrustVerifierTest, VerifyJarOnDisk)
{
    TempDir dir;
    auto path = (dir.path() / "index-v1.jar").string();
    writeSignedJar(path, {{"index-v1.json", indexJson}}, {&primaryKey()});
    EXPECT_EQ(TrustVerifier::verifyJar(path, ""), primaryKey().certificateDer());
    EXPECT_THROW(TrustVerifier::verifyJar(path, secondaryKey().fingerprint()), VerificationError);
}

TEST_F(TrustVerifierTest, BundledRepoCertificateDoesNotVouchForOtherSigner)
{
    TempDir dir;
    auto path = (dir.path() / "index-v1.jar").string();
    writeSignedJar(path, {{"index-v1.json", indexJson}}, {&secondaryKey()});

    // Re-sign with the repository certificate listed ahead of the real signer
    Entries entries;
    for (const auto& [name, content] : Jar::readEntries(path)) {
        entries.emplace_back(name, content);
    }
    for (auto& [name, content] : entries) {
        if (name == "META-INF/SIGNER0.RSA") {
            content = secondaryKey().signatureBlock(Jar::readEntry(path, "META-INF/SIGNER0.SF"),
                                                    {&primaryKey(), &secondaryKey()});
        }
    }
    writeZip(path, entries);

    EXPECT_EQ(TrustVerifier::verifyJar(path, ""), secondaryKey().certificateDer());
    EXPECT_THROW(TrustVerifier::verifyJar(path, primaryKey().fingerprint()), VerificationError);
}
