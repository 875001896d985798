#include "errors.hpp"
#include "index.hpp"
#include "jar.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"
#include "verify.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace Repodex;
using namespace Repodex::Testing;
namespace fs = std::filesystem;

namespace {

class IndexAssemblerTest : public ::testing::Test
{
protected:
    void makeIndex(bool archive = false)
    {
        IndexAssembler assembler(config, gateway, options);
        assembler.make(catalog, repodir, archive);
    }

    void configureSigning()
    {
        fs::path keystore = dir.path() / "keystore.jks";
        writeFile(keystore, "not a real keystore");
        config.repoKeyAlias = "repokey";
        config.keystore     = keystore.string();
        config.keystorePass = "storepass";
        config.keyPass      = "keypass";
    }

    TempDir dir;
    fs::path repodir = dir.path() / "repo";
    Config config    = sampleConfig();
    Catalog catalog  = sampleCatalog();
    FakeSigningGateway gateway{primaryKey()};
    IndexOptions options{true, false};
};

} // namespace

TEST(MirrorServiceUrlTest, GitHub)
{
    EXPECT_EQ(IndexAssembler::mirrorServiceUrl("https://github.com/user/repo").value_or(""),
              "https://raw.githubusercontent.com/user/repo/master/fdroid");
    EXPECT_EQ(IndexAssembler::mirrorServiceUrl("git@github.com:user/repo.git").value_or(""),
              "https://raw.githubusercontent.com/user/repo/master/fdroid");
}

TEST(MirrorServiceUrlTest, GitLab)
{
    EXPECT_EQ(IndexAssembler::mirrorServiceUrl("https://gitlab.com/user/repo.git").value_or(""),
              "https://user.gitlab.io/repo/fdroid");
    EXPECT_EQ(IndexAssembler::mirrorServiceUrl("git@gitlab.com:user/repo").value_or(""),
              "https://user.gitlab.io/repo/fdroid");
}

TEST(MirrorServiceUrlTest, UnsupportedHostsAreDropped)
{
    EXPECT_FALSE(IndexAssembler::mirrorServiceUrl("https://git.example.org/user/repo").has_value());
    EXPECT_FALSE(IndexAssembler::mirrorServiceUrl("https://github.com/user").has_value());
}

TEST(BuildMirrorsTest, JoinsRepoPathAndSorts)
{
    Config config = sampleConfig();
    config.mirrors = {"https://z.example.org/fdroid/", "https://a.example.org/fdroid"};
    config.serverGitMirrors = {"https://github.com/user/repo", "https://git.example.org/user/repo"};

    EXPECT_EQ(IndexAssembler::buildMirrors(config, false),
              (std::vector<std::string>{"https://a.example.org/fdroid/repo",
                                        "https://z.example.org/fdroid/repo",
                                        "https://raw.githubusercontent.com/user/repo/master/fdroid/"}));
    EXPECT_EQ(IndexAssembler::buildMirrors(config, true).front(), "https://a.example.org/fdroid/archive");
}

TEST(BuildMirrorsTest, RejectsNonStandardWebroot)
{
    Config config = sampleConfig();
    config.mirrors = {"https://a.example.org/fdroid/", "https://b.example.org/other/", "https://c.example.org/x"};
    try {
        IndexAssembler::buildMirrors(config, false);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("https://b.example.org/other/"), std::string::npos);
        EXPECT_NE(message.find("https://c.example.org/x"), std::string::npos);
        EXPECT_EQ(message.find("https://a.example.org"), std::string::npos);
    }

    config.nonStandardWebroot = true;
    EXPECT_EQ(IndexAssembler::buildMirrors(config, false).size(), 3u);
}

TEST(EligibleAppsTest, FiltersAndRendersDescriptions)
{
    auto apps = IndexAssembler::eligibleApps(sampleCatalog());
    ASSERT_EQ(apps.size(), 2u);
    EXPECT_EQ(apps.count("org.example.disabled"), 0u);
    EXPECT_EQ(apps.count("org.example.nopackages"), 0u);
    EXPECT_EQ(apps.at("org.example.app").Description,
              "<p>Works well with <a href=\"fdroid.app:org.example.lib\">Example Library</a>.</p>");
}

TEST(EligibleAppsTest, UnknownAppLinkIsCatalogError)
{
    Catalog catalog = sampleCatalog();
    catalog.apps["org.example.app"].Description = "See [[org.example.missing]]";
    EXPECT_THROW(IndexAssembler::eligibleApps(catalog), CatalogError);
}

TEST(RequestsTest, ComeFromConfig)
{
    Config config = sampleConfig();
    config.installList   = {"org.example.app"};
    config.uninstallList = {"org.example.old"};
    Requests requests = IndexAssembler::requests(config);
    EXPECT_EQ(requests.install, config.installList);
    EXPECT_EQ(requests.uninstall, config.uninstallList);
}

TEST_F(IndexAssemblerTest, UnsignedRunWritesUnsignedFiles)
{
    fs::create_directories(repodir);
    writeFile(repodir / "index.jar", "stale");

    makeIndex();

    EXPECT_TRUE(fs::exists(repodir / "index.xml"));
    EXPECT_TRUE(fs::exists(repodir / "index_unsigned.jar"));
    EXPECT_TRUE(fs::exists(repodir / "index-v1.json"));
    EXPECT_FALSE(fs::exists(repodir / "index.jar"));
    EXPECT_FALSE(fs::exists(repodir / "index-v1.jar"));
    EXPECT_TRUE(gateway.signedJars.empty());
    EXPECT_EQ(Jar::readEntry((repodir / "index_unsigned.jar").string(), "index.xml"),
              readFile(repodir / "index.xml"));
}

TEST_F(IndexAssemblerTest, SignedRunRequiresCredentials)
{
    options.nosign = false;
    EXPECT_THROW(makeIndex(), ConfigError);
    EXPECT_FALSE(fs::exists(repodir / "index.xml"));

    configureSigning();
    config.keystore = (dir.path() / "missing.jks").string();
    EXPECT_THROW(makeIndex(), ConfigError);
}

TEST_F(IndexAssemblerTest, SignedRunProducesVerifiableJars)
{
    configureSigning();
    options.nosign = false;

    makeIndex();

    ASSERT_EQ(gateway.signedJars.size(), 2u);
    std::string jar = (repodir / "index-v1.jar").string();
    EXPECT_EQ(TrustVerifier::verifyJar(jar, primaryKey().fingerprint()), primaryKey().certificateDer());
    EXPECT_NO_THROW(TrustVerifier::verifyJar((repodir / "index.jar").string(), primaryKey().fingerprint()));
    EXPECT_EQ(Jar::readEntry(jar, "index-v1.json"), readFile(repodir / "index-v1.json"));

    XmlQuery doc(readFile(repodir / "index.xml"));
    EXPECT_EQ(doc.value("/fdroid/repo/@pubkey"), hexEncode(primaryKey().certificateDer()));
    EXPECT_EQ(doc.value("/fdroid/repo/@fingerprint"), primaryKey().fingerprint());
}

TEST_F(IndexAssemblerTest, BothFormatsPublishTheSameApps)
{
    config.repoMaxAge = 7;
    makeIndex();

    XmlQuery doc(readFile(repodir / "index.xml"));
    auto flat = nlohmann::json::parse(readFile(repodir / "index-v1.json"));

    std::vector<std::string> flatIds;
    for (const auto& app : flat["apps"]) {
        flatIds.push_back(app["packageName"].get<std::string>());
    }
    EXPECT_EQ(doc.values("/fdroid/application/@id"), flatIds);
    EXPECT_EQ(flatIds, (std::vector<std::string>{"org.example.app", "org.example.lib"}));

    EXPECT_EQ(doc.value("/fdroid/repo/@version"), "19");
    EXPECT_EQ(flat["repo"]["version"], 19);
    EXPECT_EQ(doc.value("/fdroid/repo/@maxage"), "7");
    EXPECT_EQ(flat["repo"]["maxage"], 7);
    EXPECT_EQ(flat["repo"]["timestamp"].get<int64_t>(),
              std::stoll(doc.value("/fdroid/repo/@timestamp")) * 1000);
    EXPECT_EQ(flat["apps"][0]["description"],
              "<p>Works well with <a href=\"fdroid.app:org.example.lib\">Example Library</a>.</p>");
}

TEST_F(IndexAssemblerTest, DuplicateVersionWritesNothing)
{
    Package duplicate = catalog.packages.front();
    duplicate.apkName = "app-3-rebuild.apk";
    catalog.packages.push_back(duplicate);

    EXPECT_THROW(makeIndex(), CatalogError);
    EXPECT_FALSE(fs::exists(repodir / "index.xml"));
    EXPECT_FALSE(fs::exists(repodir / "index-v1.json"));
}

TEST_F(IndexAssemblerTest, InvalidMirrorWritesNothing)
{
    config.mirrors = {"https://mirror.example.org/other/"};
    EXPECT_THROW(makeIndex(), ConfigError);
    EXPECT_FALSE(fs::exists(repodir / "index.xml"));
    EXPECT_FALSE(fs::exists(repodir / "index-v1.json"));
}

TEST_F(IndexAssemblerTest, CurrentVersionLinkFollowsDeclaredCode)
{
    fs::create_directories(repodir);
    writeFile(repodir / "app-5.apk.asc", "signature");

    makeIndex();

    fs::path link = dir.path() / "ExampleApp.apk";
    ASSERT_TRUE(fs::is_symlink(link));
    EXPECT_EQ(fs::read_symlink(link), fs::path("repo") / "app-5.apk");
    ASSERT_TRUE(fs::is_symlink(dir.path() / "ExampleApp.apk.asc"));
    EXPECT_EQ(fs::read_symlink(dir.path() / "ExampleApp.apk.asc"), fs::path("repo") / "app-5.apk.asc");
    EXPECT_FALSE(fs::exists(dir.path() / "ExampleApp.apk.sig"));

    // A second run replaces the links instead of failing
    EXPECT_NO_THROW(makeIndex());
    EXPECT_TRUE(fs::is_symlink(link));
}

TEST_F(IndexAssemblerTest, LinkNameSourceIsConfigurable)
{
    config.currentVersionNameSource = "id";
    makeIndex();
    EXPECT_TRUE(fs::is_symlink(dir.path() / "org.example.app.apk"));
}

TEST_F(IndexAssemblerTest, UnknownLinkNameSourceWritesNothing)
{
    config.currentVersionNameSource = "Bogus";
    EXPECT_THROW(makeIndex(), ConfigError);
    EXPECT_FALSE(fs::exists(repodir / "index.xml"));
    EXPECT_FALSE(fs::exists(repodir / "index_unsigned.jar"));
    EXPECT_FALSE(fs::exists(repodir / "index-v1.json"));

    // Only relevant when links are made
    config.makeCurrentVersionLink = false;
    EXPECT_NO_THROW(makeIndex());
}

TEST_F(IndexAssemblerTest, NoLinksForArchiveOrWhenDisabled)
{
    makeIndex(true);
    EXPECT_FALSE(fs::is_symlink(dir.path() / "ExampleApp.apk"));

    config.makeCurrentVersionLink = false;
    makeIndex(false);
    EXPECT_FALSE(fs::is_symlink(dir.path() / "ExampleApp.apk"));
}

TEST_F(IndexAssemblerTest, ArchiveUsesArchiveProfile)
{
    makeIndex(true);
    XmlQuery doc(readFile(repodir / "index.xml"));
    EXPECT_EQ(doc.value("/fdroid/repo/@name"), "Example Archive");
    EXPECT_EQ(doc.value("/fdroid/repo/@url"), "https://repo.example.org/fdroid/archive");
}

TEST_F(IndexAssemblerTest, CopiesRepoIcon)
{
    fs::path icon = dir.path() / "my-icon.png";
    writeFile(icon, "png");
    config.repo.icon = icon.string();

    makeIndex();

    EXPECT_EQ(readFile(repodir / "icons" / "my-icon.png"), "png");
    XmlQuery doc(readFile(repodir / "index.xml"));
    EXPECT_EQ(doc.value("/fdroid/repo/@icon"), "my-icon.png");
}
