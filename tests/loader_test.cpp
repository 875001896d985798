#include "errors.hpp"
#include "index_json.hpp"
#include "loader.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

using namespace Repodex;

TEST(IndexLoaderTest, ReadsBuilderOutput)
{
    Catalog catalog = Testing::sampleCatalog();
    std::map<std::string, App> apps = {{"org.example.app", catalog.apps.at("org.example.app")}};

    RepoDescriptor repo;
    repo.name      = "Example Repo";
    repo.address   = "https://repo.example.org/fdroid/repo";
    repo.timestamp = 1500000000;
    repo.version   = 19;
    repo.maxage    = 14;
    repo.mirrors   = {"https://mirror.example.org/fdroid/repo"};
    Requests requests{{"org.example.app"}, {}};

    std::string text = FlatIndexBuilder::dump(
        FlatIndexBuilder::build(apps, catalog.packages, repo, requests), false);
    RepoIndex index = IndexLoader::load(text, std::string("\x30\x82", 2), "ABCD");

    EXPECT_EQ(index.repo.name, "Example Repo");
    EXPECT_EQ(index.repo.timestamp, 1500000000);
    EXPECT_EQ(index.repo.maxage.value_or(0), 14);
    EXPECT_EQ(index.repo.mirrors, repo.mirrors);
    EXPECT_EQ(index.repo.pubkey, "3082");
    EXPECT_EQ(index.repo.fingerprint, "ABCD");
    EXPECT_EQ(index.requests.install, requests.install);

    ASSERT_EQ(index.apps.size(), 1u);
    const App& app = index.apps[0];
    EXPECT_EQ(app.id, "org.example.app");
    EXPECT_EQ(app.Name, "Example App");
    EXPECT_EQ(app.CurrentVersion, "1.5");
    EXPECT_EQ(app.CurrentVersionCode, 5);
    EXPECT_EQ(app.added.value_or(0), catalog.apps.at("org.example.app").added.value_or(-1));

    ASSERT_EQ(index.packages.count("org.example.app"), 1u);
    const auto& packages = index.packages.at("org.example.app");
    ASSERT_EQ(packages.size(), 3u);
    EXPECT_EQ(packages[0].versionCode, 3);
    EXPECT_TRUE(packages[0].usesPermission == catalog.packages[0].usesPermission);
    EXPECT_EQ(packages[0].minSdkVersion.value_or(0), 14);
    EXPECT_TRUE(packages[0].name.empty());
}

TEST(IndexLoaderTest, NumericSuggestedVersionCode)
{
    RepoIndex index = IndexLoader::load(
        R"({"repo": {"timestamp": 0}, "apps": [{"packageName": "a", "suggestedVersionCode": 12}]})", "", "");
    ASSERT_EQ(index.apps.size(), 1u);
    EXPECT_EQ(index.apps[0].CurrentVersionCode, 12);
}

TEST(IndexLoaderTest, MalformedPayloads)
{
    EXPECT_THROW(IndexLoader::load("{not json", "", ""), VerificationError);
    EXPECT_THROW(IndexLoader::load("[]", "", ""), VerificationError);
    EXPECT_THROW(IndexLoader::load(R"({"repo": {"timestamp": "soon"}})", "", ""), VerificationError);
    EXPECT_THROW(IndexLoader::load(R"({"repo": {}, "apps": [{"suggestedVersionCode": "five"}]})", "", ""),
                 VerificationError);
}
