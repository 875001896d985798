#include "index_json.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace Repodex;
using nlohmann::json;

namespace {

class FlatIndexBuilderTest : public ::testing::Test
{
protected:
    json build()
    {
        RepoDescriptor repo;
        repo.name      = "Example Repo";
        repo.icon      = "icons/fdroid-icon.png";
        repo.address   = "https://repo.example.org/fdroid/repo";
        repo.timestamp = 1500000000;
        repo.version   = 19;

        std::map<std::string, App> apps;
        for (const auto& [id, app] : catalog.apps) {
            if (!app.Disabled && id != "org.example.nopackages") {
                apps.emplace(id, app);
            }
        }
        return FlatIndexBuilder::build(apps, catalog.packages, repo, Requests{});
    }

    Catalog catalog = Testing::sampleCatalog();
};

bool hasFalsyValue(const json& value)
{
    if (value.is_object()) {
        for (const auto& item : value.items()) {
            const json& child = item.value();
            if (child.is_null() || (child.is_boolean() && !child.get<bool>())
                || (child.is_string() && child.get<std::string>().empty())
                || (child.is_array() && child.empty()) || (child.is_object() && child.empty())) {
                return true;
            }
            if (hasFalsyValue(child)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

TEST_F(FlatIndexBuilderTest, TopLevelKeys)
{
    json index = build();
    EXPECT_TRUE(index.contains("repo"));
    EXPECT_TRUE(index.contains("apps"));
    EXPECT_TRUE(index.contains("packages"));
    // No requests, so nothing to publish
    EXPECT_FALSE(index.contains("requests"));
    EXPECT_FALSE(hasFalsyValue(index));
}

TEST_F(FlatIndexBuilderTest, OnlyNonEmptyRequestListsArePublished)
{
    Requests requests{{"org.example.app"}, {}};
    json index = FlatIndexBuilder::build({}, {}, RepoDescriptor{}, requests);
    EXPECT_EQ(index["requests"]["install"], json::array({"org.example.app"}));
    EXPECT_FALSE(index["requests"].contains("uninstall"));
}

TEST_F(FlatIndexBuilderTest, RepoUsesMilliseconds)
{
    json repo = build()["repo"];
    EXPECT_EQ(repo["timestamp"], 1500000000000LL);
    EXPECT_EQ(repo["version"], 19);
    EXPECT_EQ(repo["icon"], "fdroid-icon.png");
    EXPECT_FALSE(repo.contains("maxage"));
    EXPECT_FALSE(repo.contains("mirrors"));
    EXPECT_FALSE(repo.contains("description"));
}

TEST_F(FlatIndexBuilderTest, AppsAreSortedAndRenamed)
{
    json apps = build()["apps"];
    ASSERT_EQ(apps.size(), 2u);
    EXPECT_EQ(apps[0]["packageName"], "org.example.app");
    EXPECT_EQ(apps[0]["name"], "Example App");
    EXPECT_EQ(apps[0]["suggestedVersionName"], "1.5");
    EXPECT_EQ(apps[0]["suggestedVersionCode"], "5");
    EXPECT_EQ(apps[0]["added"], 1500000000000LL);
    EXPECT_EQ(apps[0]["antiFeatures"], json::array({"Ads"}));
    EXPECT_EQ(apps[1]["packageName"], "org.example.lib");
    EXPECT_EQ(apps[1]["name"], "Example Library");
    EXPECT_FALSE(apps[1].contains("autoName"));
}

TEST_F(FlatIndexBuilderTest, InternalFieldsAreExcluded)
{
    catalog.apps["org.example.app"].Provides     = "org.example.old";
    catalog.apps["org.example.app"].RequiresRoot = true;
    catalog.apps["org.example.app"].builds       = {"1.5"};
    json app = build()["apps"][0];
    for (const char* key : {"maintainerNotes", "MaintainerNotes", "provides", "requiresRoot",
                            "builds", "id", "Name", "currentVersion"}) {
        EXPECT_FALSE(app.contains(key)) << key;
    }
}

TEST_F(FlatIndexBuilderTest, NoFalsyValues)
{
    EXPECT_FALSE(hasFalsyValue(build()["apps"]));
    EXPECT_FALSE(hasFalsyValue(build()["repo"]));
}

TEST_F(FlatIndexBuilderTest, PackagesGroupedInCatalogOrder)
{
    json packages = build()["packages"];
    EXPECT_FALSE(packages.contains("org.example.disabled"));
    ASSERT_EQ(packages["org.example.app"].size(), 3u);
    EXPECT_EQ(packages["org.example.app"][0]["versionCode"], 3);
    EXPECT_EQ(packages["org.example.app"][1]["versionCode"], 7);
    EXPECT_EQ(packages["org.example.app"][2]["versionCode"], 5);
}

TEST_F(FlatIndexBuilderTest, PackageRecords)
{
    json pkg = build()["packages"]["org.example.app"][0];
    EXPECT_FALSE(pkg.contains("name"));
    EXPECT_FALSE(pkg.contains("icon"));
    EXPECT_FALSE(pkg.contains("antiFeatures"));
    EXPECT_EQ(pkg["hashType"], "sha256");
    EXPECT_EQ(pkg["minSdkVersion"], 14);
    EXPECT_EQ(pkg["uses-permission"],
              json::parse(R"([["android.permission.INTERNET", null],
                              ["android.permission.WRITE_EXTERNAL_STORAGE", 18]])"));
}

TEST_F(FlatIndexBuilderTest, ZeroSizeIsKept)
{
    json pkg = build()["packages"]["org.example.lib"][0];
    EXPECT_EQ(pkg["size"], 0);
}

TEST_F(FlatIndexBuilderTest, DumpIsDeterministic)
{
    std::string first  = FlatIndexBuilder::dump(build(), false);
    std::string second = FlatIndexBuilder::dump(build(), false);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.find('\n'), std::string::npos);
    EXPECT_NE(FlatIndexBuilder::dump(build(), true).find("\n  \"apps\""), std::string::npos);
}
