#include "index_json.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using nlohmann::json;

namespace Repodex {

namespace {

// Clients expect milliseconds since the epoch
int64_t toMillis(std::time_t time)
{
    return static_cast<int64_t>(time) * 1000;
}

/**
 * @brief Writes fields into a JSON object, skipping the ones that are
 *        empty or unset. Which test applies is decided by the field type.
 */
class SparseObject
{
public:
    explicit SparseObject(json& object) : object_(object) {}

    void put(const char* key, const std::string& value)
    {
        if (!value.empty()) {
            object_[key] = value;
        }
    }

    void put(const char* key, const std::vector<std::string>& values)
    {
        if (!values.empty()) {
            object_[key] = values;
        }
    }

    void put(const char* key, bool value)
    {
        if (value) {
            object_[key] = true;
        }
    }

    void put(const char* key, const std::optional<std::string>& value)
    {
        if (value && !value->empty()) {
            object_[key] = *value;
        }
    }

    void put(const char* key, const std::optional<int>& value)
    {
        if (value) {
            object_[key] = *value;
        }
    }

    void putDate(const char* key, const std::optional<std::time_t>& value)
    {
        if (value) {
            object_[key] = toMillis(*value);
        }
    }

    void put(const char* key, const std::vector<Permission>& permissions)
    {
        if (permissions.empty()) {
            return;
        }
        json list = json::array();
        for (const auto& perm : permissions) {
            json pair = json::array({perm.name, nullptr});
            if (perm.maxSdkVersion) {
                pair[1] = *perm.maxSdkVersion;
            }
            list.push_back(pair);
        }
        object_[key] = list;
    }

    // Fields that are always present regardless of value
    template <typename T>
    void require(const char* key, const T& value)
    {
        object_[key] = value;
    }

private:
    json& object_;
};

json repoToJson(const RepoDescriptor& repo)
{
    json out = json::object();
    SparseObject fields(out);

    fields.put("name", repo.name);
    fields.put("icon", fs::path(repo.icon).filename().string());
    fields.put("address", repo.address);
    fields.put("description", repo.description);
    fields.require("timestamp", toMillis(repo.timestamp));
    fields.require("version", repo.version);
    fields.put("maxage", repo.maxage);
    fields.put("mirrors", repo.mirrors);
    return out;
}

} // namespace

json FlatIndexBuilder::appToJson(const App& app)
{
    json out = json::object();
    SparseObject fields(out);

    // Names follow the App class of the client
    fields.put("packageName", app.id);
    fields.put("name", app.displayName());
    fields.put("summary", app.Summary);
    fields.put("description", app.Description);
    fields.put("license", app.License);
    fields.put("categories", app.Categories);
    fields.put("webSite", app.WebSite);
    fields.put("sourceCode", app.SourceCode);
    fields.put("issueTracker", app.IssueTracker);
    fields.put("changelog", app.Changelog);
    fields.put("authorName", app.AuthorName);
    fields.put("authorEmail", app.AuthorEmail);
    fields.put("donate", app.Donate);
    fields.put("bitcoin", app.Bitcoin);
    fields.put("litecoin", app.Litecoin);
    fields.put("flattrID", app.FlattrID);
    fields.put("disabled", app.Disabled);
    fields.put("antiFeatures", app.AntiFeatures);
    fields.put("suggestedVersionName", app.CurrentVersion);
    if (app.CurrentVersionCode != 0) {
        fields.require("suggestedVersionCode", std::to_string(app.CurrentVersionCode));
    }
    fields.put("icon", app.icon);
    fields.putDate("added", app.added);
    fields.putDate("lastUpdated", app.lastUpdated);

    // builds, comments, metadatapath, ArchivePolicy, AutoUpdateMode,
    // MaintainerNotes, Provides, Repo, RepoType, RequiresRoot, UpdateCheck*,
    // NoSourceSince and VercodeOperation stay internal.
    return out;
}

json FlatIndexBuilder::packageToJson(const Package& pkg)
{
    json out = json::object();
    SparseObject fields(out);

    fields.put("packageName", pkg.packageName);
    fields.put("versionName", pkg.versionName);
    fields.require("versionCode", pkg.versionCode);
    fields.put("apkName", pkg.apkName);
    fields.put("srcname", pkg.srcname);
    fields.put("hash", pkg.hash);
    fields.put("hashType", pkg.hashType);
    fields.require("size", pkg.size);
    fields.put("minSdkVersion", pkg.minSdkVersion);
    fields.put("targetSdkVersion", pkg.targetSdkVersion);
    fields.put("maxSdkVersion", pkg.maxSdkVersion);
    fields.put("sig", pkg.sig);
    fields.put("signer", pkg.signer);
    fields.put("uses-permission", pkg.usesPermission);
    fields.put("uses-permission-sdk-23", pkg.usesPermissionSdk23);
    fields.put("nativecode", pkg.nativecode);
    fields.put("features", pkg.features);
    fields.put("antiFeatures", pkg.antiFeatures);
    fields.put("obbMainFile", pkg.obbMainFile);
    fields.put("obbMainFileSha256", pkg.obbMainFileSha256);
    fields.put("obbPatchFile", pkg.obbPatchFile);
    fields.put("obbPatchFileSha256", pkg.obbPatchFileSha256);
    fields.putDate("added", pkg.added);

    // name and icon are already on the app
    return out;
}

json FlatIndexBuilder::build(const std::map<std::string, App>& apps,
                             const std::vector<Package>& packages,
                             const RepoDescriptor& repo,
                             const Requests& requests)
{
    json output = json::object();
    output["repo"] = repoToJson(repo);
    json requestLists = json::object();
    SparseObject lists(requestLists);
    lists.put("install", requests.install);
    lists.put("uninstall", requests.uninstall);
    if (!requestLists.empty()) {
        output["requests"] = requestLists;
    }

    json appsList = json::array();
    for (const auto& [appId, app] : apps) {
        appsList.push_back(appToJson(app));
    }
    output["apps"] = appsList;

    json packagesMap = json::object();
    for (const auto& pkg : packages) {
        if (apps.find(pkg.packageName) == apps.end()) {
            continue;
        }
        packagesMap[pkg.packageName].push_back(packageToJson(pkg));
    }
    output["packages"] = packagesMap;

    return output;
}

std::string FlatIndexBuilder::dump(const json& index, bool pretty)
{
    return pretty ? index.dump(2) : index.dump();
}

} // namespace Repodex
