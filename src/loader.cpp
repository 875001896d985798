#include "loader.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace Repodex {

namespace {

std::time_t fromMillis(const json& value)
{
    return static_cast<std::time_t>(value.get<int64_t>() / 1000);
}

template <typename T>
void readField(const json& object, const char* key, T& target)
{
    auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

template <typename T>
void readField(const json& object, const char* key, std::optional<T>& target)
{
    auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void readDate(const json& object, const char* key, std::optional<std::time_t>& target)
{
    auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        target = fromMillis(*it);
    }
}

std::vector<Permission> readPermissions(const json& object, const char* key)
{
    std::vector<Permission> permissions;
    auto it = object.find(key);
    if (it == object.end()) {
        return permissions;
    }
    for (const auto& pair : *it) {
        Permission perm;
        perm.name = pair.at(0).get<std::string>();
        if (pair.size() > 1 && !pair.at(1).is_null()) {
            perm.maxSdkVersion = pair.at(1).get<int>();
        }
        permissions.push_back(perm);
    }
    return permissions;
}

RepoDescriptor loadRepo(const json& object)
{
    RepoDescriptor repo;
    readField(object, "name", repo.name);
    readField(object, "icon", repo.icon);
    readField(object, "address", repo.address);
    readField(object, "description", repo.description);
    if (object.contains("timestamp")) {
        repo.timestamp = fromMillis(object.at("timestamp"));
    }
    readField(object, "version", repo.version);
    readField(object, "maxage", repo.maxage);
    readField(object, "mirrors", repo.mirrors);
    return repo;
}

App loadApp(const json& object)
{
    App app;
    readField(object, "packageName", app.id);
    readField(object, "name", app.Name);
    readField(object, "summary", app.Summary);
    readField(object, "description", app.Description);
    readField(object, "license", app.License);
    readField(object, "categories", app.Categories);
    readField(object, "webSite", app.WebSite);
    readField(object, "sourceCode", app.SourceCode);
    readField(object, "issueTracker", app.IssueTracker);
    readField(object, "changelog", app.Changelog);
    readField(object, "authorName", app.AuthorName);
    readField(object, "authorEmail", app.AuthorEmail);
    readField(object, "donate", app.Donate);
    readField(object, "bitcoin", app.Bitcoin);
    readField(object, "litecoin", app.Litecoin);
    readField(object, "flattrID", app.FlattrID);
    readField(object, "disabled", app.Disabled);
    readField(object, "antiFeatures", app.AntiFeatures);
    readField(object, "suggestedVersionName", app.CurrentVersion);
    readField(object, "icon", app.icon);
    readDate(object, "added", app.added);
    readDate(object, "lastUpdated", app.lastUpdated);

    // Older servers publish the code as a number
    auto code = object.find("suggestedVersionCode");
    if (code != object.end()) {
        app.CurrentVersionCode = code->is_string() ? std::stoll(code->get<std::string>())
                                                   : code->get<int64_t>();
    }
    return app;
}

Package loadPackage(const json& object)
{
    Package pkg;
    readField(object, "packageName", pkg.packageName);
    readField(object, "versionName", pkg.versionName);
    readField(object, "versionCode", pkg.versionCode);
    readField(object, "apkName", pkg.apkName);
    readField(object, "srcname", pkg.srcname);
    readField(object, "hash", pkg.hash);
    readField(object, "hashType", pkg.hashType);
    readField(object, "size", pkg.size);
    readField(object, "minSdkVersion", pkg.minSdkVersion);
    readField(object, "targetSdkVersion", pkg.targetSdkVersion);
    readField(object, "maxSdkVersion", pkg.maxSdkVersion);
    readField(object, "sig", pkg.sig);
    readField(object, "signer", pkg.signer);
    pkg.usesPermission      = readPermissions(object, "uses-permission");
    pkg.usesPermissionSdk23 = readPermissions(object, "uses-permission-sdk-23");
    readField(object, "nativecode", pkg.nativecode);
    readField(object, "features", pkg.features);
    readField(object, "antiFeatures", pkg.antiFeatures);
    readField(object, "obbMainFile", pkg.obbMainFile);
    readField(object, "obbMainFileSha256", pkg.obbMainFileSha256);
    readField(object, "obbPatchFile", pkg.obbPatchFile);
    readField(object, "obbPatchFileSha256", pkg.obbPatchFileSha256);
    readDate(object, "added", pkg.added);
    return pkg;
}

} // namespace

RepoIndex IndexLoader::load(const std::string& jsonText,
                            const std::string& pubkeyDer,
                            const std::string& fingerprint)
{
    RepoIndex index;
    try {
        json data = json::parse(jsonText);
        if (!data.is_object() || !data.contains("repo")) {
            throw VerificationError("Index has no repo section");
        }

        index.repo = loadRepo(data.at("repo"));

        if (data.contains("requests")) {
            const json& requests = data.at("requests");
            readField(requests, "install", index.requests.install);
            readField(requests, "uninstall", index.requests.uninstall);
        }

        if (data.contains("apps")) {
            for (const auto& app : data.at("apps")) {
                index.apps.push_back(loadApp(app));
            }
        }

        if (data.contains("packages")) {
            for (const auto& item : data.at("packages").items()) {
                auto& packages = index.packages[item.key()];
                for (const auto& pkg : item.value()) {
                    packages.push_back(loadPackage(pkg));
                }
            }
        }
    } catch (const json::exception& e) {
        throw VerificationError(std::string("Malformed index: ") + e.what());
    } catch (const std::logic_error& e) {
        // std::stoll on a non-numeric suggestedVersionCode
        throw VerificationError(std::string("Malformed index: ") + e.what());
    }

    index.repo.pubkey      = hexEncode(pubkeyDer);
    index.repo.fingerprint = fingerprint;
    return index;
}

} // namespace Repodex
