#include "catalog.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <filesystem>
#include <tuple>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Repodex {

namespace {

std::string readString(const YAML::Node& node, const char* key)
{
    return node[key] ? node[key].as<std::string>() : std::string();
}

std::optional<std::string> readOptionalString(const YAML::Node& node, const char* key)
{
    if (!node[key] || node[key].IsNull()) {
        return std::nullopt;
    }
    return node[key].as<std::string>();
}

std::optional<int> readOptionalInt(const YAML::Node& node, const char* key)
{
    if (!node[key] || node[key].IsNull()) {
        return std::nullopt;
    }
    return node[key].as<int>();
}

std::optional<std::time_t> readOptionalDate(const YAML::Node& node, const char* key)
{
    if (!node[key] || node[key].IsNull()) {
        return std::nullopt;
    }
    return parseDate(node[key].as<std::string>());
}

// Accepts either a scalar ("a,b") or a sequence.
std::vector<std::string> readList(const YAML::Node& node, const char* key)
{
    std::vector<std::string> items;
    if (!node[key] || node[key].IsNull()) {
        return items;
    }
    if (node[key].IsScalar()) {
        return split(node[key].as<std::string>(), ',');
    }
    for (const auto& item : node[key]) {
        items.push_back(item.as<std::string>());
    }
    return items;
}

// Permissions are written either as "name", [name, maxSdk] or
// {name: ..., maxSdkVersion: ...}.
std::vector<Permission> readPermissions(const YAML::Node& node, const char* key)
{
    std::vector<Permission> permissions;
    if (!node[key]) {
        return permissions;
    }
    for (const auto& item : node[key]) {
        Permission permission;
        if (item.IsScalar()) {
            permission.name = item.as<std::string>();
        } else if (item.IsSequence()) {
            permission.name = item[0].as<std::string>();
            if (item.size() > 1 && !item[1].IsNull()) {
                permission.maxSdkVersion = item[1].as<int>();
            }
        } else {
            permission.name = item["name"].as<std::string>();
            permission.maxSdkVersion = readOptionalInt(item, "maxSdkVersion");
        }
        permissions.push_back(permission);
    }
    return permissions;
}

App parseApp(const std::string& id, const YAML::Node& node)
{
    App app;
    app.id                 = id;
    app.Name               = readString(node, "Name");
    app.AutoName           = readString(node, "AutoName");
    app.Summary            = readString(node, "Summary");
    app.Description        = readString(node, "Description");
    app.License            = readString(node, "License");
    app.Categories         = readList(node, "Categories");
    app.WebSite            = readString(node, "WebSite");
    app.SourceCode         = readString(node, "SourceCode");
    app.IssueTracker       = readString(node, "IssueTracker");
    app.Changelog          = readString(node, "Changelog");
    app.AuthorName         = readString(node, "AuthorName");
    app.AuthorEmail        = readString(node, "AuthorEmail");
    app.Donate             = readString(node, "Donate");
    app.Bitcoin            = readString(node, "Bitcoin");
    app.Litecoin           = readString(node, "Litecoin");
    app.FlattrID           = readString(node, "FlattrID");
    app.Disabled           = readOptionalString(node, "Disabled");
    app.AntiFeatures       = readList(node, "AntiFeatures");
    app.CurrentVersion     = readString(node, "CurrentVersion");
    app.CurrentVersionCode = node["CurrentVersionCode"] ? node["CurrentVersionCode"].as<int64_t>() : 0;
    app.Provides           = readString(node, "Provides");
    app.RequiresRoot       = node["RequiresRoot"] && node["RequiresRoot"].as<bool>();
    app.icon               = readString(node, "icon");
    app.added              = readOptionalDate(node, "added");
    app.lastUpdated        = readOptionalDate(node, "lastUpdated");

    app.builds             = readList(node, "builds");
    if (node["comments"] && node["comments"].IsMap()) {
        for (const auto& comment : node["comments"]) {
            app.comments[comment.first.as<std::string>()] = comment.second.as<std::string>();
        }
    }
    app.metadatapath       = readString(node, "metadatapath");
    app.ArchivePolicy      = readString(node, "ArchivePolicy");
    app.AutoUpdateMode     = readString(node, "AutoUpdateMode");
    app.MaintainerNotes    = readString(node, "MaintainerNotes");
    app.Repo               = readString(node, "Repo");
    app.RepoType           = readString(node, "RepoType");
    app.UpdateCheckData    = readString(node, "UpdateCheckData");
    app.UpdateCheckIgnore  = readString(node, "UpdateCheckIgnore");
    app.UpdateCheckMode    = readString(node, "UpdateCheckMode");
    app.UpdateCheckName    = readString(node, "UpdateCheckName");
    app.NoSourceSince      = readString(node, "NoSourceSince");
    app.VercodeOperation   = readString(node, "VercodeOperation");
    return app;
}

Package parsePackage(const YAML::Node& node)
{
    Package pkg;
    pkg.packageName         = node["packageName"].as<std::string>();
    pkg.versionName         = readString(node, "versionName");
    pkg.versionCode         = node["versionCode"].as<int64_t>();
    pkg.apkName             = node["apkName"].as<std::string>();
    pkg.srcname             = readOptionalString(node, "srcname");
    pkg.hash                = readString(node, "hash");
    if (node["hashType"]) {
        pkg.hashType        = node["hashType"].as<std::string>();
    }
    pkg.size                = node["size"] ? node["size"].as<uint64_t>() : 0;
    pkg.minSdkVersion       = readOptionalInt(node, "minSdkVersion");
    pkg.targetSdkVersion    = readOptionalInt(node, "targetSdkVersion");
    pkg.maxSdkVersion       = readOptionalInt(node, "maxSdkVersion");
    pkg.sig                 = readString(node, "sig");
    pkg.signer              = readString(node, "signer");
    pkg.usesPermission      = readPermissions(node, "uses-permission");
    pkg.usesPermissionSdk23 = readPermissions(node, "uses-permission-sdk-23");
    pkg.nativecode          = readList(node, "nativecode");
    pkg.features            = readList(node, "features");
    pkg.antiFeatures        = readList(node, "antiFeatures");
    pkg.obbMainFile         = readOptionalString(node, "obbMainFile");
    pkg.obbMainFileSha256   = readOptionalString(node, "obbMainFileSha256");
    pkg.obbPatchFile        = readOptionalString(node, "obbPatchFile");
    pkg.obbPatchFileSha256  = readOptionalString(node, "obbPatchFileSha256");
    pkg.added               = readOptionalDate(node, "added");
    pkg.name                = readString(node, "name");
    pkg.icon                = readString(node, "icon");
    return pkg;
}

} // namespace

bool Permission::operator<(const Permission& other) const
{
    // An unset maxSdkVersion sorts first
    return std::tie(name, maxSdkVersion) < std::tie(other.name, other.maxSdkVersion);
}

bool Permission::operator==(const Permission& other) const
{
    return name == other.name && maxSdkVersion == other.maxSdkVersion;
}

std::string App::displayName() const
{
    return Name.empty() ? AutoName : Name;
}

namespace {

const std::map<std::string, std::string App::*>& textFields()
{
    static const std::map<std::string, std::string App::*> fields = {
        {"id", &App::id},
        {"Name", &App::Name},
        {"AutoName", &App::AutoName},
        {"Summary", &App::Summary},
        {"License", &App::License},
        {"WebSite", &App::WebSite},
        {"SourceCode", &App::SourceCode},
        {"IssueTracker", &App::IssueTracker},
        {"AuthorName", &App::AuthorName},
        {"CurrentVersion", &App::CurrentVersion},
    };
    return fields;
}

} // namespace

bool App::isTextField(const std::string& fieldName)
{
    return textFields().count(fieldName) != 0;
}

std::string App::field(const std::string& fieldName) const
{
    auto it = textFields().find(fieldName);
    if (it == textFields().end()) {
        throw ConfigError("Unknown app field for current version link: " + fieldName);
    }
    return this->*(it->second);
}

Catalog Catalog::loadFromFile(const std::string& path)
{
    if (!fs::exists(path)) {
        throw ConfigError("Catalog file not found: " + path);
    }

    Catalog catalog;
    try {
        YAML::Node root = YAML::LoadFile(path);

        if (root["apps"]) {
            for (const auto& entry : root["apps"]) {
                std::string id = entry.first.as<std::string>();
                catalog.apps[id] = parseApp(id, entry.second);
            }
        }
        if (root["packages"]) {
            for (const auto& entry : root["packages"]) {
                catalog.packages.push_back(parsePackage(entry));
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse catalog " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Failed to parse catalog " + path + ": " + e.what());
    }

    log_message("Loaded " + std::to_string(catalog.apps.size()) + " apps and "
                + std::to_string(catalog.packages.size()) + " packages from " + path);
    return catalog;
}

std::vector<Package> Catalog::packagesFor(const std::string& appId) const
{
    std::vector<Package> result;
    for (const auto& pkg : packages) {
        if (pkg.packageName == appId) {
            result.push_back(pkg);
        }
    }
    return result;
}

} // namespace Repodex
