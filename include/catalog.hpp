#ifndef CATALOG_HPP
#define CATALOG_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <ctime>

namespace Repodex {

/**
 * @brief A permission requested by a package, optionally limited to
 *        devices up to `maxSdkVersion`.
 */
struct Permission
{
    std::string name;
    std::optional<int> maxSdkVersion;

    bool operator<(const Permission& other) const;
    bool operator==(const Permission& other) const;
};

/**
 * @struct Package
 * @brief One build of an application as published in the repository.
 *
 * `name` and `icon` are display data copied from the app; the flat index
 * strips them from package records.
 */
struct Package
{
    std::string packageName;
    std::string versionName;
    int64_t versionCode = 0;
    std::string apkName;
    std::optional<std::string> srcname;
    std::string hash;
    std::string hashType = "sha256";
    uint64_t size = 0;
    std::optional<int> minSdkVersion;
    std::optional<int> targetSdkVersion;
    std::optional<int> maxSdkVersion;
    std::string sig;
    std::string signer;
    std::vector<Permission> usesPermission;
    std::vector<Permission> usesPermissionSdk23;
    std::vector<std::string> nativecode;
    std::vector<std::string> features;
    std::vector<std::string> antiFeatures;
    std::optional<std::string> obbMainFile;
    std::optional<std::string> obbMainFileSha256;
    std::optional<std::string> obbPatchFile;
    std::optional<std::string> obbPatchFileSha256;
    std::optional<std::time_t> added;

    std::string name;
    std::string icon;
};

/**
 * @struct App
 * @brief Metadata of one application in the catalog.
 *
 * Field names follow the repository metadata format. The bookkeeping
 * fields at the end are used by the build tooling and are never published.
 */
struct App
{
    std::string id;
    std::string Name;
    std::string AutoName;
    std::string Summary;
    std::string Description;
    std::string License;
    std::vector<std::string> Categories;
    std::string WebSite;
    std::string SourceCode;
    std::string IssueTracker;
    std::string Changelog;
    std::string AuthorName;
    std::string AuthorEmail;
    std::string Donate;
    std::string Bitcoin;
    std::string Litecoin;
    std::string FlattrID;
    std::optional<std::string> Disabled;
    std::vector<std::string> AntiFeatures;
    std::string CurrentVersion;
    int64_t CurrentVersionCode = 0;
    std::string Provides;
    bool RequiresRoot = false;
    std::string icon;
    std::optional<std::time_t> added;
    std::optional<std::time_t> lastUpdated;

    // Build tooling bookkeeping
    std::vector<std::string> builds;
    std::map<std::string, std::string> comments;
    std::string metadatapath;
    std::string ArchivePolicy;
    std::string AutoUpdateMode;
    std::string MaintainerNotes;
    std::string Repo;
    std::string RepoType;
    std::string UpdateCheckData;
    std::string UpdateCheckIgnore;
    std::string UpdateCheckMode;
    std::string UpdateCheckName;
    std::string NoSourceSince;
    std::string VercodeOperation;

    /**
     * @return `Name`, or the name scanned from the APK when `Name` is empty.
     */
    std::string displayName() const;

    /**
     * @brief Looks up a textual field by its metadata name (e.g. "Name",
     *        "AutoName", "id"). Used to derive the current version link name.
     *
     * @throws ConfigError if the field is unknown or not textual.
     */
    std::string field(const std::string& fieldName) const;

    /**
     * @return Whether field() accepts `fieldName`.
     */
    static bool isTextField(const std::string& fieldName);
};

/**
 * @brief Repository-level metadata shared by both index formats.
 */
struct RepoDescriptor
{
    std::string name;
    std::string icon;
    std::string address;
    std::string description;
    std::time_t timestamp = 0;
    int version = 0;
    std::optional<int> maxage;
    std::vector<std::string> mirrors;

    // Only known after verifying a downloaded index
    std::string pubkey;
    std::string fingerprint;
};

/**
 * @brief App ids the repository asks clients to install or uninstall.
 */
struct Requests
{
    std::vector<std::string> install;
    std::vector<std::string> uninstall;
};

/**
 * @class Catalog
 * @brief The resolved input of an index run: every app keyed by id and
 *        every package build, in the order they were scanned.
 */
class Catalog
{
public:
    std::map<std::string, App> apps;
    std::vector<Package> packages;

    /**
     * @brief Loads an already-resolved catalog from a YAML file with an
     *        `apps` map and a `packages` list.
     *
     * @throws ConfigError if the file is missing or malformed.
     */
    static Catalog loadFromFile(const std::string& path);

    /**
     * @return All packages belonging to `appId`, in catalog order.
     */
    std::vector<Package> packagesFor(const std::string& appId) const;
};

/**
 * @brief A parsed, verified flat index.
 */
struct RepoIndex
{
    RepoDescriptor repo;
    Requests requests;
    std::vector<App> apps;
    std::map<std::string, std::vector<Package>> packages;
};

} // namespace Repodex

#endif // CATALOG_HPP
