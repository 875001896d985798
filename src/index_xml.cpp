#include "index_xml.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <libxml/tree.h>

namespace fs = std::filesystem;

namespace Repodex {

namespace {

const char* const noDescription = "<p>No description available</p>";
const std::string permissionPrefix = "android.permission.";

using XmlDocument = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

const xmlChar* xml(const std::string& s)
{
    return reinterpret_cast<const xmlChar*>(s.c_str());
}

bool isApk(const std::string& fileName)
{
    return fs::path(fileName).extension() == ".apk";
}

// Text is escaped by libxml2.
xmlNodePtr addElement(xmlNodePtr parent, const std::string& name, const std::string& value)
{
    return xmlNewTextChild(parent, nullptr, xml(name), xml(value));
}

void addElementNonEmpty(xmlNodePtr parent, const std::string& name, const std::string& value)
{
    if (!value.empty()) {
        addElement(parent, name, value);
    }
}

template <typename T>
void addElementIfSet(xmlNodePtr parent, const std::string& name, const std::optional<T>& value)
{
    if (!value) {
        return;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        addElement(parent, name, *value);
    } else {
        addElement(parent, name, std::to_string(*value));
    }
}

void setAttribute(xmlNodePtr node, const std::string& name, const std::string& value)
{
    xmlNewProp(node, xml(name), xml(value));
}

std::vector<std::string> sorted(std::vector<std::string> items)
{
    std::sort(items.begin(), items.end());
    return items;
}

void addPermissions(xmlNodePtr pkgel, const Package& pkg)
{
    std::vector<Permission> permissions = pkg.usesPermission;
    std::sort(permissions.begin(), permissions.end());

    // Older clients only understand the comma separated short names
    std::set<std::string> oldPermissions;
    for (const auto& perm : permissions) {
        std::string name = perm.name;
        if (name.rfind(permissionPrefix, 0) == 0) {
            name = name.substr(permissionPrefix.size());
        }
        oldPermissions.insert(name);
    }
    addElementNonEmpty(pkgel, "permissions",
                       join(std::vector<std::string>(oldPermissions.begin(), oldPermissions.end()), ","));

    for (const auto& perm : permissions) {
        xmlNodePtr permel = xmlNewChild(pkgel, nullptr, xml("uses-permission"), nullptr);
        setAttribute(permel, "name", perm.name);
        if (perm.maxSdkVersion) {
            setAttribute(permel, "maxSdkVersion", std::to_string(*perm.maxSdkVersion));
        }
    }

    std::vector<Permission> permissionsSdk23 = pkg.usesPermissionSdk23;
    std::sort(permissionsSdk23.begin(), permissionsSdk23.end());
    for (const auto& perm : permissionsSdk23) {
        xmlNodePtr permel = xmlNewChild(pkgel, nullptr, xml("uses-permission-sdk-23"), nullptr);
        setAttribute(permel, "name", perm.name);
        if (perm.maxSdkVersion) {
            setAttribute(permel, "maxSdkVersion", std::to_string(*perm.maxSdkVersion));
        }
    }
}

void addPackage(xmlNodePtr apel, const Package& pkg)
{
    xmlNodePtr pkgel = xmlNewChild(apel, nullptr, xml("package"), nullptr);

    addElement(pkgel, "version", pkg.versionName);
    addElement(pkgel, "versioncode", std::to_string(pkg.versionCode));
    addElement(pkgel, "apkname", pkg.apkName);
    addElementIfSet(pkgel, "srcname", pkg.srcname);

    xmlNodePtr hashel = addElement(pkgel, "hash", pkg.hash);
    setAttribute(hashel, "type", pkg.hashType);

    addElement(pkgel, "size", std::to_string(pkg.size));
    addElementIfSet(pkgel, "sdkver", pkg.minSdkVersion);
    addElementIfSet(pkgel, "targetSdkVersion", pkg.targetSdkVersion);
    addElementIfSet(pkgel, "maxsdkver", pkg.maxSdkVersion);
    addElementIfSet(pkgel, "obbMainFile", pkg.obbMainFile);
    addElementIfSet(pkgel, "obbMainFileSha256", pkg.obbMainFileSha256);
    addElementIfSet(pkgel, "obbPatchFile", pkg.obbPatchFile);
    addElementIfSet(pkgel, "obbPatchFileSha256", pkg.obbPatchFileSha256);
    if (pkg.added) {
        addElement(pkgel, "added", formatDate(*pkg.added));
    }

    // Signatures, permissions and ABIs only exist for APKs, not source tarballs
    if (fileExtension(pkg.apkName) != "apk") {
        return;
    }
    addElement(pkgel, "sig", pkg.sig);
    addPermissions(pkgel, pkg);
    addElementNonEmpty(pkgel, "nativecode", join(sorted(pkg.nativecode), ","));
    addElementNonEmpty(pkgel, "features", join(sorted(pkg.features), ","));
}

void addRepo(xmlNodePtr root, const RepoDescriptor& repo)
{
    xmlNodePtr repoel = xmlNewChild(root, nullptr, xml("repo"), nullptr);

    setAttribute(repoel, "name", repo.name);
    if (repo.maxage) {
        setAttribute(repoel, "maxage", std::to_string(*repo.maxage));
    }
    setAttribute(repoel, "icon", fs::path(repo.icon).filename().string());
    setAttribute(repoel, "url", repo.address);
    addElement(repoel, "description", repo.description);
    for (const auto& mirror : repo.mirrors) {
        addElement(repoel, "mirror", mirror);
    }

    setAttribute(repoel, "version", std::to_string(repo.version));
    setAttribute(repoel, "timestamp", std::to_string(repo.timestamp));
    if (!repo.pubkey.empty()) {
        setAttribute(repoel, "pubkey", repo.pubkey);
    }
    if (!repo.fingerprint.empty()) {
        setAttribute(repoel, "fingerprint", repo.fingerprint);
    }
}

} // namespace

LegacyIndex LegacyIndexBuilder::build(const std::map<std::string, App>& apps,
                                      const std::vector<Package>& packages,
                                      const RepoDescriptor& repo,
                                      const Requests& requests,
                                      bool pretty)
{
    LegacyIndex result;
    XmlDocument doc(xmlNewDoc(xml("1.0")), &xmlFreeDoc);
    if (!doc) {
        throw std::runtime_error("Failed to allocate XML document");
    }

    xmlNodePtr root = xmlNewNode(nullptr, xml("fdroid"));
    xmlDocSetRootElement(doc.get(), root);

    addRepo(root, repo);

    for (const auto& appId : requests.install) {
        xmlNodePtr element = xmlNewChild(root, nullptr, xml("install"), nullptr);
        setAttribute(element, "packageName", appId);
    }
    for (const auto& appId : requests.uninstall) {
        xmlNodePtr element = xmlNewChild(root, nullptr, xml("uninstall"), nullptr);
        setAttribute(element, "packageName", appId);
    }

    for (const auto& [appId, app] : apps) {
        if (app.Disabled) {
            continue;
        }

        std::vector<Package> pkglist;
        for (const auto& pkg : packages) {
            if (pkg.packageName == appId) {
                pkglist.push_back(pkg);
            }
        }
        if (pkglist.empty()) {
            continue;
        }

        // Newest first, so clients can show the list as-is
        std::stable_sort(pkglist.begin(), pkglist.end(),
                         [](const Package& a, const Package& b) { return a.versionCode > b.versionCode; });

        for (size_t i = 0; i + 1 < pkglist.size(); ++i) {
            if (pkglist[i].versionCode == pkglist[i + 1].versionCode) {
                std::string message = "duplicate versions for " + appId + ": '"
                                      + pkglist[i].apkName + "' - '" + pkglist[i + 1].apkName + "'";
                log_error(message);
                throw CatalogError(message);
            }
        }

        xmlNodePtr apel = xmlNewChild(root, nullptr, xml("application"), nullptr);
        setAttribute(apel, "id", app.id);

        addElement(apel, "id", app.id);
        if (app.added) {
            addElement(apel, "added", formatDate(*app.added));
        }
        if (app.lastUpdated) {
            addElement(apel, "lastupdated", formatDate(*app.lastUpdated));
        }
        addElement(apel, "name", app.displayName());
        addElement(apel, "summary", app.Summary);
        addElementNonEmpty(apel, "icon", app.icon);
        addElement(apel, "desc", app.Description.empty() ? noDescription : app.Description);
        addElement(apel, "license", app.License);
        if (!app.Categories.empty()) {
            addElement(apel, "categories", join(app.Categories, ","));
            // The primary category goes in last, so clients that only
            // understand one category pick that one.
            addElement(apel, "category", app.Categories.front());
        }
        addElement(apel, "web", app.WebSite);
        addElement(apel, "source", app.SourceCode);
        addElement(apel, "tracker", app.IssueTracker);
        addElementNonEmpty(apel, "changelog", app.Changelog);
        addElementNonEmpty(apel, "author", app.AuthorName);
        addElementNonEmpty(apel, "email", app.AuthorEmail);
        addElementNonEmpty(apel, "donate", app.Donate);
        addElementNonEmpty(apel, "bitcoin", app.Bitcoin);
        addElementNonEmpty(apel, "litecoin", app.Litecoin);
        addElementNonEmpty(apel, "flattr", app.FlattrID);

        // Historically misnamed: these describe the suggested version
        addElement(apel, "marketversion", app.CurrentVersion);
        addElement(apel, "marketvercode", std::to_string(app.CurrentVersionCode));

        if (!app.Provides.empty()) {
            addElementNonEmpty(apel, "provides", join(split(app.Provides, ','), ","));
        }
        if (app.RequiresRoot) {
            addElement(apel, "requirements", "root");
        }

        std::vector<std::string> antiFeatures = app.AntiFeatures;
        for (const auto& feature : pkglist.front().antiFeatures) {
            if (std::find(antiFeatures.begin(), antiFeatures.end(), feature) == antiFeatures.end()) {
                antiFeatures.push_back(feature);
            }
        }
        addElementNonEmpty(apel, "antifeatures", join(antiFeatures, ","));

        for (const auto& pkg : pkglist) {
            // Links are always named .apk, so other build outputs are skipped
            if (pkg.versionCode == app.CurrentVersionCode && isApk(pkg.apkName)) {
                result.currentVersionFiles.push_back({appId, pkg.apkName});
            }
            addPackage(apel, pkg);
        }
    }

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc.get(), &buffer, &size, "UTF-8", pretty ? 1 : 0);
    if (!buffer) {
        throw std::runtime_error("Failed to serialize index.xml");
    }
    result.xml.assign(reinterpret_cast<const char*>(buffer), static_cast<size_t>(size));
    xmlFree(buffer);

    return result;
}

} // namespace Repodex
