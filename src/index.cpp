#include "index.hpp"
#include "description.hpp"
#include "errors.hpp"
#include "index_json.hpp"
#include "index_xml.hpp"
#include "jar.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Repodex {

namespace {

// Version of the index format understood by clients
const int indexFormatVersion = 19;

// Last path segment of a URL, "" when the path ends in a slash
std::string urlBaseName(const std::string& url)
{
    std::string path;
    try {
        path = parseUrl(url).path;
    } catch (const std::invalid_argument&) {
        return "";
    }
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

IndexAssembler::IndexAssembler(const Config& config, SigningGateway& signer, IndexOptions options)
    : config_(config), signer_(signer), options_(options)
{
}

std::optional<std::string> IndexAssembler::mirrorServiceUrl(const std::string& url)
{
    std::string https = url;
    if (https.rfind("git@", 0) == 0) {
        size_t colon = https.find(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        https = "https://" + https.substr(4, colon - 4) + "/" + https.substr(colon + 1);
    }

    // "https:", "", host, user, repo
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t slash = https.find('/', start);
        segments.push_back(https.substr(start, slash - start));
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    if (segments.size() < 5) {
        return std::nullopt;
    }

    std::string& repo = segments[4];
    if (repo.size() > 4 && repo.compare(repo.size() - 4, 4, ".git") == 0) {
        repo.resize(repo.size() - 4);
    }

    const std::string& host = segments[2];
    const std::string& user = segments[3];
    if (host == "github.com") {
        segments[2] = "raw.githubusercontent.com";
        segments.push_back("master");
        segments.push_back("fdroid");
        return join(segments, "/");
    }
    if (host == "gitlab.com") {
        return "https://" + user + ".gitlab.io/" + repo + "/fdroid";
    }
    return std::nullopt;
}

std::vector<std::string> IndexAssembler::buildMirrors(const Config& config, bool archive)
{
    const RepoProfile& profile = archive ? config.archive : config.repo;
    std::string urlBasePath = urlBaseName(profile.url);

    std::vector<std::string> sorted = config.mirrors;
    std::sort(sorted.begin(), sorted.end());

    std::vector<std::string> mirrors;
    std::vector<std::string> invalid;
    for (const auto& mirror : sorted) {
        std::string path;
        try {
            path = parseUrl(mirror).path;
        } catch (const std::invalid_argument& e) {
            log_error("mirror '" + mirror + "' is not a valid URL: " + e.what());
            invalid.push_back(mirror);
            continue;
        }
        while (!path.empty() && path.back() == '/') {
            path.pop_back();
        }
        std::string base = path.substr(path.rfind('/') == std::string::npos ? 0 : path.rfind('/') + 1);
        if (!config.nonStandardWebroot && base != "fdroid") {
            log_error("mirror '" + mirror + "' does not end with 'fdroid'!");
            invalid.push_back(mirror);
            continue;
        }
        mirrors.push_back((mirror.back() == '/' ? mirror : mirror + "/") + urlBasePath);
    }

    for (const auto& gitMirror : config.serverGitMirrors) {
        auto url = mirrorServiceUrl(gitMirror);
        if (url) {
            mirrors.push_back(*url + "/");
        }
    }

    if (!invalid.empty()) {
        throw ConfigError("Invalid mirrors: " + join(invalid, ", "));
    }
    return mirrors;
}

Requests IndexAssembler::requests(const Config& config)
{
    return Requests{config.installList, config.uninstallList};
}

std::map<std::string, App> IndexAssembler::eligibleApps(const Catalog& catalog)
{
    LinkResolver resolver = [&catalog](const std::string& appId) {
        auto it = catalog.apps.find(appId);
        if (it == catalog.apps.end()) {
            throw CatalogError("Cannot resolve app id " + appId);
        }
        return std::make_pair("fdroid.app:" + appId, it->second.displayName());
    };

    std::map<std::string, App> eligible;
    for (const auto& [appId, app] : catalog.apps) {
        if (app.Disabled) {
            continue;
        }
        bool hasPackage = std::any_of(catalog.packages.begin(), catalog.packages.end(),
                                      [&](const Package& pkg) { return pkg.packageName == appId; });
        if (!hasPackage) {
            continue;
        }
        App published = app;
        published.Description = DescriptionFormatter::toHtml(app.Description, resolver);
        eligible.emplace(appId, std::move(published));
    }
    return eligible;
}

void IndexAssembler::checkSigningKey() const
{
    std::vector<std::string> missing;
    if (!config_.repoKeyAlias) {
        missing.push_back("'repo_keyalias' not found in config");
    }
    if (!config_.keystore) {
        missing.push_back("'keystore' not found in config");
    }
    if (!config_.keystorePass) {
        missing.push_back("'keystorepass' not found in config");
    }
    if (!config_.keyPass) {
        missing.push_back("'keypass' not found in config");
    }
    // "NONE" selects a smartcard
    if (config_.keystore && *config_.keystore != "NONE" && !fs::exists(*config_.keystore)) {
        missing.push_back("'" + *config_.keystore + "' does not exist");
    }

    if (missing.empty()) {
        return;
    }
    for (const auto& problem : missing) {
        log_error(problem);
    }
    log_warning("Updating the index requires a signing key; use --nosign to skip signing");
    throw ConfigError("No usable signing key: " + join(missing, "; "));
}

RepoDescriptor IndexAssembler::describe(bool archive) const
{
    const RepoProfile& profile = archive ? config_.archive : config_.repo;

    RepoDescriptor repo;
    repo.timestamp   = std::time(nullptr);
    repo.version     = indexFormatVersion;
    repo.name        = profile.name;
    repo.icon        = fs::path(profile.icon).filename().string();
    repo.address     = profile.url;
    repo.description = profile.description;
    if (config_.repoMaxAge != 0) {
        repo.maxage = config_.repoMaxAge;
    }
    repo.mirrors = buildMirrors(config_, archive);
    return repo;
}

void IndexAssembler::make(const Catalog& catalog, const fs::path& repodir, bool archive)
{
    if (!options_.nosign) {
        checkSigningKey();
    }
    if (!archive && config_.makeCurrentVersionLink && !App::isTextField(config_.currentVersionNameSource)) {
        throw ConfigError("Unknown app field for current version link: " + config_.currentVersionNameSource);
    }

    RepoDescriptor repo = describe(archive);
    if (!options_.nosign || config_.repoPubkey || config_.repoKeyAlias) {
        std::string certificate = signer_.publicCertificate();
        repo.pubkey      = hexEncode(certificate);
        repo.fingerprint = Jar::certificateFingerprint(certificate);
    }

    std::map<std::string, App> apps = eligibleApps(catalog);
    Requests requested = requests(config_);

    // Render both documents before touching the repo directory
    LegacyIndex legacy = LegacyIndexBuilder::build(apps, catalog.packages, repo, requested, options_.pretty);
    std::string flat   = FlatIndexBuilder::dump(
        FlatIndexBuilder::build(apps, catalog.packages, repo, requested), options_.pretty);

    fs::create_directories(repodir);

    fs::path indexXml = repodir / "index.xml";
    writeFile(indexXml, legacy.xml);
    if (options_.nosign) {
        log_message("Creating unsigned index in preparation for signing");
        writeJar(repodir / "index_unsigned.jar", indexXml, repo.timestamp);
        fs::path signedJar = repodir / "index.jar";
        if (fs::exists(signedJar)) {
            fs::remove(signedJar);
        }
    } else {
        log_message("Creating signed index with this key (SHA256):");
        log_message(repo.fingerprint);
        writeJar(repodir / "index.jar", indexXml, repo.timestamp);
    }

    fs::path indexJson = repodir / "index-v1.json";
    writeFile(indexJson, flat);
    if (!options_.nosign) {
        writeJar(repodir / "index-v1.jar", indexJson, repo.timestamp);
    }

    if (!archive && config_.makeCurrentVersionLink) {
        linkCurrentVersions(legacy.currentVersionFiles, apps, repodir);
    }

    copyIcon(archive ? config_.archive : config_.repo, repodir);
    log_message("Finished writing the index of " + repodir.string());
}

void IndexAssembler::writeJar(const fs::path& jarPath, const fs::path& source, std::time_t mtime)
{
    Jar::create(jarPath.string(), {{source.filename().string(), readFile(source)}}, mtime);
    if (!options_.nosign) {
        signer_.signJar(jarPath.string());
    }
}

void IndexAssembler::linkCurrentVersions(const std::vector<CurrentVersionFile>& files,
                                         const std::map<std::string, App>& apps,
                                         const fs::path& repodir) const
{
    fs::path absolute = fs::absolute(repodir);
    fs::path linkDir  = absolute.parent_path();

    for (const auto& file : files) {
        const App& app = apps.at(file.appId);
        std::string linkName = sanitizeFileName(app.field(config_.currentVersionNameSource)) + ".apk";
        if (linkName == ".apk") {
            log_warning("No " + config_.currentVersionNameSource + " for " + app.id
                        + ", not linking its current version");
            continue;
        }

        fs::path target = absolute.filename() / file.apkName;
        replaceSymlink(target, linkDir / linkName);

        // Detached signatures of the package follow the link
        for (const char* extension : {".asc", ".sig"}) {
            if (fs::exists(absolute / (file.apkName + extension))) {
                replaceSymlink(target.string() + extension, linkDir / (linkName + extension));
            }
        }
    }
}

void IndexAssembler::copyIcon(const RepoProfile& profile, const fs::path& repodir) const
{
    fs::path icon(profile.icon);
    if (!fs::exists(icon)) {
        log_warning("Repository icon " + icon.string() + " not found, not copying it");
        return;
    }
    fs::path iconDir = repodir / "icons";
    fs::create_directories(iconDir);
    fs::copy_file(icon, iconDir / icon.filename(), fs::copy_options::overwrite_existing);
}

} // namespace Repodex
