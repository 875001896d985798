#ifndef INDEX_HPP
#define INDEX_HPP

#include "catalog.hpp"
#include "config.hpp"
#include "index_xml.hpp"
#include "signing.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Repodex {

/**
 * @brief Command line switches that change how an index run behaves.
 */
struct IndexOptions
{
    // Write index_unsigned.jar and skip every signing step
    bool nosign = false;
    bool pretty = false;
};

/**
 * @class IndexAssembler
 * @brief Produces the published index files of one repository directory.
 *
 * A run validates the configuration, renders the legacy XML and the flat
 * JSON documents from the same catalog and only then writes and signs the
 * files, so a failure leaves the previous index untouched.
 */
class IndexAssembler
{
public:
    IndexAssembler(const Config& config, SigningGateway& signer, IndexOptions options);

    /**
     * @brief Generates index.xml, index.jar, index-v1.json and index-v1.jar
     *        in `repodir`.
     *
     * @param archive Use the archive profile and skip current version links.
     * @throws ConfigError, CatalogError or SigningError. Nothing is written
     *         when configuration or catalog checks fail.
     */
    void make(const Catalog& catalog, const std::filesystem::path& repodir, bool archive);

    /**
     * @brief Translates a git remote of a `servergitmirrors` entry into the
     *        URL the hosting service serves the mirrored repo from. Returns
     *        nothing for unsupported hosts.
     */
    static std::optional<std::string> mirrorServiceUrl(const std::string& url);

    /**
     * @brief The mirror list published in the repo descriptor.
     *
     * @throws ConfigError naming every mirror that does not end in "fdroid"
     *         unless `nonstandardwebroot` is set.
     */
    static std::vector<std::string> buildMirrors(const Config& config, bool archive);

    /**
     * @brief Install and uninstall requests from the configuration.
     */
    static Requests requests(const Config& config);

    /**
     * @brief Enabled apps with at least one package, descriptions rendered
     *        to HTML.
     *
     * @throws CatalogError if a description links to an unknown app.
     */
    static std::map<std::string, App> eligibleApps(const Catalog& catalog);

private:
    void checkSigningKey() const;
    RepoDescriptor describe(bool archive) const;
    void writeJar(const std::filesystem::path& jarPath,
                  const std::filesystem::path& source,
                  std::time_t mtime);
    void linkCurrentVersions(const std::vector<CurrentVersionFile>& files,
                             const std::map<std::string, App>& apps,
                             const std::filesystem::path& repodir) const;
    void copyIcon(const RepoProfile& profile, const std::filesystem::path& repodir) const;

    const Config& config_;
    SigningGateway& signer_;
    IndexOptions options_;
};

} // namespace Repodex

#endif // INDEX_HPP
