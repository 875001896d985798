#ifndef INDEX_XML_HPP
#define INDEX_XML_HPP

#include "catalog.hpp"

#include <map>
#include <string>
#include <vector>

namespace Repodex {

/**
 * @brief The APK of an app whose version code equals the app's
 *        declared CurrentVersionCode.
 */
struct CurrentVersionFile
{
    std::string appId;
    std::string apkName;
};

/**
 * @brief Output of the legacy builder: the serialized document and the
 *        current version files found while building it.
 */
struct LegacyIndex
{
    std::string xml;
    std::vector<CurrentVersionFile> currentVersionFiles;
};

/**
 * @class LegacyIndexBuilder
 * @brief Renders a catalog into the legacy index.xml document.
 */
class LegacyIndexBuilder
{
public:
    /**
     * @brief Builds the XML index.
     *
     * Apps are emitted in id order. The packages of each app are emitted
     * newest first; two packages with the same version code abort the build.
     * `repo.pubkey` and `repo.fingerprint` are emitted as attributes of the
     * repo element when set.
     *
     * @param apps     Apps to publish, keyed by id, descriptions already rendered.
     * @param packages All package builds; those of unlisted apps are ignored.
     * @param repo     Repository descriptor.
     * @param requests Install/uninstall requests.
     * @param pretty   Indent the output.
     * @throws CatalogError on duplicate version codes.
     */
    static LegacyIndex build(const std::map<std::string, App>& apps,
                             const std::vector<Package>& packages,
                             const RepoDescriptor& repo,
                             const Requests& requests,
                             bool pretty = false);
};

} // namespace Repodex

#endif // INDEX_XML_HPP
