#ifndef INDEX_JSON_HPP
#define INDEX_JSON_HPP

#include "catalog.hpp"

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Repodex {

/**
 * @class FlatIndexBuilder
 * @brief Renders a catalog into the index-v1.json document.
 *
 * Keys follow the client's lowerCamelCase naming. Empty strings and lists,
 * false flags and unset optionals are left out entirely.
 */
class FlatIndexBuilder
{
public:
    /**
     * @brief Builds the document with the top-level keys "repo", "requests",
     *        "apps" and "packages".
     *
     * Packages are grouped by app id in catalog order; packages of apps not
     * in `apps` are not published.
     */
    static nlohmann::json build(const std::map<std::string, App>& apps,
                                const std::vector<Package>& packages,
                                const RepoDescriptor& repo,
                                const Requests& requests);

    /**
     * @brief Serializes the document; `pretty` indents with two spaces.
     */
    static std::string dump(const nlohmann::json& index, bool pretty);

    static nlohmann::json appToJson(const App& app);
    static nlohmann::json packageToJson(const Package& pkg);
};

} // namespace Repodex

#endif // INDEX_JSON_HPP
