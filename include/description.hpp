#ifndef DESCRIPTION_HPP
#define DESCRIPTION_HPP

#include <functional>
#include <string>
#include <utility>

namespace Repodex {

/**
 * @brief Maps an app id referenced as [[app.id]] to (link target, link text).
 *        Throws CatalogError when the id is not in the catalog.
 */
using LinkResolver = std::function<std::pair<std::string, std::string>(const std::string&)>;

/**
 * @class DescriptionFormatter
 * @brief Renders the description markup used in app metadata to HTML.
 *
 * Paragraphs are separated by blank lines. Lines starting with "* " or
 * "# " form bulleted and numbered lists. Inline markup: '''bold''',
 * ''italic'', [[app.id]] for links to other apps in the catalog, and
 * [http://url text] for external links.
 */
class DescriptionFormatter
{
public:
    static std::string toHtml(const std::string& text, const LinkResolver& resolver);

private:
    static std::string formatInline(const std::string& text, const LinkResolver& resolver);
    static std::string escape(const std::string& text);
};

} // namespace Repodex

#endif // DESCRIPTION_HPP
