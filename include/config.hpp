#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include <optional>

namespace Repodex {

/**
 * @brief Name, icon, address and description of one repository profile.
 */
struct RepoProfile
{
    std::string url;
    std::string name;
    std::string icon = "fdroid-icon.png";
    std::string description;
};

/**
 * @class Config
 * @brief Repository configuration, loaded once and passed by const
 *        reference to everything that needs it.
 */
class Config
{
public:
    RepoProfile repo;
    RepoProfile archive;

    /**
     * @brief Age in days after which clients treat the index as stale;
     *        0 disables it.
     */
    int repoMaxAge = 0;

    std::vector<std::string> mirrors;
    std::vector<std::string> serverGitMirrors;

    /**
     * @brief Allows mirrors whose path does not end in "fdroid".
     */
    bool nonStandardWebroot = false;

    std::vector<std::string> installList;
    std::vector<std::string> uninstallList;

    bool makeCurrentVersionLink = true;
    std::string currentVersionNameSource = "Name";

    // Signing credentials
    std::optional<std::string> repoKeyAlias;
    std::optional<std::string> keystore;
    std::optional<std::string> keystorePass;
    std::optional<std::string> keyPass;
    std::optional<std::string> repoPubkey;
    std::string keytool = "keytool";
    std::string jarsigner = "jarsigner";
    std::vector<std::string> smartcardOptions;

    /**
     * @brief Loads configuration from a YAML file on disk.
     *
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws ConfigError if the file is missing, is not valid YAML, or a
     *         value has the wrong shape.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Same as loadFromFile, from an in-memory YAML document.
     */
    static Config loadFromString(const std::string& yaml);

    /**
     * @brief Prints the effective repository settings to standard output.
     */
    void print() const;
};

} // namespace Repodex

#endif // CONFIG_HPP
