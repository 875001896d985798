#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <filesystem>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Repodex {

namespace {

void readProfile(const YAML::Node& root, const std::string& prefix, RepoProfile& profile)
{
    if (root[prefix + "_url"]) {
        profile.url = root[prefix + "_url"].as<std::string>();
    }
    if (root[prefix + "_name"]) {
        profile.name = root[prefix + "_name"].as<std::string>();
    }
    if (root[prefix + "_icon"]) {
        profile.icon = root[prefix + "_icon"].as<std::string>();
    }
    if (root[prefix + "_description"]) {
        profile.description = root[prefix + "_description"].as<std::string>();
    }
}

std::optional<std::string> readOptional(const YAML::Node& root, const char* key)
{
    if (!root[key] || root[key].IsNull()) {
        return std::nullopt;
    }
    return root[key].as<std::string>();
}

std::vector<std::string> readStringList(const YAML::Node& root, const char* key)
{
    std::vector<std::string> items;
    if (!root[key] || root[key].IsNull()) {
        return items;
    }
    if (root[key].IsScalar()) {
        items.push_back(root[key].as<std::string>());
        return items;
    }
    for (const auto& item : root[key]) {
        items.push_back(item.as<std::string>());
    }
    return items;
}

// install_list / uninstall_list: a single app id or a list of app ids.
std::vector<std::string> readRequestList(const YAML::Node& root, const char* key)
{
    std::vector<std::string> ids;
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return ids;
    }
    if (node.IsScalar()) {
        ids.push_back(node.as<std::string>());
        return ids;
    }
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                throw ConfigError(std::string("'") + key + "' only accepts strings and lists of strings");
            }
            ids.push_back(item.as<std::string>());
        }
        return ids;
    }
    throw ConfigError(std::string("'") + key + "' only accepts strings and lists of strings");
}

Config parse(const YAML::Node& root)
{
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration must be a YAML mapping");
    }

    readProfile(root, "repo", config.repo);
    readProfile(root, "archive", config.archive);

    if (root["repo_maxage"]) {
        config.repoMaxAge = root["repo_maxage"].as<int>();
    }
    config.mirrors = readStringList(root, "mirrors");
    config.serverGitMirrors = readStringList(root, "servergitmirrors");
    if (root["nonstandardwebroot"]) {
        config.nonStandardWebroot = root["nonstandardwebroot"].as<bool>();
    }

    config.installList = readRequestList(root, "install_list");
    config.uninstallList = readRequestList(root, "uninstall_list");

    if (root["make_current_version_link"]) {
        config.makeCurrentVersionLink = root["make_current_version_link"].as<bool>();
    }
    if (root["current_version_name_source"]) {
        config.currentVersionNameSource = root["current_version_name_source"].as<std::string>();
    }

    config.repoKeyAlias = readOptional(root, "repo_keyalias");
    config.keystore     = readOptional(root, "keystore");
    config.keystorePass = readOptional(root, "keystorepass");
    config.keyPass      = readOptional(root, "keypass");
    config.repoPubkey   = readOptional(root, "repo_pubkey");
    if (root["keytool"]) {
        config.keytool = root["keytool"].as<std::string>();
    }
    if (root["jarsigner"]) {
        config.jarsigner = root["jarsigner"].as<std::string>();
    }
    config.smartcardOptions = readStringList(root, "smartcardoptions");

    return config;
}

} // namespace

Config Config::loadFromFile(const std::string& path)
{
    if (!fs::exists(path)) {
        throw ConfigError("Configuration file not found: " + path);
    }

    try {
        return parse(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Unable to parse configuration file " + path + ": " + e.what());
    }
}

Config Config::loadFromString(const std::string& yaml)
{
    try {
        return parse(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Unable to parse configuration: ") + e.what());
    }
}

void Config::print() const
{
    std::cout << "Repository: " << repo.name << " <" << repo.url << ">" << std::endl;
    std::cout << "Archive:    " << archive.name << " <" << archive.url << ">" << std::endl;
    if (repoMaxAge != 0) {
        std::cout << "Max age:    " << repoMaxAge << " days" << std::endl;
    }
    std::cout << "Mirrors:" << std::endl;
    for (const auto& mirror : mirrors) {
        std::cout << "  - " << mirror << std::endl;
    }
    for (const auto& mirror : serverGitMirrors) {
        std::cout << "  - " << mirror << " (git)" << std::endl;
    }
}

} // namespace Repodex
