#include "signing.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <sys/wait.h>

namespace Repodex {

namespace {

const char* const storePassVariable = "REPODEX_KEYSTOREPASS";
const char* const keyPassVariable   = "REPODEX_KEYPASS";

std::string shellQuote(const std::string& argument)
{
    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

std::string commandLine(const std::vector<std::string>& arguments)
{
    std::vector<std::string> quoted;
    for (const auto& argument : arguments) {
        quoted.push_back(shellQuote(argument));
    }
    return join(quoted, " ");
}

/**
 * @brief Exports a variable for the lifetime of the object.
 */
class ScopedEnvironment
{
public:
    ScopedEnvironment(const char* name, const std::optional<std::string>& value) : name_(name)
    {
        if (value) {
            setenv(name_, value->c_str(), 1);
        }
    }
    ~ScopedEnvironment() { unsetenv(name_); }

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

private:
    const char* name_;
};

/**
 * @brief Runs a command and returns its standard output. Standard error is
 *        passed through so the tool's own diagnostics reach the user.
 */
std::string runCommand(const std::string& command, const std::string& tool)
{
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw SigningError("Error running " + tool);
    }

    std::string output;
    char buffer[4096];
    size_t count;
    while ((count = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, count);
    }

    int status   = pclose(pipe);
    int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exitCode != 0) {
        throw SigningError(tool + " failed with exit code " + std::to_string(exitCode));
    }
    return output;
}

} // namespace

KeystoreSigner::KeystoreSigner(const Config& config) : config_(config) {}

std::vector<std::string> KeystoreSigner::keystoreArguments() const
{
    if (!config_.keystore || !config_.repoKeyAlias) {
        throw SigningError("'keystore' and 'repo_keyalias' are required for signing");
    }
    std::vector<std::string> arguments = {"-keystore", *config_.keystore,
                                          "-storepass:env", storePassVariable};
    arguments.insert(arguments.end(), config_.smartcardOptions.begin(),
                     config_.smartcardOptions.end());
    return arguments;
}

std::string KeystoreSigner::publicCertificate()
{
    if (certificate_) {
        return *certificate_;
    }

    if (config_.repoPubkey) {
        try {
            certificate_ = hexDecode(*config_.repoPubkey);
        } catch (const std::invalid_argument& e) {
            throw SigningError(std::string("'repo_pubkey' is not valid hex: ") + e.what());
        }
        return *certificate_;
    }

    std::vector<std::string> arguments = {config_.keytool, "-exportcert"};
    auto keystore = keystoreArguments();
    arguments.insert(arguments.end(), keystore.begin(), keystore.end());
    arguments.push_back("-alias");
    arguments.push_back(*config_.repoKeyAlias);

    ScopedEnvironment storePass(storePassVariable, config_.keystorePass);
    std::string der = runCommand(commandLine(arguments), config_.keytool);
    if (der.empty()) {
        throw SigningError(config_.keytool + " returned no certificate for alias "
                           + *config_.repoKeyAlias);
    }
    certificate_ = der;
    return der;
}

void KeystoreSigner::signJar(const std::string& jarPath)
{
    std::vector<std::string> arguments = {config_.jarsigner};
    auto keystore = keystoreArguments();
    arguments.insert(arguments.end(), keystore.begin(), keystore.end());
    arguments.insert(arguments.end(), {"-keypass:env", keyPassVariable,
                                       "-sigalg", "SHA256withRSA",
                                       "-digestalg", "SHA-256",
                                       jarPath, *config_.repoKeyAlias});

    ScopedEnvironment storePass(storePassVariable, config_.keystorePass);
    ScopedEnvironment keyPass(keyPassVariable, config_.keyPass);
    log_message("Signing " + jarPath);
    runCommand(commandLine(arguments) + " >&2", config_.jarsigner);
}

} // namespace Repodex
