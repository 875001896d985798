#include <iostream>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "config.hpp"
#include "http.hpp"
#include "index.hpp"
#include "jar.hpp"
#include "signing.hpp"
#include "utils.hpp"
#include "verify.hpp"

void printHelp()
{
    std::cout << "Repodex\n"
              << "Usage: repodex command [options]\n\n"
              << "Repodex generates and verifies signed app repository indexes.\n\n"
              << "Useful commands:\n"
              << "  update       - Write the index files of a repository directory\n"
              << "                 [--config FILE] [--catalog FILE] [--repodir DIR]\n"
              << "                 [--archive] [--nosign] [--pretty]\n"
              << "  fetch        - Download and verify a repository index\n"
              << "                 <url> [--etag TAG] [--no-verify]\n"
              << "  fingerprint  - Print the signer fingerprint of a verified JAR\n"
              << "                 <jar>\n"
              << "  config       - Show the effective configuration [--config FILE]\n";
}

// Reads the value of an option that takes an argument.
bool optionValue(int argc, char* argv[], int& i, std::string& value)
{
    if (i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    std::cerr << "Error: " << argv[i] << " requires an argument.\n";
    return false;
}

int runUpdate(int argc, char* argv[])
{
    std::string configPath  = "config.yml";
    std::string catalogPath = "catalog.yml";
    std::string repodir;
    bool archive = false;
    Repodex::IndexOptions options;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (!optionValue(argc, argv, i, configPath)) return 1;
        }
        else if (arg == "--catalog") {
            if (!optionValue(argc, argv, i, catalogPath)) return 1;
        }
        else if (arg == "--repodir") {
            if (!optionValue(argc, argv, i, repodir)) return 1;
        }
        else if (arg == "--archive") {
            archive = true;
        }
        else if (arg == "--nosign") {
            options.nosign = true;
        }
        else if (arg == "--pretty") {
            options.pretty = true;
        }
        else {
            std::cerr << "Error: unknown option " << arg << "\n";
            return 1;
        }
    }
    if (repodir.empty()) {
        repodir = archive ? "archive" : "repo";
    }

    Repodex::Config config   = Repodex::Config::loadFromFile(configPath);
    Repodex::Catalog catalog = Repodex::Catalog::loadFromFile(catalogPath);

    Repodex::KeystoreSigner signer(config);
    Repodex::IndexAssembler assembler(config, signer, options);
    assembler.make(catalog, repodir, archive);
    return 0;
}

int runFetch(int argc, char* argv[])
{
    std::string url;
    std::string etag;
    bool verifyFingerprint = true;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--etag") {
            if (!optionValue(argc, argv, i, etag)) return 1;
        }
        else if (arg == "--no-verify") {
            verifyFingerprint = false;
        }
        else if (url.empty()) {
            url = arg;
        }
        else {
            std::cerr << "Error: unexpected argument " << arg << "\n";
            return 1;
        }
    }
    if (url.empty()) {
        std::cerr << "Usage: repodex fetch <url> [--etag TAG] [--no-verify]\n";
        return 1;
    }

    Repodex::CurlHttpClient client;
    Repodex::TrustVerifier verifier(client);
    Repodex::FetchResult result = verifier.downloadRepoIndex(url, etag, verifyFingerprint);

    if (!result.index) {
        std::cout << "Not modified\n";
    }
    else {
        const Repodex::RepoIndex& index = *result.index;
        std::cout << "Repository:  " << index.repo.name << "\n"
                  << "Address:     " << index.repo.address << "\n"
                  << "Timestamp:   " << Repodex::formatDate(index.repo.timestamp) << "\n"
                  << "Fingerprint: " << index.repo.fingerprint << "\n"
                  << "Apps:        " << index.apps.size() << "\n";
    }
    if (!result.etag.empty()) {
        std::cout << "ETag:        " << result.etag << "\n";
    }
    return 0;
}

int runFingerprint(int argc, char* argv[])
{
    if (argc != 3) {
        std::cerr << "Usage: repodex fingerprint <jar>\n";
        return 1;
    }
    std::string certificate = Repodex::TrustVerifier::verifyJar(argv[2], "");
    std::cout << Repodex::Jar::certificateFingerprint(certificate) << "\n";
    return 0;
}

int runConfig(int argc, char* argv[])
{
    std::string configPath = "config.yml";
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (!optionValue(argc, argv, i, configPath)) return 1;
        }
        else {
            std::cerr << "Error: unknown option " << arg << "\n";
            return 1;
        }
    }
    Repodex::Config::loadFromFile(configPath).print();
    return 0;
}

int main(int argc, char* argv[])
{
    // If no command is supplied, show the help message
    if (argc < 2) {
        printHelp();
        return 0;
    }

    std::string command = argv[1];

    try {
        if (command == "update") {
            return runUpdate(argc, argv);
        }
        else if (command == "fetch") {
            return runFetch(argc, argv);
        }
        else if (command == "fingerprint") {
            return runFingerprint(argc, argv);
        }
        else if (command == "config") {
            return runConfig(argc, argv);
        }
        else if (command == "help" || command == "--help") {
            printHelp();
            return 0;
        }
        else {
            std::cerr << "Unknown command or insufficient arguments.\n";
            return 1;
        }
    }
    catch (const std::exception& e) {
        Repodex::log_error(e.what());
        return 1;
    }
}
