/**
 * @file main.cpp
 * @brief webid-tls command-line tool
 *
 * Commands:
 *   verify <cert.pem|cert.der>     verify a client certificate, prints JSON
 *   generate --agent <uri> --spkac <file> [--country C] [--locality L]
 *            [--org O] [--cn CN] [--out file]
 *   spkac <file>                   decode an SPKAC request, prints JSON
 *
 * Exit codes: 0 success, 1 failure, 2 usage error.
 */

#include "webid/common/config_manager.h"
#include "webid/common/logger.h"
#include "webid/rdf/graph_builder.h"
#include "webid/tls/certificate_issuer.h"
#include "webid/tls/profile_resolver.h"
#include "webid/tls/verifier.h"
#include "webid/x509/certificate_parser.h"
#include "webid/x509/client_certificate.h"

#include <spdlog/spdlog.h>
#include <json/json.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace webid;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void printUsage() {
    std::cerr <<
        "Usage: webid-tls [--log-level LEVEL] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  verify <cert.pem|cert.der>\n"
        "      Verify the WebID of a client certificate.\n"
        "  generate --agent <uri> --spkac <file> [--country C] [--locality L]\n"
        "           [--org O] [--cn CN] [--out file]\n"
        "      Issue a self-signed WebID certificate for an SPKAC request.\n"
        "  spkac <file>\n"
        "      Show the challenge and public key of an SPKAC request.\n"
        "\n"
        "Environment: LOG_LEVEL, LOG_FILE, WEBID_FETCH_TIMEOUT, WEBID_CONNECT_TIMEOUT,\n"
        "             WEBID_MAX_REDIRECTS, WEBID_MAX_PROFILE_BYTES, WEBID_USER_AGENT\n";
}

/**
 * @brief Split arguments into positionals and "--name value" options
 * @return false on an option without a value
 */
bool parseArguments(const std::vector<std::string>& args,
                    std::vector<std::string>& positionals,
                    std::map<std::string, std::string>& options) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            if (i + 1 >= args.size()) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            options[arg.substr(2)] = args[++i];
        } else {
            positionals.push_back(arg);
        }
    }
    return true;
}

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void printJson(const Json::Value& json) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::cout << Json::writeString(writer, json) << std::endl;
}

void initializeLogging(const std::string& levelOverride) {
    auto& config = common::ConfigManager::getInstance();
    std::string level = levelOverride.empty()
        ? config.getString(common::ConfigManager::LOG_LEVEL, "warn")
        : levelOverride;
    std::string logFile = config.getString(common::ConfigManager::LOG_FILE);

    common::Logger::initialize("webid-tls", level, !logFile.empty(), logFile);
}

int runVerify(const std::vector<std::string>& positionals) {
    if (positionals.size() != 1) {
        printUsage();
        return kExitUsage;
    }
    const std::string& path = positionals[0];

    auto data = readFile(path);
    if (!data) {
        spdlog::error("Cannot read certificate file: {}", path);
        return kExitFailure;
    }

    x509::X509Ptr cert = x509::parseCertificate(std::vector<uint8_t>(data->begin(), data->end()));
    if (!cert) {
        spdlog::error("Not a PEM or DER certificate: {}", path);
        return kExitFailure;
    }

    std::optional<x509::ClientCertificate> record = x509::readClientCertificate(cert.get());

    tls::CurlProfileResolver resolver(tls::ResolverConfig::fromConfigManager());
    rdf::RdfGraphBuilder builder;
    tls::WebIdVerifier verifier(&resolver, &builder);

    tls::VerificationResult result = verifier.verify(record ? &*record : nullptr);
    if (result.ok()) {
        spdlog::info("Verified {}", result.webid);
    } else {
        spdlog::info("Verification failed: {} ({})", tls::verifyErrorToString(result.error), result.message);
    }

    printJson(result.toJson());
    return result.ok() ? kExitOk : kExitFailure;
}

int runGenerate(const std::map<std::string, std::string>& options) {
    auto option = [&options](const std::string& name) -> std::optional<std::string> {
        auto it = options.find(name);
        if (it == options.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    auto spkacPath = option("spkac");
    auto agent = option("agent");
    if (!agent || !spkacPath) {
        printUsage();
        return kExitUsage;
    }

    auto spkac = readFile(*spkacPath);
    if (!spkac) {
        spdlog::error("Cannot read SPKAC file: {}", *spkacPath);
        return kExitFailure;
    }

    tls::IssuanceOptions request;
    request.agent = *agent;
    request.spkac = *spkac;
    request.countryName = option("country");
    request.localityName = option("locality");
    request.organizationName = option("org");
    request.commonName = option("cn");

    tls::CertificateIssuer issuer;
    tls::IssuanceResult result = issuer.generate(request);
    if (!result.ok()) {
        spdlog::error("Certificate generation failed: {} ({})",
                      tls::verifyErrorToString(result.error), result.message);
        return kExitFailure;
    }

    auto out = option("out");
    if (!out) {
        std::cout << result.pem;
        return kExitOk;
    }

    std::ofstream file(*out, std::ios::binary | std::ios::trunc);
    if (!file || !(file << result.pem)) {
        spdlog::error("Cannot write certificate to {}", *out);
        return kExitFailure;
    }
    spdlog::info("Certificate for {} written to {} (fingerprint {})",
                 request.agent, *out, result.record.fingerprint);
    return kExitOk;
}

int runSpkac(const std::vector<std::string>& positionals) {
    if (positionals.size() != 1) {
        printUsage();
        return kExitUsage;
    }

    auto spkac = readFile(positionals[0]);
    if (!spkac) {
        spdlog::error("Cannot read SPKAC file: {}", positionals[0]);
        return kExitFailure;
    }

    std::optional<tls::SpkacInfo> info = tls::parseSpkac(*spkac);
    Json::Value json;
    json["valid"] = info.has_value();
    if (info) {
        json["challenge"] = info->challenge;
        json["publicKey"] = info->publicKeyPem;
    }
    printJson(json);
    return info ? kExitOk : kExitFailure;
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::vector<std::string> positionals;
    std::map<std::string, std::string> options;
    if (!parseArguments(args, positionals, options) || positionals.empty()) {
        printUsage();
        return kExitUsage;
    }

    common::ConfigManager::getInstance().loadFromEnvironment();
    auto levelIt = options.find("log-level");
    initializeLogging(levelIt != options.end() ? levelIt->second : "");

    const std::string command = positionals.front();
    positionals.erase(positionals.begin());

    try {
        int rc = kExitUsage;
        if (command == "verify") {
            rc = runVerify(positionals);
        } else if (command == "generate") {
            rc = runGenerate(options);
        } else if (command == "spkac") {
            rc = runSpkac(positionals);
        } else {
            std::cerr << "Unknown command: " << command << std::endl;
            printUsage();
        }
        common::Logger::flush();
        return rc;
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        common::Logger::flush();
        return kExitFailure;
    }
}
