/**
 * @file san_extractor.cpp
 * @brief SAN URI scanner
 */

#include "webid/x509/san_extractor.h"
#include <regex>

namespace webid {
namespace x509 {

std::vector<std::string> extractUris(const std::string& subjectAltName) {
    std::vector<std::string> uris;
    if (subjectAltName.empty()) {
        return uris;
    }

    static const std::regex uriPattern(R"(URI:([^, ]+))");
    auto begin = std::sregex_iterator(subjectAltName.begin(), subjectAltName.end(), uriPattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        uris.push_back((*it)[1].str());
    }
    return uris;
}

std::vector<std::string> extractUris(const ClientCertificate* certificate) {
    if (!certificate) {
        return {};
    }
    return extractUris(certificate->subjectAltName);
}

} // namespace x509
} // namespace webid
