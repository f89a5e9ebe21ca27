/**
 * @file san_extractor.h
 * @brief Identity URI extraction from Subject Alternative Name text
 */

#pragma once

#include <string>
#include <vector>
#include "webid/x509/client_certificate.h"

namespace webid {
namespace x509 {

/**
 * @brief Extract every "URI:<value>" entry from SAN text
 *
 * <value> is the longest run of characters other than comma and space.
 * Matches are returned in order of appearance. Malformed or non-URI
 * entries are skipped. Never throws.
 *
 * @param subjectAltName Printed SAN field (may be empty)
 * @return URIs in order, empty if none
 *
 * @example
 * extractUris("URI:a, URI:b, DNS:x, URI:c");  // {"a", "b", "c"}
 */
std::vector<std::string> extractUris(const std::string& subjectAltName);

/**
 * @brief Extract URIs from a certificate record
 * @param certificate Certificate, may be nullptr
 * @return URIs in order, empty for nullptr
 */
std::vector<std::string> extractUris(const ClientCertificate* certificate);

} // namespace x509
} // namespace webid
