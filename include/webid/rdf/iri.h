/**
 * @file iri.h
 * @brief IRI reference resolution (RFC 3986 Section 5)
 */

#pragma once

#include <string>

namespace webid::rdf {

/**
 * @brief Split form of an IRI reference
 *
 * The has* flags distinguish an absent component from an empty one.
 */
struct IriComponents {
    std::string scheme;
    std::string authority;
    std::string path;
    std::string query;
    std::string fragment;
    bool hasScheme = false;
    bool hasAuthority = false;
    bool hasQuery = false;
    bool hasFragment = false;

    std::string toString() const;
};

/**
 * @brief Split an IRI reference into components (never fails)
 */
IriComponents parseIri(const std::string& reference);

/**
 * @brief Check for a scheme prefix ("http:", "urn:", ...)
 */
bool isAbsoluteIri(const std::string& reference);

/**
 * @brief Resolve a reference against a base IRI
 *
 * @param base Absolute base IRI (if empty, the reference is returned with
 *        dot segments removed)
 * @param reference IRI reference, possibly relative
 * @return Target IRI
 *
 * @example
 * resolveIri("https://alice.example/profile/card", "#me");
 * // "https://alice.example/profile/card#me"
 */
std::string resolveIri(const std::string& base, const std::string& reference);

/**
 * @brief Drop the fragment ("#...") of an IRI
 */
std::string stripFragment(const std::string& iri);

/**
 * @brief Host name of an absolute IRI, lowercased, without port or user info
 * @return Host, or empty string when the IRI has no authority
 */
std::string extractHostname(const std::string& iri);

} // namespace webid::rdf
