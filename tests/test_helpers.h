/**
 * @file test_helpers.h
 * @brief Shared test helpers for webid-tls unit tests
 *
 * Provides OpenSSL key, certificate and SPKAC generation plus profile
 * builders and a scripted resolver, so tests never touch the network.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <ctime>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include "webid/tls/profile_resolver.h"

namespace test_helpers {

/// RAII wrapper for EVP_PKEY
struct PKeyDeleter { void operator()(EVP_PKEY* p) { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

/// RAII wrapper for X509
struct X509Deleter { void operator()(X509* p) { X509_free(p); } };
using UniqueCert = std::unique_ptr<X509, X509Deleter>;

constexpr const char* kAliceWebId = "https://alice.example/profile/card#me";
constexpr const char* kAliceDocument = "https://alice.example/profile/card";

// --- Key Generation ---

inline UniqueKey generateRsaKey(int bits = 1024) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_keygen_init(ctx);
    EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits);
    EVP_PKEY_keygen(ctx, &pkey);
    EVP_PKEY_CTX_free(ctx);
    return UniqueKey(pkey);
}

inline UniqueKey generateEcKey() {
    return UniqueKey(EVP_EC_gen("P-256"));
}

/// Uppercase hex modulus, as BN_bn2hex prints it
inline std::string modulusHex(EVP_PKEY* key) {
    BIGNUM* n = nullptr;
    EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_N, &n);
    char* hex = BN_bn2hex(n);
    std::string result(hex);
    OPENSSL_free(hex);
    BN_free(n);
    return result;
}

// --- Certificate Creation ---

/**
 * @brief Create a self-signed client certificate
 * @param sanConf subjectAltName in OpenSSL config syntax
 *        ("URI:https://a/#me,DNS:a"), empty for no SAN extension
 */
inline UniqueCert createClientCert(EVP_PKEY* key,
                                   const std::string& sanConf,
                                   const std::string& cn = "Test Client") {
    X509* cert = X509_new();
    X509_set_version(cert, 2);  // v3
    ASN1_INTEGER_set(X509_get_serialNumber(cert), 42);

    X509_NAME* name = X509_NAME_new();
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0);
    X509_set_subject_name(cert, name);
    X509_set_issuer_name(cert, name);
    X509_NAME_free(name);

    ASN1_TIME_set(X509_getm_notBefore(cert), time(nullptr) - 86400);
    ASN1_TIME_set(X509_getm_notAfter(cert), time(nullptr) + 365 * 86400L);

    X509_set_pubkey(cert, key);

    if (!sanConf.empty()) {
        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name,
                                                  const_cast<char*>(sanConf.c_str()));
        X509_add_ext(cert, ext, -1);
        X509_EXTENSION_free(ext);
    }

    X509_sign(cert, key, EVP_sha256());
    return UniqueCert(cert);
}

// --- SPKAC Creation ---

/**
 * @brief Build a signed SPKAC for key, base64 encoded
 */
inline std::string createSpkac(EVP_PKEY* key, const std::string& challenge = "test-challenge") {
    NETSCAPE_SPKI* spki = NETSCAPE_SPKI_new();
    ASN1_STRING_set(spki->spkac->challenge, challenge.data(), static_cast<int>(challenge.size()));
    NETSCAPE_SPKI_set_pubkey(spki, key);
    NETSCAPE_SPKI_sign(spki, key, EVP_sha256());
    char* b64 = NETSCAPE_SPKI_b64_encode(spki);
    std::string result(b64);
    OPENSSL_free(b64);
    NETSCAPE_SPKI_free(spki);
    return result;
}

// --- Profiles ---

/// (modulus hex, exponent decimal)
using KeyPair = std::pair<std::string, std::string>;

inline std::string turtleProfile(const std::string& webid, const std::vector<KeyPair>& keys) {
    std::string ttl =
        "@prefix cert: <http://www.w3.org/ns/auth/cert#> .\n"
        "@prefix xsd: <http://www.w3.org/2001/XMLSchema#> .\n"
        "@prefix foaf: <http://xmlns.com/foaf/0.1/> .\n\n"
        "<" + webid + "> a foaf:Person ;\n"
        "    foaf:name \"Alice\"";
    for (const auto& key : keys) {
        ttl += " ;\n    cert:key [ a cert:RSAPublicKey ;\n"
               "        cert:modulus \"" + key.first + "\"^^xsd:hexBinary ;\n"
               "        cert:exponent " + key.second + " ]";
    }
    ttl += " .\n";
    return ttl;
}

inline std::string ntriplesProfile(const std::string& webid, const std::string& modulus,
                                   const std::string& exponent) {
    const std::string cert = "http://www.w3.org/ns/auth/cert#";
    return "<" + webid + "> <" + cert + "key> _:k1 .\n"
           "_:k1 <" + cert + "modulus> \"" + modulus +
           "\"^^<http://www.w3.org/2001/XMLSchema#hexBinary> .\n"
           "_:k1 <" + cert + "exponent> \"" + exponent +
           "\"^^<http://www.w3.org/2001/XMLSchema#integer> .\n";
}

inline std::string jsonLdProfile(const std::string& webid, const std::string& modulus,
                                 const std::string& exponent) {
    return "{\n"
           "  \"@context\": {\n"
           "    \"cert\": \"http://www.w3.org/ns/auth/cert#\",\n"
           "    \"xsd\": \"http://www.w3.org/2001/XMLSchema#\"\n"
           "  },\n"
           "  \"@id\": \"" + webid + "\",\n"
           "  \"cert:key\": {\n"
           "    \"@type\": \"cert:RSAPublicKey\",\n"
           "    \"cert:modulus\": {\"@value\": \"" + modulus + "\", \"@type\": \"xsd:hexBinary\"},\n"
           "    \"cert:exponent\": " + exponent + "\n"
           "  }\n"
           "}\n";
}

// --- Resolver ---

/**
 * @brief Resolver answering from a fixed table, recording every request
 */
class FakeResolver : public webid::tls::IProfileResolver {
public:
    std::map<std::string, webid::tls::FetchResult> responses;
    std::vector<std::string> requests;

    void serve(const std::string& uri, const std::string& body,
               const std::string& mimeType = "text/turtle") {
        responses[uri] = webid::tls::FetchResult::success(body, mimeType);
    }

    webid::tls::FetchResult fetch(const std::string& uri) override {
        requests.push_back(uri);
        auto it = responses.find(uri);
        if (it == responses.end()) {
            return webid::tls::FetchResult::failure("HTTP 404 fetching " + uri, 404);
        }
        return it->second;
    }
};

} // namespace test_helpers
