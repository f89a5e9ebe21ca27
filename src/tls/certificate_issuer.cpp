/**
 * @file certificate_issuer.cpp
 * @brief SPKAC decoding and X.509 v3 certificate assembly
 */

#include "webid/tls/certificate_issuer.h"
#include "webid/common/exceptions.h"
#include "webid/rdf/iri.h"
#include "webid/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>
#include <ctime>
#include <memory>

namespace webid::tls {

namespace {
    struct SpkiDeleter { void operator()(NETSCAPE_SPKI* p) const { NETSCAPE_SPKI_free(p); } };
    using SpkiPtr = std::unique_ptr<NETSCAPE_SPKI, SpkiDeleter>;

    struct NameDeleter { void operator()(X509_NAME* p) const { X509_NAME_free(p); } };
    using NamePtr = std::unique_ptr<X509_NAME, NameDeleter>;

    struct GeneralNamesDeleter { void operator()(GENERAL_NAMES* p) const { GENERAL_NAMES_free(p); } };
    using GeneralNamesPtr = std::unique_ptr<GENERAL_NAMES, GeneralNamesDeleter>;

    struct PKeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
    using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

    /// Most recent OpenSSL error text, queue cleared
    std::string opensslError(const std::string& step) {
        unsigned long code = ERR_get_error();
        std::string message = step;
        if (code != 0) {
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            message += ": ";
            message += buf;
        }
        ERR_clear_error();
        return message;
    }

    /// Decode and check signature; key stays owned by the caller
    x509::PKeyPtr decodeSpkac(const std::string& normalized, SpkiPtr& spkiOut) {
        SpkiPtr spki(NETSCAPE_SPKI_b64_decode(normalized.c_str(), static_cast<int>(normalized.size())));
        if (!spki) {
            ERR_clear_error();
            return nullptr;
        }
        x509::PKeyPtr key(NETSCAPE_SPKI_get_pubkey(spki.get()));
        if (!key || NETSCAPE_SPKI_verify(spki.get(), key.get()) <= 0) {
            ERR_clear_error();
            return nullptr;
        }
        spkiOut = std::move(spki);
        return key;
    }

    void addNameEntry(X509_NAME* name, int nid, int type, const std::string& value) {
        if (X509_NAME_add_entry_by_NID(name, nid, type,
                reinterpret_cast<const unsigned char*>(value.c_str()),
                static_cast<int>(value.size()), -1, 0) != 1) {
            throw common::CryptoException(opensslError(
                std::string("invalid ") + OBJ_nid2sn(nid) + " value '" + value + "'"));
        }
    }

    void setValidity(X509* cert) {
        time_t now = std::time(nullptr);
        struct tm tmNow = {};
        gmtime_r(&now, &tmNow);
        tmNow.tm_year += 1;
        time_t nextYear = timegm(&tmNow);

        if (!ASN1_TIME_set(X509_getm_notBefore(cert), now) ||
            !ASN1_TIME_set(X509_getm_notAfter(cert), nextYear)) {
            throw common::CryptoException(opensslError("failed to set validity"));
        }
    }

    void addSubjectAltUri(X509* cert, const std::string& uri) {
        GeneralNamesPtr names(sk_GENERAL_NAME_new_null());
        GENERAL_NAME* name = GENERAL_NAME_new();
        ASN1_IA5STRING* ia5 = ASN1_IA5STRING_new();
        if (!names || !name || !ia5 ||
            !ASN1_STRING_set(ia5, uri.data(), static_cast<int>(uri.size()))) {
            GENERAL_NAME_free(name);
            ASN1_IA5STRING_free(ia5);
            throw common::CryptoException(opensslError("failed to build subjectAltName"));
        }
        GENERAL_NAME_set0_value(name, GEN_URI, ia5);
        if (!sk_GENERAL_NAME_push(names.get(), name)) {
            GENERAL_NAME_free(name);
            throw common::CryptoException(opensslError("failed to build subjectAltName"));
        }
        if (X509_add1_ext_i2d(cert, NID_subject_alt_name, names.get(), 0, X509V3_ADD_DEFAULT) != 1) {
            throw common::CryptoException(opensslError("failed to add subjectAltName"));
        }
    }

    void addSubjectKeyIdentifier(X509* cert) {
        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_key_identifier,
                                                  const_cast<char*>("hash"));
        if (!ext) {
            throw common::CryptoException(opensslError("failed to compute subjectKeyIdentifier"));
        }
        int added = X509_add_ext(cert, ext, -1);
        X509_EXTENSION_free(ext);
        if (added != 1) {
            throw common::CryptoException(opensslError("failed to add subjectKeyIdentifier"));
        }
    }
}

std::string normalizeSpkac(const std::string& spkac) {
    std::string value = utils::trim(spkac);
    if (utils::startsWith(value, "SPKAC=")) {
        value = value.substr(6);
    }
    return utils::removeWhitespace(value);
}

std::optional<SpkacInfo> parseSpkac(const std::string& spkac) {
    const std::string normalized = normalizeSpkac(spkac);
    if (normalized.empty()) {
        return std::nullopt;
    }

    SpkiPtr spki;
    x509::PKeyPtr key = decodeSpkac(normalized, spki);
    if (!key) {
        return std::nullopt;
    }

    SpkacInfo info;
    const ASN1_IA5STRING* challenge = spki->spkac->challenge;
    if (challenge && ASN1_STRING_length(challenge) > 0) {
        info.challenge.assign(reinterpret_cast<const char*>(ASN1_STRING_get0_data(challenge)),
                              static_cast<size_t>(ASN1_STRING_length(challenge)));
    }

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        return std::nullopt;
    }
    if (PEM_write_bio_PUBKEY(bio, key.get()) == 1) {
        char* data = nullptr;
        long len = BIO_get_mem_data(bio, &data);
        if (len > 0 && data) {
            info.publicKeyPem.assign(data, static_cast<size_t>(len));
        }
    }
    BIO_free(bio);
    ERR_clear_error();

    if (info.publicKeyPem.empty()) {
        return std::nullopt;
    }
    return info;
}

x509::PKeyPtr CertificateIssuer::generateSigningKey() const {
    PKeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    EVP_PKEY* raw = nullptr;
    if (!ctx ||
        EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), kSigningKeyBits) <= 0 ||
        EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw common::CryptoException(opensslError("RSA key generation failed"));
    }
    keysGenerated_.fetch_add(1);
    return x509::PKeyPtr(raw);
}

IssuanceResult CertificateIssuer::generate(const IssuanceOptions& options) const {
    if (options.agent.empty()) {
        return IssuanceResult::failure(VerifyError::MISSING_AGENT);
    }
    const std::string spkac = normalizeSpkac(options.spkac);
    if (spkac.empty()) {
        return IssuanceResult::failure(VerifyError::MISSING_SPKAC);
    }

    SpkiPtr spki;
    x509::PKeyPtr subjectKey = decodeSpkac(spkac, spki);
    if (!subjectKey) {
        spdlog::debug("[CertificateIssuer] SPKAC rejected for {}", options.agent);
        return IssuanceResult::failure(VerifyError::INVALID_SPKAC);
    }

    std::string commonName = options.commonName.value_or("");
    if (commonName.empty()) {
        commonName = rdf::extractHostname(options.agent);
        if (commonName.empty()) {
            return IssuanceResult::failure(VerifyError::MISSING_AGENT, "Agent uri has no host name");
        }
    }

    IssuanceResult result;
    try {
        x509::PKeyPtr signingKey = generateSigningKey();

        x509::X509Ptr cert(X509_new());
        if (!cert) {
            throw common::CryptoException(opensslError("X509_new failed"));
        }
        X509_set_version(cert.get(), 2);  // v3
        ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);

        NamePtr name(X509_NAME_new());
        if (!name) {
            throw common::CryptoException(opensslError("X509_NAME_new failed"));
        }
        // Country is PrintableString; "." would fail the 2-character check otherwise
        addNameEntry(name.get(), NID_countryName, V_ASN1_PRINTABLESTRING,
                     options.countryName.value_or(kNamePlaceholder));
        addNameEntry(name.get(), NID_localityName, MBSTRING_UTF8,
                     options.localityName.value_or(kNamePlaceholder));
        addNameEntry(name.get(), NID_organizationName, MBSTRING_UTF8,
                     options.organizationName.value_or(kNamePlaceholder));
        addNameEntry(name.get(), NID_commonName, MBSTRING_UTF8, commonName);
        X509_set_subject_name(cert.get(), name.get());
        X509_set_issuer_name(cert.get(), name.get());

        setValidity(cert.get());

        if (X509_set_pubkey(cert.get(), subjectKey.get()) != 1) {
            throw common::CryptoException(opensslError("failed to set subject key"));
        }

        addSubjectAltUri(cert.get(), options.agent);
        addSubjectKeyIdentifier(cert.get());

        if (X509_sign(cert.get(), signingKey.get(), EVP_sha256()) <= 0) {
            throw common::CryptoException(opensslError("signing failed"));
        }

        std::optional<std::string> pem = x509::certificateToPem(cert.get());
        std::optional<x509::ClientCertificate> record = x509::readClientCertificate(cert.get());
        if (!pem || !record) {
            throw common::CryptoException(opensslError("failed to serialize certificate"));
        }

        result.pem = *pem;
        result.record = *record;
        result.certificate = std::move(cert);
    } catch (const common::CryptoException& e) {
        spdlog::debug("[CertificateIssuer] Generation failed for {}: {}", options.agent, e.what());
        return IssuanceResult::failure(VerifyError::ISSUANCE_FAILURE, e.what());
    }

    spdlog::debug("[CertificateIssuer] Issued certificate for {} (CN={})", options.agent, commonName);
    return result;
}

void CertificateIssuer::generate(const IssuanceOptions& options, const Callback& callback) const {
    IssuanceResult result = generate(options);
    if (callback) {
        callback(result);
    }
}

} // namespace webid::tls
