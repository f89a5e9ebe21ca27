/**
 * @file certificate_parser.cpp
 * @brief Certificate loading and serialization implementation
 */

#include "webid/x509/certificate_parser.h"
#include "webid/utils/string_utils.h"
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/err.h>
#include <cctype>
#include <cstring>

namespace webid {
namespace x509 {

namespace {
    constexpr const char* kPemMarker = "-----BEGIN CERTIFICATE-----";

    /**
     * @brief Check if data holds a PEM marker after optional leading whitespace
     */
    bool isPemFormat(const std::vector<uint8_t>& data) {
        size_t start = 0;
        while (start < data.size() && std::isspace(data[start])) {
            ++start;
        }
        const size_t markerLen = std::strlen(kPemMarker);
        if (data.size() - start < markerLen) {
            return false;
        }
        return std::memcmp(data.data() + start, kPemMarker, markerLen) == 0;
    }
}

CertificateFormat detectCertificateFormat(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return CertificateFormat::UNKNOWN;
    }
    if (isPemFormat(data)) {
        return CertificateFormat::PEM;
    }
    // DER certificates start with SEQUENCE tag (0x30)
    if (data.size() >= 2 && data[0] == 0x30) {
        return CertificateFormat::DER;
    }
    return CertificateFormat::UNKNOWN;
}

X509Ptr parseCertificate(const std::vector<uint8_t>& data) {
    switch (detectCertificateFormat(data)) {
        case CertificateFormat::PEM:
            return parseCertificateFromPem(
                std::string(reinterpret_cast<const char*>(data.data()), data.size()));
        case CertificateFormat::DER:
            return parseCertificateFromDer(data);
        default:
            return nullptr;
    }
}

X509Ptr parseCertificateFromPem(const std::string& pem) {
    if (pem.empty()) {
        return nullptr;
    }

    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return nullptr;
    }

    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!cert) {
        ERR_clear_error();
    }
    return X509Ptr(cert);
}

X509Ptr parseCertificateFromDer(const std::vector<uint8_t>& der) {
    if (der.empty()) {
        return nullptr;
    }

    // d2i_X509 advances p past the consumed bytes
    const unsigned char* p = der.data();
    X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
    if (!cert) {
        ERR_clear_error();
        return nullptr;
    }
    if (p != der.data() + der.size()) {
        return nullptr;
    }
    return cert;
}

std::optional<std::string> certificateToPem(X509* cert) {
    if (!cert) {
        return std::nullopt;
    }

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        return std::nullopt;
    }

    if (PEM_write_bio_X509(bio, cert) != 1) {
        BIO_free(bio);
        return std::nullopt;
    }

    char* pemData = nullptr;
    long pemLen = BIO_get_mem_data(bio, &pemData);
    if (pemLen <= 0 || !pemData) {
        BIO_free(bio);
        return std::nullopt;
    }

    std::string pem(pemData, static_cast<size_t>(pemLen));
    BIO_free(bio);
    return pem;
}

std::optional<std::string> computeFingerprint(X509* cert) {
    if (!cert) {
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (X509_digest(cert, EVP_sha256(), digest, &digestLen) != 1) {
        return std::nullopt;
    }

    return utils::bytesToHex(digest, digestLen);
}

} // namespace x509
} // namespace webid
