/**
 * @file client_certificate.cpp
 * @brief ClientCertificate extraction from OpenSSL X509
 */

#include "webid/x509/client_certificate.h"
#include "webid/x509/certificate_parser.h"
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <cstdio>
#include <ctime>

namespace webid {
namespace x509 {

namespace {
    std::string bignumToHex(const BIGNUM* bn) {
        if (!bn) {
            return "";
        }
        char* hex = BN_bn2hex(bn);
        if (!hex) {
            return "";
        }
        std::string result(hex);
        OPENSSL_free(hex);
        return result;
    }

    std::string getCommonName(X509_NAME* name) {
        if (!name) {
            return "";
        }
        int idx = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
        if (idx < 0) {
            return "";
        }
        ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, idx));
        unsigned char* utf8 = nullptr;
        int len = ASN1_STRING_to_UTF8(&utf8, data);
        if (len < 0 || !utf8) {
            return "";
        }
        std::string result(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
        OPENSSL_free(utf8);
        return result;
    }

    std::string asn1TimeToIso8601(const ASN1_TIME* t) {
        if (!t) {
            return "";
        }
        struct tm tmTime = {};
        if (ASN1_TIME_to_tm(t, &tmTime) != 1) {
            return "";
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                      tmTime.tm_year + 1900, tmTime.tm_mon + 1, tmTime.tm_mday,
                      tmTime.tm_hour, tmTime.tm_min, tmTime.tm_sec);
        return buf;
    }

    std::string serialToHex(const ASN1_INTEGER* serial) {
        if (!serial) {
            return "";
        }
        BIGNUM* bn = ASN1_INTEGER_to_BN(serial, nullptr);
        std::string hex = bignumToHex(bn);
        BN_free(bn);
        return hex;
    }
}

std::string getSubjectAltNameText(X509* cert) {
    if (!cert) {
        return "";
    }

    int idx = X509_get_ext_by_NID(cert, NID_subject_alt_name, -1);
    if (idx < 0) {
        return "";
    }
    X509_EXTENSION* ext = X509_get_ext(cert, idx);

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        return "";
    }

    std::string text;
    if (X509V3_EXT_print(bio, ext, 0, 0) == 1) {
        char* data = nullptr;
        long len = BIO_get_mem_data(bio, &data);
        if (len > 0 && data) {
            text.assign(data, static_cast<size_t>(len));
        }
    } else {
        ERR_clear_error();
    }
    BIO_free(bio);
    return text;
}

std::optional<ClientCertificate> readClientCertificate(X509* cert) {
    if (!cert) {
        return std::nullopt;
    }

    ClientCertificate record;
    record.subjectAltName = getSubjectAltNameText(cert);

    EVP_PKEY* pkey = X509_get0_pubkey(cert);
    if (pkey && EVP_PKEY_base_id(pkey) == EVP_PKEY_RSA) {
        BIGNUM* n = nullptr;
        BIGNUM* e = nullptr;
        if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_N, &n) == 1) {
            record.modulus = bignumToHex(n);
        }
        if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_E, &e) == 1) {
            record.exponent = bignumToHex(e);
        }
        BN_free(n);
        BN_free(e);
        ERR_clear_error();
    }

    record.subjectCommonName = getCommonName(X509_get_subject_name(cert));
    record.issuerCommonName = getCommonName(X509_get_issuer_name(cert));
    record.serialNumber = serialToHex(X509_get0_serialNumber(cert));
    record.validFrom = asn1TimeToIso8601(X509_get0_notBefore(cert));
    record.validTo = asn1TimeToIso8601(X509_get0_notAfter(cert));
    record.fingerprint = computeFingerprint(cert).value_or("");

    return record;
}

} // namespace x509
} // namespace webid
