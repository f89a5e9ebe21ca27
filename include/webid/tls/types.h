/**
 * @file types.h
 * @brief Result and error types shared by the verifier and the issuer
 */

#pragma once

#include <string>
#include <json/json.h>

namespace webid::tls {

/**
 * @brief Typed failure kinds
 */
enum class VerifyError {
    NONE = 0,

    // Verification
    NO_CERTIFICATE,
    EMPTY_SAN,
    FETCH_FAILURE,
    PARSE_FAILURE,
    MISSING_MODULUS,
    MISSING_EXPONENT,
    KEY_NOT_FOUND,

    // Issuance
    INVALID_SPKAC,
    MISSING_AGENT,
    MISSING_SPKAC,
    ISSUANCE_FAILURE
};

/**
 * @brief Stable name of an error code (for logs and JSON output)
 */
inline std::string verifyErrorToString(VerifyError code) {
    switch (code) {
        case VerifyError::NONE: return "NONE";

        case VerifyError::NO_CERTIFICATE: return "NO_CERTIFICATE";
        case VerifyError::EMPTY_SAN: return "EMPTY_SAN";
        case VerifyError::FETCH_FAILURE: return "FETCH_FAILURE";
        case VerifyError::PARSE_FAILURE: return "PARSE_FAILURE";
        case VerifyError::MISSING_MODULUS: return "MISSING_MODULUS";
        case VerifyError::MISSING_EXPONENT: return "MISSING_EXPONENT";
        case VerifyError::KEY_NOT_FOUND: return "KEY_NOT_FOUND";

        case VerifyError::INVALID_SPKAC: return "INVALID_SPKAC";
        case VerifyError::MISSING_AGENT: return "MISSING_AGENT";
        case VerifyError::MISSING_SPKAC: return "MISSING_SPKAC";
        case VerifyError::ISSUANCE_FAILURE: return "ISSUANCE_FAILURE";

        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Default human-readable message for an error code
 *
 * FETCH_FAILURE, PARSE_FAILURE and ISSUANCE_FAILURE normally carry the
 * collaborator's own message instead.
 */
inline std::string defaultErrorMessage(VerifyError code) {
    switch (code) {
        case VerifyError::NONE: return "";
        case VerifyError::NO_CERTIFICATE: return "No certificate given";
        case VerifyError::EMPTY_SAN: return "Empty Subject Alternative Name field in certificate";
        case VerifyError::FETCH_FAILURE: return "Could not fetch profile";
        case VerifyError::PARSE_FAILURE: return "Could not parse profile";
        case VerifyError::MISSING_MODULUS: return "Missing modulus value in client certificate";
        case VerifyError::MISSING_EXPONENT: return "Missing exponent value in client certificate";
        case VerifyError::KEY_NOT_FOUND: return "Certificate public key not found in the user's profile";
        case VerifyError::INVALID_SPKAC: return "invalid spkac";
        case VerifyError::MISSING_AGENT: return "No agent uri found";
        case VerifyError::MISSING_SPKAC: return "No public key found";
        case VerifyError::ISSUANCE_FAILURE: return "Certificate generation failed";
        default: return "Unknown error";
    }
}

/**
 * @brief One key published in a profile
 *
 * Lexical forms as written in the profile, datatypes dropped.
 */
struct KeyAssertion {
    std::string webid;
    std::string modulus;
    std::string exponent;
};

/**
 * @brief Outcome of a verification
 */
struct VerificationResult {
    VerifyError error = VerifyError::NONE;
    std::string message;
    std::string webid;      ///< verified identity URI (success only)

    bool ok() const { return error == VerifyError::NONE; }

    static VerificationResult success(const std::string& uri) {
        VerificationResult r;
        r.webid = uri;
        return r;
    }

    static VerificationResult failure(VerifyError code, const std::string& message = "") {
        VerificationResult r;
        r.error = code;
        r.message = message.empty() ? defaultErrorMessage(code) : message;
        return r;
    }

    /**
     * @brief JSON form: {"verified", "webid", "error": {"code", "message"}}
     */
    Json::Value toJson() const {
        Json::Value json;
        json["verified"] = ok();
        if (ok()) {
            json["webid"] = webid;
            json["error"] = Json::nullValue;
        } else {
            json["webid"] = Json::nullValue;
            json["error"]["code"] = verifyErrorToString(error);
            json["error"]["message"] = message;
        }
        return json;
    }
};

} // namespace webid::tls
