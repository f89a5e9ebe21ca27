/**
 * @file profile_resolver.h
 * @brief Profile document retrieval
 *
 * The verifier depends only on IProfileResolver. CurlProfileResolver is the
 * default adapter (libcurl, one easy handle per fetch).
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace webid::tls {

/**
 * @brief Fetched document, or error message
 */
struct FetchResult {
    bool ok = false;
    std::string body;
    std::string mimeType;   ///< Content-Type as received (may carry parameters)
    std::string error;
    long status = 0;        ///< HTTP status, 0 for file:// or transport errors

    static FetchResult success(std::string body, std::string mimeType, long status = 200) {
        FetchResult r;
        r.ok = true;
        r.body = std::move(body);
        r.mimeType = std::move(mimeType);
        r.status = status;
        return r;
    }

    static FetchResult failure(const std::string& message, long status = 0) {
        FetchResult r;
        r.error = message;
        r.status = status;
        return r;
    }
};

/**
 * @brief Profile resolver interface
 *
 * Implementations report failures in the result and must not throw.
 */
class IProfileResolver {
public:
    virtual ~IProfileResolver() = default;

    /**
     * @brief Retrieve the document an identity URI points to
     * @param uri Identity URI (a fragment may be present)
     */
    virtual FetchResult fetch(const std::string& uri) = 0;
};

/**
 * @brief CurlProfileResolver settings
 */
struct ResolverConfig {
    long timeoutSeconds = 10;
    long connectTimeoutSeconds = 5;
    long maxRedirects = 5;
    size_t maxBodyBytes = 1024 * 1024;
    std::string userAgent = "webid-tls/1.0";
    std::string accept =
        "text/turtle, application/ld+json;q=0.9, application/n-triples;q=0.8, "
        "text/n3;q=0.7, */*;q=0.1";

    /// Also accept file: URIs (local fixtures). Never set from the environment.
    bool allowFileScheme = false;

    /**
     * @brief Build from ConfigManager (WEBID_* keys); bad values fall back to defaults
     */
    static ResolverConfig fromConfigManager();
};

/**
 * @brief Media type for a file path, from its extension
 * @return e.g. "text/turtle" for ".ttl", empty when unknown
 */
std::string guessMediaTypeFromPath(const std::string& path);

/**
 * @brief libcurl-backed resolver
 *
 * Only http and https are fetched, redirects included. Any other scheme
 * fails before a request is made. file: is accepted only when
 * ResolverConfig::allowFileScheme is set.
 */
class CurlProfileResolver : public IProfileResolver {
public:
    explicit CurlProfileResolver(ResolverConfig config = ResolverConfig());

    FetchResult fetch(const std::string& uri) override;

    const ResolverConfig& config() const { return config_; }

private:
    ResolverConfig config_;
};

} // namespace webid::tls
