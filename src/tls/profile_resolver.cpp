/**
 * @file profile_resolver.cpp
 * @brief libcurl profile fetching
 */

#include "webid/tls/profile_resolver.h"
#include "webid/common/config_manager.h"
#include "webid/rdf/iri.h"
#include "webid/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace webid::tls {

namespace {
    struct CurlDeleter { void operator()(CURL* p) const { curl_easy_cleanup(p); } };
    using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

    struct SlistDeleter { void operator()(curl_slist* p) const { curl_slist_free_all(p); } };
    using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

    std::once_flag curlInitFlag;

    void ensureCurlInitialized() {
        std::call_once(curlInitFlag, []() {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        });
    }

    struct BodyBuffer {
        std::string data;
        size_t limit = 0;
        bool overflow = false;
    };

    size_t writeCallback(void* contents, size_t size, size_t nmemb, BodyBuffer* out) {
        size_t totalSize = size * nmemb;
        if (out->data.size() + totalSize > out->limit) {
            out->overflow = true;
            return 0;  // aborts the transfer with CURLE_WRITE_ERROR
        }
        out->data.append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    long positiveOrDefault(const std::string& key, long fallback) {
        int value = common::ConfigManager::getInstance().getInt(key, static_cast<int>(fallback));
        if (value <= 0) {
            spdlog::warn("Config '{}' must be positive (using default: {})", key, fallback);
            return fallback;
        }
        return value;
    }
}

ResolverConfig ResolverConfig::fromConfigManager() {
    auto& cfg = common::ConfigManager::getInstance();
    ResolverConfig config;

    config.timeoutSeconds = positiveOrDefault(common::ConfigManager::FETCH_TIMEOUT, config.timeoutSeconds);
    config.connectTimeoutSeconds = positiveOrDefault(common::ConfigManager::CONNECT_TIMEOUT,
                                                     config.connectTimeoutSeconds);

    int redirects = cfg.getInt(common::ConfigManager::MAX_REDIRECTS, static_cast<int>(config.maxRedirects));
    if (redirects < 0) {
        spdlog::warn("Config '{}' must not be negative (using default: {})",
                     common::ConfigManager::MAX_REDIRECTS, config.maxRedirects);
    } else {
        config.maxRedirects = redirects;
    }

    config.maxBodyBytes = static_cast<size_t>(
        positiveOrDefault(common::ConfigManager::MAX_PROFILE_BYTES, static_cast<long>(config.maxBodyBytes)));
    config.userAgent = cfg.getString(common::ConfigManager::USER_AGENT, config.userAgent);
    return config;
}

std::string guessMediaTypeFromPath(const std::string& path) {
    std::string lower = utils::toLower(path);
    if (utils::endsWith(lower, ".ttl")) return "text/turtle";
    if (utils::endsWith(lower, ".nt")) return "application/n-triples";
    if (utils::endsWith(lower, ".n3")) return "text/n3";
    if (utils::endsWith(lower, ".jsonld")) return "application/ld+json";
    if (utils::endsWith(lower, ".json")) return "application/json";
    return "";
}

CurlProfileResolver::CurlProfileResolver(ResolverConfig config)
    : config_(std::move(config)) {
    ensureCurlInitialized();
}

FetchResult CurlProfileResolver::fetch(const std::string& uri) {
    const std::string documentUri = rdf::stripFragment(uri);
    const std::string scheme = utils::toLower(rdf::parseIri(documentUri).scheme);
    const bool isFile = scheme == "file";

    if (scheme != "http" && scheme != "https" && !(isFile && config_.allowFileScheme)) {
        spdlog::debug("[CurlProfileResolver] Refusing {} (scheme '{}')", documentUri, scheme);
        return FetchResult::failure("Unsupported URI scheme for profile: " + documentUri);
    }

    CurlPtr curl(curl_easy_init());
    if (!curl) {
        return FetchResult::failure("Failed to initialize HTTP client for " + documentUri);
    }

    BodyBuffer body;
    body.limit = config_.maxBodyBytes;

    SlistPtr headers(curl_slist_append(nullptr, ("Accept: " + config_.accept).c_str()));

    curl_easy_setopt(curl.get(), CURLOPT_URL, documentUri.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, isFile ? "file" : "http,https");
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, config_.maxRedirects > 0 ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, config_.maxRedirects);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.timeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, config_.connectTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    spdlog::debug("[CurlProfileResolver] GET {}", documentUri);

    CURLcode res = curl_easy_perform(curl.get());
    if (body.overflow) {
        return FetchResult::failure("Profile at " + documentUri + " exceeds " +
                                    std::to_string(config_.maxBodyBytes) + " bytes");
    }
    if (res != CURLE_OK) {
        spdlog::debug("[CurlProfileResolver] {} failed: {}", documentUri, curl_easy_strerror(res));
        return FetchResult::failure(std::string("Failed to fetch ") + documentUri + ": " +
                                    curl_easy_strerror(res));
    }

    if (isFile) {
        return FetchResult::success(std::move(body.data), guessMediaTypeFromPath(documentUri), 0);
    }

    long responseCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);
    if (responseCode < 200 || responseCode >= 300) {
        return FetchResult::failure("HTTP " + std::to_string(responseCode) + " fetching " + documentUri,
                                    responseCode);
    }

    char* contentType = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &contentType);
    std::string mimeType = contentType ? contentType : "";

    spdlog::debug("[CurlProfileResolver] {} -> HTTP {}, {} bytes, {}",
                  documentUri, responseCode, body.data.size(), mimeType.empty() ? "no content type" : mimeType);
    return FetchResult::success(std::move(body.data), mimeType, responseCode);
}

} // namespace webid::tls
