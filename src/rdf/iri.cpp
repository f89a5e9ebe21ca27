/**
 * @file iri.cpp
 * @brief RFC 3986 reference resolution
 */

#include "webid/rdf/iri.h"
#include "webid/utils/string_utils.h"
#include <cctype>

namespace webid::rdf {

namespace {
    size_t schemeLength(const std::string& ref) {
        if (ref.empty() || !std::isalpha(static_cast<unsigned char>(ref[0]))) {
            return 0;
        }
        for (size_t i = 1; i < ref.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(ref[i]);
            if (c == ':') {
                return i;
            }
            if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
                return 0;
            }
        }
        return 0;
    }

    // RFC 3986 Section 5.2.4
    std::string removeDotSegments(const std::string& path) {
        std::string input = path;
        std::string output;

        while (!input.empty()) {
            if (utils::startsWith(input, "../")) {
                input.erase(0, 3);
            } else if (utils::startsWith(input, "./")) {
                input.erase(0, 2);
            } else if (utils::startsWith(input, "/./")) {
                input.erase(0, 2);
            } else if (input == "/.") {
                input = "/";
            } else if (utils::startsWith(input, "/../")) {
                input.erase(0, 3);
                size_t pos = output.rfind('/');
                output.erase(pos == std::string::npos ? 0 : pos);
            } else if (input == "/..") {
                input = "/";
                size_t pos = output.rfind('/');
                output.erase(pos == std::string::npos ? 0 : pos);
            } else if (input == "." || input == "..") {
                input.clear();
            } else {
                size_t start = input[0] == '/' ? 1 : 0;
                size_t next = input.find('/', start);
                if (next == std::string::npos) {
                    next = input.size();
                }
                output += input.substr(0, next);
                input.erase(0, next);
            }
        }
        return output;
    }

    std::string mergePaths(const IriComponents& base, const std::string& refPath) {
        if (base.hasAuthority && base.path.empty()) {
            return "/" + refPath;
        }
        size_t slash = base.path.rfind('/');
        if (slash == std::string::npos) {
            return refPath;
        }
        return base.path.substr(0, slash + 1) + refPath;
    }
}

std::string IriComponents::toString() const {
    std::string out;
    if (hasScheme) {
        out += scheme + ":";
    }
    if (hasAuthority) {
        out += "//" + authority;
    }
    out += path;
    if (hasQuery) {
        out += "?" + query;
    }
    if (hasFragment) {
        out += "#" + fragment;
    }
    return out;
}

IriComponents parseIri(const std::string& reference) {
    IriComponents c;
    std::string rest = reference;

    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        c.hasFragment = true;
        c.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }

    size_t question = rest.find('?');
    if (question != std::string::npos) {
        c.hasQuery = true;
        c.query = rest.substr(question + 1);
        rest.erase(question);
    }

    size_t schemeLen = schemeLength(rest);
    if (schemeLen > 0) {
        c.hasScheme = true;
        c.scheme = rest.substr(0, schemeLen);
        rest.erase(0, schemeLen + 1);
    }

    if (utils::startsWith(rest, "//")) {
        c.hasAuthority = true;
        size_t end = rest.find('/', 2);
        if (end == std::string::npos) {
            end = rest.size();
        }
        c.authority = rest.substr(2, end - 2);
        rest.erase(0, end);
    }

    c.path = rest;
    return c;
}

bool isAbsoluteIri(const std::string& reference) {
    return schemeLength(reference) > 0;
}

std::string resolveIri(const std::string& base, const std::string& reference) {
    IriComponents r = parseIri(reference);
    IriComponents b = parseIri(base);
    IriComponents t;

    if (r.hasScheme) {
        t = r;
        t.path = removeDotSegments(r.path);
        return t.toString();
    }

    if (r.hasAuthority) {
        t.hasAuthority = true;
        t.authority = r.authority;
        t.path = removeDotSegments(r.path);
        t.hasQuery = r.hasQuery;
        t.query = r.query;
    } else {
        if (r.path.empty()) {
            t.path = b.path;
            if (r.hasQuery) {
                t.hasQuery = true;
                t.query = r.query;
            } else {
                t.hasQuery = b.hasQuery;
                t.query = b.query;
            }
        } else {
            if (r.path[0] == '/') {
                t.path = removeDotSegments(r.path);
            } else {
                t.path = removeDotSegments(mergePaths(b, r.path));
            }
            t.hasQuery = r.hasQuery;
            t.query = r.query;
        }
        t.hasAuthority = b.hasAuthority;
        t.authority = b.authority;
    }

    t.hasScheme = b.hasScheme;
    t.scheme = b.scheme;
    t.hasFragment = r.hasFragment;
    t.fragment = r.fragment;
    return t.toString();
}

std::string stripFragment(const std::string& iri) {
    size_t hash = iri.find('#');
    return hash == std::string::npos ? iri : iri.substr(0, hash);
}

std::string extractHostname(const std::string& iri) {
    IriComponents c = parseIri(iri);
    if (!c.hasAuthority) {
        return "";
    }

    std::string host = c.authority;
    size_t at = host.rfind('@');
    if (at != std::string::npos) {
        host.erase(0, at + 1);
    }

    if (!host.empty() && host[0] == '[') {
        size_t close = host.find(']');
        return close == std::string::npos ? "" : utils::toLower(host.substr(1, close - 1));
    }

    size_t colon = host.find(':');
    if (colon != std::string::npos) {
        host.erase(colon);
    }
    return utils::toLower(host);
}

} // namespace webid::rdf
