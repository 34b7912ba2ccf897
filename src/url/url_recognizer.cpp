/**
 * @file url_recognizer.cpp
 * @brief UrlRecognizer implementation
 */

#include "storagefile/url/url_recognizer.h"
#include <algorithm>

namespace storagefile::url {

namespace {

bool isAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isAsciiHex(char c) {
    return isAsciiDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool isControlOrSpace(char c) {
    auto u = static_cast<unsigned char>(c);
    return u <= 0x20 || u == 0x7F;
}

} // namespace

UrlKind UrlRecognizer::recognize(const std::string& value) {
    if (value.empty()) {
        return UrlKind::NOT_URL;
    }

    if (std::any_of(value.begin(), value.end(), isControlOrSpace)) {
        return UrlKind::NOT_URL;
    }

    size_t schemeEnd = value.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return UrlKind::NOT_URL;
    }

    if (!isValidScheme(value.substr(0, schemeEnd))) {
        return UrlKind::NOT_URL;
    }

    size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = value.find_first_of("/?#", authorityStart);
    if (authorityEnd == std::string::npos) {
        authorityEnd = value.length();
    }

    std::string authority = value.substr(authorityStart, authorityEnd - authorityStart);
    if (authority.empty()) {
        return UrlKind::NOT_URL;
    }

    if (std::any_of(authority.begin(), authority.end(),
                    [](char c) { return static_cast<unsigned char>(c) >= 0x80; })) {
        return UrlKind::NOT_URL;
    }

    // userinfo is opaque here; only the host part matters
    size_t atPos = authority.rfind('@');
    std::string hostPort = atPos == std::string::npos ? authority : authority.substr(atPos + 1);
    if (hostPort.empty()) {
        return UrlKind::NOT_URL;
    }

    std::string rest;

    if (hostPort.front() == '[') {
        size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            return UrlKind::NOT_URL;
        }
        if (!isValidIpv6Literal(hostPort.substr(1, close - 1))) {
            return UrlKind::NOT_URL;
        }
        rest = hostPort.substr(close + 1);
    } else {
        size_t colon = hostPort.find(':');
        std::string host = hostPort.substr(0, colon);
        rest = colon == std::string::npos ? "" : hostPort.substr(colon);
        if (!isValidHost(host)) {
            return UrlKind::NOT_URL;
        }
    }

    if (!rest.empty()) {
        if (rest.front() != ':' || !isValidPort(rest.substr(1))) {
            return UrlKind::NOT_URL;
        }
    }

    return UrlKind::IS_URL;
}

bool UrlRecognizer::isValidScheme(const std::string& scheme) {
    if (scheme.empty() || !isAsciiAlpha(scheme.front())) {
        return false;
    }
    return std::all_of(scheme.begin() + 1, scheme.end(), [](char c) {
        return isAsciiAlpha(c) || isAsciiDigit(c) || c == '+' || c == '-' || c == '.';
    });
}

bool UrlRecognizer::isValidHost(const std::string& host) {
    if (host.empty()) {
        return false;
    }

    bool hasLabel = false;
    for (size_t i = 0; i < host.length(); ++i) {
        char c = host[i];
        if (c == '%') {
            if (i + 2 >= host.length() || !isAsciiHex(host[i + 1]) || !isAsciiHex(host[i + 2])) {
                return false;
            }
            i += 2;
            hasLabel = true;
        } else if (isAsciiAlpha(c) || isAsciiDigit(c) || c == '-' || c == '_' || c == '~') {
            hasLabel = true;
        } else if (c != '.') {
            return false;
        }
    }

    // "." or ".." alone is not a host
    return hasLabel;
}

bool UrlRecognizer::isValidIpv6Literal(const std::string& literal) {
    if (literal.empty()) {
        return false;
    }
    bool hasColon = literal.find(':') != std::string::npos;
    return hasColon && std::all_of(literal.begin(), literal.end(), [](char c) {
        return isAsciiHex(c) || c == ':' || c == '.';
    });
}

bool UrlRecognizer::isValidPort(const std::string& port) {
    return !port.empty() && port.length() <= 5 &&
           std::all_of(port.begin(), port.end(), isAsciiDigit);
}

} // namespace storagefile::url
