/**
 * @file url_recognizer.h
 * @brief Absolute URL syntax recognizer
 *
 * Field values that are absolute URLs reference remote resources and skip
 * the temporary-storage check. Recognition is purely syntactic; nothing is
 * resolved or fetched.
 */

#pragma once

#include <string>

namespace storagefile::url {

/**
 * @brief Outcome of URL recognition
 */
enum class UrlKind {
    IS_URL,     // scheme://host[...]
    NOT_URL
};

/**
 * @brief Convert UrlKind to string
 */
inline std::string toString(UrlKind kind) {
    switch (kind) {
        case UrlKind::IS_URL: return "IS_URL";
        case UrlKind::NOT_URL: return "NOT_URL";
    }
    return "NOT_URL";
}

/**
 * @brief Stateless absolute URL recognizer
 *
 * Accepted shape (RFC 3986, absolute form with authority):
 * ```
 * scheme "://" [ userinfo "@" ] host [ ":" port ] [ "/" path ] [ "?" query ] [ "#" fragment ]
 * ```
 * - scheme: letter followed by letters, digits, '+', '-', '.'
 * - host: non-empty registered name (letters, digits, '-', '.', '_', '~',
 *   percent escapes) or a bracketed IPv6 literal
 * - port: digits only
 * - no whitespace, control characters or non-ASCII bytes before the path
 * - no whitespace or control characters anywhere
 */
class UrlRecognizer {
public:
    static UrlKind recognize(const std::string& value);

    static bool isUrl(const std::string& value) {
        return recognize(value) == UrlKind::IS_URL;
    }

private:
    static bool isValidScheme(const std::string& scheme);
    static bool isValidHost(const std::string& host);
    static bool isValidIpv6Literal(const std::string& literal);
    static bool isValidPort(const std::string& port);
};

} // namespace storagefile::url
