#pragma once
#include <optional>
#include <string>

namespace Reader {
namespace Utils {

// A validated absolute http(s) URL. Scheme and host are always non-empty and
// lower-cased, the path always starts with '/'. Default ports are dropped.
struct TargetUrl {
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path = "/";
    std::string query;
    std::string fragment;

    std::string to_string() const;
    // Origin-form request target: path plus query, no fragment.
    std::string request_target() const;
    std::string effective_port() const;
    bool        is_https() const {
        return scheme == "https";
    }
};

class Url {
public:
    // Strict absolute URL parser. Returns std::nullopt when `url` is relative,
    // uses a scheme other than http/https, has no host or an invalid port.
    static std::optional<TargetUrl> parse_absolute(const std::string& url);

    // One pass of percent-decoding. Returns std::nullopt on a malformed escape.
    static std::optional<std::string> percent_decode(const std::string& str);

    // RFC 3986 reference resolution against `base`, used for redirect
    // locations. The result goes through parse_absolute, so a location that
    // leaves http(s) yields std::nullopt.
    static std::optional<TargetUrl> resolve(const TargetUrl& base, const std::string& reference);
};

}  // namespace Utils
}  // namespace Reader
