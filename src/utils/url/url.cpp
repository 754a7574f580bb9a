#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>
#include <vector>

namespace Reader {
namespace Utils {

namespace {

constexpr int kMaxPort = 65535;

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

// True when `ref` starts with "scheme:", i.e. it is not a relative reference.
bool has_scheme(const std::string& ref) {
    size_t colon = ref.find(':');
    if (colon == std::string::npos || colon == 0 || !std::isalpha(static_cast<unsigned char>(ref[0])))
        return false;
    return std::all_of(ref.begin(), ref.begin() + static_cast<std::ptrdiff_t>(colon), is_scheme_char);
}

// Host code points that can never appear in a hostname.
bool is_forbidden_host_char(unsigned char c) {
    if (c <= 0x20 || c == 0x7f || c >= 0x80)
        return true;
    switch (c) {
        case '#':
        case '%':
        case '/':
        case ':':
        case '<':
        case '>':
        case '?':
        case '@':
        case '[':
        case '\\':
        case ']':
        case '^':
        case '|':
            return true;
        default:
            return false;
    }
}

// Percent-encodes spaces and non-ASCII bytes, leaving existing escapes alone.
std::string encode_component(std::string_view sv) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string           out;
    out.reserve(sv.size());
    for (unsigned char c : sv) {
        if (c == ' ' || c == '"' || c == '<' || c == '>' || c == '`' || c >= 0x80) {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0f];
        }
        else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    size_t                   pos = 1;
    while (pos <= path.size()) {
        size_t      next    = path.find('/', pos);
        std::string segment = path.substr(pos, next == std::string::npos ? std::string::npos
                                                                          : next - pos);
        bool        last    = next == std::string::npos;
        if (segment == ".." || segment == "%2e%2e" || segment == "%2E%2E") {
            if (!segments.empty())
                segments.pop_back();
            if (last)
                segments.emplace_back();
        }
        else if (segment == "." || segment == "%2e" || segment == "%2E") {
            if (last)
                segments.emplace_back();
        }
        else {
            segments.push_back(std::move(segment));
        }
        if (last)
            break;
        pos = next + 1;
    }

    std::string normalized;
    for (const auto& segment : segments) {
        normalized += "/" + segment;
    }
    return normalized.empty() ? "/" : normalized;
}

bool parse_host(const std::string& host_port, TargetUrl& out) {
    std::string host;
    std::string port;

    if (!host_port.empty() && host_port[0] == '[') {
        size_t end_bracket = host_port.find(']');
        if (end_bracket == std::string::npos)
            return false;
        host = host_port.substr(0, end_bracket + 1);
        for (size_t i = 1; i < end_bracket; ++i) {
            char c = host[i];
            if (!std::isxdigit(static_cast<unsigned char>(c)) && c != ':' && c != '.')
                return false;
        }
        if (end_bracket == 1)
            return false;
        std::string rest = host_port.substr(end_bracket + 1);
        if (!rest.empty()) {
            if (rest[0] != ':')
                return false;
            port = rest.substr(1);
        }
    }
    else {
        size_t p_colon = host_port.find_last_of(':');
        if (p_colon != std::string::npos) {
            host = host_port.substr(0, p_colon);
            port = host_port.substr(p_colon + 1);
        }
        else {
            host = host_port;
        }
        for (char c : host) {
            if (is_forbidden_host_char(static_cast<unsigned char>(c)))
                return false;
        }
    }

    if (host.empty())
        return false;

    if (!port.empty()) {
        if (port.size() > 5
            || !std::all_of(port.begin(), port.end(), [](unsigned char c) {
                   return std::isdigit(c);
               }))
            return false;
        int value = std::stoi(port);
        if (value > kMaxPort)
            return false;
        port = std::to_string(value);
    }

    std::transform(host.begin(), host.end(), host.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    out.host = host;
    out.port = port;
    return true;
}

}  // namespace

std::string TargetUrl::to_string() const {
    std::string out = scheme + "://";
    if (!userinfo.empty())
        out += userinfo + "@";
    out += host;
    if (!port.empty())
        out += ":" + port;
    out += path;
    if (!query.empty())
        out += "?" + query;
    if (!fragment.empty())
        out += "#" + fragment;
    return out;
}

std::string TargetUrl::request_target() const {
    return query.empty() ? path : path + "?" + query;
}

std::string TargetUrl::effective_port() const {
    if (!port.empty())
        return port;
    return is_https() ? "443" : "80";
}

std::optional<TargetUrl> Url::parse_absolute(const std::string& url) {
    for (unsigned char c : url) {
        if (c < 0x20 || c == 0x7f)
            return std::nullopt;
    }

    size_t colon = url.find(':');
    if (colon == std::string::npos || colon == 0
        || !std::isalpha(static_cast<unsigned char>(url[0])))
        return std::nullopt;
    for (size_t i = 0; i < colon; ++i) {
        if (!is_scheme_char(url[i]))
            return std::nullopt;
    }

    TargetUrl target;
    target.scheme = url.substr(0, colon);
    std::transform(target.scheme.begin(),
                   target.scheme.end(),
                   target.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (target.scheme != "http" && target.scheme != "https")
        return std::nullopt;

    std::string_view sv(url);
    sv.remove_prefix(colon + 1);
    while (!sv.empty() && (sv.front() == '/' || sv.front() == '\\'))
        sv.remove_prefix(1);

    size_t      end_auth  = sv.find_first_of("/\\?#");
    std::string authority = std::string(sv.substr(0, end_auth));
    sv.remove_prefix(end_auth == std::string_view::npos ? sv.size() : end_auth);

    size_t at = authority.find_last_of('@');
    if (at != std::string::npos) {
        target.userinfo = encode_component(std::string_view(authority).substr(0, at));
        authority       = authority.substr(at + 1);
    }
    if (!parse_host(authority, target))
        return std::nullopt;

    if ((target.scheme == "http" && target.port == "80")
        || (target.scheme == "https" && target.port == "443"))
        target.port.clear();

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        target.fragment = encode_component(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }
    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        target.query = encode_component(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    std::string path = encode_component(sv);
    std::replace(path.begin(), path.end(), '\\', '/');
    target.path = path.empty() ? "/" : remove_dot_segments(path);
    return target;
}

std::optional<std::string> Url::percent_decode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] != '%') {
            out += str[i];
            continue;
        }
        if (i + 2 >= str.size())
            return std::nullopt;
        int hi = hex_value(str[i + 1]);
        int lo = hex_value(str[i + 2]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

std::optional<TargetUrl> Url::resolve(const TargetUrl& base, const std::string& reference) {
    if (reference.empty()) {
        TargetUrl out = base;
        out.fragment.clear();
        return out;
    }
    if (has_scheme(reference))
        return parse_absolute(reference);
    if (reference.rfind("//", 0) == 0)
        return parse_absolute(base.scheme + ":" + reference);

    std::string origin = base.scheme + "://";
    if (!base.userinfo.empty())
        origin += base.userinfo + "@";
    origin += base.host;
    if (!base.port.empty())
        origin += ":" + base.port;

    switch (reference.front()) {
        case '/':
            return parse_absolute(origin + reference);
        case '?':
            return parse_absolute(origin + base.path + reference);
        case '#':
            return parse_absolute(origin + base.request_target() + reference);
        default:
            return parse_absolute(origin + base.path.substr(0, base.path.rfind('/') + 1) + reference);
    }
}

}  // namespace Utils
}  // namespace Reader
