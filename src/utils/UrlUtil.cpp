#include "UrlUtil.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace Anime1Relay {
namespace UrlUtil {

static inline bool starts_with(const std::string& s, const char* pfx) {
    size_t n = strlen(pfx);
    return s.size() >= n && memcmp(s.data(), pfx, n) == 0;
}

static inline std::string get_scheme_host(const std::string& url) {
    // Very small parser: scheme://host[:port]
    auto pos_scheme = url.find("://");
    if (pos_scheme == std::string::npos) return {};
    auto start_host = pos_scheme + 3;
    auto pos_end = url.find_first_of("/\\?#", start_host);
    if (pos_end == std::string::npos) pos_end = url.size();
    return url.substr(0, pos_end);
}

static inline std::string get_base_dir(const std::string& url) {
    // Returns scheme://host[:port]/path/dir (without filename)
    auto scheme_host = get_scheme_host(url);
    if (scheme_host.empty()) return {};
    std::string rest = url.substr(scheme_host.size());
    auto qpos = rest.find_first_of("?#");
    if (qpos != std::string::npos) rest = rest.substr(0, qpos);
    if (!rest.empty()) {
        if (rest.back() != '/') {
            auto slash = rest.find_last_of('/');
            if (slash != std::string::npos) rest = rest.substr(0, slash + 1);
            else rest = "/";
        }
    } else {
        rest = "/";
    }
    return scheme_host + rest;
}

static inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string ExtractHost(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return {};
    auto start = scheme_end + 3;
    auto end = url.find_first_of("/\\?#", start);
    if (end == std::string::npos) end = url.size();
    std::string authority = url.substr(start, end - start);

    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string host;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return {};
        host = authority.substr(0, close + 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }
    std::transform(host.begin(), host.end(), host.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return host;
}

bool HostMatchesDomain(const std::string& host, const std::string& domain) {
    if (host.empty() || domain.empty()) return false;
    if (host == domain) return true;
    if (host.size() <= domain.size() + 1) return false;
    return host.compare(host.size() - domain.size(), domain.size(), domain) == 0
        && host[host.size() - domain.size() - 1] == '.';
}

std::string ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    if (candidate.empty()) return candidate;
    if (starts_with(candidate, "http://") || starts_with(candidate, "https://")) return candidate;

    auto scheme_host = get_scheme_host(base_url);
    if (scheme_host.empty()) return candidate; // fallback

    if (starts_with(candidate, "//")) {
        return scheme_host.substr(0, scheme_host.find("://")) + ":" + candidate;
    }

    if (candidate[0] == '/') {
        return scheme_host + candidate;
    }

    auto base_dir = get_base_dir(base_url);
    if (base_dir.empty()) return candidate;
    if (base_dir.back() != '/') {
        return base_dir + "/" + candidate;
    }
    return base_dir + candidate;
}

std::string PercentEncode(const std::string& s) {
    auto is_unreserved = [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    };
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::string PercentDecode(const std::string& s, bool plus_as_space) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string FormEncode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string body;
    for (const auto& field : fields) {
        if (!body.empty()) body.push_back('&');
        body += PercentEncode(field.first);
        body.push_back('=');
        body += PercentEncode(field.second);
    }
    return body;
}

std::optional<std::string> GetQueryParam(const std::string& target, const std::string& key) {
    auto qpos = target.find('?');
    if (qpos == std::string::npos) return std::nullopt;
    auto end = target.find('#', qpos);
    std::string qs = target.substr(qpos + 1, end == std::string::npos ? std::string::npos : end - qpos - 1);

    size_t start = 0;
    while (start <= qs.size()) {
        auto amp = qs.find('&', start);
        std::string kv = qs.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        auto eq = kv.find('=');
        std::string k = PercentDecode(kv.substr(0, eq), true);
        if (k == key) {
            return eq == std::string::npos ? std::string() : PercentDecode(kv.substr(eq + 1), true);
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return std::nullopt;
}

std::string GetPath(const std::string& target) {
    return target.substr(0, target.find_first_of("?#"));
}

std::optional<std::string> SplitPart(const std::string& s, char sep, size_t index) {
    size_t start = 0;
    for (size_t i = 0; i < index; ++i) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) return std::nullopt;
        start = pos + 1;
    }
    auto end = s.find(sep, start);
    return s.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string TrimTrailingSlashes(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

}
}
