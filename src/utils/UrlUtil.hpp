#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Anime1Relay {
namespace UrlUtil {

// Lower-cased host of an absolute URL, without userinfo or port. Empty on parse failure.
std::string ExtractHost(const std::string& url);

// True when host equals domain or is a subdomain of it.
bool HostMatchesDomain(const std::string& host, const std::string& domain);

// Resolve possibly-relative or protocol-relative URL against a base URL (page URL).
// Rules:
// - If candidate starts with http:// or https://, return as-is.
// - If candidate starts with //, prefix the scheme of base_url.
// - If candidate starts with /, return base_scheme://base_host + candidate.
// - Otherwise, append to base directory: base_scheme://base_host/base_dir/ + candidate.
// On parse failure, returns candidate unchanged.
std::string ResolveAgainst(const std::string& base_url, const std::string& candidate);

// RFC 3986 percent-encoding of everything except unreserved characters.
std::string PercentEncode(const std::string& s);

// Decodes %XX sequences; malformed sequences are kept verbatim. '+' is decoded
// to a space only when plus_as_space is set (query strings).
std::string PercentDecode(const std::string& s, bool plus_as_space = false);

// application/x-www-form-urlencoded body.
std::string FormEncode(const std::vector<std::pair<std::string, std::string>>& fields);

// Decoded value of a query parameter in a request target such as "/p?url=...".
std::optional<std::string> GetQueryParam(const std::string& target, const std::string& key);

// Path part of a request target, without query or fragment.
std::string GetPath(const std::string& target);

// Piece number index of s split on sep, or nullopt when there are fewer pieces.
std::optional<std::string> SplitPart(const std::string& s, char sep, size_t index);

std::string TrimTrailingSlashes(std::string s);

}
}
