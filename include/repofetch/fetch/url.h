#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace repofetch::fetch::url {

// Join two URL parts with exactly one '/' between them. Empty parts are skipped.
// joinUrl("https://host/chan/noarch/", "/repodata.json")
//   == "https://host/chan/noarch/repodata.json"
std::string joinUrl(std::string_view base, std::string_view part);

// Percent-decode; malformed escapes are kept verbatim.
std::string unquote(std::string_view s);

// Anaconda-style channel token embedded as "/t/<token>/" in the path.
std::optional<std::string> extractToken(std::string_view url);

// Scheme-less form with no trailing slash: "https://a.org/x/" -> "a.org/x"
std::string location(std::string_view url);

// Last non-empty path segment ("https://h/c/noarch/" -> "noarch").
std::string lastSegment(std::string_view url);

// Everything before the last non-empty path segment, without trailing slash.
std::string dirname(std::string_view url);

} // namespace repofetch::fetch::url
