#include <repofetch/fetch/url.h>

#include <regex>

namespace repofetch::fetch::url {

namespace {

std::string_view stripSlashes(std::string_view s) {
    while (!s.empty() && s.front() == '/')
        s.remove_prefix(1);
    while (!s.empty() && s.back() == '/')
        s.remove_suffix(1);
    return s;
}

std::string_view stripTrailingSlashes(std::string_view s) {
    while (!s.empty() && s.back() == '/')
        s.remove_suffix(1);
    return s;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

std::string joinUrl(std::string_view base, std::string_view part) {
    auto b = stripTrailingSlashes(base);
    auto p = stripSlashes(part);
    if (p.empty())
        return std::string(b);
    if (b.empty())
        return std::string(p);
    std::string out(b);
    out.push_back('/');
    out.append(p);
    return out;
}

std::string unquote(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::optional<std::string> extractToken(std::string_view url) {
    static const std::regex re(R"(/t/([A-Za-z0-9_-]+)(/|$))");
    std::match_results<std::string_view::const_iterator> m;
    if (std::regex_search(url.begin(), url.end(), m, re)) {
        return m[1].str();
    }
    return std::nullopt;
}

std::string location(std::string_view url) {
    auto pos = url.find("://");
    if (pos != std::string_view::npos)
        url.remove_prefix(pos + 3);
    return std::string(stripTrailingSlashes(url));
}

std::string lastSegment(std::string_view url) {
    auto s = stripTrailingSlashes(url);
    auto pos = s.rfind('/');
    if (pos == std::string_view::npos)
        return std::string(s);
    return std::string(s.substr(pos + 1));
}

std::string dirname(std::string_view url) {
    auto s = stripTrailingSlashes(url);
    auto pos = s.rfind('/');
    if (pos == std::string_view::npos)
        return {};
    return std::string(stripTrailingSlashes(s.substr(0, pos)));
}

} // namespace repofetch::fetch::url
