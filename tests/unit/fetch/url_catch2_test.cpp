#include <catch2/catch_test_macros.hpp>

#include <repofetch/fetch/url.h>

using namespace repofetch::fetch::url;

TEST_CASE("joinUrl", "[fetch][url]") {
    CHECK(joinUrl("https://h/c/noarch", "repodata.json") == "https://h/c/noarch/repodata.json");
    CHECK(joinUrl("https://h/c/noarch/", "/repodata.json") == "https://h/c/noarch/repodata.json");
    CHECK(joinUrl("https://h/c/noarch//", "") == "https://h/c/noarch");
    CHECK(joinUrl("", "repodata.json") == "repodata.json");
}

TEST_CASE("unquote", "[fetch][url]") {
    CHECK(unquote("a%20b%2Fc") == "a b/c");
    CHECK(unquote("100%") == "100%");
    CHECK(unquote("%zz") == "%zz");
    CHECK(unquote("%4") == "%4");
    CHECK(unquote("plain") == "plain");
}

TEST_CASE("extractToken", "[fetch][url]") {
    CHECK(extractToken("https://conda.anaconda.org/t/abc-123/chan/noarch") ==
          std::optional<std::string>("abc-123"));
    CHECK(extractToken("https://conda.anaconda.org/t/xy_z") == std::optional<std::string>("xy_z"));
    CHECK_FALSE(extractToken("https://conda.anaconda.org/chan/noarch"));
    CHECK_FALSE(extractToken("https://h/t/bad.token/x"));
}

TEST_CASE("location, lastSegment and dirname", "[fetch][url]") {
    CHECK(location("https://conda.anaconda.org/") == "conda.anaconda.org");
    CHECK(location("conda.anaconda.org/x") == "conda.anaconda.org/x");
    CHECK(lastSegment("https://h/c/noarch/") == "noarch");
    CHECK(lastSegment("noarch") == "noarch");
    CHECK(dirname("https://h/c/linux-64/") == "https://h/c");
    CHECK(dirname("linux-64").empty());
}
