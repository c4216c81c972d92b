#include <catch2/catch_test_macros.hpp>
#include <webprobe/http/util/url.hpp>

using namespace webprobe::http::util::url;

// ============================================================================
// parse
// ============================================================================

TEST_CASE("url parse", "[url][unit]") {

    SECTION("All components") {
        auto url = parse("https://user:pw@example.com:8443/a/b?x=1&y=2#top");
        REQUIRE(url);
        REQUIRE(url->scheme == "https");
        REQUIRE(url->host == "example.com");
        REQUIRE(url->port == 8443);
        REQUIRE(url->path == "/a/b");
        REQUIRE(url->query == "x=1&y=2");
        REQUIRE(url->fragment == "top");
    }

    SECTION("Host only") {
        auto url = parse("http://test.com");
        REQUIRE(url);
        REQUIRE(url->host == "test.com");
        REQUIRE_FALSE(url->port);
        REQUIRE(url->path.empty());
    }

    SECTION("IPv6 host") {
        auto url = parse("http://[::1]:8080/");
        REQUIRE(url);
        REQUIRE(url->host == "[::1]");
        REQUIRE(url->port == 8080);
        REQUIRE(url->path == "/");
    }

    SECTION("Relative or invalid urls") {
        REQUIRE_FALSE(parse("/just/a/path"));
        REQUIRE_FALSE(parse("not a url"));
        REQUIRE_FALSE(parse("http://test.com:99999/"));
    }
}

// ============================================================================
// percent_escape
// ============================================================================

TEST_CASE("percent_escape", "[url][unit]") {

    SECTION("Only unsafe characters are escaped") {
        REQUIRE(percent_escape("a=b;c", "=;") == "a%3Db%3Bc");
        REQUIRE(percent_escape("hello world", "=;") == "hello world");
    }

    SECTION("Uppercase hex") {
        REQUIRE(percent_escape("\xC3\xA9", "\xC3\xA9") == "%C3%A9");
    }

    SECTION("NUL can be unsafe") {
        REQUIRE(percent_escape(std::string_view("a\0b", 3), std::string_view("\0", 1)) == "a%00b");
    }

    SECTION("Empty string") {
        REQUIRE(percent_escape("", "=").empty());
    }
}

// ============================================================================
// percent_unescape
// ============================================================================

TEST_CASE("percent_unescape", "[url][unit]") {

    SECTION("Decodes sequences in either case") {
        REQUIRE(percent_unescape("a%3Db%3bc") == "a=b;c");
        REQUIRE(percent_unescape("caf%C3%A9") == "caf\xC3\xA9");
    }

    SECTION("Plus is left alone") {
        REQUIRE(percent_unescape("a+b") == "a+b");
    }

    SECTION("Malformed sequences are kept") {
        REQUIRE(percent_unescape("100%") == "100%");
        REQUIRE(percent_unescape("%zz") == "%zz");
        REQUIRE(percent_unescape("%4") == "%4");
    }

    SECTION("NUL is decoded") {
        REQUIRE(percent_unescape("a%00b") == std::string("a\0b", 3));
    }
}
