#include <catch2/catch_test_macros.hpp>
#include <webprobe/elements/cookie/cookie.hpp>
#include <fixtures/recording_transport.hpp>
#include <fixtures/page_auditor.hpp>
#include <string>

using namespace webprobe;
using namespace webprobe::elements;
using namespace std::string_literals;

TEST_CASE("Cookie construction", "[cookie][unit]") {

    SECTION("from name and value") {
        cookie c("http://owner-url.com/app/index.php", "session", "abc123");
        REQUIRE(c.name() == "session");
        REQUIRE(c.value() == "abc123");
        REQUIRE(c.inputs() == element::input_map{{"session", "abc123"}});
        REQUIRE(c.type() == "cookie");
        REQUIRE(c.method() == "get");
        REQUIRE(c.action() == "http://owner-url.com/app/index.php");
    }

    SECTION("from a bare name => value map") {
        cookie c("http://owner-url.com/", attribute_map{{"session", "abc123"s}});
        REQUIRE(c.name() == "session");
        REQUIRE(c.value() == "abc123");
        REQUIRE(c.simple() == element::input_map{{"session", "abc123"}});
    }

    SECTION("from a full attribute map") {
        cookie c("http://owner-url.com/", attribute_map{
            {"name", "id"s}, {"value", "42"s}, {"domain", ".foo.com"s},
            {"path", "/x"s}, {"secure", true}, {"httponly", true}});
        REQUIRE(c.name() == "id");
        REQUIRE(c.domain() == ".foo.com");
        REQUIRE(c.path() == "/x");
        REQUIRE(c.is_secure());
        REQUIRE(c.is_http_only());
    }

    SECTION("without input") {
        cookie c("http://owner-url.com/");
        REQUIRE(c.inputs().empty());
        REQUIRE(c.name().empty());
    }

    SECTION("value is decoded") {
        cookie c("http://owner-url.com/", "coo@ki e2", "blah+val2%40");
        REQUIRE(c.value() == "blah val2@");
        REQUIRE(c.inputs().at("coo@ki e2") == "blah val2@");
    }

    SECTION("original inputs are frozen") {
        cookie c("http://owner-url.com/", "session", "abc123");
        c.set_inputs({{"session", "changed"}});
        REQUIRE(c.original() == element::input_map{{"session", "abc123"}});
        REQUIRE(c.value() == "changed");
    }
}

TEST_CASE("Cookie defaults from owner url", "[cookie][unit]") {

    SECTION("path and domain come from the url") {
        cookie c("http://owner-url.com/some/path?q=1", "a", "1");
        REQUIRE(c.path() == "/some/path");
        REQUIRE(c.domain() == "owner-url.com");
    }

    SECTION("empty url path defaults to /") {
        cookie c("http://owner-url.com", "a", "1");
        REQUIRE(c.path() == "/");
    }

    SECTION("explicit path and domain win") {
        cookie c("http://owner-url.com/x", attribute_map{
            {"name", "a"s}, {"value", "1"s}, {"path", "/y"s}, {"domain", "other.com"s}});
        REQUIRE(c.path() == "/y");
        REQUIRE(c.domain() == "other.com");
    }

    SECTION("remaining attributes have their defaults") {
        cookie c("http://owner-url.com/", "a", "1");
        REQUIRE(c.version() == 0);
        REQUIRE_FALSE(c.is_http_only());
        REQUIRE_FALSE(c.is_secure());
        REQUIRE(c.attributes().is_absent(attribute::secure));
        REQUIRE(c.attributes().is_absent(attribute::comment));
        REQUIRE_FALSE(c.max_age().has_value());
    }
}

TEST_CASE("Cookie attribute access", "[cookie][unit]") {
    cookie c("http://owner-url.com/", attribute_map{{"name", "a"s}, {"value", "1"s}, {"comment", "hi"s}});

    SECTION("known attributes") {
        REQUIRE(cookie::has_attribute("comment"));
        REQUIRE(c.get_string("comment") == "hi");
        REQUIRE(std::holds_alternative<std::monostate>(c.attribute("port")));
    }

    SECTION("unknown attributes throw") {
        REQUIRE_FALSE(cookie::has_attribute("flavour"));
        REQUIRE_THROWS_AS(c.attribute("flavour"), no_such_attribute);
    }
}

TEST_CASE("Cookie predicates", "[cookie][unit]") {
    const auto expiry = time_point(std::chrono::seconds(1349205957));

    SECTION("secure and httponly require exactly true") {
        cookie c("http://a.com/", attribute_map{{"name", "a"s}, {"value", "1"s}, {"secure", "true"s}});
        REQUIRE_FALSE(c.is_secure());
    }

    SECTION("session cookie") {
        cookie c("http://a.com/", "a", "1");
        REQUIRE(c.is_session());
        REQUIRE_FALSE(c.expires_at().has_value());
        REQUIRE_FALSE(c.is_expired(expiry + std::chrono::hours(24 * 365 * 100)));
    }

    SECTION("expired only strictly after expiry") {
        cookie c("http://a.com/", attribute_map{{"name", "a"s}, {"value", "1"s}, {"expires", expiry}});
        REQUIRE_FALSE(c.is_session());
        REQUIRE(c.expires_at() == expiry);
        REQUIRE_FALSE(c.is_expired(expiry - std::chrono::seconds(1)));
        REQUIRE_FALSE(c.is_expired(expiry));
        REQUIRE(c.is_expired(expiry + std::chrono::seconds(1)));
        REQUIRE(c.is_expired());
    }
}

TEST_CASE("Cookie input reassignment", "[cookie][unit]") {
    cookie c("http://a.com/", "a", "1");

    SECTION("name and value follow the input pair") {
        c.set_inputs({{"b", "2"}});
        REQUIRE(c.name() == "b");
        REQUIRE(c.value() == "2");
        REQUIRE(c.inputs() == element::input_map{{"b", "2"}});
    }

    SECTION("only one pair is kept") {
        c.set_inputs({{"x", "1"}, {"y", "2"}});
        REQUIRE(c.inputs().size() == 1);
    }

    SECTION("an empty name clears the input") {
        c.set_inputs({{"", "orphan"}});
        REQUIRE(c.inputs().empty());
        REQUIRE(c.value() == "orphan");
    }
}

TEST_CASE("Cookie wire form", "[cookie][unit]") {

    SECTION("name and value are encoded") {
        cookie c("http://a.com/", "coo@ki e2", "blah val2@;x=1");
        REQUIRE(c.to_string() == "coo@ki+e2=blah+val2@%3Bx%3D1");
    }

    SECTION("simple pair") {
        cookie c("http://a.com/", "session", "abc");
        REQUIRE(c.to_string() == "session=abc");
    }
}

TEST_CASE("Cookie copies", "[cookie][unit]") {
    cookie c("http://a.com/", "a", "1");

    SECTION("clone is independent") {
        auto copy = std::dynamic_pointer_cast<cookie>(c.clone());
        REQUIRE(copy);
        copy->set_inputs({{"b", "2"}});
        copy->options().cookies["x"] = "y";
        REQUIRE(c.name() == "a");
        REQUIRE(c.options().cookies.empty());
        REQUIRE(copy->original() == c.original());
    }

    SECTION("identity ignores provenance labels") {
        auto copy = c.clone();
        copy->set_altered("label");
        REQUIRE(copy->id() == c.id());
    }
}

TEST_CASE("Cookie request assembly", "[cookie][unit]") {
    test::RecordingTransport transport;

    SECTION("cookie travels in the cookie channel of a GET") {
        cookie c("http://a.com/page", "session", "abc");
        c.set_method("post");
        c.submit(transport, nullptr);

        REQUIRE(transport.requests.size() == 1);
        const auto& request = transport.requests.front();
        REQUIRE(request.method == "GET");
        REQUIRE(request.url == "http://a.com/page");
        REQUIRE(request.options.cookies == std::map<std::string, std::string>{{"session", "abc"}});
        REQUIRE(request.options.params.empty());
    }
}

TEST_CASE("Cookie audit", "[cookie][audit][unit]") {
    test::RecordingTransport transport;
    auto auditor = std::make_shared<test::PageAuditor>();
    config::scan_options scan;
    mutation_options options;

    cookie c("http://a.com/", "session", "abc");
    c.set_auditor(auditor);

    SECTION("excluded cookies are skipped before any mutation") {
        scan.exclude_cookies = {"session"};
        size_t responses = 0;
        auto result = c.audit("<x>", options, scan, transport,
                              [&](const http::http_response&, const element&) { ++responses; });

        REQUIRE(result.skipped);
        REQUIRE(result.dispatched == 0);
        REQUIRE(transport.requests.empty());
        REQUIRE(responses == 0);
        REQUIRE(auditor->messages == std::vector<std::string>{"Skipping audit of 'session' cookie."});
    }

    SECTION("other cookies dispatch every mutation") {
        scan.exclude_cookies = {"other"};
        std::vector<std::string> values;
        auto result = c.audit("<x>", options, scan, transport,
                              [&](const http::http_response& response, const element& mutation) {
                                  REQUIRE(response.is_ok());
                                  values.push_back(mutation.inputs().at("session"));
                              });

        REQUIRE_FALSE(result.skipped);
        REQUIRE(result.dispatched == 4);
        REQUIRE(transport.requests.size() == 4);
        REQUIRE(values == std::vector<std::string>{"<x>", "abc<x>", std::string("<x>\0", 4), ";<x>"});
        for (const auto& request : transport.requests) {
            REQUIRE(request.method == "GET");
            REQUIRE(request.options.params.empty());
            REQUIRE(request.options.cookies.count("session") == 1);
        }
        REQUIRE(auditor->messages.empty());
    }
}
