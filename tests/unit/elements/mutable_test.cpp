#include <catch2/catch_test_macros.hpp>
#include <webprobe/elements/capabilities/mutable.hpp>
#include <webprobe/elements/link.hpp>

using namespace webprobe;
using namespace webprobe::elements;

TEST_CASE("Injection formats", "[mutable][unit]") {
    REQUIRE(basic_mutator::format("<p>", "orig", injection_format::straight) == "<p>");
    REQUIRE(basic_mutator::format("<p>", "orig", injection_format::append) == "orig<p>");
    REQUIRE(basic_mutator::format("<p>", "orig", injection_format::null) == std::string("<p>\0", 4));
    REQUIRE(basic_mutator::format("<p>", "orig", injection_format::semicolon) == ";<p>");
}

TEST_CASE("Basic mutator", "[mutable][unit]") {
    basic_mutator mutator;
    config::scan_options scan;
    scan.seed = "seed";
    mutation_options options;

    SECTION("one variant per input and format") {
        elements::link l("http://test.com/", "http://test.com/search", {{"q", "term"}, {"page", "2"}});
        auto variants = mutator.mutations(l, "<p>", options, scan);
        REQUIRE(variants.size() == 8);

        for (const auto& v : variants) {
            REQUIRE(v->type() == "link");
            REQUIRE(v->original() == l.original());
        }
        REQUIRE(variants[0]->altered() == "page");
        REQUIRE(variants[0]->inputs() == element::input_map{{"page", "<p>"}, {"q", "term"}});
        REQUIRE(variants[5]->inputs().at("q") == "term<p>");
    }

    SECTION("empty inputs are filled in every variant") {
        elements::link l("http://test.com/", "http://test.com/item", {{"id", ""}, {"q", "x"}});
        options.formats = {injection_format::straight};
        auto variants = mutator.mutations(l, "<p>", options, scan);
        REQUIRE(variants.size() == 2);
        REQUIRE(variants[0]->inputs() == element::input_map{{"id", "<p>"}, {"q", "x"}});
        REQUIRE(variants[1]->inputs() == element::input_map{{"id", "1"}, {"q", "<p>"}});
    }

    SECTION("append uses the filled value") {
        elements::link l("http://test.com/", "http://test.com/item", {{"id", ""}});
        options.formats = {injection_format::append};
        auto variants = mutator.mutations(l, "<p>", options, scan);
        REQUIRE(variants[0]->inputs().at("id") == "1<p>");
    }

    SECTION("inputs holding the seed are skipped") {
        elements::link l("http://test.com/", "http://test.com/search", {{"<p>", "seed"}});
        REQUIRE(mutator.mutations(l, "<p>", options, scan).empty());
    }

    SECTION("duplicate variants are dropped") {
        // the same format twice yields identical variants
        elements::link l("http://test.com/", "http://test.com/search", {{"q", "<p>"}});
        options.formats = {injection_format::straight, injection_format::straight};
        REQUIRE(mutator.mutations(l, "<p>", options, scan).size() == 1);
    }

    SECTION("elements without inputs have no variants") {
        elements::link l("http://test.com/", "http://test.com/about", {});
        REQUIRE(mutator.mutations(l, "<p>", options, scan).empty());
    }
}
