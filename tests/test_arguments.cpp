#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libwire.hpp>

#include <memory>
#include <string>

using namespace libwire;

namespace {

injector make_injector() {
    return libwire::bind({{key("b"), 2}}, {.warn_when_unneeded = false});
}

} // namespace

// ---------------------------------------------------------------
// Call-time argument errors
// ---------------------------------------------------------------

TEST_CASE("Arguments: unknown keyword is rejected", "[arguments]") {
    auto op = make_injector().wrap([](int a, int b) { return a + b; },
                                   {param("a"), param("b", key("b"))}, "add");
    try {
        op(1, named("c", 3));
        FAIL("Expected argument_error");
    } catch (const argument_error& e) {
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("add"));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("'c'"));
    }
}

TEST_CASE("Arguments: a parameter cannot be given twice", "[arguments]") {
    auto op = make_injector().wrap([](int a, int b) { return a + b; },
                                   {param("a"), param("b", key("b"))}, "add");

    REQUIRE_THROWS_AS(op(1, named("a", 3)), argument_error);
    REQUIRE_THROWS_AS(op(1, 2, named("b", 3)), argument_error);
    REQUIRE_THROWS_AS(op(named("a", 1), named("a", 1)), argument_error);
}

TEST_CASE("Arguments: missing non-injectable parameter is rejected", "[arguments]") {
    auto op = make_injector().wrap([](int a, int b) { return a + b; },
                                   {param("a"), param("b", key("b"))}, "add");
    try {
        op();
        FAIL("Expected argument_error");
    } catch (const argument_error& e) {
        REQUIRE_THAT(std::string(e.what()),
                     Catch::Matchers::ContainsSubstring("missing required argument 'a'"));
    }
}

TEST_CASE("Arguments: keyword value of an incompatible type is rejected", "[arguments]") {
    auto op = make_injector().wrap([](int a, int b) { return a + b; },
                                   {param("a"), param("b", key("b"))}, "add");

    REQUIRE_THROWS_AS(op(named("a", std::string("one"))), argument_error);
}

TEST_CASE("Arguments: non-const reference parameters refuse temporaries", "[arguments]") {
    auto op = make_injector().wrap([](std::string& s) { s += "!"; },
                                   {param("s")}, "shout");

    std::string text = "hi";
    op(named("s", text));
    REQUIRE(text == "hi!");
    REQUIRE_THROWS_AS(op(named("s", std::string("tmp"))), argument_error);
}

TEST_CASE("Arguments: injected value of the wrong type raises type_mismatch", "[arguments]") {
    auto inj = libwire::bind({{key("n"), std::string("not a number")}});
    auto op = inj.wrap([](int n) { return n; }, {param("n", key("n"))});

    REQUIRE_THROWS_AS(op(), type_mismatch);
    REQUIRE(op(3) == 3);
}

TEST_CASE("Arguments: null dependency cannot bind to a reference", "[arguments]") {
    auto map = std::make_shared<dependency_map>();
    map->add_instance(key("conn"), std::shared_ptr<std::string>());

    auto by_ref = libwire::bind(map).wrap([](const std::string& s) { return s; },
                                          {param("s", key("conn"))});
    auto by_ptr = libwire::bind(map).wrap([](std::shared_ptr<std::string> s) { return s == nullptr; },
                                          {param("s", key("conn"))});

    REQUIRE_THROWS_AS(by_ref(), argument_error);
    REQUIRE(by_ptr());
}

// ---------------------------------------------------------------
// Wrap-time declaration errors
// ---------------------------------------------------------------

TEST_CASE("Arguments: declaration must cover every parameter", "[arguments]") {
    auto inj = make_injector();
    REQUIRE_THROWS_AS(inj.wrap([](int, int) { return 0; }, {param("a")}), di_error);
    REQUIRE_THROWS_AS(inj.wrap([](int) { return 0; }, {param("a"), param("b")}), di_error);
}

TEST_CASE("Arguments: parameter names must be unique", "[arguments]") {
    auto inj = make_injector();
    REQUIRE_THROWS_AS(inj.wrap([](int, int) { return 0; }, {param("a"), param("a")}), di_error);
}

TEST_CASE("Arguments: non-copyable parameters cannot be injection points", "[arguments]") {
    auto inj = libwire::bind({{key("p"), 1}});

    try {
        inj.wrap([](std::unique_ptr<int> p) { return *p; }, {param("p", key("p"))}, "consume");
        FAIL("Expected argument_error");
    } catch (const argument_error& e) {
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("consume"));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("'p'"));
    }
    REQUIRE_THROWS_AS(inj.wrap([](std::unique_ptr<int>&& p) { return *p; },
                               {param("p", key("p"))}),
                      argument_error);
}

TEST_CASE("Arguments: non-copyable parameters can still be supplied by the caller", "[arguments]") {
    auto op = libwire::bind({{key("n"), 2}}).wrap(
        [](std::unique_ptr<int> p, int n) { return *p * n; },
        {param("p"), param("n", key("n"))}, "scale");

    REQUIRE(op(std::make_unique<int>(21)) == 42);
    REQUIRE(op(named("p", std::make_unique<int>(5))) == 10);
}

TEST_CASE("Arguments: argument_error is a di_error", "[arguments]") {
    auto op = make_injector().wrap([](int a) { return a; }, {param("a")}, "identity");
    REQUIRE_THROWS_AS(op(), di_error);
}
