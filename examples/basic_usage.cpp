/// basic_usage.cpp — libwire introductory example.
///
/// Demonstrates the register → bind → wrap → call workflow:
///   1. Register dependencies in a dependency_map under named or type keys.
///   2. Bind an injector to the map.
///   3. Wrap operations, declaring which parameters are injection points.
///   4. Call the wrapped operations, overriding any dependency per call.

#include <libwire.hpp>
#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

using namespace libwire;

// -----------------------------------------------------------------------
// Domain types
// -----------------------------------------------------------------------

using hash_fn = std::function<std::size_t(const std::string&)>;

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct console_logger : i_logger {
    void log(const std::string& message) override {
        std::cout << "[LOG] " << message << '\n';
    }
};

struct request_context {
    inline static int counter = 0;
    int id_;

    request_context() : id_(++counter) {}

    std::string request_id() const {
        return "req-" + std::to_string(id_);
    }
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    // ── Registration ──────────────────────────────────────────────────
    auto map = std::make_shared<dependency_map>();

    // console_logger: singleton, keyed by its interface.
    map->add_singleton<i_logger>([] { return std::make_shared<console_logger>(); });

    // "hash": a capability that is not naturally a type, so it gets a named key.
    map->add_singleton<hash_fn>(key("hash"), [] {
        return hash_fn([](const std::string& s) { return std::hash<std::string>{}(s); });
    });

    // request_context: a fresh instance for every call.
    map->add_factory(key("request"), [] { return request_context(); });

    // ── Wrapping ──────────────────────────────────────────────────────
    const auto inj = libwire::bind(map);

    auto hasher = inj.wrap(
        [](const std::string& subject, const hash_fn& hash, i_logger& logger) {
            const auto digest = hash(subject);
            logger.log(subject + " -> " + std::to_string(digest));
            return digest;
        },
        {param("subject"), param("hash", key("hash")), param("logger", type_key<i_logger>())},
        "hasher");

    auto handle = inj.wrap(
        [](const request_context& ctx) { return ctx.request_id(); },
        {param("ctx", key("request"))},
        "handle");

    // ── Calls ─────────────────────────────────────────────────────────
    hasher("foobarbaz");

    // Override the hash function for this call only; nothing is resolved
    // for the "hash" parameter.
    const auto fixed = hasher("x", named("hash", [](const std::string&) -> std::size_t { return 42; }));
    assert(fixed == 42);

    const auto r1 = handle();
    const auto r2 = handle();
    assert(r1 != r2 && "factory must produce a fresh context per call");
    std::cout << r1 << ' ' << r2 << '\n';

    // Re-registering a key is visible to existing wrappers.
    map->add_instance(key("request"), request_context());
    std::cout << "After re-registration: " << handle() << ' ' << handle() << '\n';

    std::cout << "Done.\n";
    return 0;
}
