#include <catch2/catch_test_macros.hpp>
#include <libwire.hpp>

#include <memory>
#include <set>
#include <thread>
#include <vector>

namespace {

struct Counter {
    int n = 0;
    int next() { return ++n; }
};

} // namespace

TEST_CASE("instance resolves to the registered object", "[lifetime]") {
    auto counter = std::make_shared<Counter>();
    libwire::dependency_map map;
    map.add_instance(libwire::key("counter"), counter);

    auto a = map.resolve<Counter>(libwire::key("counter"));
    auto b = map.resolve<Counter>(libwire::key("counter"));
    REQUIRE(a == counter);
    REQUIRE(b == counter);
}

TEST_CASE("factory runs on every resolution", "[lifetime]") {
    int built = 0;
    libwire::dependency_map map;
    map.add_factory(libwire::key("counter"), [&built] { ++built; return Counter{}; });

    auto a = map.resolve<Counter>(libwire::key("counter"));
    auto b = map.resolve<Counter>(libwire::key("counter"));
    REQUIRE(built == 2);
    REQUIRE(a.get() != b.get());
    REQUIRE(a->next() == 1);
    REQUIRE(b->next() == 1); // independent instances
}

TEST_CASE("singleton runs its constructor once", "[lifetime]") {
    int built = 0;
    libwire::dependency_map map;
    map.add_singleton(libwire::key("counter"), [&built] { ++built; return Counter{}; });

    REQUIRE_FALSE(map.find(libwire::key("counter"))->constructed());

    auto a = map.resolve<Counter>(libwire::key("counter"));
    auto b = map.resolve<Counter>(libwire::key("counter"));
    REQUIRE(built == 1);
    REQUIRE(a == b);
    REQUIRE(a->next() == 1);
    REQUIRE(b->next() == 2); // same instance
    REQUIRE(map.find(libwire::key("counter"))->constructed());
}

TEST_CASE("singleton constructor may return shared_ptr or unique_ptr", "[lifetime]") {
    libwire::dependency_map map;
    map.add_singleton(libwire::key("shared"), [] { return std::make_shared<Counter>(); });
    map.add_singleton(libwire::key("unique"), [] { return std::make_unique<Counter>(); });

    REQUIRE(map.resolve<Counter>(libwire::key("shared"))
            == map.resolve<Counter>(libwire::key("shared")));
    REQUIRE(map.resolve<Counter>(libwire::key("unique"))
            == map.resolve<Counter>(libwire::key("unique")));
}

TEST_CASE("thread-local provider constructs once per thread", "[lifetime]") {
    libwire::dependency_map map;
    map.add_thread_local(libwire::key("counter"), [] { return Counter{}; });

    auto main_a = map.resolve<Counter>(libwire::key("counter"));
    auto main_b = map.resolve<Counter>(libwire::key("counter"));
    REQUIRE(main_a == main_b);

    std::shared_ptr<Counter> other_a;
    std::shared_ptr<Counter> other_b;
    std::thread([&] {
        other_a = map.resolve<Counter>(libwire::key("counter"));
        other_b = map.resolve<Counter>(libwire::key("counter"));
    }).join();

    REQUIRE(other_a == other_b);
    REQUIRE(other_a != main_a);
}

TEST_CASE("thread-local provider constructs for every new thread", "[lifetime]") {
    int built = 0;
    libwire::dependency_map map;
    map.add_thread_local(libwire::key("counter"), [&built] { ++built; return Counter{}; });

    // Each thread finishes before the next starts, so thread ids may repeat.
    constexpr int rounds = 20;
    std::vector<std::shared_ptr<Counter>> first(rounds);
    std::vector<std::shared_ptr<Counter>> second(rounds);
    for (int i = 0; i < rounds; ++i) {
        std::thread([&, i] {
            first[i] = map.resolve<Counter>(libwire::key("counter"));
            second[i] = map.resolve<Counter>(libwire::key("counter"));
        }).join();
    }

    REQUIRE(built == rounds);
    std::set<Counter*> distinct;
    for (int i = 0; i < rounds; ++i) {
        REQUIRE(first[i] == second[i]);
        distinct.insert(first[i].get());
    }
    REQUIRE(distinct.size() == static_cast<std::size_t>(rounds));
}

TEST_CASE("thread-local values are released when their thread exits", "[lifetime]") {
    libwire::dependency_map map;
    map.add_thread_local(libwire::key("counter"), [] { return Counter{}; });

    std::weak_ptr<Counter> seen;
    bool alive_in_thread = false;
    std::thread([&] {
        seen = map.resolve<Counter>(libwire::key("counter"));
        alive_in_thread = !seen.expired();
    }).join();

    REQUIRE(alive_in_thread);
    REQUIRE(seen.expired());
}

TEST_CASE("reset_cached forgets singleton and thread values", "[lifetime]") {
    int singles = 0;
    int threads = 0;
    libwire::dependency_map map;
    map.add_singleton(libwire::key("single"), [&singles] { ++singles; return Counter{}; });
    map.add_thread_local(libwire::key("thread"), [&threads] { ++threads; return Counter{}; });
    map.add_instance(libwire::key("instance"), Counter{});

    auto s1 = map.resolve<Counter>(libwire::key("single"));
    auto t1 = map.resolve<Counter>(libwire::key("thread"));
    auto i1 = map.resolve<Counter>(libwire::key("instance"));

    map.reset_cached();

    auto s2 = map.resolve<Counter>(libwire::key("single"));
    auto t2 = map.resolve<Counter>(libwire::key("thread"));
    auto i2 = map.resolve<Counter>(libwire::key("instance"));

    REQUIRE(singles == 2);
    REQUIRE(threads == 2);
    REQUIRE(s1 != s2);
    REQUIRE(t1 != t2);
    REQUIRE(i1 == i2); // instances are not cached values
}

TEST_CASE("lifetime_kind names", "[lifetime]") {
    REQUIRE(libwire::to_string(libwire::lifetime_kind::instance) == "instance");
    REQUIRE(libwire::to_string(libwire::lifetime_kind::factory) == "factory");
    REQUIRE(libwire::to_string(libwire::lifetime_kind::singleton) == "singleton");
    REQUIRE(libwire::to_string(libwire::lifetime_kind::thread) == "thread");
}
