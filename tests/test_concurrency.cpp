#include <catch2/catch_test_macros.hpp>
#include <libwire.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace libwire;

// ---------------------------------------------------------------
// Test types
// ---------------------------------------------------------------

struct ConcurrentImpl {
    static std::atomic<int> construct_count;
    ConcurrentImpl() {
        ++construct_count;
        // Sleep briefly to widen the race window
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
};
std::atomic<int> ConcurrentImpl::construct_count{0};

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Concurrency: singleton resolved once under contention", "[concurrency]") {
    ConcurrentImpl::construct_count = 0;

    dependency_map map;
    map.add_singleton<ConcurrentImpl>([] { return std::make_shared<ConcurrentImpl>(); });

    constexpr std::size_t N = 32;
    std::vector<std::shared_ptr<ConcurrentImpl>> results(N);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < N; ++i) {
            threads.emplace_back([&, i] {
                results[i] = map.resolve<ConcurrentImpl>();
            });
        }
    }

    REQUIRE(ConcurrentImpl::construct_count == 1);
    for (std::size_t i = 1; i < N; ++i) {
        REQUIRE(results[i] == results[0]);
    }
}

TEST_CASE("Concurrency: wrapped operation injects one singleton across threads", "[concurrency]") {
    ConcurrentImpl::construct_count = 0;

    auto map = std::make_shared<dependency_map>();
    map->add_singleton<ConcurrentImpl>([] { return std::make_shared<ConcurrentImpl>(); });

    auto op = libwire::bind(map).wrap(
        [](std::shared_ptr<ConcurrentImpl> impl) { return impl.get(); },
        {param("impl", type_key<ConcurrentImpl>())}, "use_impl");

    constexpr std::size_t N = 16;
    std::vector<ConcurrentImpl*> seen(N, nullptr);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < N; ++i) {
            threads.emplace_back([&, i] { seen[i] = op(); });
        }
    }

    REQUIRE(ConcurrentImpl::construct_count == 1);
    for (std::size_t i = 1; i < N; ++i) {
        REQUIRE(seen[i] == seen[0]);
    }
}

TEST_CASE("Concurrency: failed singleton construction is retried", "[concurrency]") {
    std::atomic<int> attempts{0};

    dependency_map map;
    map.add_singleton(key("flaky"), [&attempts] {
        if (attempts.fetch_add(1) == 0) {
            throw std::runtime_error("first attempt fails");
        }
        return 7;
    });

    REQUIRE_THROWS_AS(map.resolve<int>(key("flaky")), std::runtime_error);

    constexpr std::size_t N = 8;
    std::vector<int> values(N, 0);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < N; ++i) {
            threads.emplace_back([&, i] { values[i] = *map.resolve<int>(key("flaky")); });
        }
    }

    REQUIRE(attempts == 2);
    for (int v : values) {
        REQUIRE(v == 7);
    }
}

TEST_CASE("Concurrency: registration during resolution is safe", "[concurrency]") {
    dependency_map map;
    map.add_instance(key("v"), 0);

    std::atomic<bool> stop{false};
    std::atomic<int> empty_reads{0};
    std::jthread reader([&] {
        while (!stop) {
            if (!map.resolve<int>(key("v"))) ++empty_reads;
        }
    });

    for (int i = 1; i <= 200; ++i) {
        map.add_instance(key("v"), i);
    }
    stop = true;
    reader.join();

    REQUIRE(empty_reads == 0);
    REQUIRE(*map.resolve<int>(key("v")) == 200);
}

TEST_CASE("Concurrency: singleton cycle split across threads is reported", "[concurrency]") {
    dependency_map map;
    map.add_singleton(key("a"), [](dependency_source& src) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return *src.resolve<int>(key("b")) + 1;
    });
    map.add_singleton(key("b"), [](dependency_source& src) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return *src.resolve<int>(key("a")) + 1;
    });

    std::atomic<int> cycles{0};
    std::atomic<int> other_failures{0};
    auto resolve_counting = [&](const char* name) {
        try {
            map.resolve<int>(key(name));
        } catch (const cyclic_dependency&) {
            ++cycles;
        } catch (const std::exception&) {
            ++other_failures;
        }
    };
    {
        std::jthread first([&] { resolve_counting("a"); });
        std::jthread second([&] { resolve_counting("b"); });
    }

    REQUIRE(cycles == 2);
    REQUIRE(other_failures == 0);
    REQUIRE_FALSE(map.find(key("a"))->constructed());
    REQUIRE_FALSE(map.find(key("b"))->constructed());
}
