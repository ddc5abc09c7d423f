#pragma once

#include "export.hpp"
#include "dependency_source.hpp"
#include "erased_value.hpp"
#include "key.hpp"
#include "provider.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace libwire {

namespace detail {

template <typename V>
erased_value to_erased(V&& value) {
    if constexpr (is_shared_ptr_v<V>) {
        return make_erased(std::forward<V>(value));
    } else {
        return make_erased_copy(std::forward<V>(value));
    }
}

} // namespace detail

// ---------------------------------------------------------------
// binding — one entry of a literal key → value list
// ---------------------------------------------------------------

/// `{key("foo"), std::string("FOO")}` or `{type_key<conn>(), conn_ptr}`.
/// A shared_ptr<T> is stored as T; any other value is copied into a new
/// shared object.
struct binding {
    template <typename V>
    binding(dependency_key k, V&& v)
        : key(std::move(k)), value(detail::to_erased(std::forward<V>(v))) {}

    dependency_key key;
    erased_value value;
};

// ---------------------------------------------------------------
// dependency_map
// ---------------------------------------------------------------

class LIBWIRE_EXPORT dependency_map : public dependency_source {
public:
    dependency_map();
    ~dependency_map() override;

    dependency_map(const dependency_map&) = delete;
    dependency_map& operator=(const dependency_map&) = delete;
    dependency_map(dependency_map&&) noexcept;
    dependency_map& operator=(dependency_map&&) noexcept;

    // ===============================================================
    // Instance registration
    // ===============================================================

    /// Bind `key` to an existing object, registered as T.
    template <typename T>
    dependency_map& add_instance(dependency_key key, std::shared_ptr<T> value,
                                 std::source_location loc = std::source_location::current()) {
        return register_provider(
            std::move(key),
            std::make_unique<instance_provider>(make_erased(std::move(value))),
            "add_instance", loc);
    }

    /// Bind `key` to a copy of `value`.
    template <typename V>
        requires (!is_shared_ptr_v<V>)
    dependency_map& add_instance(dependency_key key, V&& value,
                                 std::source_location loc = std::source_location::current()) {
        return register_provider(
            std::move(key),
            std::make_unique<instance_provider>(make_erased_copy(std::forward<V>(value))),
            "add_instance", loc);
    }

    /// Bind `type_key<T>()` to `value` (a shared_ptr convertible to
    /// shared_ptr<T>, or anything T is constructible from).
    template <typename T, typename V>
        requires std::is_convertible_v<V, std::shared_ptr<T>>
              || std::is_constructible_v<T, V>
    dependency_map& add_instance(V&& value,
                                 std::source_location loc = std::source_location::current()) {
        std::shared_ptr<T> ptr;
        if constexpr (std::is_convertible_v<V, std::shared_ptr<T>>) {
            ptr = std::forward<V>(value);
        } else {
            ptr = std::make_shared<T>(std::forward<V>(value));
        }
        return register_provider(
            type_key<T>(),
            std::make_unique<instance_provider>(make_erased(std::move(ptr))),
            "add_instance", loc);
    }

    // ===============================================================
    // Factory registration (constructor runs on every resolution)
    // ===============================================================

    /// `T` defaults to the constructor's product (U for U, shared_ptr<U>,
    /// unique_ptr<U>).
    template <typename T = void, provider_constructor F>
    dependency_map& add_factory(dependency_key key, F&& fn,
                                std::source_location loc = std::source_location::current()) {
        using value_t = std::conditional_t<std::is_void_v<T>, produced_type_t<std::decay_t<F>>, T>;
        return register_provider(
            std::move(key),
            std::make_unique<factory_provider>(
                std::type_index(typeid(value_t)),
                make_constructor<value_t>(std::forward<F>(fn))),
            "add_factory", loc);
    }

    template <typename T, provider_constructor F>
    dependency_map& add_factory(F&& fn,
                                std::source_location loc = std::source_location::current()) {
        return add_factory<T>(type_key<T>(), std::forward<F>(fn), loc);
    }

    // ===============================================================
    // Singleton registration (constructor runs at most once)
    // ===============================================================

    template <typename T = void, provider_constructor F>
    dependency_map& add_singleton(dependency_key key, F&& fn,
                                  std::source_location loc = std::source_location::current()) {
        using value_t = std::conditional_t<std::is_void_v<T>, produced_type_t<std::decay_t<F>>, T>;
        return register_provider(
            std::move(key),
            std::make_unique<singleton_provider>(
                std::type_index(typeid(value_t)),
                make_constructor<value_t>(std::forward<F>(fn))),
            "add_singleton", loc);
    }

    template <typename T, provider_constructor F>
    dependency_map& add_singleton(F&& fn,
                                  std::source_location loc = std::source_location::current()) {
        return add_singleton<T>(type_key<T>(), std::forward<F>(fn), loc);
    }

    // ===============================================================
    // Thread-local registration (constructor runs once per thread)
    // ===============================================================

    template <typename T = void, provider_constructor F>
    dependency_map& add_thread_local(dependency_key key, F&& fn,
                                     std::source_location loc = std::source_location::current()) {
        using value_t = std::conditional_t<std::is_void_v<T>, produced_type_t<std::decay_t<F>>, T>;
        return register_provider(
            std::move(key),
            std::make_unique<thread_provider>(
                std::type_index(typeid(value_t)),
                make_constructor<value_t>(std::forward<F>(fn))),
            "add_thread_local", loc);
    }

    template <typename T, provider_constructor F>
    dependency_map& add_thread_local(F&& fn,
                                     std::source_location loc = std::source_location::current()) {
        return add_thread_local<T>(type_key<T>(), std::forward<F>(fn), loc);
    }

    // ===============================================================
    // Generic registration
    // ===============================================================

    /// Bind `key` to `p`, replacing (and discarding the cached value of)
    /// any previous provider.
    dependency_map& add(dependency_key key, std::unique_ptr<provider> p,
                        std::source_location loc = std::source_location::current());

    // ===============================================================
    // Lookup
    // ===============================================================

    bool contains(const dependency_key& key) const override;

    erased_value resolve_from(const dependency_key& key,
                              dependency_source& origin) override;

    /// The provider bound to `key`, or nullptr.
    std::shared_ptr<provider> find(const dependency_key& key) const;

    /// Remove the binding for `key`.  Returns false if there was none.
    bool erase(const dependency_key& key);

    /// Forget every memoized singleton / thread value.
    void reset_cached();

    std::size_t size() const;
    std::vector<dependency_key> keys() const;

    /// A new map holding fresh copies of every provider (instances are
    /// shared, nothing memoized is carried over).
    std::shared_ptr<dependency_map> fork() const;

private:
    dependency_map& register_provider(dependency_key key,
                                      std::unique_ptr<provider> p,
                                      std::string_view api_name,
                                      std::source_location loc);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Build a dependency_map of instance providers from a literal list.
LIBWIRE_EXPORT std::shared_ptr<dependency_map> make_map(std::initializer_list<binding> bindings);

} // namespace libwire
