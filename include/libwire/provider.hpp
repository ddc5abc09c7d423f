#pragma once

#include "export.hpp"
#include "erased_value.hpp"
#include "key.hpp"
#include "lifetime.hpp"
#include "type_traits.hpp"

#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <thread>
#include <typeindex>
#include <utility>

namespace libwire {

class dependency_source;

namespace internal {
/// Capture the current stacktrace (returns an empty std::any when
/// stacktrace support is disabled).  Implemented in stacktrace_capture.cpp.
LIBWIRE_EXPORT std::any capture_stacktrace();
} // namespace internal

using constructor_fn = std::function<erased_value(dependency_source&)>;

// ---------------------------------------------------------------
// registration_info — where a provider was registered
// ---------------------------------------------------------------

struct registration_info {
    std::source_location location;
    std::any stacktrace;        // boost::stacktrace::stacktrace when enabled
    std::string api_name;       // e.g. "add_singleton"
};

// ---------------------------------------------------------------
// provider — recipe for producing one dependency's value
// ---------------------------------------------------------------

class LIBWIRE_EXPORT provider {
public:
    virtual ~provider();

    provider(const provider&) = delete;
    provider& operator=(const provider&) = delete;

    virtual lifetime_kind lifetime() const noexcept = 0;

    /// Produce the value bound under `self`.  `origin` is the source the
    /// resolution went through; constructors receive it so they can resolve
    /// further dependencies.
    virtual erased_value get(const dependency_key& self, dependency_source& origin) = 0;

    /// A copy of this recipe with no memoized state.
    virtual std::unique_ptr<provider> clone() const = 0;

    /// Drop memoized values.  No-op for providers that cache nothing.
    virtual void reset() {}

    /// True when get() can return without running a constructor.
    virtual bool constructed() const = 0;

    std::type_index value_type() const noexcept { return value_type_; }

    const registration_info& registration() const noexcept { return registration_; }
    void set_registration(registration_info info) { registration_ = std::move(info); }

protected:
    explicit provider(std::type_index value_type);

private:
    std::type_index value_type_;
    registration_info registration_;
};

/// Holds a precomputed value; returns it unchanged every time.
class LIBWIRE_EXPORT instance_provider final : public provider {
public:
    explicit instance_provider(erased_value value);

    lifetime_kind lifetime() const noexcept override { return lifetime_kind::instance; }
    erased_value get(const dependency_key& self, dependency_source& origin) override;
    std::unique_ptr<provider> clone() const override;
    bool constructed() const override { return true; }

private:
    erased_value value_;
};

/// Common base for providers that run a constructor function.
class LIBWIRE_EXPORT constructing_provider : public provider {
public:
    const constructor_fn& constructor() const noexcept { return ctor_; }

protected:
    constructing_provider(std::type_index value_type, constructor_fn ctor);

    /// Run the constructor.  Exceptions propagate unchanged; di_error is
    /// annotated with `self` and the registration stacktrace on the way out.
    erased_value construct(const dependency_key& self, dependency_source& origin);

private:
    constructor_fn ctor_;
};

/// Runs its constructor on every resolution.
class LIBWIRE_EXPORT factory_provider final : public constructing_provider {
public:
    factory_provider(std::type_index value_type, constructor_fn ctor);

    lifetime_kind lifetime() const noexcept override { return lifetime_kind::factory; }
    erased_value get(const dependency_key& self, dependency_source& origin) override;
    std::unique_ptr<provider> clone() const override;
    bool constructed() const override { return false; }
};

/// Runs its constructor at most once; a failed attempt is not cached.
class LIBWIRE_EXPORT singleton_provider final : public constructing_provider {
public:
    singleton_provider(std::type_index value_type, constructor_fn ctor);

    lifetime_kind lifetime() const noexcept override { return lifetime_kind::singleton; }
    erased_value get(const dependency_key& self, dependency_source& origin) override;
    std::unique_ptr<provider> clone() const override;
    void reset() override;
    bool constructed() const override;

private:
    mutable std::mutex mutex_;
    std::optional<erased_value> value_;
    std::atomic<std::thread::id> constructing_{};
};

/// Runs its constructor at most once per calling thread.
///
/// Values live in storage owned by the calling thread and are released when
/// that thread exits.  reset() moves the provider to a new generation, so
/// values built before it are never returned again.
class LIBWIRE_EXPORT thread_provider final : public constructing_provider {
public:
    thread_provider(std::type_index value_type, constructor_fn ctor);

    lifetime_kind lifetime() const noexcept override { return lifetime_kind::thread; }
    erased_value get(const dependency_key& self, dependency_source& origin) override;
    std::unique_ptr<provider> clone() const override;
    void reset() override;

    /// Constructed for the calling thread.
    bool constructed() const override;

private:
    std::atomic<std::uint64_t> generation_;
};

// ---------------------------------------------------------------
// Constructor adaptation
// ---------------------------------------------------------------

namespace detail {

template <typename T>
struct is_unique_ptr : std::false_type {};

template <typename U, typename D>
struct is_unique_ptr<std::unique_ptr<U, D>> : std::true_type {};

template <typename T, typename R>
std::shared_ptr<T> to_shared(R&& result) {
    using raw = std::remove_cvref_t<R>;
    if constexpr (is_shared_ptr<raw>::value || is_unique_ptr<raw>::value) {
        return std::shared_ptr<T>(std::forward<R>(result));
    } else {
        return std::make_shared<T>(std::forward<R>(result));
    }
}

} // namespace detail

/// Adapt a user constructor (taking nothing or a dependency_source&, and
/// returning T, shared_ptr<T> or unique_ptr<T>) to a constructor_fn that
/// yields a value registered as T.
template <typename T, provider_constructor F>
constructor_fn make_constructor(F&& fn) {
    return [f = std::forward<F>(fn)](dependency_source& source) mutable -> erased_value {
        if constexpr (source_constructor<std::decay_t<F>>) {
            return make_erased(detail::to_shared<T>(f(source)));
        } else {
            return make_erased(detail::to_shared<T>(f()));
        }
    };
}

} // namespace libwire
