#pragma once

#include "exceptions.hpp"
#include "type_traits.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace libwire {

// ---------------------------------------------------------------
// arg_slot<A> — one parameter of a wrapped call being assembled
// ---------------------------------------------------------------

/// Holds the argument for a parameter of type A until the target is called.
/// It is filled either by the caller (supply) or by resolution (inject).
/// Resolved dependencies arrive as shared_ptr and are kept alive by the slot
/// for the duration of the call.
///
///   `std::shared_ptr<T>`  receives the resolved pointer
///   `T&`, `const T&`      receive a reference to the resolved object
///   `T` (by value)        receives a copy
template <typename A>
class arg_slot {
public:
    using value_type = std::remove_cv_t<A>;

    /// Whether a caller argument forwarded as V can initialise this slot.
    template <typename V>
    static constexpr bool accepts = std::is_constructible_v<value_type, V&&>;

    /// Whether a resolved dependency can fill this slot.
    static constexpr bool injectable =
        is_shared_ptr_v<A> || std::is_copy_constructible_v<value_type>;

    bool filled() const noexcept { return value_.has_value(); }

    template <typename V>
    void supply(V&& v) {
        value_.emplace(std::forward<V>(v));
    }

    void inject(std::shared_ptr<injected_type_t<A>> p,
                std::string_view operation, std::string_view param) {
        if constexpr (is_shared_ptr_v<A>) {
            value_.emplace(std::move(p));
        } else {
            if (!p) {
                throw argument_error(operation, "parameter '" + std::string(param)
                                     + "' received a null dependency");
            }
            if constexpr (std::is_copy_constructible_v<value_type>) {
                value_.emplace(*p);
            } else {
                throw argument_error(operation, "parameter '" + std::string(param)
                                     + "' takes a non-copyable type by value and cannot be injected");
            }
        }
    }

    A take() { return std::move(*value_); }

private:
    std::optional<value_type> value_;
};

/// Lvalue reference parameters bind to the caller's object, or (for const
/// references) to a materialised copy of an rvalue.
template <typename T>
class arg_slot<T&> {
public:
    using value_type = std::remove_cv_t<T>;

    template <typename V>
    static constexpr bool binds_directly =
        std::is_lvalue_reference_v<V>
        && std::is_convertible_v<std::remove_reference_t<V>*, T*>;

    template <typename V>
    static constexpr bool accepts =
        binds_directly<V>
        || (std::is_const_v<T> && std::is_constructible_v<value_type, V&&>);

    static constexpr bool injectable = true;

    bool filled() const noexcept { return ptr_ != nullptr; }

    template <typename V>
    void supply(V&& v) {
        if constexpr (binds_directly<V>) {
            ptr_ = std::addressof(v);
        } else {
            auto owned = std::make_shared<value_type>(std::forward<V>(v));
            ptr_ = owned.get();
            keepalive_ = std::move(owned);
        }
    }

    void inject(std::shared_ptr<value_type> p,
                std::string_view operation, std::string_view param) {
        if (!p) {
            throw argument_error(operation, "parameter '" + std::string(param)
                                 + "' received a null dependency");
        }
        ptr_ = p.get();
        keepalive_ = std::move(p);
    }

    T& take() { return *ptr_; }

private:
    T* ptr_ = nullptr;
    std::shared_ptr<void> keepalive_;
};

/// Rvalue reference parameters receive a slot-owned object the target may
/// move from; injected dependencies are copied first.
template <typename T>
class arg_slot<T&&> {
public:
    using value_type = std::remove_cv_t<T>;

    template <typename V>
    static constexpr bool accepts =
        !std::is_lvalue_reference_v<V> && std::is_constructible_v<value_type, V&&>;

    static constexpr bool injectable = std::is_copy_constructible_v<value_type>;

    bool filled() const noexcept { return value_.has_value(); }

    template <typename V>
    void supply(V&& v) {
        value_.emplace(std::forward<V>(v));
    }

    void inject(std::shared_ptr<value_type> p,
                std::string_view operation, std::string_view param) {
        if (!p) {
            throw argument_error(operation, "parameter '" + std::string(param)
                                 + "' received a null dependency");
        }
        if constexpr (std::is_copy_constructible_v<value_type>) {
            value_.emplace(*p);
        } else {
            throw argument_error(operation, "parameter '" + std::string(param)
                                 + "' takes a non-copyable type by rvalue reference and cannot be injected");
        }
    }

    T&& take() { return std::move(*value_); }

private:
    std::optional<value_type> value_;
};

} // namespace libwire
