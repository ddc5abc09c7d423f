#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>

namespace libwire {

class dependency_source;

// ---------------------------------------------------------------
// function_signature — deduce R(Args...) from a callable
// ---------------------------------------------------------------

/// Primary: a class type with a single, non-template operator().
template <typename F>
struct function_signature : function_signature<decltype(&F::operator())> {};

template <typename R, typename... Args>
struct function_signature<R(Args...)> {
    using type = R(Args...);
};

template <typename R, typename... Args>
struct function_signature<R (*)(Args...)> : function_signature<R(Args...)> {};

template <typename R, typename... Args>
struct function_signature<R (*)(Args...) noexcept> : function_signature<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_signature<R (C::*)(Args...)> : function_signature<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_signature<R (C::*)(Args...) const> : function_signature<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_signature<R (C::*)(Args...) noexcept> : function_signature<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_signature<R (C::*)(Args...) const noexcept> : function_signature<R(Args...)> {};

template <typename R, typename... Args>
struct function_signature<std::function<R(Args...)>> : function_signature<R(Args...)> {};

template <typename F>
using function_signature_t = typename function_signature<std::remove_cvref_t<F>>::type;

// ---------------------------------------------------------------
// shared_ptr detection
// ---------------------------------------------------------------

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {
    using element_type = T;
};

template <typename T>
inline constexpr bool is_shared_ptr_v = is_shared_ptr<std::remove_cvref_t<T>>::value;

// ---------------------------------------------------------------
// injected_type — which registered type a parameter is resolved as
// ---------------------------------------------------------------

/// `T`, `T&`, `const T&`, `T&&`  → T
/// `std::shared_ptr<T>`, `std::shared_ptr<const T>` → T
template <typename A, bool = is_shared_ptr_v<A>>
struct injected_type {
    using type = std::remove_cvref_t<A>;
};

template <typename A>
struct injected_type<A, true> {
    using type = std::remove_cv_t<typename is_shared_ptr<std::remove_cvref_t<A>>::element_type>;
};

template <typename A>
using injected_type_t = typename injected_type<A>::type;

// ---------------------------------------------------------------
// Provider constructor concepts
// ---------------------------------------------------------------

/// Constructor taking nothing.
template <typename F>
concept nullary_constructor = std::is_invocable_v<F&>;

/// Constructor taking the dependency source it is resolved through.
template <typename F>
concept source_constructor = std::is_invocable_v<F&, dependency_source&>;

template <typename F>
concept provider_constructor = nullary_constructor<F> || source_constructor<F>;

namespace detail {

template <typename F, bool = source_constructor<F>>
struct constructor_result {
    using type = std::invoke_result_t<F&, dependency_source&>;
};

template <typename F>
struct constructor_result<F, false> {
    using type = std::invoke_result_t<F&>;
};

/// What a constructor yields once normalised: `U` for `U`, `shared_ptr<U>`
/// and `unique_ptr<U>`.
template <typename R>
struct produced {
    using type = std::remove_cvref_t<R>;
};

template <typename U>
struct produced<std::shared_ptr<U>> {
    using type = U;
};

template <typename U, typename D>
struct produced<std::unique_ptr<U, D>> {
    using type = U;
};

} // namespace detail

/// Raw return type of a provider constructor.
template <typename F>
using constructor_result_t = typename detail::constructor_result<F>::type;

/// The value type a provider constructor is registered as by default.
template <typename F>
using produced_type_t = std::remove_cv_t<
    typename detail::produced<std::remove_cvref_t<constructor_result_t<F>>>::type>;

} // namespace libwire
