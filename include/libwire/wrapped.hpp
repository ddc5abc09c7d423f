#pragma once

#include "export.hpp"
#include "arg_slot.hpp"
#include "dependency_source.hpp"
#include "exceptions.hpp"
#include "key.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace libwire {

class injector;

// ---------------------------------------------------------------
// Parameter declaration
// ---------------------------------------------------------------

/// Declares one parameter of a wrapped operation: its name and, for an
/// injection point, the dependency key it defaults to.
struct param {
    explicit param(std::string n)
        : name(std::move(n)) {}

    param(std::string n, dependency_key k)
        : name(std::move(n)), default_key(std::move(k)) {}

    std::string name;
    std::optional<dependency_key> default_key;
};

// ---------------------------------------------------------------
// Named call-site argument
// ---------------------------------------------------------------

/// Argument passed by parameter name.  Holds a reference to the value, which
/// must outlive the call (true for anything written inline in the call).
template <typename V>
struct named_arg {
    std::string_view name;
    V&& value;
};

template <typename V>
named_arg<V> named(std::string_view name, V&& value) {
    return named_arg<V>{name, std::forward<V>(value)};
}

template <typename T>
struct is_named_arg : std::false_type {};

template <typename V>
struct is_named_arg<named_arg<V>> : std::true_type {};

template <typename T>
inline constexpr bool is_named_arg_v = is_named_arg<std::remove_cvref_t<T>>::value;

// ---------------------------------------------------------------
// injection_plan — computed once at wrap time
// ---------------------------------------------------------------

struct LIBWIRE_EXPORT injection_plan {
    std::string operation;
    std::vector<std::string> names;

    /// keys[i] is set iff parameter i is injectable.
    std::vector<std::optional<dependency_key>> keys;

    bool log_injections = true;

    std::optional<std::size_t> index_of(std::string_view name) const;
    std::vector<std::string> injection_points() const;

    /// Debug-log that parameter `index` is being injected.
    void log_injection(std::size_t index) const;
};

namespace detail {

/// Number of leading arguments that are not named_arg.
template <typename... Ts>
constexpr std::size_t leading_positional() {
    constexpr bool flags[] = {is_named_arg_v<Ts>..., true};
    std::size_t n = 0;
    while (!flags[n]) ++n;
    return n;
}

/// Every argument from index `from` on is a named_arg.
template <std::size_t From, typename... Ts>
constexpr bool all_named_from() {
    constexpr bool flags[] = {is_named_arg_v<Ts>..., true};
    for (std::size_t i = From; i < sizeof...(Ts); ++i) {
        if (!flags[i]) return false;
    }
    return true;
}

} // namespace detail

// ---------------------------------------------------------------
// wrapped<R(Args...)> — an operation that supplies its own dependencies
// ---------------------------------------------------------------

template <typename Signature>
class wrapped;

template <typename R, typename... Args>
class wrapped<R(Args...)> {
public:
    using result_type = R;
    static constexpr std::size_t arity = sizeof...(Args);

    /// Call with positional arguments followed by named(...) arguments.
    /// Injectable parameters the caller did not supply are resolved from the
    /// bound source; supplied ones are never resolved.
    template <typename... Ts>
    R operator()(Ts&&... ts) const {
        constexpr std::size_t positional = detail::leading_positional<Ts...>();
        static_assert(detail::all_named_from<positional, Ts...>(),
                      "positional argument follows named argument");
        static_assert(positional <= arity, "too many positional arguments");

        slots_t slots;
        auto args = std::forward_as_tuple(std::forward<Ts>(ts)...);
        supply_positional(slots, args, std::make_index_sequence<positional>{});
        supply_named<positional>(slots, args,
                                 std::make_index_sequence<sizeof...(Ts) - positional>{});
        fill_injected(slots, std::index_sequence_for<Args...>{});
        return invoke(slots, std::index_sequence_for<Args...>{});
    }

    const std::string& name() const noexcept { return plan_->operation; }

    /// Names of the parameters classified as injectable at wrap time.
    std::vector<std::string> injection_points() const { return plan_->injection_points(); }

    bool is_injectable(std::string_view param_name) const {
        auto idx = plan_->index_of(param_name);
        return idx && plan_->keys[*idx].has_value();
    }

    /// The original operation.
    const std::function<R(Args...)>& target() const noexcept { return target_; }

private:
    friend class injector;

    using slots_t = std::tuple<arg_slot<Args>...>;

    wrapped(std::function<R(Args...)> target,
            std::shared_ptr<const injection_plan> plan,
            std::shared_ptr<dependency_source> source)
        : target_(std::move(target))
        , plan_(std::move(plan))
        , source_(std::move(source))
    {
        constexpr bool can_inject[] = {arg_slot<Args>::injectable..., true};
        for (std::size_t i = 0; i < arity; ++i) {
            if (plan_->keys[i] && !can_inject[i]) {
                throw argument_error(plan_->operation,
                                     "parameter '" + plan_->names[i]
                                     + "' takes a non-copyable type and cannot be injected");
            }
        }
    }

    template <typename ArgTuple, std::size_t... I>
    void supply_positional(slots_t& slots, ArgTuple& args, std::index_sequence<I...>) const {
        (supply_at<I>(std::get<I>(slots),
                      std::forward<std::tuple_element_t<I, ArgTuple>>(std::get<I>(args))), ...);
    }

    template <std::size_t I, typename Slot, typename V>
    static void supply_at(Slot& slot, V&& v) {
        static_assert(Slot::template accepts<V>,
                      "positional argument cannot initialise the parameter at this position");
        slot.supply(std::forward<V>(v));
    }

    template <std::size_t Offset, typename ArgTuple, std::size_t... J>
    void supply_named(slots_t& slots, ArgTuple& args, std::index_sequence<J...>) const {
        (supply_by_name(slots, std::get<Offset + J>(args)), ...);
    }

    template <typename V>
    void supply_by_name(slots_t& slots, const named_arg<V>& arg) const {
        auto idx = plan_->index_of(arg.name);
        if (!idx) {
            throw argument_error(plan_->operation,
                                 "unexpected keyword argument '" + std::string(arg.name) + "'");
        }
        visit_slot(slots, *idx, [&](auto& slot) {
            using slot_type = std::remove_cvref_t<decltype(slot)>;
            if (slot.filled()) {
                throw argument_error(plan_->operation,
                                     "got multiple values for argument '" + std::string(arg.name) + "'");
            }
            if constexpr (slot_type::template accepts<V>) {
                slot.supply(std::forward<V>(arg.value));
            } else {
                throw argument_error(plan_->operation,
                                     "argument '" + std::string(arg.name)
                                     + "' has a type the parameter cannot be initialised from");
            }
        }, std::index_sequence_for<Args...>{});
    }

    template <typename F, std::size_t... I>
    static void visit_slot(slots_t& slots, std::size_t idx, F&& f, std::index_sequence<I...>) {
        ((idx == I ? f(std::get<I>(slots)) : void()), ...);
    }

    template <std::size_t... I>
    void fill_injected(slots_t& slots, std::index_sequence<I...>) const {
        (inject_at<I>(std::get<I>(slots)), ...);
    }

    template <std::size_t I, typename Slot>
    void inject_at(Slot& slot) const {
        if (slot.filled()) return;

        const auto& key = plan_->keys[I];
        if (!key) {
            throw argument_error(plan_->operation,
                                 "missing required argument '" + plan_->names[I] + "'");
        }
        using A = std::tuple_element_t<I, std::tuple<Args...>>;
        plan_->log_injection(I);
        slot.inject(source_->resolve<injected_type_t<A>>(*key),
                    plan_->operation, plan_->names[I]);
    }

    template <std::size_t... I>
    R invoke(slots_t& slots, std::index_sequence<I...>) const {
        return target_(std::get<I>(slots).take()...);
    }

    std::function<R(Args...)> target_;
    std::shared_ptr<const injection_plan> plan_;
    std::shared_ptr<dependency_source> source_;
};

} // namespace libwire
