#pragma once

#include <memory>
#include <string>
#include <typeindex>
#include <type_traits>
#include <utility>

namespace libwire {

// ---------------------------------------------------------------
// erased_value — type-erased shared value
// ---------------------------------------------------------------

/// A resolved dependency with its static type stripped.  `type` records the
/// type the value was registered as; casting back to anything else is refused
/// by the dependency source.
struct erased_value {
    std::shared_ptr<void> ptr;
    std::type_index type = std::type_index(typeid(void));

    erased_value() = default;
    erased_value(std::shared_ptr<void> p, std::type_index t) noexcept
        : ptr(std::move(p)), type(t) {}

    void* get() const noexcept { return ptr.get(); }
    explicit operator bool() const noexcept { return ptr != nullptr; }
};

/// The type a literal value is stored as.  String literals are stored as
/// std::string so they can be resolved as one.
template <typename V>
using stored_type_t = std::conditional_t<
    std::is_same_v<std::decay_t<V>, const char*> || std::is_same_v<std::decay_t<V>, char*>,
    std::string, std::decay_t<V>>;

/// Wrap an existing shared_ptr<T>, recording T.
template <typename T>
erased_value make_erased(std::shared_ptr<T> p) {
    return erased_value(
        std::const_pointer_cast<void>(std::static_pointer_cast<const void>(std::move(p))),
        std::type_index(typeid(std::remove_cv_t<T>)));
}

/// Copy or move a plain value into a new shared object.
template <typename V>
erased_value make_erased_copy(V&& v) {
    using T = stored_type_t<V>;
    return make_erased(std::make_shared<T>(std::forward<V>(v)));
}

} // namespace libwire
