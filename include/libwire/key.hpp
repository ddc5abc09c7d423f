#pragma once

/// @file key.hpp
/// Identifiers used to index a dependency map.
///
/// A dependency is looked up either by a named `key` (for capabilities that
/// are not naturally a type, e.g. "hash") or by the type it yields.  Both
/// cases are folded into `dependency_key`, which carries a single
/// equality/hash contract.

#include "export.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <typeindex>
#include <variant>
#include <vector>

namespace libwire {

// ---------------------------------------------------------------
// key — named dependency identifier
// ---------------------------------------------------------------

class LIBWIRE_EXPORT key {
public:
    explicit key(std::string label);

    /// Composite key.  Equal to another key only when all parts match in order.
    key(std::initializer_list<std::string> parts);

    /// Parts joined with ':'.
    std::string label() const;

    const std::vector<std::string>& parts() const noexcept { return parts_; }

    std::size_t hash() const noexcept;

    bool operator==(const key&) const = default;

private:
    std::vector<std::string> parts_;
};

// ---------------------------------------------------------------
// dependency_key — named key or type identifier
// ---------------------------------------------------------------

class LIBWIRE_EXPORT dependency_key {
public:
    dependency_key(key k);
    dependency_key(std::type_index type);

    bool is_named() const noexcept { return std::holds_alternative<key>(value_); }
    bool is_type() const noexcept { return std::holds_alternative<std::type_index>(value_); }

    /// The named key, or nullptr for a type key.
    const key* named() const noexcept { return std::get_if<key>(&value_); }

    std::optional<std::type_index> type() const noexcept;

    /// Human-readable form: `key("hash")` or the demangled type name.
    std::string to_string() const;

    std::size_t hash() const noexcept;

    bool operator==(const dependency_key&) const = default;

private:
    std::variant<key, std::type_index> value_;
};

/// Dependency key naming the type T itself.
template <typename T>
dependency_key type_key() {
    return dependency_key(std::type_index(typeid(T)));
}

} // namespace libwire

template <>
struct std::hash<libwire::key> {
    std::size_t operator()(const libwire::key& k) const noexcept { return k.hash(); }
};

template <>
struct std::hash<libwire::dependency_key> {
    std::size_t operator()(const libwire::dependency_key& k) const noexcept { return k.hash(); }
};
