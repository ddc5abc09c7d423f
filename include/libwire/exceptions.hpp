#pragma once

#include "export.hpp"
#include "key.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>

namespace libwire {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
LIBWIRE_EXPORT std::string demangle(std::type_index type);
} // namespace internal

class LIBWIRE_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  When a provider throws
    /// during resolution, each enclosing resolution layer appends its key so
    /// that the final what() message shows the full chain, e.g.:
    ///   "... (while resolving key(\"b\") -> key(\"a\"))"
    /// May be called multiple times for nested resolution chains.
    void append_resolution_context(const std::string& component_info);

    /// Override to append resolution context (if any) to the base message.
    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

class LIBWIRE_EXPORT unknown_dependency : public di_error {
public:
    explicit unknown_dependency(const dependency_key& key,
                                std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    unknown_dependency(const dependency_key& key, std::string_view hint,
                       std::source_location loc = std::source_location::current());

    const dependency_key& key() const noexcept { return key_; }

private:
    dependency_key key_;
};

class LIBWIRE_EXPORT type_mismatch : public di_error {
public:
    type_mismatch(const dependency_key& key, std::type_index requested,
                  std::type_index registered,
                  std::source_location loc = std::source_location::current());

    const dependency_key& key() const noexcept { return key_; }
    std::type_index requested() const noexcept { return requested_; }
    std::type_index registered() const noexcept { return registered_; }

private:
    dependency_key key_;
    std::type_index requested_;
    std::type_index registered_;
};

class LIBWIRE_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(const dependency_key& key,
                               std::source_location loc = std::source_location::current());

    const dependency_key& key() const noexcept { return key_; }

private:
    dependency_key key_;
};

/// Raised by a wrapped operation when its call-site arguments cannot be
/// matched to the declared parameters.
class LIBWIRE_EXPORT argument_error : public di_error {
public:
    argument_error(std::string_view operation, const std::string& message,
                   std::source_location loc = std::source_location::current());
};

} // namespace libwire
