#pragma once

#include "export.hpp"
#include "dependency_map.hpp"
#include "dependency_source.hpp"
#include "options.hpp"
#include "type_traits.hpp"
#include "wrapped.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace libwire {

namespace detail {

/// Classify each declared parameter once.  A parameter is injectable iff it
/// has a default key and that key is a named key or a type key the source
/// contains right now.  Throws di_error if the declaration does not match
/// the operation's arity or repeats a name.
LIBWIRE_EXPORT std::shared_ptr<const injection_plan>
plan_injection(std::string operation, const std::vector<param>& params,
               std::size_t arity, const dependency_source& source,
               const injector_options& options);

} // namespace detail

// ---------------------------------------------------------------
// injector
// ---------------------------------------------------------------

/// Binds a dependency source and wraps operations so that their injectable
/// parameters are resolved from it on every call.
///
/// The injector itself never changes after construction; it may be shared
/// between threads freely.  What a call resolves depends on the source's
/// state at call time.
class LIBWIRE_EXPORT injector {
public:
    explicit injector(std::shared_ptr<dependency_source> source,
                      injector_options options = {});

    dependency_source& source() const noexcept { return *source_; }
    const std::shared_ptr<dependency_source>& source_ptr() const noexcept { return source_; }
    const injector_options& options() const noexcept { return options_; }

    /// Wrap `fn` whose parameter list is described by `params` (one entry
    /// per parameter, in order).  The signature is deduced from `fn`.
    template <typename F>
    wrapped<function_signature_t<F>> wrap(F&& fn, std::vector<param> params,
                                          std::string name = "operation") const {
        return wrap_as<function_signature_t<F>>(std::forward<F>(fn), std::move(params),
                                                std::move(name));
    }

    /// Wrap `fn` with an explicit signature (for overloaded or generic
    /// callables).
    template <typename Signature, typename F>
    wrapped<Signature> wrap_as(F&& fn, std::vector<param> params,
                               std::string name = "operation") const {
        using wrapped_t = wrapped<Signature>;
        auto plan = detail::plan_injection(std::move(name), params, wrapped_t::arity,
                                           *source_, options_);
        return wrapped_t(std::function<Signature>(std::forward<F>(fn)),
                         std::move(plan), source_);
    }

private:
    std::shared_ptr<dependency_source> source_;
    injector_options options_;
};

// ---------------------------------------------------------------
// bind
// ---------------------------------------------------------------

/// An injector over an existing dependency source.
LIBWIRE_EXPORT injector bind(std::shared_ptr<dependency_source> source,
                             injector_options options = {});

/// An injector over a new map of instance providers built from `bindings`.
LIBWIRE_EXPORT injector bind(std::initializer_list<binding> bindings,
                             injector_options options = {});

} // namespace libwire
