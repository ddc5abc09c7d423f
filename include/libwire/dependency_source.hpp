#pragma once

#include "export.hpp"
#include "erased_value.hpp"
#include "exceptions.hpp"
#include "key.hpp"

#include <memory>
#include <typeindex>

namespace libwire {

/// Anything dependencies can be resolved from.  The injector only talks to
/// this interface; dependency_map, contextual_map and patched_map implement
/// it.
class LIBWIRE_EXPORT dependency_source {
public:
    virtual ~dependency_source();

    /// Membership test.  Never constructs anything.
    virtual bool contains(const dependency_key& key) const = 0;

    /// Resolve `key` with this source as the origin handed to constructors.
    erased_value resolve_erased(const dependency_key& key) {
        return resolve_from(key, *this);
    }

    /// Resolve `key`; `origin` is the outermost source of the lookup and is
    /// what constructors receive.  Throws unknown_dependency.
    virtual erased_value resolve_from(const dependency_key& key,
                                      dependency_source& origin) = 0;

    /// Resolve `key` as a T.  Throws unknown_dependency or type_mismatch.
    template <typename T>
    std::shared_ptr<T> resolve(const dependency_key& key) {
        auto value = resolve_erased(key);
        if (value.type != std::type_index(typeid(T))) {
            throw type_mismatch(key, typeid(T), value.type);
        }
        return std::static_pointer_cast<T>(std::move(value.ptr));
    }

    /// Resolve the dependency keyed by the type T.
    template <typename T>
    std::shared_ptr<T> resolve() {
        return resolve<T>(type_key<T>());
    }

protected:
    dependency_source() = default;
    dependency_source(const dependency_source&) = default;
    dependency_source& operator=(const dependency_source&) = default;
};

} // namespace libwire
