#pragma once

#include "export.hpp"
#include "dependency_map.hpp"
#include "dependency_source.hpp"
#include "erased_value.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace libwire {

/// Overlays explicit values on top of another dependency source.  Mostly
/// useful in tests: bind the injector to a patched_map over the real map and
/// patch in fakes.
///
/// Lookups that fall through to the target resolve with the patched_map as
/// origin, so constructors running in the target see patched values too.
class LIBWIRE_EXPORT patched_map : public dependency_source {
public:
    explicit patched_map(std::shared_ptr<dependency_source> target);
    ~patched_map() override;

    patched_map(const patched_map&) = delete;
    patched_map& operator=(const patched_map&) = delete;

    /// Patch `key` with an existing object, registered as T.
    template <typename T>
    patched_map& patch(dependency_key key, std::shared_ptr<T> value) {
        return patch_erased(std::move(key), make_erased(std::move(value)));
    }

    /// Patch `key` with a copy of `value`.
    template <typename V>
        requires (!is_shared_ptr_v<V>)
    patched_map& patch(dependency_key key, V&& value) {
        return patch_erased(std::move(key), make_erased_copy(std::forward<V>(value)));
    }

    patched_map& patch_erased(dependency_key key, erased_value value);

    /// Remove one patch.  Returns false if `key` was not patched.
    bool unpatch(const dependency_key& key);

    /// Remove every patch.
    void clear();

    bool is_patched(const dependency_key& key) const;

    dependency_source& target() noexcept { return *target_; }

    bool contains(const dependency_key& key) const override;

    erased_value resolve_from(const dependency_key& key,
                              dependency_source& origin) override;

private:
    std::shared_ptr<dependency_source> target_;
    mutable std::mutex mutex_;
    std::unordered_map<dependency_key, erased_value> patched_;
};

} // namespace libwire
