#include "libwire/patched_map.hpp"
#include "libwire/exceptions.hpp"
#include "log.hpp"

namespace libwire {

patched_map::patched_map(std::shared_ptr<dependency_source> target)
    : target_(std::move(target))
{
    if (!target_) {
        throw di_error("patched_map requires a target dependency source");
    }
}

patched_map::~patched_map() = default;

patched_map& patched_map::patch_erased(dependency_key key, erased_value value) {
    internal::logger().debug("Patched {}", key.to_string());
    std::lock_guard lock(mutex_);
    patched_.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

bool patched_map::unpatch(const dependency_key& key) {
    std::lock_guard lock(mutex_);
    return patched_.erase(key) > 0;
}

void patched_map::clear() {
    std::lock_guard lock(mutex_);
    patched_.clear();
}

bool patched_map::is_patched(const dependency_key& key) const {
    std::lock_guard lock(mutex_);
    return patched_.contains(key);
}

bool patched_map::contains(const dependency_key& key) const {
    return is_patched(key) || target_->contains(key);
}

erased_value patched_map::resolve_from(const dependency_key& key,
                                       dependency_source& origin) {
    {
        std::lock_guard lock(mutex_);
        auto it = patched_.find(key);
        if (it != patched_.end()) {
            return it->second;
        }
    }
    return target_->resolve_from(key, origin);
}

} // namespace libwire
