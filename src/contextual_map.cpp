#include "libwire/contextual_map.hpp"
#include "log.hpp"

#include <utility>

namespace libwire {

// ---------------------------------------------------------------
// context_guard
// ---------------------------------------------------------------

context_guard::context_guard(contextual_map& owner, std::optional<std::string> previous_name,
                             std::shared_ptr<dependency_map> previous_map,
                             std::shared_ptr<dependency_map> activated)
    : owner_(&owner)
    , previous_name_(std::move(previous_name))
    , previous_map_(std::move(previous_map))
    , map_(std::move(activated))
{}

context_guard::context_guard(context_guard&& o) noexcept
    : owner_(std::exchange(o.owner_, nullptr))
    , previous_name_(std::move(o.previous_name_))
    , previous_map_(std::move(o.previous_map_))
    , map_(std::move(o.map_))
{}

context_guard::~context_guard() {
    if (owner_) {
        owner_->restore(std::move(previous_name_), previous_map_);
    }
}

// ---------------------------------------------------------------
// contextual_map
// ---------------------------------------------------------------

contextual_map::contextual_map()
    : root_(std::make_shared<dependency_map>())
    , active_(root_)
{}

contextual_map::~contextual_map() = default;

std::shared_ptr<dependency_map> contextual_map::active() const {
    std::lock_guard lock(mutex_);
    return active_;
}

dependency_map& contextual_map::current() {
    return *active();
}

std::optional<std::string> contextual_map::current_context() const {
    std::lock_guard lock(mutex_);
    return active_name_;
}

std::shared_ptr<dependency_map> contextual_map::switch_to(const std::optional<std::string>& name) {
    std::lock_guard lock(mutex_);
    if (!name) {
        active_name_.reset();
        active_ = root_;
        internal::logger().debug("Switched dependency map context to root");
        return active_;
    }

    auto it = contexts_.find(*name);
    if (it == contexts_.end()) {
        internal::logger().debug("Initializing dependency map for context: {}", *name);
        it = contexts_.emplace(*name, root_->fork()).first;
    }
    active_name_ = *name;
    active_ = it->second;
    internal::logger().debug("Switched dependency map context to: {}", *name);
    return active_;
}

dependency_map& contextual_map::context(std::optional<std::string> name) {
    return *switch_to(name);
}

context_guard contextual_map::activate(std::string name) {
    std::optional<std::string> previous_name;
    std::shared_ptr<dependency_map> previous_map;
    {
        std::lock_guard lock(mutex_);
        previous_name = active_name_;
        previous_map = active_;
    }
    auto activated = switch_to(name);
    return context_guard(*this, std::move(previous_name), std::move(previous_map),
                         std::move(activated));
}

void contextual_map::restore(std::optional<std::string> name,
                             const std::shared_ptr<dependency_map>& map) noexcept {
    std::lock_guard lock(mutex_);
    // Only a context that still holds the same map is restored; anything
    // else falls back to the root without creating a context.
    if (name) {
        auto it = contexts_.find(*name);
        if (it != contexts_.end() && it->second == map) {
            active_name_ = std::move(name);
            active_ = map;
            return;
        }
    }
    active_name_.reset();
    active_ = root_;
}

void contextual_map::reset() {
    std::lock_guard lock(mutex_);
    contexts_.clear();
    active_name_.reset();
    active_ = root_;
}

bool contextual_map::contains(const dependency_key& key) const {
    return active()->contains(key);
}

erased_value contextual_map::resolve_from(const dependency_key& key,
                                          dependency_source& origin) {
    // Constructors of the active context see that context's map, unless
    // the lookup started from an outer source (e.g. a patched_map).
    auto map = active();
    if (&origin == this) {
        return map->resolve_from(key, *map);
    }
    return map->resolve_from(key, origin);
}

} // namespace libwire
