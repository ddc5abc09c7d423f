#include "libwire/dependency_map.hpp"
#include "libwire/exceptions.hpp"
#include "log.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace libwire {

dependency_source::~dependency_source() = default;

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct dependency_map::Impl {
    // Guards `providers` only; never held while a constructor runs.
    mutable std::mutex mutex;

    // Providers are shared so a resolution in flight keeps its provider
    // alive when the key is re-registered or erased concurrently.
    std::unordered_map<dependency_key, std::shared_ptr<provider>> providers;
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

dependency_map::dependency_map()
    : impl_(std::make_unique<Impl>())
{}

dependency_map::~dependency_map() = default;

dependency_map::dependency_map(dependency_map&&) noexcept = default;
dependency_map& dependency_map::operator=(dependency_map&&) noexcept = default;

// ---------------------------------------------------------------
// Registration
// ---------------------------------------------------------------

dependency_map& dependency_map::add(dependency_key key, std::unique_ptr<provider> p,
                                    std::source_location loc) {
    return register_provider(std::move(key), std::move(p), "add", loc);
}

dependency_map& dependency_map::register_provider(dependency_key key,
                                                  std::unique_ptr<provider> p,
                                                  std::string_view api_name,
                                                  std::source_location loc) {
    if (!p) {
        throw di_error("Cannot register an empty provider for " + key.to_string(), loc);
    }

    p->set_registration({loc, internal::capture_stacktrace(), std::string(api_name)});
    internal::logger().debug("Registered {} as {}", key.to_string(), to_string(p->lifetime()));

    std::shared_ptr<provider> replaced;
    {
        std::lock_guard lock(impl_->mutex);
        std::shared_ptr<provider> next(std::move(p));
        auto it = impl_->providers.find(key);
        if (it == impl_->providers.end()) {
            impl_->providers.emplace(key, std::move(next));
        } else {
            replaced = std::exchange(it->second, std::move(next));
        }
    }
    if (replaced) {
        internal::logger().debug("Replaced previous {} provider for {}",
                                 to_string(replaced->lifetime()), key.to_string());
    }
    return *this;
}

// ---------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------

bool dependency_map::contains(const dependency_key& key) const {
    std::lock_guard lock(impl_->mutex);
    return impl_->providers.contains(key);
}

std::shared_ptr<provider> dependency_map::find(const dependency_key& key) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->providers.find(key);
    if (it == impl_->providers.end()) return nullptr;
    return it->second;
}

erased_value dependency_map::resolve_from(const dependency_key& key,
                                          dependency_source& origin) {
    auto p = find(key);
    if (!p) {
        throw unknown_dependency(key);
    }
    return p->get(key, origin);
}

bool dependency_map::erase(const dependency_key& key) {
    std::shared_ptr<provider> removed;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->providers.find(key);
        if (it == impl_->providers.end()) return false;
        removed = std::move(it->second);
        impl_->providers.erase(it);
    }
    internal::logger().debug("Removed {}", key.to_string());
    return true;
}

void dependency_map::reset_cached() {
    std::vector<std::shared_ptr<provider>> all;
    {
        std::lock_guard lock(impl_->mutex);
        all.reserve(impl_->providers.size());
        for (auto& [k, p] : impl_->providers) all.push_back(p);
    }
    for (auto& p : all) p->reset();
}

std::size_t dependency_map::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->providers.size();
}

std::vector<dependency_key> dependency_map::keys() const {
    std::lock_guard lock(impl_->mutex);
    std::vector<dependency_key> out;
    out.reserve(impl_->providers.size());
    for (auto& [k, p] : impl_->providers) out.push_back(k);
    return out;
}

std::shared_ptr<dependency_map> dependency_map::fork() const {
    auto copy = std::make_shared<dependency_map>();
    std::lock_guard lock(impl_->mutex);
    for (auto& [k, p] : impl_->providers) {
        copy->impl_->providers.emplace(k, std::shared_ptr<provider>(p->clone()));
    }
    return copy;
}

// ---------------------------------------------------------------
// make_map
// ---------------------------------------------------------------

std::shared_ptr<dependency_map> make_map(std::initializer_list<binding> bindings) {
    auto map = std::make_shared<dependency_map>();
    for (const auto& b : bindings) {
        map->add(b.key, std::make_unique<instance_provider>(b.value));
    }
    return map;
}

} // namespace libwire
