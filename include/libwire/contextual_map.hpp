#pragma once

#include "export.hpp"
#include "dependency_map.hpp"
#include "dependency_source.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace libwire {

class contextual_map;

/// RAII context activation.  When destroyed, the context that was active
/// when the guard was created is restored.  If that context was dropped by
/// contextual_map::reset() in the meantime, the root is restored instead.
class LIBWIRE_EXPORT context_guard {
public:
    ~context_guard();

    context_guard(const context_guard&) = delete;
    context_guard& operator=(const context_guard&) = delete;
    context_guard(context_guard&&) noexcept;
    context_guard& operator=(context_guard&&) = delete;

    /// The map of the context this guard activated.
    dependency_map& map() noexcept { return *map_; }

private:
    friend class contextual_map;
    context_guard(contextual_map& owner, std::optional<std::string> previous_name,
                  std::shared_ptr<dependency_map> previous_map,
                  std::shared_ptr<dependency_map> activated);

    contextual_map* owner_;
    std::optional<std::string> previous_name_;
    std::shared_ptr<dependency_map> previous_map_;
    std::shared_ptr<dependency_map> map_;
};

/// A dependency source with one isolated dependency_map per named context.
///
/// Providers registered on root() seed every context created afterwards:
/// each new context receives fresh copies of them, so singletons are
/// constructed once per context.  The active context is process-wide.
class LIBWIRE_EXPORT contextual_map : public dependency_source {
public:
    contextual_map();
    ~contextual_map() override;

    contextual_map(const contextual_map&) = delete;
    contextual_map& operator=(const contextual_map&) = delete;

    /// The context-less map.
    dependency_map& root() noexcept { return *root_; }

    /// The map of the active context (root() when none is active).
    dependency_map& current();

    /// Name of the active context, nullopt for the root.
    std::optional<std::string> current_context() const;

    /// Switch the active context, creating it from root() on first use.
    /// nullopt reactivates the root.  Returns the now-active map.
    dependency_map& context(std::optional<std::string> name);

    /// Switch to `name` until the returned guard is destroyed.
    [[nodiscard]] context_guard activate(std::string name);

    /// Drop every context and reactivate the root.
    void reset();

    bool contains(const dependency_key& key) const override;

    erased_value resolve_from(const dependency_key& key,
                              dependency_source& origin) override;

private:
    friend class context_guard;

    std::shared_ptr<dependency_map> active() const;
    void restore(std::optional<std::string> name,
                 const std::shared_ptr<dependency_map>& map) noexcept;
    std::shared_ptr<dependency_map> switch_to(const std::optional<std::string>& name);

    mutable std::mutex mutex_;
    std::shared_ptr<dependency_map> root_;
    std::map<std::string, std::shared_ptr<dependency_map>> contexts_;
    std::optional<std::string> active_name_;
    std::shared_ptr<dependency_map> active_;
};

} // namespace libwire
