#include "libwire/injector.hpp"
#include "libwire/exceptions.hpp"
#include "log.hpp"

#include <algorithm>
#include <unordered_set>

namespace libwire {

// ---------------------------------------------------------------
// injection_plan
// ---------------------------------------------------------------

std::optional<std::size_t> injection_plan::index_of(std::string_view name) const {
    auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) return std::nullopt;
    return static_cast<std::size_t>(it - names.begin());
}

std::vector<std::string> injection_plan::injection_points() const {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (keys[i]) out.push_back(names[i]);
    }
    return out;
}

void injection_plan::log_injection(std::size_t index) const {
    if (!log_injections) return;
    auto& log = internal::logger();
    if (log.should_log(spdlog::level::debug)) {
        log.debug("{}: Injecting {} with {}", operation, names[index], keys[index]->to_string());
    }
}

// ---------------------------------------------------------------
// plan_injection
// ---------------------------------------------------------------

namespace detail {

std::shared_ptr<const injection_plan>
plan_injection(std::string operation, const std::vector<param>& params,
               std::size_t arity, const dependency_source& source,
               const injector_options& options) {
    if (params.size() != arity) {
        throw di_error(operation + ": " + std::to_string(params.size())
                       + " parameter(s) declared for an operation taking "
                       + std::to_string(arity));
    }

    auto plan = std::make_shared<injection_plan>();
    plan->operation = std::move(operation);
    plan->log_injections = options.log_injections;
    plan->names.reserve(params.size());
    plan->keys.reserve(params.size());

    std::unordered_set<std::string> seen;
    for (const auto& p : params) {
        if (!seen.insert(p.name).second) {
            throw di_error(plan->operation + ": parameter '" + p.name + "' declared twice");
        }
        plan->names.push_back(p.name);

        std::optional<dependency_key> key;
        if (p.default_key && (p.default_key->is_named() || source.contains(*p.default_key))) {
            key = p.default_key;
        }
        plan->keys.push_back(std::move(key));
    }

    bool any = std::any_of(plan->keys.begin(), plan->keys.end(),
                           [](const auto& k) { return k.has_value(); });
    if (!any && options.warn_when_unneeded) {
        internal::logger().warn("{}: No injectable params found. You can safely remove the wrapper.",
                                plan->operation);
    }
    return plan;
}

} // namespace detail

// ---------------------------------------------------------------
// injector
// ---------------------------------------------------------------

injector::injector(std::shared_ptr<dependency_source> source, injector_options options)
    : source_(std::move(source))
    , options_(options)
{
    if (!source_) {
        throw di_error("injector requires a dependency source");
    }
}

injector bind(std::shared_ptr<dependency_source> source, injector_options options) {
    return injector(std::move(source), options);
}

injector bind(std::initializer_list<binding> bindings, injector_options options) {
    return injector(make_map(bindings), options);
}

} // namespace libwire
