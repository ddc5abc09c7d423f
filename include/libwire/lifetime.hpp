#pragma once

#include <string_view>

namespace libwire {

/// How a provider produces its value.
enum class lifetime_kind {
    instance,
    factory,
    singleton,
    thread
};

constexpr std::string_view to_string(lifetime_kind lt) noexcept {
    constexpr std::string_view names[] = {"instance", "factory", "singleton", "thread"};
    return names[static_cast<int>(lt)];
}

} // namespace libwire
