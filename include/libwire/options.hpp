#pragma once

#include "export.hpp"

#include <string_view>

namespace libwire {

/// Options fixed when an injector is bound.
struct injector_options {
    /// Log a warning when an operation is wrapped but none of its parameters
    /// is injectable.
    bool warn_when_unneeded = true;

    /// Log (at debug level) every parameter the wrapper injects.
    bool log_injections = true;
};

// ---------------------------------------------------------------
// Logging verbosity
// ---------------------------------------------------------------

enum class log_level {
    trace,
    debug,
    info,
    warn,
    error,
    off
};

constexpr std::string_view to_string(log_level lvl) noexcept {
    constexpr std::string_view names[] = {"trace", "debug", "info", "warn", "error", "off"};
    return names[static_cast<int>(lvl)];
}

/// Set the verbosity of the library's "libwire" logger (default: warn).
LIBWIRE_EXPORT void set_log_level(log_level lvl);

LIBWIRE_EXPORT log_level get_log_level();

} // namespace libwire
