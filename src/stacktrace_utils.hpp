#pragma once

// Internal helper for stacktrace capture and formatting.
// This header is NOT installed — it is only used by the library's .cpp files.

#include "libwire/key.hpp"
#include "libwire/provider.hpp"

#include <any>
#include <string>
#include <sstream>

#ifdef LIBWIRE_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libwire::internal {

// capture_stacktrace() is declared in provider.hpp (public header)
// and implemented in stacktrace_capture.cpp.  No inline definition here.

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef LIBWIRE_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format one provider's registration trace for diagnostic output.
/// Returns a block like:
///   "Registration stacktrace for key(\"hash\") (singleton, called via add_singleton):\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const dependency_key& key, const provider& p) {
    std::string trace = format_stacktrace(p.registration().stacktrace);
    if (trace.empty()) return {};

    std::string header = "Registration stacktrace for " + key.to_string()
                         + " (" + std::string(to_string(p.lifetime()));
    if (!p.registration().api_name.empty()) {
        header += ", called via " + p.registration().api_name;
    }
    return header + "):\n" + trace;
}

} // namespace libwire::internal
