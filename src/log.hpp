#pragma once

// Internal access to the library logger.
// This header is NOT installed — it is only used by the library's .cpp files.

#include <spdlog/spdlog.h>

namespace libwire::internal {

/// The "libwire" logger, created on first use with a stdout colour sink.
spdlog::logger& logger();

} // namespace libwire::internal
