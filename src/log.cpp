#include "log.hpp"

#include "libwire/options.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace libwire {

namespace {

constexpr const char* logger_name = "libwire";

spdlog::level::level_enum to_spdlog(log_level lvl) {
    switch (lvl) {
        case log_level::trace: return spdlog::level::trace;
        case log_level::debug: return spdlog::level::debug;
        case log_level::info:  return spdlog::level::info;
        case log_level::warn:  return spdlog::level::warn;
        case log_level::error: return spdlog::level::err;
        case log_level::off:   return spdlog::level::off;
    }
    return spdlog::level::off;
}

log_level from_spdlog(spdlog::level::level_enum lvl) {
    switch (lvl) {
        case spdlog::level::trace:    return log_level::trace;
        case spdlog::level::debug:    return log_level::debug;
        case spdlog::level::info:     return log_level::info;
        case spdlog::level::warn:     return log_level::warn;
        case spdlog::level::err:
        case spdlog::level::critical: return log_level::error;
        default:                      return log_level::off;
    }
}

std::shared_ptr<spdlog::logger> create_logger() {
    // An application may have registered its own "libwire" logger already.
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    auto created = spdlog::stdout_color_mt(logger_name);
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

namespace internal {

spdlog::logger& logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return *instance;
}

} // namespace internal

void set_log_level(log_level lvl) {
    internal::logger().set_level(to_spdlog(lvl));
}

log_level get_log_level() {
    return from_spdlog(internal::logger().level());
}

} // namespace libwire
