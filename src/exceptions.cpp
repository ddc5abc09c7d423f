#include "libwire/exceptions.hpp"

#include <cstdlib>
#include <typeindex>
#include <string>
#include <memory>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace libwire {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

} // namespace internal

std::string di_error::format_message(const std::string& msg,
                                     const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

di_error::di_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void di_error::append_resolution_context(const std::string& component_info) {
    if (!resolution_context_.empty()) {
        resolution_context_ += " -> ";
    }
    resolution_context_ += component_info;
    cached_what_.clear();
}

const char* di_error::what() const noexcept {
    if (resolution_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + resolution_context_ + ")";
        } catch (const std::bad_alloc&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string di_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

unknown_dependency::unknown_dependency(const dependency_key& key,
                                       std::source_location loc)
    : di_error("Unable to find a provider for " + key.to_string(), loc)
    , key_(key)
{}

unknown_dependency::unknown_dependency(const dependency_key& key,
                                       std::string_view hint,
                                       std::source_location loc)
    : di_error([&]() {
          std::string msg = "Unable to find a provider for " + key.to_string();
          if (!hint.empty())
              msg += "; " + std::string(hint);
          return msg;
      }(), loc)
    , key_(key)
{}

type_mismatch::type_mismatch(const dependency_key& key,
                             std::type_index requested,
                             std::type_index registered,
                             std::source_location loc)
    : di_error("Dependency " + key.to_string() + " is registered as "
               + internal::demangle(registered) + " but was requested as "
               + internal::demangle(requested), loc)
    , key_(key)
    , requested_(requested)
    , registered_(registered)
{}

cyclic_dependency::cyclic_dependency(const dependency_key& key,
                                     std::source_location loc)
    : di_error("Cyclic dependency detected: " + key.to_string()
               + " is required while it is being constructed", loc)
    , key_(key)
{}

argument_error::argument_error(std::string_view operation,
                               const std::string& message,
                               std::source_location loc)
    : di_error(std::string(operation) + ": " + message, loc)
{}

} // namespace libwire
