#pragma once

/// @file fwd.hpp
/// Forward declarations for all public libwire symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace libwire {

// lifetime.hpp
enum class lifetime_kind;

// key.hpp
class key;
class dependency_key;

// erased_value.hpp
struct erased_value;

// provider.hpp
struct registration_info;
class provider;
class instance_provider;
class factory_provider;
class singleton_provider;
class thread_provider;

// exceptions.hpp
class di_error;
class unknown_dependency;
class type_mismatch;
class cyclic_dependency;
class argument_error;

// dependency_source.hpp
class dependency_source;

// dependency_map.hpp
struct binding;
class dependency_map;

// contextual_map.hpp
class context_guard;
class contextual_map;

// patched_map.hpp
class patched_map;

// options.hpp
struct injector_options;
enum class log_level;

// wrapped.hpp
struct param;
struct injection_plan;
template <typename Signature>
class wrapped;

// injector.hpp
class injector;

} // namespace libwire
