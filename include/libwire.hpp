#pragma once

#include "libwire/export.hpp"
#include "libwire/fwd.hpp"
#include "libwire/lifetime.hpp"
#include "libwire/key.hpp"
#include "libwire/erased_value.hpp"
#include "libwire/exceptions.hpp"
#include "libwire/type_traits.hpp"
#include "libwire/provider.hpp"
#include "libwire/dependency_source.hpp"
#include "libwire/dependency_map.hpp"
#include "libwire/contextual_map.hpp"
#include "libwire/patched_map.hpp"
#include "libwire/options.hpp"
#include "libwire/arg_slot.hpp"
#include "libwire/wrapped.hpp"
#include "libwire/injector.hpp"
