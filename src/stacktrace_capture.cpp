#include "libwire/provider.hpp"

#include <any>

#ifdef LIBWIRE_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libwire::internal {

std::any capture_stacktrace() {
#ifdef LIBWIRE_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace libwire::internal
