#include "libwire/provider.hpp"
#include "libwire/exceptions.hpp"
#include "log.hpp"
#include "stacktrace_utils.hpp"

#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

namespace libwire {

namespace {

/// Marks the calling thread as constructing a singleton for the lifetime of
/// the guard.
struct construction_mark {
    std::atomic<std::thread::id>& owner;

    explicit construction_mark(std::atomic<std::thread::id>& o) : owner(o) {
        owner.store(std::this_thread::get_id());
    }
    ~construction_mark() { owner.store(std::thread::id{}); }

    construction_mark(const construction_mark&) = delete;
    construction_mark& operator=(const construction_mark&) = delete;
};

// Which singleton each thread is blocked on.  Together with
// singleton_provider::constructing_ this forms the wait-for graph that is
// walked before blocking, so a cycle spanning threads is reported instead of
// deadlocking.
std::mutex wait_graph_mutex;
std::unordered_map<std::thread::id, const singleton_provider*> waiting_on;

/// Registers the calling thread as waiting for a singleton until the guard
/// is destroyed.
struct wait_registration {
    std::thread::id self;

    wait_registration(std::thread::id tid, const singleton_provider* target) : self(tid) {
        waiting_on[self] = target;
    }
    ~wait_registration() {
        std::lock_guard lock(wait_graph_mutex);
        waiting_on.erase(self);
    }

    wait_registration(const wait_registration&) = delete;
    wait_registration& operator=(const wait_registration&) = delete;
};

std::atomic<std::uint64_t> next_thread_generation{1};

struct thread_cell {
    std::optional<erased_value> value;
    bool constructing = false;
};

// Values of every thread_provider for the current thread, keyed by provider
// generation.  Destroyed with the thread.
thread_local std::unordered_map<std::uint64_t, thread_cell> thread_cells;

} // namespace

// ---------------------------------------------------------------
// provider
// ---------------------------------------------------------------

provider::provider(std::type_index value_type)
    : value_type_(value_type)
{}

provider::~provider() = default;

// ---------------------------------------------------------------
// instance_provider
// ---------------------------------------------------------------

instance_provider::instance_provider(erased_value value)
    : provider(value.type)
    , value_(std::move(value))
{}

erased_value instance_provider::get(const dependency_key&, dependency_source&) {
    return value_;
}

std::unique_ptr<provider> instance_provider::clone() const {
    auto copy = std::make_unique<instance_provider>(value_);
    copy->set_registration(registration());
    return copy;
}

// ---------------------------------------------------------------
// constructing_provider
// ---------------------------------------------------------------

constructing_provider::constructing_provider(std::type_index value_type, constructor_fn ctor)
    : provider(value_type)
    , ctor_(std::move(ctor))
{
    if (!ctor_) {
        throw di_error("Provider constructor cannot be empty");
    }
}

erased_value constructing_provider::construct(const dependency_key& self,
                                              dependency_source& origin) {
    try {
        return ctor_(origin);
    } catch (di_error& e) {
        // Annotate with resolution context so nested failures show the
        // full chain: "... (while resolving key("b") -> key("a"))".
        e.append_resolution_context(self.to_string());
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(self, *this);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        // Rethrown unchanged.
        internal::logger().error("Unexpected problem when creating an instance of {}: {}",
                                 self.to_string(), e.what());
        throw;
    }
}

// ---------------------------------------------------------------
// factory_provider
// ---------------------------------------------------------------

factory_provider::factory_provider(std::type_index value_type, constructor_fn ctor)
    : constructing_provider(value_type, std::move(ctor))
{}

erased_value factory_provider::get(const dependency_key& self, dependency_source& origin) {
    internal::logger().debug("Running factory for dependency {}", self.to_string());
    return construct(self, origin);
}

std::unique_ptr<provider> factory_provider::clone() const {
    auto copy = std::make_unique<factory_provider>(value_type(), constructor());
    copy->set_registration(registration());
    return copy;
}

// ---------------------------------------------------------------
// singleton_provider
// ---------------------------------------------------------------

singleton_provider::singleton_provider(std::type_index value_type, constructor_fn ctor)
    : constructing_provider(value_type, std::move(ctor))
{}

erased_value singleton_provider::get(const dependency_key& self, dependency_source& origin) {
    const auto me = std::this_thread::get_id();
    // Re-entry from our own constructor would deadlock on mutex_.
    if (constructing_.load() == me) {
        auto ex = cyclic_dependency(self);
        ex.set_diagnostic_detail(internal::format_registration_trace(self, *this));
        throw ex;
    }

    std::optional<wait_registration> waiting;
    {
        std::lock_guard graph(wait_graph_mutex);
        // Follow owner -> awaited singleton -> owner ... back to this thread.
        const singleton_provider* target = this;
        for (std::size_t hops = 0; target != nullptr && hops <= waiting_on.size(); ++hops) {
            const auto owner = target->constructing_.load();
            if (owner == std::thread::id{}) break;
            if (owner == me) {
                internal::logger().warn("Cycle across threads while resolving {}",
                                        self.to_string());
                auto ex = cyclic_dependency(self);
                ex.set_diagnostic_detail(internal::format_registration_trace(self, *this));
                throw ex;
            }
            auto it = waiting_on.find(owner);
            target = it == waiting_on.end() ? nullptr : it->second;
        }
        waiting.emplace(me, this);
    }

    std::lock_guard lock(mutex_);
    waiting.reset();
    if (value_) {
        return *value_;
    }

    internal::logger().debug("Running singleton factory for dependency {}", self.to_string());
    construction_mark mark(constructing_);
    value_ = construct(self, origin);
    return *value_;
}

std::unique_ptr<provider> singleton_provider::clone() const {
    auto copy = std::make_unique<singleton_provider>(value_type(), constructor());
    copy->set_registration(registration());
    return copy;
}

void singleton_provider::reset() {
    std::lock_guard lock(mutex_);
    value_.reset();
}

bool singleton_provider::constructed() const {
    std::lock_guard lock(mutex_);
    return value_.has_value();
}

// ---------------------------------------------------------------
// thread_provider
// ---------------------------------------------------------------

thread_provider::thread_provider(std::type_index value_type, constructor_fn ctor)
    : constructing_provider(value_type, std::move(ctor))
    , generation_(next_thread_generation.fetch_add(1))
{}

erased_value thread_provider::get(const dependency_key& self, dependency_source& origin) {
    const auto generation = generation_.load();
    auto& cell = thread_cells[generation];
    if (cell.value) {
        return *cell.value;
    }
    if (cell.constructing) {
        auto ex = cyclic_dependency(self);
        ex.set_diagnostic_detail(internal::format_registration_trace(self, *this));
        throw ex;
    }
    cell.constructing = true;

    // Nested resolutions may insert into thread_cells, so the cell is looked
    // up again rather than held across construct().
    struct unmark {
        std::uint64_t generation;
        ~unmark() {
            auto it = thread_cells.find(generation);
            if (it == thread_cells.end()) return;
            it->second.constructing = false;
            if (!it->second.value) thread_cells.erase(it);
        }
    } guard{generation};

    internal::logger().debug("Running thread factory for dependency {} in thread {}",
                             self.to_string(),
                             std::hash<std::thread::id>{}(std::this_thread::get_id()));
    auto value = construct(self, origin);
    thread_cells[generation].value = value;
    return value;
}

std::unique_ptr<provider> thread_provider::clone() const {
    auto copy = std::make_unique<thread_provider>(value_type(), constructor());
    copy->set_registration(registration());
    return copy;
}

void thread_provider::reset() {
    const auto previous = generation_.exchange(next_thread_generation.fetch_add(1));
    thread_cells.erase(previous);
}

bool thread_provider::constructed() const {
    auto it = thread_cells.find(generation_.load());
    return it != thread_cells.end() && it->second.value.has_value();
}

} // namespace libwire
