#include <reactree/runtime/computed.h>
#include <reactree/runtime/evaluation_stack.h>

namespace reactree {
    Computed::Computed(Scheduler &scheduler, Watcher::getter_type getter, std::string name)
        : _watcher{Watcher::create(scheduler, std::move(getter), {},
                                   WatcherOptions{.lazy = true, .expression = std::move(name)})} {}

    computed_s_ptr Computed::make(Scheduler &scheduler, Watcher::getter_type getter, std::string name) {
        return std::make_shared<Computed>(scheduler, std::move(getter), std::move(name));
    }

    Value Computed::get() {
        if (_watcher->dirty()) { _watcher->recompute(); }
        if (EvaluationStack::current() != nullptr) { _watcher->depend(); }
        return _watcher->value();
    }

    void Computed::teardown() { _watcher->teardown(); }
} // namespace reactree
