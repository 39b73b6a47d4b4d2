#include <reactree/config.h>
#include <reactree/runtime/scheduler.h>
#include <reactree/util/diagnostics.h>

#include <algorithm>

namespace reactree {
    Scheduler::Scheduler(TickHost &tick_host) : _tick_host{tick_host} {}

    void Scheduler::schedule(const watcher_s_ptr &watcher) {
        if (!watcher) { return; }
        auto id = watcher->id();
        if (!_has.insert(id).second) { return; }
        if (!_flushing) {
            _queue.push_back(watcher);
        } else {
            // Keep the unprocessed remainder ordered by id, never insert before the watcher currently running
            auto i = static_cast<std::ptrdiff_t>(_queue.size()) - 1;
            while (i > static_cast<std::ptrdiff_t>(_index) && _queue[static_cast<std::size_t>(i)]->id() > id) { --i; }
            _queue.insert(_queue.begin() + (i + 1), watcher);
        }
        if (_waiting) { return; }
        _waiting = true;
        if (!config().async) {
            flush();
            return;
        }
        _tick_host.run_before_next_render([this] { flush(); });
    }

    void Scheduler::flush() {
        if (_flushing) { return; }
        _current_flush_timestamp = _tick_host.now();
        _flushing = true;

        std::ranges::sort(_queue, {}, [](const watcher_s_ptr &w) { return w->id(); });

        for (_index = 0; _index < _queue.size(); ++_index) {
            // Hold a reference, running the watcher can grow the queue
            auto watcher = _queue[_index];
            auto id = watcher->id();
            // A watcher torn down while queued (its owner was destroyed) is a no-op
            if (_runaway.contains(id) || !watcher->active()) { continue; }

            invoke_with_error_handling("watcher before hook", [&watcher] { watcher->run_before(); });
            _has.erase(id);
            invoke_with_error_handling(fmt::format("watcher \"{}\"", watcher->expression()),
                                       [&watcher] { watcher->force_reevaluate(); });

            if (_has.contains(id) && ++_circular[id] > config().max_update_count) {
                if (watcher->is_user()) {
                    warn("You may have an infinite update loop in watcher with expression \"{}\"", watcher->expression());
                } else {
                    warn("You may have an infinite update loop in a component render function.");
                }
                _runaway.insert(id);
            }
        }

        auto activated = std::move(_activated);
        auto updated = std::move(_queue);
        auto after_flush = std::move(_after_flush);
        reset();

        for (auto &fn : activated) { invoke_with_error_handling("activated hook", fn); }

        ankerl::unordered_dense::set<std::uint64_t> notified;
        for (auto it = updated.rbegin(); it != updated.rend(); ++it) {
            const auto &watcher = *it;
            if (!watcher->active() || !watcher->has_after() || !notified.insert(watcher->id()).second) { continue; }
            invoke_with_error_handling("updated hook", [&watcher] { watcher->run_after(); });
        }

        for (auto &fn : after_flush) { invoke_with_error_handling("after flush notification", fn); }
    }

    void Scheduler::queue_activated(notification_type fn) { _activated.push_back(std::move(fn)); }

    void Scheduler::add_after_flush_notification(notification_type fn) { _after_flush.push_back(std::move(fn)); }

    void Scheduler::reset() {
        _queue.clear();
        _has.clear();
        _circular.clear();
        _runaway.clear();
        _activated.clear();
        _after_flush.clear();
        _index = 0;
        _waiting = false;
        _flushing = false;
    }
} // namespace reactree
