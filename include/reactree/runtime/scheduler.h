#ifndef REACTREE_SCHEDULER_H
#define REACTREE_SCHEDULER_H

#include <reactree/runtime/tick_host.h>
#include <reactree/runtime/watcher.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <vector>

namespace reactree {
    /**
     * Batches watcher re-evaluation.
     *
     * Invalidated watchers are queued once per flush and run in ascending id order, so parents (created first) update
     * before their children. Watchers scheduled while a flush is running are inserted into the not yet processed part
     * of the queue at their id position and run in the same flush. A watcher that keeps re-scheduling itself is
     * reported once it exceeds config().max_update_count re-runs and skipped for the rest of the flush.
     */
    class REACTREE_EXPORT Scheduler {
    public:
        using notification_type = std::function<void()>;

        explicit Scheduler(TickHost &tick_host);

        Scheduler(const Scheduler &) = delete;

        Scheduler &operator=(const Scheduler &) = delete;

        /**
         * Queue watcher unless it is already pending. Requests a flush from the tick host when none is pending, or
         * flushes immediately when config().async is false.
         */
        void schedule(const watcher_s_ptr &watcher);

        /**
         * Run every queued watcher. Normally invoked by the tick host.
         */
        void flush();

        /**
         * Queue a hook to run after the current (or next) flush, before the after hooks of updated watchers.
         */
        void queue_activated(notification_type fn);

        /**
         * Register a one-shot notification run once the current (or next) flush has completed.
         */
        void add_after_flush_notification(notification_type fn);

        [[nodiscard]] bool is_flushing() const { return _flushing; }

        [[nodiscard]] bool is_waiting() const { return _waiting; }

        [[nodiscard]] bool has_pending(std::uint64_t watcher_id) const { return _has.contains(watcher_id); }

        [[nodiscard]] std::size_t queue_size() const { return _queue.size(); }

        /**
         * Time the most recent flush started.
         */
        [[nodiscard]] render_time_t current_flush_timestamp() const { return _current_flush_timestamp; }

        [[nodiscard]] TickHost &tick_host() const { return _tick_host; }

    private:
        void reset();

        TickHost &_tick_host;
        std::vector<watcher_s_ptr> _queue;
        ankerl::unordered_dense::set<std::uint64_t> _has;
        ankerl::unordered_dense::map<std::uint64_t, std::size_t> _circular;
        ankerl::unordered_dense::set<std::uint64_t> _runaway;
        std::vector<notification_type> _activated;
        std::vector<notification_type> _after_flush;
        bool _waiting{false};
        bool _flushing{false};
        std::size_t _index{0};
        render_time_t _current_flush_timestamp{MIN_RT};
    };
} // namespace reactree

#endif  // REACTREE_SCHEDULER_H
