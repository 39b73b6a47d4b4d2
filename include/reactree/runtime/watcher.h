#ifndef REACTREE_WATCHER_H
#define REACTREE_WATCHER_H

#include <reactree/types/subject.h>
#include <reactree/types/value.h>

#include <ankerl/unordered_dense.h>

#include <functional>

namespace reactree {
    struct WatcherOptions {
        // Traverse the result so nested mutations also invalidate
        bool deep{false};
        // Errors raised by the getter or callback are reported through handle_error instead of propagating
        bool user{false};
        // Only mark dirty on invalidation, evaluated on demand (computed values)
        bool lazy{false};
        // Run immediately on invalidation instead of going through the scheduler
        bool sync{false};
        // The render watcher of a component, used for diagnostics
        bool render{false};
        // Run by the scheduler just before the watcher is re-evaluated
        std::function<void()> before;
        // Run by the scheduler once the flush that re-evaluated the watcher has completed
        std::function<void()> after;
        // Human readable description of the computation, used in diagnostics
        std::string expression;
    };

    /**
     * A re-runnable computation that records the subjects it reads and is invalidated when any of them notifies.
     *
     * Each evaluation collects a fresh dependency set; subjects not read again are unsubscribed from so a watcher only
     * ever depends on what its last evaluation touched. Watchers are created through Watcher::create as the
     * dependency collection needs a shared reference to the watcher.
     */
    class REACTREE_EXPORT Watcher : public Subscriber, public std::enable_shared_from_this<Watcher> {
    public:
        using getter_type = std::function<Value()>;
        using callback_type = std::function<void(const Value &new_value, const Value &old_value)>;

        /**
         * Create a watcher over getter. Watchers that are not lazy are evaluated immediately.
         */
        static watcher_s_ptr create(Scheduler &scheduler, getter_type getter, callback_type callback = {},
                                    WatcherOptions options = {});

        /**
         * Create a watcher over a dot-delimited path read from root. An invalid path is reported and the watcher
         * evaluates to Undefined.
         */
        static watcher_s_ptr create(Scheduler &scheduler, Value root, std::string_view path,
                                    callback_type callback = {}, WatcherOptions options = {});

        /**
         * Build a getter for a dot-delimited path such as "a.b.0.c". Returns an empty function when the path contains
         * characters other than letters, digits, '.', '$' and '_'.
         */
        [[nodiscard]] static getter_type parse_path(Value root, std::string_view path);

        Watcher(const Watcher &) = delete;

        Watcher &operator=(const Watcher &) = delete;

        ~Watcher() override;

        [[nodiscard]] std::uint64_t id() const override { return _id; }

        void add_dependency(const subject_s_ptr &subject) override;

        void invalidate() override;

        /**
         * Run the getter collecting dependencies, returning its result.
         */
        Value evaluate();

        /**
         * Re-evaluate and invoke the callback when the result changed, is an object or array, or the watcher is deep.
         */
        void force_reevaluate();

        /**
         * Evaluate a lazy watcher and clear its dirty flag.
         */
        void recompute();

        /**
         * Make the currently evaluating subscriber depend on everything this watcher depends on.
         */
        void depend();

        /**
         * Unsubscribe from every subject and become permanently inactive.
         */
        void teardown();

        /**
         * Invokes the before hook, if any.
         */
        void run_before() const;

        /**
         * Invokes the after hook, if any.
         */
        void run_after() const;

        [[nodiscard]] const Value &value() const { return _value; }

        [[nodiscard]] bool dirty() const { return _dirty; }

        [[nodiscard]] bool active() const { return _active; }

        [[nodiscard]] bool is_lazy() const { return _options.lazy; }

        [[nodiscard]] bool is_user() const { return _options.user; }

        [[nodiscard]] bool is_render() const { return _options.render; }

        [[nodiscard]] bool has_before() const { return static_cast<bool>(_options.before); }

        [[nodiscard]] bool has_after() const { return static_cast<bool>(_options.after); }

        [[nodiscard]] const std::string &expression() const { return _options.expression; }

        [[nodiscard]] std::size_t dependency_count() const { return _deps.size(); }

        [[nodiscard]] bool depends_on(const subject_s_ptr &subject) const;

        [[nodiscard]] Scheduler &scheduler() const { return _scheduler; }

    protected:
        Watcher(Scheduler &scheduler, getter_type getter, callback_type callback, WatcherOptions options);

    private:
        void cleanup_deps();

        Scheduler &_scheduler;
        getter_type _getter;
        callback_type _callback;
        WatcherOptions _options;
        std::uint64_t _id;
        bool _active{true};
        bool _dirty{false};
        Value _value;

        std::vector<subject_s_ptr> _deps;
        std::vector<subject_s_ptr> _new_deps;
        ankerl::unordered_dense::set<Subject::id_type> _dep_ids;
        ankerl::unordered_dense::set<Subject::id_type> _new_dep_ids;
    };

    struct WatchOptions {
        bool deep{false};
        // Invoke the callback once with the initial value (old value Undefined)
        bool immediate{false};
        bool sync{false};
        std::function<void()> before;
        std::string expression;
    };

    /**
     * Create a user watcher. Calling teardown on the returned watcher stops watching.
     */
    REACTREE_EXPORT watcher_s_ptr watch(Scheduler &scheduler, Watcher::getter_type getter,
                                        Watcher::callback_type callback, WatchOptions options = {});

    REACTREE_EXPORT watcher_s_ptr watch(Scheduler &scheduler, Value root, std::string_view path,
                                        Watcher::callback_type callback, WatchOptions options = {});
} // namespace reactree

#endif  // REACTREE_WATCHER_H
