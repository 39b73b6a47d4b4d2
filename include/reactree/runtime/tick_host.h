#ifndef REACTREE_TICK_HOST_H
#define REACTREE_TICK_HOST_H

#include <reactree/reactree_base.h>

#include <functional>
#include <vector>

namespace reactree {
    /**
     * The host's "run later, before the next render" capability and its clock.
     */
    struct REACTREE_EXPORT TickHost {
        using callback_type = std::function<void()>;

        virtual ~TickHost() = default;

        /**
         * Run callback after the current synchronous work completes and before the next render. Implementations may
         * coalesce several requests into one batch but must preserve request order.
         */
        virtual void run_before_next_render(callback_type callback) = 0;

        [[nodiscard]] virtual render_time_t now() const = 0;
    };

    /**
     * A TickHost driven explicitly by the caller.
     *
     * Requests accumulate until run_pending is called; every request made before that point runs as one batch.
     * Errors raised by callbacks are reported through handle_error and do not stop the batch.
     */
    class REACTREE_EXPORT ManualTickHost : public TickHost {
    public:
        void run_before_next_render(callback_type callback) override;

        [[nodiscard]] render_time_t now() const override;

        /**
         * Fix the value returned by now(). Until set, now() follows the steady clock.
         */
        void set_now(render_time_t time);

        void advance(render_time_delta_t delta);

        /**
         * Run pending batches until no more requests are queued. Returns the number of callbacks run.
         */
        std::size_t run_pending();

        [[nodiscard]] bool has_pending() const { return !_pending.empty(); }

        [[nodiscard]] std::size_t pending_count() const { return _pending.size(); }

        /**
         * Number of batches run so far.
         */
        [[nodiscard]] std::size_t tick_count() const { return _tick_count; }

    private:
        std::vector<callback_type> _pending;
        std::optional<render_time_t> _now;
        std::size_t _tick_count{0};
    };
} // namespace reactree

#endif  // REACTREE_TICK_HOST_H
