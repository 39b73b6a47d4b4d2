#include <reactree/runtime/tick_host.h>
#include <reactree/util/diagnostics.h>

namespace reactree {
    void ManualTickHost::run_before_next_render(callback_type callback) { _pending.push_back(std::move(callback)); }

    render_time_t ManualTickHost::now() const { return _now.value_or(render_now()); }

    void ManualTickHost::set_now(render_time_t time) { _now = time; }

    void ManualTickHost::advance(render_time_delta_t delta) { _now = now() + delta; }

    std::size_t ManualTickHost::run_pending() {
        std::size_t count{0};
        while (!_pending.empty()) {
            // Callbacks requested while running the batch go into the next one
            auto batch = std::move(_pending);
            _pending.clear();
            ++_tick_count;
            for (auto &callback : batch) {
                invoke_with_error_handling("nextTick", callback);
                ++count;
            }
        }
        return count;
    }
} // namespace reactree
