#ifndef REACTREE_DATE_TIME_H
#define REACTREE_DATE_TIME_H

#include <chrono>

namespace reactree {
    using render_clock = std::chrono::steady_clock;
    // Microsecond precision is plenty for flush and render timestamps
    using render_time_t = std::chrono::time_point<render_clock, std::chrono::microseconds>;
    using render_time_delta_t = std::chrono::microseconds;

    constexpr render_time_t min_time() noexcept { return render_time_t{}; }

    inline render_time_t render_now() noexcept {
        return std::chrono::time_point_cast<std::chrono::microseconds>(render_clock::now());
    }

    inline auto static MIN_RT = min_time();
} // namespace reactree

#endif  // REACTREE_DATE_TIME_H
