#ifndef REACTREE_PERF_H
#define REACTREE_PERF_H

#include <reactree/reactree_base.h>

#include <vector>

namespace reactree {
    struct Measure {
        std::string name;
        render_time_t start;
        render_time_delta_t duration;
    };

    /**
     * Record a named timestamp.
     */
    REACTREE_EXPORT void mark(std::string_view tag);

    /**
     * Record the time between two marks under name and clear both marks. Ignored when either mark is missing.
     */
    REACTREE_EXPORT void measure(std::string_view name, std::string_view start_tag, std::string_view end_tag);

    /**
     * Measures recorded so far, oldest first.
     */
    [[nodiscard]] REACTREE_EXPORT const std::vector<Measure> &measures();

    REACTREE_EXPORT void clear_measures();
} // namespace reactree

#endif  // REACTREE_PERF_H
