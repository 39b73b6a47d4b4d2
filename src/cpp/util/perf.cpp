#include <reactree/util/perf.h>

#include <reactree/util/string_hash.h>

namespace reactree {
    namespace {
        using marks_type = string_map<render_time_t>;

        marks_type &marks() {
            static marks_type instance;
            return instance;
        }

        std::vector<Measure> &measure_log() {
            static std::vector<Measure> instance;
            return instance;
        }
    } // namespace

    void mark(std::string_view tag) { marks().insert_or_assign(std::string{tag}, render_now()); }

    void measure(std::string_view name, std::string_view start_tag, std::string_view end_tag) {
        auto &all = marks();
        auto start = all.find(start_tag);
        auto end = all.find(end_tag);
        if (start != all.end() && end != all.end()) {
            measure_log().push_back(Measure{std::string{name}, start->second, end->second - start->second});
        }
        all.erase(std::string{start_tag});
        all.erase(std::string{end_tag});
    }

    const std::vector<Measure> &measures() { return measure_log(); }

    void clear_measures() { measure_log().clear(); }
} // namespace reactree
