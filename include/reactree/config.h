#ifndef REACTREE_CONFIG_H
#define REACTREE_CONFIG_H

#include <reactree/reactree_base.h>

#include <exception>
#include <functional>
#include <vector>

namespace reactree {

    /**
     * Process wide behaviour switches and diagnostic sinks.
     *
     * The configuration is read at the point of use, so changes take effect immediately, including for
     * flushes already requested from the tick host.
     */
    struct REACTREE_EXPORT Config {
        using error_handler_t = std::function<void(std::exception_ptr error, const std::string &info)>;
        using warn_handler_t = std::function<void(const std::string &message)>;
        using tag_predicate_t = std::function<bool(std::string_view tag)>;
        using tag_namespace_t = std::function<std::optional<std::string>(std::string_view tag)>;

        static constexpr std::size_t DEFAULT_MAX_UPDATE_COUNT = 100;

        /**
         * Suppress warnings written to stderr. Warnings are still delivered to the warn_handler when set.
         */
        bool silent{false};

        /**
         * When false the scheduler flushes synchronously as soon as a watcher is scheduled, and subjects notify
         * their subscribers in creation order.
         */
        bool async{true};

        /**
         * Record render / patch timings for components.
         */
        bool performance{false};

        /**
         * Number of times a single watcher may re-schedule itself within one flush before it is reported as a
         * runaway update loop and skipped.
         */
        std::size_t max_update_count{DEFAULT_MAX_UPDATE_COUNT};

        error_handler_t error_handler;
        warn_handler_t warn_handler;

        std::vector<std::string> ignored_elements;
        tag_predicate_t is_unknown_element;
        tag_namespace_t get_tag_namespace;

        [[nodiscard]] bool is_ignored_element(std::string_view tag) const;

        [[nodiscard]] std::optional<std::string> tag_namespace(std::string_view tag) const;

        [[nodiscard]] bool unknown_element(std::string_view tag) const;
    };

    /**
     * The global configuration.
     */
    REACTREE_EXPORT Config &config();

    /**
     * Captures the current configuration and restores it on destruction, tests use this to isolate changes.
     */
    struct REACTREE_EXPORT ConfigScope {
        ConfigScope();

        ~ConfigScope();

        ConfigScope(const ConfigScope &) = delete;

        ConfigScope &operator=(const ConfigScope &) = delete;

    private:
        Config _saved;
    };
} // namespace reactree

#endif  // REACTREE_CONFIG_H
