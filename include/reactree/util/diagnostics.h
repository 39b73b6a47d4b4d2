#ifndef REACTREE_DIAGNOSTICS_H
#define REACTREE_DIAGNOSTICS_H

#include <reactree/reactree_base.h>

#include <exception>
#include <utility>

namespace reactree {
    /**
     * Surface a recoverable diagnostic. Delivered to config().warn_handler when one is installed, otherwise written
     * to stderr (unless config().silent is set).
     */
    REACTREE_EXPORT void warn(std::string_view message);

    template<typename... Ts>
        requires (sizeof...(Ts) > 0)
    void warn(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        warn(std::string_view{fmt::format(fmt_str, std::forward<Ts>(xs)...)});
    }

    /**
     * Extracts a readable message from an exception pointer.
     */
    REACTREE_EXPORT std::string describe_exception(const std::exception_ptr &error);

    /**
     * Funnel an error raised by user code (watcher getters and callbacks, render functions, lifecycle hooks) to
     * config().error_handler, or log it when no handler is installed. Never throws.
     */
    REACTREE_EXPORT void handle_error(const std::exception_ptr &error, std::string_view info) noexcept;

    /**
     * Invoke fn, routing any exception to handle_error with the supplied context.
     * Returns true when fn completed without raising.
     */
    template<typename Fn, typename... Args>
    bool invoke_with_error_handling(std::string_view info, Fn &&fn, Args &&... args) noexcept {
        try {
            std::forward<Fn>(fn)(std::forward<Args>(args)...);
            return true;
        } catch (...) {
            handle_error(std::current_exception(), info);
            return false;
        }
    }
} // namespace reactree

#endif  // REACTREE_DIAGNOSTICS_H
