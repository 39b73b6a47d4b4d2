#include <reactree/config.h>
#include <reactree/util/diagnostics.h>

#include <cstdio>

namespace reactree {
    void warn(std::string_view message) {
        auto &cfg = config();
        if (cfg.warn_handler) {
            cfg.warn_handler(std::string{message});
        } else if (!cfg.silent) {
            fmt::print(stderr, "[reactree warn]: {}\n", message);
        }
    }

    std::string describe_exception(const std::exception_ptr &error) {
        if (!error) { return "<no exception>"; }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            return e.what();
        } catch (...) {
            return "unknown exception";
        }
    }

    void handle_error(const std::exception_ptr &error, std::string_view info) noexcept {
        try {
            auto &cfg = config();
            if (cfg.error_handler) {
                try {
                    cfg.error_handler(error, std::string{info});
                    return;
                } catch (...) {
                    // The handler itself failed, report both rather than losing the original
                    auto handler_error = std::current_exception();
                    fmt::print(stderr, "[reactree error]: Error in config.error_handler: \"{}\"\n",
                               describe_exception(handler_error));
                }
            }
            fmt::print(stderr, "[reactree error]: Error in {}: \"{}\"\n", info, describe_exception(error));
        } catch (const std::exception &e) {
            // Formatting or the stream failed; nothing sensible is left to report to
            std::fprintf(stderr, "[reactree error]: failed to report error: %s\n", e.what());
        }
    }
} // namespace reactree
