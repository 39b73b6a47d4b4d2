#include <reactree/runtime/evaluation_stack.h>
#include <reactree/runtime/scheduler.h>
#include <reactree/runtime/watcher.h>
#include <reactree/types/array.h>
#include <reactree/types/object.h>
#include <reactree/types/traverse.h>
#include <reactree/util/diagnostics.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>

namespace reactree {
    namespace {
        std::uint64_t next_watcher_id() {
            static std::atomic<std::uint64_t> counter{0};
            return ++counter;
        }

        bool is_path_character(char c) {
            auto uc = static_cast<unsigned char>(c);
            return std::isalnum(uc) || c == '.' || c == '$' || c == '_' || uc >= 0x80;
        }

        Value read_segment(const Value &current, const std::string &segment) {
            if (current.is_object()) { return current.as_object()->get(segment); }
            if (current.is_array()) {
                const auto &array = *current.as_array();
                if (segment == "length") { return Value{array.size()}; }
                std::size_t index{0};
                auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
                if (ec == std::errc{} && ptr == segment.data() + segment.size() && index < array.size()) {
                    return array.at(index);
                }
            }
            return {};
        }
    } // namespace

    Watcher::Watcher(Scheduler &scheduler, getter_type getter, callback_type callback, WatcherOptions options)
        : _scheduler{scheduler}, _getter{std::move(getter)}, _callback{std::move(callback)},
          _options{std::move(options)}, _id{next_watcher_id()}, _dirty{_options.lazy} {}

    watcher_s_ptr Watcher::create(Scheduler &scheduler, getter_type getter, callback_type callback,
                                  WatcherOptions options) {
        // Not make_shared, the constructor is not public
        auto watcher = watcher_s_ptr{new Watcher(scheduler, std::move(getter), std::move(callback), std::move(options))};
        if (!watcher->_options.lazy) { watcher->_value = watcher->evaluate(); }
        return watcher;
    }

    watcher_s_ptr Watcher::create(Scheduler &scheduler, Value root, std::string_view path, callback_type callback,
                                  WatcherOptions options) {
        auto getter = parse_path(std::move(root), path);
        if (options.expression.empty()) { options.expression = std::string{path}; }
        if (!getter) {
            warn("Failed watching path: \"{}\" Watcher only accepts simple dot-delimited paths. For full control, use "
                 "a function instead.", path);
            getter = [] { return Value{}; };
        }
        return create(scheduler, std::move(getter), std::move(callback), std::move(options));
    }

    Watcher::getter_type Watcher::parse_path(Value root, std::string_view path) {
        if (!std::ranges::all_of(path, is_path_character)) { return {}; }
        std::vector<std::string> segments;
        std::size_t start{0};
        while (true) {
            auto end = path.find('.', start);
            segments.emplace_back(path.substr(start, end == std::string_view::npos ? end : end - start));
            if (end == std::string_view::npos) { break; }
            start = end + 1;
        }
        return [root = std::move(root), segments = std::move(segments)]() -> Value {
            Value current = root;
            for (const auto &segment : segments) {
                if (current.is_nullish()) { return {}; }
                current = read_segment(current, segment);
            }
            return current;
        };
    }

    Watcher::~Watcher() { teardown(); }

    void Watcher::add_dependency(const subject_s_ptr &subject) {
        if (!_active) { return; }
        auto id = subject->id();
        if (!_new_dep_ids.insert(id).second) { return; }
        _new_deps.push_back(subject);
        if (!_dep_ids.contains(id)) { subject->subscribe(shared_from_this()); }
    }

    void Watcher::invalidate() {
        if (!_active) { return; }
        if (_options.lazy) {
            _dirty = true;
        } else if (_options.sync) {
            force_reevaluate();
        } else {
            _scheduler.schedule(shared_from_this());
        }
    }

    Value Watcher::evaluate() {
        Value value;
        std::exception_ptr error;
        {
            EvaluationScope scope{this};
            try {
                if (_getter) { value = _getter(); }
            } catch (...) {
                error = std::current_exception();
            }
            if (_options.deep) { traverse(value); }
        }
        cleanup_deps();
        if (error) {
            if (!_options.user) { std::rethrow_exception(error); }
            handle_error(error, fmt::format("getter for watcher \"{}\"", expression()));
        }
        return value;
    }

    void Watcher::force_reevaluate() {
        if (!_active) { return; }
        auto value = evaluate();
        if (same_value(value, _value) && !value.is_reference() && !_options.deep) { return; }
        auto old_value = std::exchange(_value, value);
        if (!_callback) { return; }
        if (_options.user) {
            invoke_with_error_handling(fmt::format("callback for watcher \"{}\"", expression()), _callback, value,
                                       old_value);
        } else {
            _callback(value, old_value);
        }
    }

    void Watcher::recompute() {
        _value = evaluate();
        _dirty = false;
    }

    void Watcher::depend() {
        // Copy, depending can re-enter and re-collect this watcher's dependencies
        auto deps = _deps;
        for (const auto &subject : deps) { subject->depend(); }
    }

    void Watcher::teardown() {
        if (!_active) { return; }
        for (const auto &subject : _deps) { subject->unsubscribe(this); }
        _deps.clear();
        _dep_ids.clear();
        _active = false;
        // The hooks can refer to the owner being destroyed
        _options.before = nullptr;
        _options.after = nullptr;
    }

    void Watcher::run_before() const {
        if (!_active || !_options.before) { return; }
        // Copy, the hook may tear this watcher down
        auto before = _options.before;
        before();
    }

    void Watcher::run_after() const {
        if (!_active || !_options.after) { return; }
        auto after = _options.after;
        after();
    }

    bool Watcher::depends_on(const subject_s_ptr &subject) const { return subject && _dep_ids.contains(subject->id()); }

    void Watcher::cleanup_deps() {
        for (const auto &subject : _deps) {
            if (!_new_dep_ids.contains(subject->id())) { subject->unsubscribe(this); }
        }
        std::swap(_dep_ids, _new_dep_ids);
        _new_dep_ids.clear();
        std::swap(_deps, _new_deps);
        _new_deps.clear();
    }

    watcher_s_ptr watch(Scheduler &scheduler, Watcher::getter_type getter, Watcher::callback_type callback,
                        WatchOptions options) {
        WatcherOptions watcher_options{
            .deep = options.deep,
            .user = true,
            .sync = options.sync,
            .before = std::move(options.before),
            .expression = std::move(options.expression),
        };
        auto watcher = Watcher::create(scheduler, std::move(getter), callback, std::move(watcher_options));
        if (options.immediate && callback) {
            UntrackedScope untracked;
            invoke_with_error_handling(fmt::format("callback for immediate watcher \"{}\"", watcher->expression()),
                                       callback, watcher->value(), Value{});
        }
        return watcher;
    }

    watcher_s_ptr watch(Scheduler &scheduler, Value root, std::string_view path, Watcher::callback_type callback,
                        WatchOptions options) {
        auto getter = Watcher::parse_path(std::move(root), path);
        if (!getter) {
            warn("Failed watching path: \"{}\" Watcher only accepts simple dot-delimited paths. For full control, use "
                 "a function instead.", path);
            getter = [] { return Value{}; };
        }
        if (options.expression.empty()) { options.expression = std::string{path}; }
        return watch(scheduler, std::move(getter), std::move(callback), std::move(options));
    }
} // namespace reactree
