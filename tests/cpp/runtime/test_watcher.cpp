#include <catch2/catch_test_macros.hpp>

#include <reactree/config.h>
#include <reactree/runtime/computed.h>
#include <reactree/runtime/scheduler.h>
#include <reactree/runtime/watcher.h>
#include <reactree/types/interceptor.h>
#include <reactree/types/object.h>

#include <algorithm>
#include <stdexcept>

using namespace reactree;

// ============================================================================
// Helpers
// ============================================================================

namespace {

struct WatcherFixture {
    ConfigScope config_scope;
    ManualTickHost tick_host;
    Scheduler scheduler{tick_host};
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    WatcherFixture() {
        config().warn_handler = [this](const std::string &message) { warnings.push_back(message); };
        config().error_handler = [this](std::exception_ptr, const std::string &info) { errors.push_back(info); };
    }

    [[nodiscard]] bool warned(std::string_view fragment) const {
        return std::ranges::any_of(warnings, [fragment](const std::string &w) { return w.find(fragment) != std::string::npos; });
    }
};

object_s_ptr observed(std::initializer_list<std::pair<std::string, Value>> properties) {
    auto object = Object::make(properties);
    Interceptor::instrument(Value{object});
    return object;
}

struct Change {
    Value new_value;
    Value old_value;
};

}  // namespace

// ============================================================================
// Watcher
// ============================================================================

TEST_CASE("Watcher - callback runs once per flush with new and old values", "[runtime][watcher]") {
    WatcherFixture f;
    auto state = observed({{"a", 1}});
    std::vector<Change> changes;

    auto w = watch(f.scheduler, [state] { return state->get("a"); },
                   [&](const Value &n, const Value &o) { changes.push_back({n, o}); });
    REQUIRE(w->value().as_int() == 1);
    REQUIRE(changes.empty());

    state->put("a", 2);
    state->put("a", 3);
    REQUIRE(changes.empty());
    REQUIRE(f.tick_host.has_pending());

    f.tick_host.run_pending();
    REQUIRE(changes.size() == 1);
    CHECK(changes[0].new_value.as_int() == 3);
    CHECK(changes[0].old_value.as_int() == 1);
}

TEST_CASE("Watcher - dependencies follow the last evaluation", "[runtime][watcher]") {
    WatcherFixture f;
    auto state = observed({{"flag", true}, {"a", 1}, {"b", 2}});
    std::size_t evaluations{0};

    auto w = Watcher::create(f.scheduler, [&evaluations, state] {
        ++evaluations;
        return state->get("flag").as_bool() ? state->get("a") : state->get("b");
    });
    REQUIRE(w->dependency_count() == 2);

    state->put("flag", false);
    f.tick_host.run_pending();
    REQUIRE(evaluations == 2);
    REQUIRE(w->value().as_int() == 2);
    REQUIRE(w->dependency_count() == 2);

    // a is no longer read
    state->put("a", 10);
    REQUIRE_FALSE(f.tick_host.has_pending());
    REQUIRE_FALSE(f.scheduler.has_pending(w->id()));

    state->put("b", 20);
    f.tick_host.run_pending();
    REQUIRE(evaluations == 3);
    REQUIRE(w->value().as_int() == 20);
}

TEST_CASE("Watcher - teardown stops all notification", "[runtime][watcher]") {
    WatcherFixture f;
    auto state = observed({{"a", 1}});
    std::size_t calls{0};

    auto w = watch(f.scheduler, [state] { return state->get("a"); }, [&](const Value &, const Value &) { ++calls; });
    w->teardown();
    REQUIRE_FALSE(w->active());
    REQUIRE(w->dependency_count() == 0);

    state->put("a", 2);
    f.tick_host.run_pending();
    REQUIRE(calls == 0);
}

TEST_CASE("Watcher - paths read nested properties and array indices", "[runtime][watcher]") {
    WatcherFixture f;
    auto state = observed({{"user", Object::make({{"name", "ann"}})}, {"items", Array::make({"x", "y"})}});
    std::vector<Change> changes;

    auto name = watch(f.scheduler, Value{state}, "user.name",
                      [&](const Value &n, const Value &o) { changes.push_back({n, o}); });
    REQUIRE(name->value().as_string() == "ann");
    REQUIRE(name->expression() == "user.name");

    auto second = Watcher::create(f.scheduler, Value{state}, "items.1");
    REQUIRE(second->value().as_string() == "y");

    auto missing = Watcher::create(f.scheduler, Value{state}, "nobody.name");
    REQUIRE(missing->value().is_undefined());

    state->get("user").as_object()->put("name", "bob");
    f.tick_host.run_pending();
    REQUIRE(changes.size() == 1);
    CHECK(changes[0].new_value.as_string() == "bob");
    CHECK(changes[0].old_value.as_string() == "ann");
}

TEST_CASE("Watcher - an invalid path is reported and evaluates to undefined", "[runtime][watcher]") {
    WatcherFixture f;
    auto state = observed({{"a", 1}});

    auto w = watch(f.scheduler, Value{state}, "a[0]", [](const Value &, const Value &) {});
    REQUIRE(f.warned("Failed watching path: \"a[0]\""));
    REQUIRE(w->value().is_undefined());
    REQUIRE_FALSE(Watcher::parse_path(Value{state}, "a b"));
}

TEST_CASE("Watcher - deep watchers see nested mutation", "[runtime][watcher]") {
    WatcherFixture f;
    auto nested = Object::make({{"x", 1}});
    auto state = observed({{"nested", nested}});
    std::size_t shallow_calls{0};
    std::size_t deep_calls{0};

    auto shallow = watch(f.scheduler, [state] { return state->get("nested"); },
                         [&](const Value &, const Value &) { ++shallow_calls; });
    auto deep = watch(f.scheduler, [state] { return state->get("nested"); },
                      [&](const Value &n, const Value &o) {
                          ++deep_calls;
                          // The same object, mutated in place
                          CHECK(same_value(n, o));
                      },
                      WatchOptions{.deep = true});

    nested->put("x", 2);
    f.tick_host.run_pending();
    REQUIRE(shallow_calls == 0);
    REQUIRE(deep_calls == 1);
}

TEST_CASE("Watcher - immediate invokes the callback with the initial value", "[runtime][watcher]") {
    WatcherFixture f;
    auto state = observed({{"a", 1}});
    std::vector<Change> changes;

    auto w = watch(f.scheduler, [state] { return state->get("a"); },
                   [&](const Value &n, const Value &o) { changes.push_back({n, o}); }, WatchOptions{.immediate = true});
    REQUIRE(changes.size() == 1);
    CHECK(changes[0].new_value.as_int() == 1);
    CHECK(changes[0].old_value.is_undefined());
}

TEST_CASE("Watcher - sync watchers bypass the scheduler", "[runtime][watcher]") {
    WatcherFixture f;
    auto state = observed({{"a", 1}});
    std::vector<std::int64_t> seen;

    auto w = watch(f.scheduler, [state] { return state->get("a"); },
                   [&](const Value &n, const Value &) { seen.push_back(n.as_int()); }, WatchOptions{.sync = true});
    state->put("a", 2);
    state->put("a", 3);
    REQUIRE(seen == std::vector<std::int64_t>{2, 3});
    REQUIRE_FALSE(f.tick_host.has_pending());
}

TEST_CASE("Watcher - user errors are routed to the error handler", "[runtime][watcher]") {
    WatcherFixture f;
    auto state = observed({{"a", 1}});

    auto w = watch(f.scheduler, [state] { return state->get("a"); },
                   [](const Value &, const Value &) { throw std::runtime_error("boom"); },
                   WatchOptions{.expression = "a"});
    state->put("a", 2);
    REQUIRE_NOTHROW(f.tick_host.run_pending());
    REQUIRE(f.errors.size() == 1);
    REQUIRE(f.errors[0] == "callback for watcher \"a\"");

    auto failing = watch(f.scheduler, []() -> Value { throw std::runtime_error("getter"); }, {},
                         WatchOptions{.expression = "failing"});
    REQUIRE(failing->value().is_undefined());
    REQUIRE(f.errors.back() == "getter for watcher \"failing\"");
}

TEST_CASE("Watcher - internal watchers propagate getter errors", "[runtime][watcher]") {
    WatcherFixture f;
    REQUIRE_THROWS_AS(Watcher::create(f.scheduler, []() -> Value { throw std::runtime_error("getter"); }),
                      std::runtime_error);
}

// ============================================================================
// Computed
// ============================================================================

TEST_CASE("Computed - evaluates lazily and caches", "[runtime][computed]") {
    WatcherFixture f;
    auto state = observed({{"a", 1}});
    std::size_t evaluations{0};

    auto doubled = Computed::make(f.scheduler, [&evaluations, state] {
        ++evaluations;
        return Value{state->get("a").as_int() * 2};
    }, "doubled");
    REQUIRE(evaluations == 0);
    REQUIRE(doubled->dirty());
    REQUIRE(doubled->name() == "doubled");

    REQUIRE(doubled->get().as_int() == 2);
    REQUIRE(doubled->get().as_int() == 2);
    REQUIRE(evaluations == 1);

    state->put("a", 5);
    REQUIRE(doubled->dirty());
    REQUIRE(evaluations == 1);
    REQUIRE_FALSE(f.tick_host.has_pending());

    REQUIRE(doubled->get().as_int() == 10);
    REQUIRE(evaluations == 2);
}

TEST_CASE("Computed - a torn down computed value collects no dependencies", "[runtime][computed]") {
    WatcherFixture f;
    auto state = observed({{"a", 1}});
    auto doubled = Computed::make(f.scheduler, [state] { return Value{state->get("a").as_int() * 2}; });

    doubled->teardown();
    REQUIRE(doubled->dirty());
    REQUIRE(doubled->get().as_int() == 2);
    REQUIRE(doubled->watcher()->dependency_count() == 0);
    REQUIRE_FALSE(doubled->watcher()->active());

    state->put("a", 3);
    REQUIRE_FALSE(doubled->dirty());
    REQUIRE_FALSE(f.tick_host.has_pending());
}

TEST_CASE("Computed - readers depend on the computed dependencies", "[runtime][computed]") {
    WatcherFixture f;
    auto state = observed({{"a", 1}});
    auto doubled = Computed::make(f.scheduler, [state] { return Value{state->get("a").as_int() * 2}; });
    std::vector<std::int64_t> seen;

    auto w = watch(f.scheduler, [doubled] { return doubled->get(); },
                   [&](const Value &n, const Value &) { seen.push_back(n.as_int()); });
    REQUIRE(w->value().as_int() == 2);

    state->put("a", 4);
    f.tick_host.run_pending();
    REQUIRE(seen == std::vector<std::int64_t>{8});

    doubled->teardown();
    state->put("a", 5);
    f.tick_host.run_pending();
    REQUIRE(seen == std::vector<std::int64_t>{8});
}
