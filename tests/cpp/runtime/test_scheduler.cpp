#include <catch2/catch_test_macros.hpp>

#include <reactree/config.h>
#include <reactree/runtime/scheduler.h>
#include <reactree/runtime/watcher.h>
#include <reactree/types/interceptor.h>
#include <reactree/types/object.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace reactree;

namespace {

struct SchedulerFixture {
    ConfigScope config_scope;
    ManualTickHost tick_host;
    Scheduler scheduler{tick_host};
    std::vector<std::string> warnings;
    std::vector<std::string> log;

    SchedulerFixture() {
        config().warn_handler = [this](const std::string &message) { warnings.push_back(message); };
    }

    Watcher::callback_type record(std::string entry) {
        return [this, entry = std::move(entry)](const Value &, const Value &) { log.push_back(entry); };
    }
};

object_s_ptr observed(std::initializer_list<std::pair<std::string, Value>> properties) {
    auto object = Object::make(properties);
    Interceptor::instrument(Value{object});
    return object;
}

Watcher::getter_type read(const object_s_ptr &state, std::string key) {
    return [state, key = std::move(key)] { return state->get(key); };
}

}  // namespace

TEST_CASE("Scheduler - watchers are batched into one tick", "[runtime][scheduler]") {
    SchedulerFixture f;
    auto state = observed({{"a", 1}, {"b", 1}});
    auto wa = watch(f.scheduler, read(state, "a"), f.record("a"));
    auto wb = watch(f.scheduler, read(state, "b"), f.record("b"));

    state->put("a", 2);
    state->put("b", 2);
    state->put("a", 3);
    REQUIRE(f.tick_host.pending_count() == 1);
    REQUIRE(f.scheduler.is_waiting());
    REQUIRE(f.scheduler.queue_size() == 2);

    REQUIRE(f.tick_host.run_pending() == 1);
    REQUIRE(f.log == std::vector<std::string>{"a", "b"});
    REQUIRE_FALSE(f.scheduler.is_waiting());
    REQUIRE(f.scheduler.queue_size() == 0);
}

TEST_CASE("Scheduler - watchers run in creation order", "[runtime][scheduler]") {
    SchedulerFixture f;
    auto state = observed({{"a", 1}, {"b", 1}, {"c", 1}});
    auto w1 = watch(f.scheduler, read(state, "a"), f.record("w1"));
    auto w2 = watch(f.scheduler, read(state, "b"), f.record("w2"));
    auto w3 = watch(f.scheduler, read(state, "c"), f.record("w3"));

    state->put("c", 2);
    state->put("a", 2);
    state->put("b", 2);
    f.tick_host.run_pending();
    REQUIRE(f.log == std::vector<std::string>{"w1", "w2", "w3"});
}

TEST_CASE("Scheduler - watchers scheduled during a flush are inserted by id", "[runtime][scheduler]") {
    SchedulerFixture f;
    auto state = observed({{"a", 1}, {"b", 1}, {"c", 1}});
    auto w1 = watch(f.scheduler, read(state, "a"), [&](const Value &, const Value &) {
        f.log.push_back("w1");
        state->put("b", 2);
        state->put("c", 2);
    });
    auto w2 = watch(f.scheduler, read(state, "c"), f.record("w2"));
    auto w3 = watch(f.scheduler, read(state, "b"), f.record("w3"));

    state->put("a", 2);
    REQUIRE(f.tick_host.run_pending() == 1);
    REQUIRE(f.log == std::vector<std::string>{"w1", "w2", "w3"});
}

TEST_CASE("Scheduler - a watcher that keeps scheduling itself is stopped", "[runtime][scheduler]") {
    SchedulerFixture f;
    auto state = observed({{"n", 0}});
    std::size_t calls{0};
    auto w = watch(f.scheduler, read(state, "n"), [&](const Value &n, const Value &) {
        ++calls;
        state->put("n", n.as_int() + 1);
    }, WatchOptions{.expression = "n"});

    state->put("n", 1);
    f.tick_host.run_pending();
    REQUIRE(calls == Config::DEFAULT_MAX_UPDATE_COUNT + 1);
    REQUIRE(f.warnings.size() == 1);
    REQUIRE(f.warnings[0] == "You may have an infinite update loop in watcher with expression \"n\"");
    REQUIRE_FALSE(f.scheduler.is_flushing());
}

TEST_CASE("Scheduler - the update limit is configurable", "[runtime][scheduler]") {
    SchedulerFixture f;
    config().max_update_count = 3;
    auto state = observed({{"n", 0}});
    std::size_t calls{0};
    auto w = watch(f.scheduler, read(state, "n"), [&](const Value &n, const Value &) {
        ++calls;
        state->put("n", n.as_int() + 1);
    });

    state->put("n", 1);
    f.tick_host.run_pending();
    REQUIRE(calls == 4);
}

TEST_CASE("Scheduler - synchronous mode flushes on schedule", "[runtime][scheduler]") {
    SchedulerFixture f;
    config().async = false;
    auto state = observed({{"a", 1}});
    auto w = watch(f.scheduler, read(state, "a"), f.record("a"));

    state->put("a", 2);
    REQUIRE(f.log == std::vector<std::string>{"a"});
    REQUIRE_FALSE(f.tick_host.has_pending());
}

TEST_CASE("Scheduler - before, activated, after and after flush ordering", "[runtime][scheduler]") {
    SchedulerFixture f;
    auto state = observed({{"a", 1}});

    auto w = Watcher::create(f.scheduler, read(state, "a"), f.record("run"),
                             WatcherOptions{
                                 .before = [&] { f.log.push_back("before"); },
                                 .after = [&] { f.log.push_back("after"); },
                             });
    f.scheduler.add_after_flush_notification([&] { f.log.push_back("after flush"); });

    state->put("a", 2);
    f.scheduler.queue_activated([&] { f.log.push_back("activated"); });
    f.tick_host.run_pending();
    REQUIRE(f.log == std::vector<std::string>{"before", "run", "activated", "after", "after flush"});

    // Notifications are one-shot
    f.log.clear();
    state->put("a", 3);
    f.tick_host.run_pending();
    REQUIRE(f.log == std::vector<std::string>{"before", "run", "after"});
}

TEST_CASE("Scheduler - after hooks of torn down watchers are skipped", "[runtime][scheduler]") {
    SchedulerFixture f;
    auto state = observed({{"a", 1}});
    std::vector<watcher_s_ptr> watchers;

    auto first = Watcher::create(f.scheduler, read(state, "a"), [&](const Value &, const Value &) {
        watchers.back()->teardown();
    }, WatcherOptions{.after = [&] { f.log.push_back("first"); }});
    watchers.push_back(Watcher::create(f.scheduler, read(state, "a"), {},
                                       WatcherOptions{.after = [&] { f.log.push_back("second"); }}));

    state->put("a", 2);
    f.tick_host.run_pending();
    REQUIRE(f.log == std::vector<std::string>{"first"});
}

TEST_CASE("Scheduler - flush timestamp follows the tick host clock", "[runtime][scheduler]") {
    SchedulerFixture f;
    auto start = render_time_t{} + std::chrono::seconds{10};
    f.tick_host.set_now(start);
    auto state = observed({{"a", 1}});
    auto w = watch(f.scheduler, read(state, "a"), f.record("a"));

    state->put("a", 2);
    f.tick_host.run_pending();
    REQUIRE(f.scheduler.current_flush_timestamp() == start);
}

TEST_CASE("ManualTickHost - nested requests run in a later batch", "[runtime][tick]") {
    ConfigScope config_scope;
    std::vector<std::string> errors;
    config().error_handler = [&errors](const std::exception_ptr &, const std::string &info) { errors.push_back(info); };

    ManualTickHost host;
    std::vector<std::string> log;
    host.run_before_next_render([&] {
        log.push_back("first");
        host.run_before_next_render([&] { log.push_back("nested"); });
    });
    host.run_before_next_render([] { throw std::runtime_error("boom"); });
    host.run_before_next_render([&] { log.push_back("second"); });
    REQUIRE(host.pending_count() == 3);

    REQUIRE(host.run_pending() == 4);
    CHECK(log == std::vector<std::string>{"first", "second", "nested"});
    CHECK(errors == std::vector<std::string>{"nextTick"});
    CHECK(host.tick_count() == 2);
    CHECK_FALSE(host.has_pending());
}
