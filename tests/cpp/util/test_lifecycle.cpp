#include <catch2/catch_test_macros.hpp>

#include <reactree/util/lifecycle.h>

#include <fmt/ranges.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct MockLifecycle : reactree::ComponentLifeCycle {
    std::vector<std::string> calls;
    bool fail_start{false};

protected:
    void initialise() override { calls.push_back(is_initialising() ? "initialise" : "initialise?"); }

    void start() override {
        calls.push_back(is_starting() ? "start" : "start?");
        if (fail_start) { throw std::runtime_error("start failed"); }
    }

    void stop() override { calls.push_back(is_stopping() ? "stop" : "stop?"); }

    void dispose() override { calls.push_back(is_disposing() ? "dispose" : "dispose?"); }
};

// Space separated list of the flags raised on component, transition flags included
std::string state_of(const reactree::ComponentLifeCycle &component) {
    std::vector<std::string> flags;
    if (component.is_initialising()) { flags.emplace_back("initialising"); }
    if (component.is_initialised()) { flags.emplace_back("initialised"); }
    if (component.is_starting()) { flags.emplace_back("starting"); }
    if (component.is_started()) { flags.emplace_back("started"); }
    if (component.is_stopping()) { flags.emplace_back("stopping"); }
    if (component.is_disposing()) { flags.emplace_back("disposing"); }
    if (component.is_disposed()) { flags.emplace_back("disposed"); }
    return fmt::format("{}", fmt::join(flags, " "));
}

}  // namespace

TEST_CASE("ComponentLifeCycle - transitions", "[util][lifecycle]") {
    using namespace reactree;
    MockLifecycle mock{};
    REQUIRE(state_of(mock).empty());

    initialise_component(mock);
    REQUIRE(state_of(mock) == "initialised");

    start_component(mock);
    REQUIRE(state_of(mock) == "initialised started");

    stop_component(mock);
    REQUIRE(state_of(mock) == "initialised");

    dispose_component(mock);
    REQUIRE(state_of(mock) == "disposed");

    REQUIRE(mock.calls == std::vector<std::string>{"initialise", "start", "stop", "dispose"});
}

TEST_CASE("ComponentLifeCycle - start initialises first and repeated calls are no-ops", "[util][lifecycle]") {
    using namespace reactree;
    MockLifecycle mock{};

    start_component(mock);
    start_component(mock);
    initialise_component(mock);
    REQUIRE(mock.calls == std::vector<std::string>{"initialise", "start"});

    stop_component(mock);
    stop_component(mock);
    start_component(mock);
    REQUIRE(mock.calls == std::vector<std::string>{"initialise", "start", "stop", "start"});
}

TEST_CASE("ComponentLifeCycle - a disposed component can not be started again", "[util][lifecycle]") {
    using namespace reactree;
    MockLifecycle mock{};

    start_component(mock);
    dispose_component(mock);
    REQUIRE_FALSE(mock.is_started());

    start_component(mock);
    initialise_component(mock);
    REQUIRE_FALSE(mock.is_started());
    REQUIRE(mock.calls == std::vector<std::string>{"initialise", "start", "dispose"});
}

TEST_CASE("ComponentLifeCycle - a start that throws leaves the component stopped", "[util][lifecycle]") {
    using namespace reactree;
    MockLifecycle mock{};
    mock.fail_start = true;

    REQUIRE_THROWS_AS(start_component(mock), std::runtime_error);
    REQUIRE(state_of(mock) == "initialised");

    // Nothing to stop, the failed start can be retried
    stop_component(mock);
    mock.fail_start = false;
    start_component(mock);
    REQUIRE(state_of(mock) == "initialised started");
    REQUIRE(mock.calls == std::vector<std::string>{"initialise", "start", "start"});
}
