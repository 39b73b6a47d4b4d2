#include <reactree/python/nb_wiring.h>
#include <reactree/runtime/computed.h>
#include <reactree/runtime/scheduler.h>
#include <reactree/runtime/tick_host.h>
#include <reactree/runtime/watcher.h>

namespace {
    reactree::Watcher::getter_type wrap_getter(nb::callable getter) {
        return [getter = std::move(getter)]() -> reactree::Value { return reactree::to_value(getter()); };
    }

    reactree::Watcher::callback_type wrap_callback(std::optional<nb::callable> callback) {
        if (!callback) { return {}; }
        return [callback = std::move(*callback)](const reactree::Value &new_value, const reactree::Value &old_value) {
            callback(reactree::from_value(new_value), reactree::from_value(old_value));
        };
    }
} // namespace

void export_runtime(nb::module_ &m) {
    using namespace reactree;

    nb::class_<TickHost>(m, "TickHost");

    nb::class_<ManualTickHost, TickHost>(m, "ManualTickHost")
        .def(nb::init<>())
        .def("run_pending", &ManualTickHost::run_pending)
        .def_prop_ro("has_pending", &ManualTickHost::has_pending)
        .def_prop_ro("pending_count", &ManualTickHost::pending_count)
        .def_prop_ro("tick_count", &ManualTickHost::tick_count)
        .def("next_tick", [](ManualTickHost &self, nb::callable fn) {
            self.run_before_next_render([fn = std::move(fn)] { fn(); });
        });

    // The scheduler keeps a reference to its tick host
    nb::class_<Scheduler>(m, "Scheduler")
        .def(nb::init<TickHost &>(), "tick_host"_a, nb::keep_alive<1, 2>())
        .def("flush", &Scheduler::flush)
        .def_prop_ro("is_flushing", &Scheduler::is_flushing)
        .def_prop_ro("is_waiting", &Scheduler::is_waiting)
        .def_prop_ro("queue_size", &Scheduler::queue_size);

    nb::class_<Watcher>(m, "Watcher")
        .def_prop_ro("id", &Watcher::id)
        .def_prop_ro("value", [](const Watcher &self) { return from_value(self.value()); })
        .def_prop_ro("active", &Watcher::active)
        .def_prop_ro("dirty", &Watcher::dirty)
        .def_prop_ro("expression", &Watcher::expression)
        .def_prop_ro("dependency_count", &Watcher::dependency_count)
        .def("teardown", &Watcher::teardown);

    m.def("watch",
          [](Scheduler &scheduler, nb::handle source, std::optional<nb::callable> callback, bool deep, bool immediate,
             bool sync) {
              WatchOptions options{.deep = deep, .immediate = immediate, .sync = sync};
              if (nb::isinstance<nb::callable>(source)) {
                  return reactree::watch(scheduler, wrap_getter(nb::borrow<nb::callable>(source)),
                                         wrap_callback(std::move(callback)), std::move(options));
              }
              // A (root, path) pair
              auto pair = nb::cast<nb::tuple>(source);
              return reactree::watch(scheduler, to_value(pair[0]), nb::cast<std::string>(pair[1]),
                                     wrap_callback(std::move(callback)), std::move(options));
          },
          "scheduler"_a, "source"_a, "callback"_a = nb::none(), "deep"_a = false, "immediate"_a = false,
          "sync"_a = false, nb::keep_alive<0, 1>(),
          "Watch a getter, or a (root, 'dotted.path') pair. Call teardown on the result to stop watching.");

    nb::class_<Computed>(m, "Computed")
        .def(nb::new_([](Scheduler &scheduler, nb::callable getter, std::string name) {
                 return Computed::make(scheduler, wrap_getter(std::move(getter)), std::move(name));
             }),
             "scheduler"_a, "getter"_a, "name"_a = "", nb::keep_alive<0, 1>())
        .def_prop_ro("value", [](Computed &self) { return from_value(self.get()); })
        .def_prop_ro("dirty", &Computed::dirty)
        .def_prop_ro("name", &Computed::name)
        .def("teardown", &Computed::teardown);
}
