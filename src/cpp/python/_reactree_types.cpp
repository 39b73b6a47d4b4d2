#include <reactree/config.h>
#include <reactree/python/nb_wiring.h>
#include <reactree/types/array.h>
#include <reactree/types/interceptor.h>
#include <reactree/types/object.h>
#include <reactree/util/diagnostics.h>

namespace reactree {
    Value to_value(nb::handle handle) {
        if (handle.is_none()) { return Value{nullptr}; }
        if (nb::isinstance<nb::bool_>(handle)) { return Value{nb::cast<bool>(handle)}; }
        if (nb::isinstance<nb::int_>(handle)) { return Value{nb::cast<std::int64_t>(handle)}; }
        if (nb::isinstance<nb::float_>(handle)) { return Value{nb::cast<double>(handle)}; }
        if (nb::isinstance<nb::str>(handle)) { return Value{nb::cast<std::string>(handle)}; }
        if (nb::isinstance<Object>(handle)) { return Value{nb::cast<object_s_ptr>(handle)}; }
        if (nb::isinstance<Array>(handle)) { return Value{nb::cast<array_s_ptr>(handle)}; }
        if (nb::isinstance<nb::dict>(handle)) {
            auto object = Object::make();
            for (auto [key, item] : nb::borrow<nb::dict>(handle)) {
                object->put(nb::cast<std::string>(nb::str(key)), to_value(item));
            }
            return Value{object};
        }
        if (nb::isinstance<nb::list>(handle) || nb::isinstance<nb::tuple>(handle)) {
            Array::storage_type values;
            for (auto item : handle) { values.push_back(to_value(item)); }
            return Value{Array::make(std::move(values))};
        }
        throw nb::type_error(fmt::format("Can not convert a value of type '{}' to a reactree value",
                                         nb::cast<std::string>(nb::str(handle.type())))
                                 .c_str());
    }

    nb::object from_value(const Value &value) {
        switch (value.type()) {
            case ValueType::UNDEFINED:
            case ValueType::NULL_VALUE: return nb::none();
            case ValueType::BOOL: return nb::cast(value.as_bool());
            case ValueType::INT: return nb::cast(value.as_int());
            case ValueType::DOUBLE: return nb::cast(value.as_double());
            case ValueType::STRING: return nb::cast(value.as_string());
            case ValueType::OBJECT: return nb::cast(value.as_object());
            case ValueType::ARRAY: return nb::cast(value.as_array());
        }
        return nb::none();
    }
} // namespace reactree

void export_types(nb::module_ &m) {
    using namespace reactree;

    nb::class_<Object>(m, "Object")
        .def(nb::new_([](nb::dict properties) { return nb::cast<object_s_ptr>(from_value(to_value(properties))); }),
             "properties"_a = nb::dict())
        .def("__getitem__", [](const Object &self, std::string_view key) { return from_value(self.get(key)); })
        .def("__setitem__", [](Object &self, std::string_view key, nb::handle value) { self.put(key, to_value(value)); })
        .def("__contains__", &Object::has)
        .def("__len__", &Object::size)
        .def("keys", &Object::keys)
        .def("peek", [](const Object &self, std::string_view key) { return from_value(self.peek(key)); })
        .def("remove", &Object::remove)
        .def("freeze", &Object::freeze)
        .def_prop_ro("is_frozen", &Object::is_frozen)
        .def("mark_raw", &Object::mark_raw)
        .def_prop_ro("is_instrumented", &Object::is_instrumented)
        .def("__repr__", [](const Object &self) { return self.keys().empty() ? std::string{"Object()"} : fmt::format("Object({})", self.keys()); })
        .doc() = "A reactive property bag, instrumented when reachable from watched state";

    nb::class_<Array>(m, "Array")
        .def(nb::new_([](nb::list values) { return nb::cast<array_s_ptr>(from_value(to_value(values))); }),
             "values"_a = nb::list())
        .def("__getitem__", [](const Array &self, std::size_t index) { return from_value(self.at(index)); })
        .def("__len__", &Array::size)
        .def("push", [](Array &self, nb::handle value) { return self.push(to_value(value)); })
        .def("pop", [](Array &self) { return from_value(self.pop()); })
        .def("shift", [](Array &self) { return from_value(self.shift()); })
        .def("unshift", [](Array &self, nb::handle value) { return self.unshift(to_value(value)); })
        .def("splice",
             [](Array &self, std::int64_t start, std::optional<std::int64_t> delete_count, nb::list items) {
                 Array::storage_type inserted;
                 for (auto item : items) { inserted.push_back(to_value(item)); }
                 nb::list removed;
                 for (const auto &value : self.splice(start, delete_count, std::move(inserted))) {
                     removed.append(from_value(value));
                 }
                 return removed;
             },
             "start"_a, "delete_count"_a = nb::none(), "items"_a = nb::list())
        .def("reverse", &Array::reverse)
        .def("sort", [](Array &self) { self.sort(); })
        .def("freeze", &Array::freeze)
        .def_prop_ro("is_instrumented", &Array::is_instrumented)
        .doc() = "A reactive list whose mutators notify watchers of the array";

    m.def("observe", [](nb::handle value) {
        auto converted = to_value(value);
        Interceptor::instrument(converted);
        return from_value(converted);
    }, "value"_a, "Instrument value (converting dict / list first) and return the reactive instance");

    m.def("set", [](nb::handle target, nb::handle key, nb::handle value) {
        return from_value(reactree::set(to_value(target), to_value(key), to_value(value)));
    }, "target"_a, "key"_a, "value"_a);

    m.def("delete", [](nb::handle target, nb::handle key) { reactree::del(to_value(target), to_value(key)); },
          "target"_a, "key"_a);

    nb::class_<Config>(m, "Config")
        .def_rw("silent", &Config::silent)
        .def_rw("async_", &Config::async)
        .def_rw("performance", &Config::performance)
        .def_rw("max_update_count", &Config::max_update_count)
        .def_rw("ignored_elements", &Config::ignored_elements)
        .def_prop_rw(
            "warn_handler", [](const Config &) { return nb::none(); },
            [](Config &self, std::optional<nb::callable> handler) {
                if (!handler) {
                    self.warn_handler = {};
                    return;
                }
                self.warn_handler = [handler = *handler](const std::string &message) {
                    nb::gil_scoped_acquire guard;
                    handler(message);
                };
            })
        .def_prop_rw(
            "error_handler", [](const Config &) { return nb::none(); },
            [](Config &self, std::optional<nb::callable> handler) {
                if (!handler) {
                    self.error_handler = {};
                    return;
                }
                self.error_handler = [handler = *handler](std::exception_ptr error, const std::string &info) {
                    nb::gil_scoped_acquire guard;
                    handler(describe_exception(error), info);
                };
            });

    m.def("config", &config, nb::rv_policy::reference);
}
