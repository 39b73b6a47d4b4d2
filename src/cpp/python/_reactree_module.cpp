/*
 * The entry point into the python _reactree module exposing the reactive core, the scheduler and the reconciler.
 *
 * Objects, arrays, watchers and render nodes are shared between C++ and python through shared pointers. Components
 * are not exposed; python code drives the reconciler directly with render trees it builds.
 */
#include <reactree/python/nb_wiring.h>
#include <reactree/util/errors.h>

NB_MODULE(_reactree, m) {
    nb::set_leak_warnings(false);
    m.doc() = "The reactree reactivity and reconciliation engine";

    nb::register_exception_translator([](const std::exception_ptr &p, void *) {
        try {
            if (p) { std::rethrow_exception(p); }
        } catch (const reactree::bad_value_access &e) {
            PyErr_SetString(PyExc_TypeError, e.what());
        }
    }, nullptr);

    export_types(m);
    export_runtime(m);
    export_vdom(m);
}
