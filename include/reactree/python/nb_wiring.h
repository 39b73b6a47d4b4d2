/*
 * Shared imports for the _reactree python module. Only the binding sources include this header.
 */

#ifndef REACTREE_NB_WIRING_H
#define REACTREE_NB_WIRING_H

#include <reactree/reactree_base.h>
#include <reactree/types/value.h>

#include <nanobind/nanobind.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace reactree {
    /**
     * Convert a python value: None, bool, int, float and str map to primitives, dict and list are copied into a new
     * Object / Array, and bound Object / Array instances are shared.
     */
    Value to_value(nb::handle handle);

    /**
     * Primitives are converted, Object and Array are returned as the bound (shared) instances.
     */
    nb::object from_value(const Value &value);
} // namespace reactree

void export_types(nb::module_ &m);

void export_runtime(nb::module_ &m);

void export_vdom(nb::module_ &m);

#endif  // REACTREE_NB_WIRING_H
