/*
 * The nanobind imports for the _stagehand module. Include this first in every binding unit so the stl casters are
 * seen consistently.
 */

#ifndef STAGEHAND_PYTHON_NB_BASE_H
#define STAGEHAND_PYTHON_NB_BASE_H

#include <nanobind/nanobind.h>

#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unique_ptr.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

#include <stagehand/prop_types/types.h>
#include <stagehand/value/value.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace stagehand::python {
    /**
     * None, bool, int, float, str, dict, list, tuple, Rgba and Asset convert; anything else is InvalidArgument.
     */
    Value from_python(nb::handle object);

    nb::object to_python(const Value &value);

    /**
     * A prop type from a PropTypeConfig, a dict of shorthands (a compound) or a plain default value.
     */
    ShorthandProp shorthand_from_python(nb::handle object);
} // namespace stagehand::python

#endif  // STAGEHAND_PYTHON_NB_BASE_H
