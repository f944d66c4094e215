#ifndef DYNSCOPE_PYTHON_PY_VALUE_H
#define DYNSCOPE_PYTHON_PY_VALUE_H

#include <dynscope/types/value.h>

#include <nanobind/nanobind.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace dynscope {

    /**
     * The TypeMeta of every value bound from Python, the stored object is an nb::object.
     * Reference counts are only touched with the GIL held.
     */
    const TypeMeta *py_object_type_meta();

    /**
     * The declared type for a Python class: a value is assignable when isinstance(value, type) holds.
     * ``object`` and ``None`` declare the open type. Metas are created once per class and live for the process.
     */
    const TypeMeta *py_declared_type_meta(nb::handle type);

    Value to_value(nb::handle obj);

    /**
     * Convert a bound value to Python. Values bound from C++ are converted for the common scalar types and
     * rendered with their to_string otherwise.
     */
    nb::object from_value(const Value &value);

} // namespace dynscope

void export_types(nb::module_ &m);

void export_scope(nb::module_ &m);

void export_runtime(nb::module_ &m);

#endif // DYNSCOPE_PYTHON_PY_VALUE_H
