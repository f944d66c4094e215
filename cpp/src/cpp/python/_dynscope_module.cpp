/*
 * The entry point into the python _dynscope module exposing dynamically scoped variables to python.
 *
 * Values bound from python are held as python objects and are only ever touched with the GIL held. Keys are declared
 * with a python type and bindings are checked with isinstance when the carrier is built.
 */
#include <dynscope/python/py_value.h>
#include <dynscope/util/errors.h>

NB_MODULE(_dynscope, m) {
    m.doc() = "Dynamically scoped, inheritable context variables";

    // Derived errors are registered last so their translators are tried first
    auto base_error = nb::exception<dynscope::DynscopeError>(m, "DynscopeError", PyExc_RuntimeError);
    nb::exception<dynscope::TypeMismatchError>(m, "TypeMismatchError", base_error);
    nb::exception<dynscope::UnboundKeyError>(m, "UnboundKeyError", base_error);
    nb::exception<dynscope::CancelledError>(m, "CancelledError", base_error);

    export_types(m);
    export_scope(m);
    export_runtime(m);
}
