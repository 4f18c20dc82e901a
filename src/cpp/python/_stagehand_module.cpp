/*
 * The entry point into the python _stagehand module exposing the C++ types to python.
 *
 * Handles (Project, Sheet, SheetObject, Sequence) are plain values indexing into the CoreContext that created them.
 * Each one keeps its parent Python object alive, so a context is only collected once no handle refers to it.
 */
#include <stagehand/python/nb_base.h>
#include <stagehand/util/errors.h>

void export_types(nb::module_ &);

void export_reactive(nb::module_ &);

void export_runtime(nb::module_ &);

void export_project(nb::module_ &);

NB_MODULE(_stagehand, m) {
    m.doc() = "The stagehand reactive property graph and timeline player";

    // InvalidArgument derives std::invalid_argument and surfaces as ValueError
    nb::exception<stagehand::SchemaVersionMismatch>(m, "SchemaVersionMismatch", PyExc_RuntimeError);

    export_types(m);
    export_reactive(m);
    export_runtime(m);
    export_project(m);
}
