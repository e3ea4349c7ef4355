/*
 * The entry point into the python _syncdl module, exposing the deferred value, batch scope and loader over
 * arbitrary Python objects.
 *
 * Callbacks registered from Python receive the settled result (None if the future failed), matching the shape of
 * the pure Python SyncFuture. All of this runs with the GIL held, nothing here releases it.
 */
#include <syncdl/python/hashable.h>
#include <syncdl/runtime/batch_loader.h>
#include <syncdl/runtime/batch_scope.h>
#include <syncdl/runtime/deferred.h>
#include <syncdl/util/errors.h>

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <cstdint>
#include <memory>

using namespace nb::literals;

namespace {

    using PyFuture = syncdl::Deferred<nb::object>;
    using PyLoader = syncdl::BatchLoader<nb::object, nb::object, syncdl::python::PyObjectHash,
                                         syncdl::python::PyObjectEqual>;

    struct PyBatchScope {
        syncdl::BatchScope scope{};
        std::unique_ptr<syncdl::BatchScope::Activation> activation{};
    };

    nb::handle invalid_state_error_type{};

    // Captures a Python exception instance (or class) so that it is raised again when the future is read
    std::exception_ptr to_exception_ptr(nb::handle exception) {
        nb::object instance = PyType_Check(exception.ptr()) ? exception() : nb::borrow(exception);
        PyErr_SetObject(reinterpret_cast<PyObject *>(Py_TYPE(instance.ptr())), instance.ptr());
        return std::make_exception_ptr(nb::python_error());
    }

    nb::object to_python_exception(const std::exception_ptr &error) {
        try {
            std::rethrow_exception(error);
        } catch (const nb::python_error &e) {
            return nb::borrow(e.value());
        } catch (const syncdl::InvalidStateError &e) {
            return invalid_state_error_type(e.what());
        } catch (...) {
            return nb::handle(PyExc_RuntimeError)(syncdl::describe_exception(error));
        }
    }

    void settle_from_python(const PyFuture &future, nb::handle value) {
        if (nb::isinstance<PyFuture>(value)) {
            future.set_result(nb::cast<const PyFuture &>(value));
        } else {
            future.set_result(nb::borrow(value));
        }
    }

    nb::object result_or_none(const PyFuture &settled) {
        return settled.is_failed() ? nb::none() : settled.get_result();
    }

    PyFuture py_then(const PyFuture &self, nb::callable on_complete) {
        PyFuture next;
        auto continuation = [next, on_complete](const PyFuture &settled) {
            if (settled.is_failed()) {
                next.set_error(settled.error());
                return;
            }
            nb::object produced;
            try {
                produced = on_complete(settled.get_result());
            } catch (const nb::python_error &) {
                next.set_error(std::current_exception());
                return;
            }
            settle_from_python(next, produced);
        };
        if (self.is_done()) {
            continuation(self);
        } else {
            self.on_done(std::move(continuation));
        }
        return next;
    }

    PyLoader::batch_load_fn wrap_batch_load(nb::callable batch_load_fn) {
        return [batch_load_fn](const std::vector<nb::object> &keys) {
            nb::list py_keys;
            for (const auto &key : keys) { py_keys.append(key); }
            nb::object values = batch_load_fn(py_keys);
            if (!PySequence_Check(values.ptr()) || PyUnicode_Check(values.ptr())) {
                throw nb::type_error("The batch load function must return a sequence with one entry per key");
            }
            std::vector<PyLoader::result_type> results;
            for (nb::handle value : values) {
                if (PyObject_IsInstance(value.ptr(), PyExc_Exception) == 1) {
                    results.emplace_back(to_exception_ptr(value));
                } else {
                    results.emplace_back(nb::borrow(value));
                }
            }
            return results;
        };
    }

} // namespace

NB_MODULE(_syncdl, m) {
    m.doc() = "Synchronous batched data loading";

    auto invalid_state = nb::exception<syncdl::InvalidStateError>(m, "InvalidStateError");
    invalid_state_error_type = invalid_state;
    nb::exception<syncdl::ConfigurationError>(m, "ConfigurationError");
    nb::exception<syncdl::BatchContractError>(m, "BatchContractError", PyExc_ValueError);

    nb::class_<PyFuture>(m, "SyncFuture")
        .def(nb::init<>())
        .def("done", &PyFuture::is_done)
        .def("result", [](const PyFuture &self) { return self.get_result(); })
        .def("exception", [](const PyFuture &self) -> nb::object {
            auto error = self.error();
            return error ? to_python_exception(error) : nb::none();
        })
        .def("add_done_callback", [](const PyFuture &self, nb::callable fn) {
            self.on_done([fn](const PyFuture &settled) { fn(result_or_none(settled)); });
        }, "fn"_a)
        .def("set_result", [](const PyFuture &self, nb::handle result) { settle_from_python(self, result); },
             "result"_a)
        .def("set_exception", [](const PyFuture &self, nb::handle exception) {
            self.set_error(to_exception_ptr(exception));
        }, "exception"_a)
        .def("then", &py_then, "on_complete"_a)
        .def("__eq__", [](const PyFuture &self, const PyFuture &other) { return self == other; })
        .def("__hash__", [](const PyFuture &self) { return reinterpret_cast<std::uintptr_t>(self.id()); });

    nb::class_<PyBatchScope>(m, "BatchScope")
        .def(nb::init<>())
        .def("__enter__", [](PyBatchScope &self) -> PyBatchScope & {
            self.activation = std::make_unique<syncdl::BatchScope::Activation>(self.scope);
            return self;
        }, nb::rv_policy::reference)
        .def("__exit__", [](PyBatchScope &self, nb::handle exc_type, nb::handle, nb::handle) {
            auto activation = std::move(self.activation);
            if (!activation) { return; }
            if (exc_type.is_none()) {
                activation->close();
            } else {
                activation->abandon();
            }
        }, "exc_type"_a.none(), "exc_value"_a.none(), "traceback"_a.none())
        .def("add_callback", [](PyBatchScope &self, nb::callable fn) { self.scope.add_callback([fn] { fn(); }); },
             "callback"_a)
        .def("run_all_callbacks", [](PyBatchScope &self) { return self.scope.drain(); })
        .def_prop_ro("active", [](const PyBatchScope &self) { return self.scope.is_active(); })
        .def_prop_ro("pending", [](const PyBatchScope &self) { return self.scope.pending(); });

    nb::class_<PyLoader>(m, "SyncDataLoader")
        .def("__init__", [](PyLoader *self, nb::callable batch_load_fn, PyBatchScope &scope,
                            std::size_t max_batch_size, bool cache, std::string name) {
            new(self) PyLoader(scope.scope, wrap_batch_load(std::move(batch_load_fn)),
                               syncdl::BatchLoaderOptions{max_batch_size, cache, std::move(name)});
        }, "batch_load_fn"_a, "scope"_a, "max_batch_size"_a = 0, "cache"_a = true, "name"_a = "loader",
        nb::keep_alive<1, 3>())
        .def("load", &PyLoader::load, "key"_a)
        .def("load_many", [](PyLoader &self, const std::vector<nb::object> &keys) {
            return self.load_many(keys).then([](const std::vector<nb::object> &values) {
                nb::list result;
                for (const auto &value : values) { result.append(value); }
                return nb::object(result);
            });
        }, "keys"_a)
        .def("clear", &PyLoader::clear, "key"_a)
        .def("clear_all", &PyLoader::clear_all)
        .def("prime", &PyLoader::prime, "key"_a, "value"_a)
        .def("dispatch_queue", &PyLoader::dispatch);
}
