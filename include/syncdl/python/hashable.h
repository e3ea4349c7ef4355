#ifndef SYNCDL_PYTHON_HASHABLE_H
#define SYNCDL_PYTHON_HASHABLE_H

#include <nanobind/nanobind.h>

#include <cstddef>

namespace nb = nanobind;

namespace syncdl::python {

    // Python's own hash / equality, so loader keys behave as they would in a dict. The GIL must be held.
    struct PyObjectHash {
        [[nodiscard]] std::size_t operator()(const nb::object &key) const {
            return static_cast<std::size_t>(nb::hash(key));
        }
    };

    struct PyObjectEqual {
        [[nodiscard]] bool operator()(const nb::object &lhs, const nb::object &rhs) const {
            return lhs.is(rhs) || lhs.equal(rhs);
        }
    };

} // namespace syncdl::python

#endif // SYNCDL_PYTHON_HASHABLE_H
