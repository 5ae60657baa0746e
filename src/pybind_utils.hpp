#pragma once

#include <span>
#include <stdexcept>
#include <vector>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

namespace py = pybind11;

template <typename T>
using PyArrayT = py::array_t<T, py::array::c_style | py::array::forcecast>;

// Copying view of a vector as a 1-D numpy array
template <typename Sequence>
inline py::array_t<typename Sequence::value_type>
as_pyarray_ref(const Sequence& seq) {
    auto size        = seq.size();
    const auto* data = seq.data();
    return py::array_t<typename Sequence::value_type>(size, data);
}

template <typename T>
inline std::span<const T> to_span(const PyArrayT<T>& arr) {
    static_assert(!std::is_pointer_v<T>, "T must not be a pointer type");
    static_assert(!std::is_reference_v<T>, "T must not be a reference type");
    if (arr.ndim() != 1) {
        throw std::runtime_error("Input array must be 1-dimensional");
    }
    py::buffer_info buffer = arr.request();
    return std::span<const T>(static_cast<const T*>(buffer.ptr), buffer.size);
}

// Convert a python sequence of 1-D arrays to owned vectors
template <typename T>
inline std::vector<std::vector<T>> as_vector_of_vectors(const py::list& lists) {
    std::vector<std::vector<T>> result;
    result.reserve(lists.size());
    for (const auto& item : lists) {
        const auto arr  = item.cast<PyArrayT<T>>();
        const auto view = to_span<T>(arr);
        result.emplace_back(view.begin(), view.end());
    }
    return result;
}
