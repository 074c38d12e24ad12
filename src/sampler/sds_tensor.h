#pragma once

#include "sds_error.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace sds {

using Shape = std::vector<int64_t>;

// Number of elements described by shape, or -1 if a dimension is negative or
// the count does not fit a 32-bit signed integer.
int64_t count_elements(const Shape & shape);

// stride[last] = 1, stride[i] = stride[i+1] * shape[i+1]
Shape row_major_strides(const Shape & shape);

std::string shape_to_string(const Shape & shape);

// Throws ShapeError unless shape has at least one dimension, a non-negative
// leading dimension, positive trailing dimensions and a 32-bit element count.
void validate_shape(const Shape & shape);

template <typename T>
class Tensor {
public:
    explicit Tensor(Shape shape);
    Tensor(std::vector<T> data, Shape shape);

    Tensor(Tensor && other) noexcept = default;
    Tensor & operator=(Tensor && other) noexcept = default;
    Tensor(const Tensor &) = delete;
    Tensor & operator=(const Tensor &) = delete;

    const Shape & shape() const { return dims; }
    const Shape & strides() const { return row_strides; }
    int rank() const { return (int)dims.size(); }
    int64_t dim(int i) const { return dims[(size_t)i]; }
    size_t size() const { return buf.size(); }

    T * data() { return buf.data(); }
    const T * data() const { return buf.data(); }
    const std::vector<T> & values() const { return buf; }

    T & operator[](size_t i) { return buf[i]; }
    const T & operator[](size_t i) const { return buf[i]; }

    size_t index_of(std::initializer_list<int64_t> idx) const;
    T get(std::initializer_list<int64_t> idx) const { return buf[index_of(idx)]; }
    void set(std::initializer_list<int64_t> idx, T value) { buf[index_of(idx)] = value; }

    Tensor copy() const;

    void scale(T scalar);
    void add(const Tensor & other);

    // Partitions the flat buffer into consecutive tensors of new_shape.
    std::vector<Tensor> split(const Shape & new_shape) const;

    // Concatenates along the last dimension, e.g. [2,3,4] + [2,3,2] -> [2,3,6].
    static Tensor concat(const Tensor & first, const Tensor & second);

private:
    std::vector<T> buf;
    Shape dims;
    Shape row_strides;
};

template <typename T>
Tensor<T>::Tensor(Shape shape) : dims(std::move(shape)) {
    validate_shape(dims);
    row_strides = row_major_strides(dims);
    buf.assign((size_t)count_elements(dims), T(0));
}

template <typename T>
Tensor<T>::Tensor(std::vector<T> data, Shape shape) : buf(std::move(data)), dims(std::move(shape)) {
    validate_shape(dims);
    row_strides = row_major_strides(dims);
    const int64_t n = count_elements(dims);
    if ((int64_t)buf.size() != n) {
        throw ShapeError("buffer has " + std::to_string(buf.size()) + " elements but shape " +
                         shape_to_string(dims) + " expects " + std::to_string(n));
    }
}

template <typename T>
size_t Tensor<T>::index_of(std::initializer_list<int64_t> idx) const {
    size_t linear = 0;
    size_t i = 0;
    for (int64_t v : idx) {
        linear += (size_t)(v * row_strides[i++]);
    }
    return linear;
}

template <typename T>
Tensor<T> Tensor<T>::copy() const {
    return Tensor(std::vector<T>(buf), Shape(dims));
}

template <typename T>
void Tensor<T>::scale(T scalar) {
    for (T & v : buf) v *= scalar;
}

template <typename T>
void Tensor<T>::add(const Tensor & other) {
    if (other.dims != dims) {
        throw ShapeError("invalid shape for add, expected " + shape_to_string(dims) +
                         ", found " + shape_to_string(other.dims));
    }
    for (size_t i = 0; i < buf.size(); ++i) buf[i] += other.buf[i];
}

template <typename T>
std::vector<Tensor<T>> Tensor<T>::split(const Shape & new_shape) const {
    validate_shape(new_shape);
    const int64_t chunk = count_elements(new_shape);
    if (chunk <= 0 || (int64_t)buf.size() % chunk != 0) {
        throw ShapeError("cannot split " + shape_to_string(dims) + " into equal chunks of " +
                         shape_to_string(new_shape));
    }
    const int64_t n_chunks = (int64_t)buf.size() / chunk;
    std::vector<Tensor> out;
    out.reserve((size_t)n_chunks);
    for (int64_t c = 0; c < n_chunks; ++c) {
        auto first = buf.begin() + c * chunk;
        out.emplace_back(std::vector<T>(first, first + chunk), new_shape);
    }
    return out;
}

template <typename T>
Tensor<T> Tensor<T>::concat(const Tensor & first, const Tensor & second) {
    const Shape & a = first.dims;
    const Shape & b = second.dims;
    if (a.size() != b.size()) {
        throw ShapeError("invalid shapes for concatenation, got " + shape_to_string(a) + " and " + shape_to_string(b));
    }
    int64_t n_rows = 1;
    for (size_t i = 0; i + 1 < a.size(); ++i) {
        if (a[i] != b[i]) {
            throw ShapeError("invalid shapes for concatenation, got " + shape_to_string(a) + " and " + shape_to_string(b));
        }
        n_rows *= a[i];
    }

    Shape out_shape = a;
    out_shape.back() += b.back();
    Tensor out(out_shape);

    const size_t row_a = (size_t)a.back();
    const size_t row_b = (size_t)b.back();
    const T * src_a = first.buf.data();
    const T * src_b = second.buf.data();
    T * dst = out.buf.data();
    for (int64_t r = 0; r < n_rows; ++r) {
        dst = std::copy(src_a, src_a + row_a, dst);
        dst = std::copy(src_b, src_b + row_b, dst);
        src_a += row_a;
        src_b += row_b;
    }
    return out;
}

extern template class Tensor<float>;
extern template class Tensor<int32_t>;
extern template class Tensor<int64_t>;

using FloatTensor = Tensor<float>;
using IntTensor = Tensor<int32_t>;
using LongTensor = Tensor<int64_t>;

}
