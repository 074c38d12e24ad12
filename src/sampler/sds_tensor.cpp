#include "sds_tensor.h"

#include <limits>
#include <sstream>

namespace sds {

int64_t count_elements(const Shape & shape) {
    for (int64_t d : shape) {
        if (d < 0) return -1;
    }
    int64_t total = 1;
    for (int64_t d : shape) {
        if (d == 0) return 0;
        if (total > std::numeric_limits<int32_t>::max() / d) return -1;
        total *= d;
    }
    return total;
}

Shape row_major_strides(const Shape & shape) {
    Shape strides(shape.size(), 1);
    for (size_t i = shape.size(); i > 1; --i) {
        strides[i - 2] = strides[i - 1] * shape[i - 1];
    }
    return strides;
}

std::string shape_to_string(const Shape & shape) {
    std::ostringstream ss;
    ss << '[';
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) ss << ", ";
        ss << shape[i];
    }
    ss << ']';
    return ss.str();
}

void validate_shape(const Shape & shape) {
    if (shape.empty()) {
        throw ShapeError("tensor shape must have at least one dimension");
    }
    if (shape[0] < 0) {
        throw ShapeError("invalid leading dimension in shape " + shape_to_string(shape));
    }
    for (size_t i = 1; i < shape.size(); ++i) {
        if (shape[i] <= 0) {
            throw ShapeError("non-positive dimension " + std::to_string(i) + " in shape " + shape_to_string(shape));
        }
    }
    if (count_elements(shape) < 0) {
        throw ShapeError("shape " + shape_to_string(shape) + " exceeds the maximum element count");
    }
}

template class Tensor<float>;
template class Tensor<int32_t>;
template class Tensor<int64_t>;

}
