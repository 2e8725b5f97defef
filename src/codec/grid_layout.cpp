#include "codec/grid_layout.hpp"

#include "common/errors.hpp"

#include <limits>
#include <string>
#include <utility>

namespace vqhuff {

namespace {

std::string shape_to_string(const Shape& shape) {
    std::string s = "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(shape[i]);
    }
    return s + "]";
}

} // namespace

uint32_t shape_product(const Shape& shape) {
    if (shape.empty()) {
        throw ShapeMismatchError("shape: no dimensions");
    }
    uint64_t product = 1;
    for (uint32_t d : shape) {
        if (d == 0) throw ShapeMismatchError("shape: zero dimension in " + shape_to_string(shape));
        product *= d;
        if (product > std::numeric_limits<uint32_t>::max()) {
            throw ShapeMismatchError("shape: " + shape_to_string(shape) + " holds more than 2^32-1 indices");
        }
    }
    return static_cast<uint32_t>(product);
}

std::vector<Symbol> flatten_grid(const IndexGrid& grid) {
    const uint32_t expected = shape_product(grid.shape);
    if (grid.values.size() != expected) {
        throw ShapeMismatchError("flatten: shape " + shape_to_string(grid.shape) + " expects " +
                                 std::to_string(expected) + " indices, grid holds " +
                                 std::to_string(grid.values.size()));
    }
    // values are already stored row-major
    return grid.values;
}

IndexGrid reshape_indices(std::vector<Symbol> values, const Shape& shape) {
    const uint32_t expected = shape_product(shape);
    if (values.size() != expected) {
        throw ShapeMismatchError("reshape: shape " + shape_to_string(shape) + " expects " +
                                 std::to_string(expected) + " indices, got " +
                                 std::to_string(values.size()));
    }
    IndexGrid grid;
    grid.shape = shape;
    grid.values = std::move(values);
    return grid;
}

} // namespace vqhuff
