#pragma once

#include <cstdint>
#include <vector>

#include "model/index_model.hpp"

namespace vqhuff {

// Product of all dimensions. Throws ShapeMismatchError for an empty shape,
// a zero dimension, or a product that does not fit in 32 bits.
uint32_t shape_product(const Shape& shape);

// Row-major flatten (last dimension fastest). Throws ShapeMismatchError when
// values.size() differs from the shape product.
std::vector<Symbol> flatten_grid(const IndexGrid& grid);

// Inverse of flatten_grid with the same traversal order.
IndexGrid reshape_indices(std::vector<Symbol> values, const Shape& shape);

} // namespace vqhuff
