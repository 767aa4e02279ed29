// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <unsupported/Eigen/CXX11/Tensor>

namespace molio::utils {

/**
 * @brief Calculate the (generalized) volume of a cell
 *
 * @param cellvecs Matrix of shape (k, 3) with k in {1, 2, 3}; each row is one
 * cell vector
 * @return The length (k = 1), area (k = 2) or signed volume (k = 3) of the
 * cell
 * @throws std::invalid_argument if cellvecs does not have 1-3 rows of length 3
 */
double volume(const Eigen::MatrixXd& cellvecs);

/**
 * @brief Assign an element of a four-index object, respecting the 8-fold
 * permutational symmetry of real two-electron integrals
 *
 * Physicists' notation is assumed: <01|23>.
 *
 * @param four_index_object Rank-4 tensor of shape (n, n, n, n); written to
 * @param i0,i1,i2,i3 Indices of the element to assign
 * @param value Value stored at all eight symmetry-equivalent positions
 * @throws std::out_of_range if an index exceeds the tensor dimensions
 */
void set_four_index_element(Eigen::Tensor<double, 4>& four_index_object,
                            size_t i0, size_t i1, size_t i2, size_t i3,
                            double value);

}  // namespace molio::utils
