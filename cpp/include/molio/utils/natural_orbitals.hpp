// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <utility>

namespace molio::utils {

/**
 * @brief Derive natural orbitals from a density matrix
 *
 * Solves the generalized symmetric eigenproblem (S^T D S) v = n S v with the
 * overlap matrix S as metric. Eigenpairs are returned in ascending order of
 * occupation, as produced by the solver.
 *
 * @param dm Density matrix, shape (n_basis, n_basis)
 * @param overlap Overlap matrix, shape (n_basis, n_basis), positive definite
 * @return Pair (coefficients, occupations); coefficients has one natural
 * orbital per column
 * @throws std::invalid_argument if the matrices are not square or differ in
 * size
 * @throws std::runtime_error if the eigensolver fails, e.g. because the
 * overlap matrix is not positive definite
 */
std::pair<Eigen::MatrixXd, Eigen::VectorXd> derive_naturals(
    const Eigen::MatrixXd& dm, const Eigen::MatrixXd& overlap);

/**
 * @brief Check that the natural occupations of a density matrix lie in
 * [-eps, occ_max + eps]
 *
 * @param dm Density matrix
 * @param overlap Overlap matrix
 * @param eps Tolerance on both bounds
 * @param occ_max Maximum occupation (1 for a spin-orbital density, 2 for a
 * spin-summed one)
 * @throws molio::data::ValueRangeError if an occupation is out of range
 */
void check_dm(const Eigen::MatrixXd& dm, const Eigen::MatrixXd& overlap,
              double eps = 1e-4, double occ_max = 1.0);

}  // namespace molio::utils
