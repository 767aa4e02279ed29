// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <molio/data/orbital_set.hpp>
#include <utility>
#include <vector>

namespace molio::utils {

/**
 * @enum DensityType
 * @brief Flavour of a one-particle density matrix
 */
enum class DensityType {
  Full,  ///< Spin-summed density, P_alpha + P_beta
  Spin   ///< Spin density, P_alpha - P_beta
};

/**
 * @brief Per-channel AO density matrices of a set of orbitals
 *
 * Each channel is accumulated as P = C diag(n) C^T. When no beta set is given
 * the description is restricted closed-shell and P_beta equals P_alpha.
 *
 * @param orbital_sets One alpha set and at most one beta set
 * @return Pair (P_alpha, P_beta)
 * @throws std::invalid_argument if there is no alpha set, a spin channel
 * occurs twice, or the channels disagree on the number of basis functions
 */
std::pair<Eigen::MatrixXd, Eigen::MatrixXd> compute_spin_density_matrices(
    const std::vector<data::OrbitalSet>& orbital_sets);

/**
 * @brief Full or spin AO density matrix of a set of orbitals
 *
 * @param orbital_sets One alpha set and at most one beta set
 * @param density_type Full (P_alpha + P_beta) or Spin (P_alpha - P_beta)
 * @throws std::invalid_argument as compute_spin_density_matrices()
 */
Eigen::MatrixXd compute_density_matrix(
    const std::vector<data::OrbitalSet>& orbital_sets,
    DensityType density_type);

}  // namespace molio::utils
