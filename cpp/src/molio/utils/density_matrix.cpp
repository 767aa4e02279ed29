// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <molio/utils/density_matrix.hpp>
#include <molio/utils/logger.hpp>
#include <stdexcept>
#include <string>

namespace molio::utils {

std::pair<Eigen::MatrixXd, Eigen::MatrixXd> compute_spin_density_matrices(
    const std::vector<data::OrbitalSet>& orbital_sets) {
  MOLIO_LOG_TRACE_ENTERING();

  const data::OrbitalSet* alpha = nullptr;
  const data::OrbitalSet* beta = nullptr;
  for (const auto& orbital_set : orbital_sets) {
    const data::OrbitalSet*& slot =
        orbital_set.get_spin() == data::Spin::Alpha ? alpha : beta;
    if (slot != nullptr) {
      throw std::invalid_argument(
          "Spin channel '" + data::spin_to_string(orbital_set.get_spin()) +
          "' given more than once");
    }
    slot = &orbital_set;
  }

  if (alpha == nullptr) {
    throw std::invalid_argument(
        "Density matrix reconstruction requires alpha orbitals");
  }

  Eigen::MatrixXd dm_alpha = alpha->calculate_density_matrix();
  if (beta == nullptr) {
    MOLIO_LOGGER().debug(
        "No beta orbitals, using restricted closed-shell densities");
    return {dm_alpha, dm_alpha};
  }

  if (beta->get_num_atomic_orbitals() != alpha->get_num_atomic_orbitals()) {
    throw std::invalid_argument(
        "Alpha and beta orbitals have different numbers of basis functions: " +
        std::to_string(alpha->get_num_atomic_orbitals()) + " vs " +
        std::to_string(beta->get_num_atomic_orbitals()));
  }
  return {dm_alpha, beta->calculate_density_matrix()};
}

Eigen::MatrixXd compute_density_matrix(
    const std::vector<data::OrbitalSet>& orbital_sets,
    DensityType density_type) {
  auto [dm_alpha, dm_beta] = compute_spin_density_matrices(orbital_sets);
  if (density_type == DensityType::Full) {
    return dm_alpha + dm_beta;
  }
  return dm_alpha - dm_beta;
}

}  // namespace molio::utils
