// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/fmt/fmt.h>

#include <molio/data/errors.hpp>
#include <molio/utils/logger.hpp>
#include <molio/utils/natural_orbitals.hpp>
#include <stdexcept>
#include <string>

namespace molio::utils {

std::pair<Eigen::MatrixXd, Eigen::VectorXd> derive_naturals(
    const Eigen::MatrixXd& dm, const Eigen::MatrixXd& overlap) {
  MOLIO_LOG_TRACE_ENTERING();

  if (dm.rows() != dm.cols() || overlap.rows() != overlap.cols()) {
    throw std::invalid_argument(
        "Density and overlap matrices must be square");
  }
  if (dm.rows() != overlap.rows()) {
    throw std::invalid_argument(
        "Density matrix (" + std::to_string(dm.rows()) +
        ") and overlap matrix (" + std::to_string(overlap.rows()) +
        ") have different dimensions");
  }

  // The generalized solver factorizes S without reporting failure
  Eigen::LLT<Eigen::MatrixXd> cholesky(overlap);
  if (cholesky.info() != Eigen::Success) {
    throw std::runtime_error("Overlap matrix is not positive definite");
  }

  // S^T D S, a Fock-like matrix whose S-metric eigenvalues are occupations
  const Eigen::MatrixXd sds = overlap.transpose() * dm * overlap;
  Eigen::GeneralizedSelfAdjointEigenSolver<Eigen::MatrixXd> solver(sds,
                                                                   overlap);
  if (solver.info() != Eigen::Success) {
    throw std::runtime_error("Generalized eigensolver failed to converge");
  }
  return {solver.eigenvectors(), solver.eigenvalues()};
}

void check_dm(const Eigen::MatrixXd& dm, const Eigen::MatrixXd& overlap,
              double eps, double occ_max) {
  const Eigen::VectorXd occupations = derive_naturals(dm, overlap).second;
  if (occupations.size() == 0) {
    return;
  }

  const double occ_min_found = occupations.minCoeff();
  const double occ_max_found = occupations.maxCoeff();
  MOLIO_LOGGER().debug("Natural occupations span [{:.6e}, {:.6e}]",
                       occ_min_found, occ_max_found);

  if (occ_min_found < -eps) {
    throw data::ValueRangeError(fmt::format(
        "The density matrix has eigenvalues considerably smaller than zero. "
        "error={:e}",
        occ_min_found));
  }
  if (occ_max_found > occ_max + eps) {
    throw data::ValueRangeError(fmt::format(
        "The density matrix has eigenvalues considerably larger than the max. "
        "error={:e}",
        occ_max_found - occ_max));
  }
}

}  // namespace molio::utils
