// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <molio/utils/density_matrix.hpp>

#include "ut_common.hpp"

using namespace molio::data;
using namespace molio::utils;

class DensityMatrixTest : public ::testing::Test {
 protected:
  void SetUp() override {
    overlap = testing::create_model_overlap(3);
    coefficients = testing::create_orthonormal_coefficients(overlap);
    alpha_occupations = Eigen::VectorXd(3);
    alpha_occupations << 1.0, 1.0, 0.0;
    beta_occupations = Eigen::VectorXd(3);
    beta_occupations << 1.0, 0.0, 0.0;
  }

  Eigen::MatrixXd overlap;
  Eigen::MatrixXd coefficients;
  Eigen::VectorXd alpha_occupations;
  Eigen::VectorXd beta_occupations;
};

TEST_F(DensityMatrixTest, OrbitalSetDensity) {
  OrbitalSet alpha(coefficients, alpha_occupations);
  const Eigen::MatrixXd dm = alpha.calculate_density_matrix();
  const Eigen::MatrixXd expected =
      coefficients.leftCols(2) * coefficients.leftCols(2).transpose();
  EXPECT_TRUE(dm.isApprox(expected, testing::density_tolerance));
  EXPECT_NEAR(2.0, (overlap * dm).trace(), testing::density_tolerance);
}

TEST_F(DensityMatrixTest, RestrictedClosedShell) {
  std::vector<OrbitalSet> sets = {OrbitalSet(coefficients, alpha_occupations)};
  auto [dm_alpha, dm_beta] = compute_spin_density_matrices(sets);
  EXPECT_TRUE(dm_alpha.isApprox(dm_beta));

  const Eigen::MatrixXd full = compute_density_matrix(sets, DensityType::Full);
  const Eigen::MatrixXd spin = compute_density_matrix(sets, DensityType::Spin);
  EXPECT_TRUE(full.isApprox(2.0 * dm_alpha));
  EXPECT_LT(spin.cwiseAbs().maxCoeff(), testing::numerical_zero_tolerance);
}

TEST_F(DensityMatrixTest, Unrestricted) {
  std::vector<OrbitalSet> sets = {
      OrbitalSet(coefficients, alpha_occupations, Spin::Alpha),
      OrbitalSet(coefficients, beta_occupations, Spin::Beta)};

  const Eigen::MatrixXd full = compute_density_matrix(sets, DensityType::Full);
  const Eigen::MatrixXd spin = compute_density_matrix(sets, DensityType::Spin);
  EXPECT_NEAR(3.0, (overlap * full).trace(), testing::density_tolerance);
  EXPECT_NEAR(1.0, (overlap * spin).trace(), testing::density_tolerance);

  // Channel order in the input does not matter
  std::vector<OrbitalSet> reversed = {sets[1], sets[0]};
  EXPECT_TRUE(
      full.isApprox(compute_density_matrix(reversed, DensityType::Full)));
}

TEST_F(DensityMatrixTest, MissingAlphaRejected) {
  std::vector<OrbitalSet> none;
  EXPECT_THROW(compute_density_matrix(none, DensityType::Full),
               std::invalid_argument);

  std::vector<OrbitalSet> beta_only = {
      OrbitalSet(coefficients, beta_occupations, Spin::Beta)};
  EXPECT_THROW(compute_density_matrix(beta_only, DensityType::Spin),
               std::invalid_argument);
}

TEST_F(DensityMatrixTest, DuplicateChannelRejected) {
  std::vector<OrbitalSet> sets = {OrbitalSet(coefficients, alpha_occupations),
                                  OrbitalSet(coefficients, beta_occupations)};
  EXPECT_THROW(compute_spin_density_matrices(sets), std::invalid_argument);
}

TEST_F(DensityMatrixTest, BasisSizeMismatchRejected) {
  Eigen::MatrixXd small = Eigen::MatrixXd::Identity(2, 2);
  Eigen::VectorXd occupations(2);
  occupations << 1.0, 0.0;
  std::vector<OrbitalSet> sets = {
      OrbitalSet(coefficients, alpha_occupations, Spin::Alpha),
      OrbitalSet(small, occupations, Spin::Beta)};
  EXPECT_THROW(compute_density_matrix(sets, DensityType::Full),
               std::invalid_argument);
}
