// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <molio/data/orbital_set.hpp>

#include "ut_common.hpp"

using namespace molio::data;

class OrbitalSetTest : public ::testing::Test {
 protected:
  void SetUp() override {
    coefficients = Eigen::MatrixXd::Identity(3, 2);
    occupations = Eigen::VectorXd(2);
    occupations << 1.0, 0.5;
    energies = Eigen::VectorXd(2);
    energies << -0.5, 0.25;
  }

  Eigen::MatrixXd coefficients;
  Eigen::VectorXd occupations;
  Eigen::VectorXd energies;
};

TEST_F(OrbitalSetTest, Construction) {
  OrbitalSet orbitals(coefficients, occupations, Spin::Beta, energies);
  EXPECT_EQ(Spin::Beta, orbitals.get_spin());
  EXPECT_EQ(3u, orbitals.get_num_atomic_orbitals());
  EXPECT_EQ(2u, orbitals.get_num_molecular_orbitals());
  EXPECT_DOUBLE_EQ(1.5, orbitals.get_num_electrons());
  ASSERT_TRUE(orbitals.has_energies());
  EXPECT_DOUBLE_EQ(0.25, orbitals.get_energies()(1));

  OrbitalSet without_energies(coefficients, occupations);
  EXPECT_EQ(Spin::Alpha, without_energies.get_spin());
  EXPECT_FALSE(without_energies.has_energies());
  EXPECT_THROW(without_energies.get_energies(), std::runtime_error);
}

TEST_F(OrbitalSetTest, InvalidSizes) {
  Eigen::VectorXd three = Eigen::VectorXd::Ones(3);
  EXPECT_THROW(OrbitalSet(coefficients, three), std::invalid_argument);
  EXPECT_THROW(OrbitalSet(coefficients, occupations, Spin::Alpha, three),
               std::invalid_argument);
  Eigen::MatrixXd empty(0, 0);
  Eigen::VectorXd no_occupations(0);
  EXPECT_THROW(OrbitalSet(empty, no_occupations), std::invalid_argument);
}

TEST_F(OrbitalSetTest, WithSpin) {
  OrbitalSet alpha(coefficients, occupations);
  OrbitalSet beta = alpha.with_spin(Spin::Beta);
  EXPECT_EQ(Spin::Alpha, alpha.get_spin());
  EXPECT_EQ(Spin::Beta, beta.get_spin());
  EXPECT_TRUE(beta.get_coefficients().isApprox(alpha.get_coefficients()));
}

TEST_F(OrbitalSetTest, SpinNames) {
  EXPECT_EQ("alpha", spin_to_string(Spin::Alpha));
  EXPECT_EQ(Spin::Beta, string_to_spin("Beta"));
  EXPECT_THROW(string_to_spin("gamma"), std::invalid_argument);
}

TEST_F(OrbitalSetTest, JsonRoundTrip) {
  OrbitalSet original(coefficients, occupations, Spin::Beta, energies);
  auto restored = OrbitalSet::from_json(original.to_json());
  EXPECT_EQ(Spin::Beta, restored.get_spin());
  EXPECT_TRUE(restored.get_coefficients().isApprox(coefficients,
                                                   testing::json_tolerance));
  EXPECT_TRUE(restored.get_occupations().isApprox(occupations,
                                                  testing::json_tolerance));
  ASSERT_TRUE(restored.has_energies());

  nlohmann::json incomplete = {{"spin", "alpha"}};
  EXPECT_THROW(OrbitalSet::from_json(incomplete), std::runtime_error);
}
