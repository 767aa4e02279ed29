// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <molio/data/basis_set.hpp>

#include "ut_common.hpp"

using namespace molio::data;

class BasisSetTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Eigen::VectorXd s_exponents(3);
    s_exponents << 130.70932, 23.808861, 6.4436083;
    Eigen::VectorXd s_coefficients(3);
    s_coefficients << 0.15432897, 0.53532814, 0.44463454;
    Eigen::VectorXd p_exponents(1);
    p_exponents << 0.38038896;
    Eigen::VectorXd p_coefficients(1);
    p_coefficients << 1.0;
    Eigen::VectorXd d_exponents(1);
    d_exponents << 1.2;
    Eigen::VectorXd d_coefficients(1);
    d_coefficients << 1.0;

    shells.emplace_back(0, OrbitalType::S, s_exponents, s_coefficients);
    shells.emplace_back(0, OrbitalType::P, p_exponents, p_coefficients);
    shells.emplace_back(2, OrbitalType::D, d_exponents, d_coefficients);
  }

  std::vector<Shell> shells;
};

TEST_F(BasisSetTest, ShellFunctionCounts) {
  EXPECT_EQ(3u, shells[0].get_num_primitives());
  EXPECT_EQ(1u, shells[0].get_num_basis_functions());
  EXPECT_EQ(3u, shells[1].get_num_basis_functions());
  EXPECT_EQ(5u, shells[2].get_num_basis_functions(BasisType::Spherical));
  EXPECT_EQ(6u, shells[2].get_num_basis_functions(BasisType::Cartesian));
  EXPECT_EQ(2, shells[2].get_angular_momentum());
}

TEST_F(BasisSetTest, InvalidShells) {
  Eigen::VectorXd two(2);
  two << 1.0, 2.0;
  Eigen::VectorXd one(1);
  one << 1.0;
  EXPECT_THROW(Shell(0, OrbitalType::S, two, one), std::invalid_argument);
  Eigen::VectorXd empty(0);
  EXPECT_THROW(Shell(0, OrbitalType::S, empty, empty), std::invalid_argument);
}

TEST_F(BasisSetTest, Descriptor) {
  BasisSetDescriptor spherical("custom", shells);
  EXPECT_EQ("custom", spherical.get_name());
  EXPECT_EQ(3u, spherical.get_num_shells());
  EXPECT_EQ(BasisType::Spherical, spherical.get_basis_type());
  EXPECT_EQ(9u, spherical.get_num_basis_functions());
  EXPECT_EQ(3u, spherical.get_num_atoms_referenced());

  BasisSetDescriptor cartesian("custom", shells, BasisType::Cartesian);
  EXPECT_EQ(10u, cartesian.get_num_basis_functions());

  const auto mapping = spherical.get_basis_function_to_atom_map();
  ASSERT_EQ(9u, mapping.size());
  EXPECT_EQ(0u, mapping[0]);
  EXPECT_EQ(0u, mapping[3]);
  EXPECT_EQ(2u, mapping[4]);
  EXPECT_EQ(2u, mapping[8]);

  BasisSetDescriptor empty("empty", {});
  EXPECT_EQ(0u, empty.get_num_basis_functions());
  EXPECT_EQ(0u, empty.get_num_atoms_referenced());
}

TEST_F(BasisSetTest, OrbitalTypeConversions) {
  EXPECT_EQ("d", orbital_type_to_string(OrbitalType::D));
  EXPECT_EQ(OrbitalType::F, string_to_orbital_type("F"));
  EXPECT_EQ(OrbitalType::I, angular_momentum_to_orbital_type(6));
  EXPECT_THROW(angular_momentum_to_orbital_type(7), std::invalid_argument);
  EXPECT_THROW(angular_momentum_to_orbital_type(-1), std::invalid_argument);
  EXPECT_THROW(string_to_orbital_type("k"), std::invalid_argument);

  EXPECT_EQ("cartesian", basis_type_to_string(BasisType::Cartesian));
  EXPECT_EQ(BasisType::Spherical, string_to_basis_type("Spherical"));
  EXPECT_THROW(string_to_basis_type("polar"), std::invalid_argument);
}

TEST_F(BasisSetTest, JsonRoundTrip) {
  BasisSetDescriptor original("custom", shells, BasisType::Cartesian);
  auto j = original.to_json();
  EXPECT_EQ("custom", j["name"].get<std::string>());
  EXPECT_EQ(3u, j["shells"].size());

  auto restored = BasisSetDescriptor::from_json(j);
  EXPECT_EQ(original.get_name(), restored.get_name());
  EXPECT_EQ(BasisType::Cartesian, restored.get_basis_type());
  ASSERT_EQ(3u, restored.get_num_shells());
  EXPECT_EQ(2u, restored.get_shells()[2].atom_index);
  EXPECT_EQ(OrbitalType::D, restored.get_shells()[2].orbital_type);
  EXPECT_TRUE(shells[0].exponents.isApprox(restored.get_shells()[0].exponents,
                                           testing::json_tolerance));

  nlohmann::json missing_shells = {{"name", "broken"}};
  EXPECT_THROW(BasisSetDescriptor::from_json(missing_shells),
               std::runtime_error);
}
