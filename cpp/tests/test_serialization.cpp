// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <molio/data/molecule_data.hpp>

#include "ut_common.hpp"

using namespace molio::data;

class SerializationTest : public ::testing::Test {
 protected:
  void SetUp() override { remove_files(); }
  void TearDown() override { remove_files(); }

  void remove_files() {
    for (const auto& name : files) {
      std::filesystem::remove(name);
    }
  }

  const std::vector<std::string> files = {
      "test_h4.molecule_data.json", "test_h4.molecule_data.h5",
      "test_cube.molecule_data.h5", "test_cube.molecule_data.json",
      "test_h4.json",               "test_broken.molecule_data.json"};
};

namespace {

void expect_same_orbitals(const OrbitalSet& expected, const OrbitalSet& actual,
                          double tolerance) {
  EXPECT_EQ(expected.get_spin(), actual.get_spin());
  EXPECT_TRUE(
      expected.get_coefficients().isApprox(actual.get_coefficients(),
                                           tolerance));
  EXPECT_TRUE(
      expected.get_occupations().isApprox(actual.get_occupations(),
                                          tolerance));
  ASSERT_EQ(expected.has_energies(), actual.has_energies());
  if (expected.has_energies()) {
    EXPECT_TRUE(
        expected.get_energies().isApprox(actual.get_energies(), tolerance));
  }
}

void expect_same_molecule(const MoleculeData& expected,
                          const MoleculeData& actual, double tolerance) {
  ASSERT_EQ(expected.keys(), actual.keys());
  EXPECT_EQ(expected.get<std::string>("title"),
            actual.get<std::string>("title"));
  EXPECT_TRUE(expected.get<IntVector>("numbers") ==
              actual.get<IntVector>("numbers"));
  EXPECT_TRUE(expected.get<Eigen::MatrixXd>("coordinates")
                  .isApprox(actual.get<Eigen::MatrixXd>("coordinates"),
                            tolerance));
  EXPECT_TRUE(expected.get<Eigen::MatrixXd>("overlap")
                  .isApprox(actual.get<Eigen::MatrixXd>("overlap"),
                            tolerance));
  EXPECT_NEAR(expected.get<double>("energy"), actual.get<double>("energy"),
              tolerance);
  expect_same_orbitals(expected.get<OrbitalSet>("orb_alpha"),
                       actual.get<OrbitalSet>("orb_alpha"), tolerance);

  const auto& expected_basis = expected.get<BasisSetDescriptor>("obasis");
  const auto& actual_basis = actual.get<BasisSetDescriptor>("obasis");
  EXPECT_EQ(expected_basis.get_name(), actual_basis.get_name());
  EXPECT_EQ(expected_basis.get_num_shells(), actual_basis.get_num_shells());
  EXPECT_EQ(expected_basis.get_num_basis_functions(),
            actual_basis.get_num_basis_functions());
}

std::shared_ptr<MoleculeData> create_cube_molecule() {
  RealTensor3 grid(2, 3, 4);
  for (int i = 0; i < 2; ++i) {
    for (int j = 0; j < 3; ++j) {
      for (int k = 0; k < 4; ++k) {
        grid(i, j, k) = 100.0 * i + 10.0 * j + k;
      }
    }
  }
  Eigen::VectorXd origin(3);
  origin << -2.0, -3.0, -4.0;
  Eigen::MatrixXd axes = 0.5 * Eigen::MatrixXd::Identity(3, 3);
  IntVector numbers(1);
  numbers << 6;
  return std::make_shared<MoleculeData>(AttributeMap{
      {"cube_data", grid}, {"origin", origin}, {"axes", axes},
      {"numbers", numbers}});
}

void expect_same_grid(const RealTensor3& expected, const RealTensor3& actual) {
  ASSERT_EQ(expected.dimension(0), actual.dimension(0));
  ASSERT_EQ(expected.dimension(1), actual.dimension(1));
  ASSERT_EQ(expected.dimension(2), actual.dimension(2));
  for (Eigen::Index i = 0; i < expected.dimension(0); ++i) {
    for (Eigen::Index j = 0; j < expected.dimension(1); ++j) {
      for (Eigen::Index k = 0; k < expected.dimension(2); ++k) {
        EXPECT_DOUBLE_EQ(expected(i, j, k), actual(i, j, k));
      }
    }
  }
}

}  // namespace

TEST_F(SerializationTest, JsonLayout) {
  auto molecule = testing::create_restricted_h4();
  auto j = molecule->to_json();
  EXPECT_EQ("0.1.0", j["version"].get<std::string>());
  ASSERT_TRUE(j["attributes"].contains("numbers"));
  EXPECT_EQ("int_vector",
            j["attributes"]["numbers"]["type"].get<std::string>());
  EXPECT_EQ("real_matrix",
            j["attributes"]["coordinates"]["type"].get<std::string>());
  EXPECT_EQ("orbital_set",
            j["attributes"]["orb_alpha"]["type"].get<std::string>());
  EXPECT_EQ("basis_set", j["attributes"]["obasis"]["type"].get<std::string>());
  EXPECT_EQ(4u, j["attributes"]["coordinates"]["value"].size());
}

TEST_F(SerializationTest, JsonRoundTrip) {
  auto molecule = testing::create_restricted_h4();
  auto restored = MoleculeData::from_json(molecule->to_json());
  expect_same_molecule(*molecule, *restored, testing::json_tolerance);

  molecule->to_json_file("test_h4.molecule_data.json");
  auto from_file = MoleculeData::from_json_file("test_h4.molecule_data.json");
  expect_same_molecule(*molecule, *from_file, testing::json_tolerance);

  auto dm_full = from_file->get_dm_full();
  ASSERT_TRUE(dm_full.has_value());
  EXPECT_TRUE(dm_full->isApprox(*molecule->get_dm_full(), 1e-10));
}

TEST_F(SerializationTest, JsonCubeRoundTrip) {
  auto molecule = create_cube_molecule();
  molecule->to_file("test_cube.molecule_data.json", "json");
  auto restored =
      MoleculeData::from_file("test_cube.molecule_data.json", "json");
  expect_same_grid(molecule->get<RealTensor3>("cube_data"),
                   restored->get<RealTensor3>("cube_data"));
  EXPECT_TRUE(restored->get_cube().has_value());
}

TEST_F(SerializationTest, JsonVersionChecked) {
  auto j = testing::create_water()->to_json();
  j["version"] = "0.1.7";
  EXPECT_NO_THROW(MoleculeData::from_json(j));
  j["version"] = "1.0.0";
  EXPECT_THROW(MoleculeData::from_json(j), std::runtime_error);
  j["version"] = "one";
  EXPECT_THROW(MoleculeData::from_json(j), std::runtime_error);
}

TEST_F(SerializationTest, JsonMalformedDocuments) {
  nlohmann::json no_attributes = {{"version", "0.1.0"}};
  EXPECT_THROW(MoleculeData::from_json(no_attributes), std::runtime_error);

  auto j = testing::create_water()->to_json();
  j["attributes"]["numbers"]["type"] = "complex_vector";
  EXPECT_THROW(MoleculeData::from_json(j), std::runtime_error);

  // Contracts are enforced on load
  auto wrong_shape = testing::create_water()->to_json();
  wrong_shape["attributes"]["numbers"]["value"] = {1, 1};
  EXPECT_THROW(MoleculeData::from_json(wrong_shape), TypeMismatch);

  {
    std::ofstream file("test_broken.molecule_data.json");
    file << "{ \"version\": ";
  }
  EXPECT_THROW(MoleculeData::from_json_file("test_broken.molecule_data.json"),
               std::runtime_error);
  EXPECT_THROW(MoleculeData::from_json_file("missing.molecule_data.json"),
               std::runtime_error);
}

TEST_F(SerializationTest, JsonIntegerTagsDoNotTruncate) {
  nlohmann::json fractional = {
      {"version", "0.1.0"},
      {"attributes",
       {{"numbers", {{"type", "int_vector"}, {"value", {1.5, 2.9}}}}}}};
  try {
    MoleculeData::from_json(fractional);
    FAIL() << "Expected TypeMismatch";
  } catch (const TypeMismatch& e) {
    ASSERT_EQ(1u, e.get_keys().size());
    EXPECT_EQ("numbers", e.get_keys()[0]);
    EXPECT_STRING_CONTAINS(e.get_reason(), "not an integer");
  }

  // Integral reals are accepted for numbers, as through the constructor
  nlohmann::json integral = {
      {"version", "0.1.0"},
      {"attributes",
       {{"numbers", {{"type", "int_vector"}, {"value", {8.0, 1.0}}}}}}};
  auto molecule = MoleculeData::from_json(integral);
  const auto& numbers = molecule->get<IntVector>("numbers");
  ASSERT_EQ(2, numbers.size());
  EXPECT_EQ(8, numbers(0));
  EXPECT_EQ(1, numbers(1));

  // Real-valued attributes keep the fractional part
  nlohmann::json coordinates = {
      {"version", "0.1.0"},
      {"attributes",
       {{"coordinates",
         {{"type", "int_matrix"}, {"value", {{0.0, 0.0, 0.25}}}}}}}};
  auto atom = MoleculeData::from_json(coordinates);
  EXPECT_DOUBLE_EQ(0.25, atom->get<Eigen::MatrixXd>("coordinates")(0, 2));

  nlohmann::json scalar = {
      {"version", "0.1.0"},
      {"attributes", {{"title", {{"type", "int"}, {"value", 1.5}}}}}};
  EXPECT_THROW(MoleculeData::from_json(scalar), TypeMismatch);
}

TEST_F(SerializationTest, FilenameSuffixRequired) {
  auto molecule = testing::create_water();
  EXPECT_THROW(molecule->to_json_file("test_h4.json"), std::invalid_argument);
  EXPECT_THROW(molecule->to_hdf5_file("test_h4.structure.h5"),
               std::invalid_argument);
  EXPECT_THROW(MoleculeData::from_json_file("test_h4.json"),
               std::invalid_argument);
  EXPECT_FALSE(std::filesystem::exists("test_h4.json"));

  // to_file imposes no naming convention
  EXPECT_NO_THROW(molecule->to_file("test_h4.json", "json"));
  EXPECT_TRUE(std::filesystem::exists("test_h4.json"));
}

TEST_F(SerializationTest, Hdf5RoundTrip) {
  auto molecule = testing::create_open_shell_h4_cation();
  molecule->set("energy", -1.52);
  molecule->set("dm_full_scf", *molecule->get_dm_full());
  molecule->to_hdf5_file("test_h4.molecule_data.h5");

  auto restored = MoleculeData::from_hdf5_file("test_h4.molecule_data.h5");
  expect_same_molecule(*molecule, *restored, testing::hdf5_tolerance);
  expect_same_orbitals(molecule->get<OrbitalSet>("orb_beta"),
                       restored->get<OrbitalSet>("orb_beta"),
                       testing::hdf5_tolerance);
  EXPECT_DOUBLE_EQ(1.0, restored->get<double>("charge"));
  EXPECT_TRUE(restored->get<Eigen::MatrixXd>("dm_full_scf")
                  .isApprox(molecule->get<Eigen::MatrixXd>("dm_full_scf"),
                            testing::hdf5_tolerance));

  const auto& overlap = restored->get<Eigen::MatrixXd>("overlap");
  EXPECT_NEAR(1.0, (overlap * *restored->get_dm_spin()).trace(),
              testing::density_tolerance);
}

TEST_F(SerializationTest, Hdf5CubeRoundTrip) {
  auto molecule = create_cube_molecule();
  molecule->to_file("test_cube.molecule_data.h5", "hdf5");
  auto restored = MoleculeData::from_file("test_cube.molecule_data.h5", "hdf5");
  expect_same_grid(molecule->get<RealTensor3>("cube_data"),
                   restored->get<RealTensor3>("cube_data"));
  EXPECT_TRUE(molecule->get<IntVector>("numbers") ==
              restored->get<IntVector>("numbers"));
  EXPECT_TRUE(restored->get<Eigen::MatrixXd>("axes").isApprox(
      molecule->get<Eigen::MatrixXd>("axes")));
}

TEST_F(SerializationTest, Hdf5MissingFile) {
  EXPECT_THROW(MoleculeData::from_hdf5_file("missing.molecule_data.h5"),
               std::runtime_error);
}

TEST_F(SerializationTest, UnsupportedType) {
  auto molecule = testing::create_water();
  try {
    molecule->to_file("test_h4.molecule_data.json", "yaml");
    FAIL() << "Expected UnsupportedFormat";
  } catch (const UnsupportedFormat& e) {
    EXPECT_STRING_CONTAINS(e.what(), "yaml");
    EXPECT_STRING_CONTAINS(e.what(), "json, hdf5, xyz");
  }
  EXPECT_THROW(MoleculeData::from_file("test_h4.molecule_data.json", "fchk"),
               std::invalid_argument);
}
