// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <molio/constants.hpp>
#include <molio/io/formats.hpp>
#include <molio/io/xyz.hpp>

#include "ut_common.hpp"

using namespace molio::data;
using namespace molio::io;

class FormatsTest : public ::testing::Test {
 protected:
  void SetUp() override { remove_files(); }
  void TearDown() override { remove_files(); }

  void remove_files() {
    for (const auto& name : files) {
      std::filesystem::remove(name);
    }
  }

  void write_file(const std::string& filename, const std::string& content) {
    std::ofstream file(filename);
    file << content;
  }

  const std::vector<std::string> files = {
      "test_water.xyz", "test_water.json", "test_water.h5",
      "test_input.xyz", "test_water.txt",  "test_empty.xyz"};
};

TEST_F(FormatsTest, GuessFormat) {
  EXPECT_EQ("json", guess_format("water.json"));
  EXPECT_EQ("hdf5", guess_format("water.h5"));
  EXPECT_EQ("hdf5", guess_format("data/water.HDF5"));
  EXPECT_EQ("xyz", guess_format("water.molecule_data.xyz"));
  EXPECT_THROW(guess_format("water.fchk"), UnsupportedFormat);
  EXPECT_THROW(guess_format("water"), UnsupportedFormat);
  EXPECT_THROW(guess_format("data.dir/water"), UnsupportedFormat);
}

TEST_F(FormatsTest, LoadXyz) {
  write_file("test_input.xyz",
             "3\n"
             "water molecule  \n"
             "O   0.000000  -0.075792   0.000000\n"
             "h   0.866812   0.601436   0.000000\n"
             "1  -0.866812   0.601436   0.000000\n"
             "\n");
  auto molecule = load_xyz("test_input.xyz");
  EXPECT_EQ("water molecule", molecule->get<std::string>("title"));

  const auto& numbers = molecule->get<IntVector>("numbers");
  ASSERT_EQ(3, numbers.size());
  EXPECT_EQ(8, numbers(0));
  EXPECT_EQ(1, numbers(1));
  EXPECT_EQ(1, numbers(2));

  const auto& coordinates = molecule->get<Eigen::MatrixXd>("coordinates");
  EXPECT_NEAR(0.866812 * molio::constants::angstrom, coordinates(1, 0),
              testing::plain_text_tolerance);
  EXPECT_NEAR(-0.075792 * molio::constants::angstrom, coordinates(0, 1),
              testing::plain_text_tolerance);
}

TEST_F(FormatsTest, LoadXyzIgnoresTrailingContent) {
  write_file("test_input.xyz",
             "1\n"
             "\n"
             "He 0.0 0.0 0.0\n"
             "this line is not an atom\n");
  auto molecule = load_xyz("test_input.xyz");
  EXPECT_EQ(1u, *molecule->get_num_atoms());
  EXPECT_EQ("", molecule->get<std::string>("title"));
}

TEST_F(FormatsTest, LoadXyzErrors) {
  write_file("test_input.xyz", "three\ntitle\n");
  try {
    load_xyz("test_input.xyz");
    FAIL() << "Expected FileFormatError";
  } catch (const FileFormatError& e) {
    EXPECT_EQ(1u, e.get_lineno());
    EXPECT_STRING_CONTAINS(e.what(), "number of atoms");
  }

  write_file("test_input.xyz", "2\ntitle\nH 0.0 0.0 0.0\nH 0.0 0.74\n");
  try {
    load_xyz("test_input.xyz");
    FAIL() << "Expected FileFormatError";
  } catch (const FileFormatError& e) {
    EXPECT_EQ(4u, e.get_lineno());
    EXPECT_EQ("test_input.xyz", e.get_filename());
  }

  write_file("test_input.xyz", "2\ntitle\nH 0.0 0.0 0.0\n");
  EXPECT_THROW(load_xyz("test_input.xyz"), FileFormatError);

  write_file("test_input.xyz", "1\ntitle\nQq 0.0 0.0 0.0\n");
  EXPECT_THROW(load_xyz("test_input.xyz"), FileFormatError);

  write_file("test_empty.xyz", "");
  EXPECT_THROW(load_xyz("test_empty.xyz"), FileFormatError);

  EXPECT_THROW(load_xyz("missing.xyz"), std::runtime_error);
}

TEST_F(FormatsTest, LoadXyzHugeAtomCount) {
  write_file("test_input.xyz",
             "100000000000000\n"
             "truncated\n"
             "H 0.0 0.0 0.0\n");
  try {
    load_xyz("test_input.xyz");
    FAIL() << "Expected FileFormatError";
  } catch (const FileFormatError& e) {
    EXPECT_EQ(3u, e.get_lineno());
    EXPECT_STRING_CONTAINS(e.what(), "found 1");
  }
}

TEST_F(FormatsTest, LoadXyzAtomicNumberLabels) {
  write_file("test_input.xyz", "1\ntitle\n1H 0.0 0.0 0.0\n");
  try {
    load_xyz("test_input.xyz");
    FAIL() << "Expected FileFormatError";
  } catch (const FileFormatError& e) {
    EXPECT_EQ(3u, e.get_lineno());
    EXPECT_STRING_CONTAINS(e.what(), "1H");
  }

  write_file("test_input.xyz", "1\ntitle\n6.5 0.0 0.0 0.0\n");
  EXPECT_THROW(load_xyz("test_input.xyz"), FileFormatError);

  write_file("test_input.xyz", "1\ntitle\n26 0.0 0.0 0.0\n");
  EXPECT_EQ(26, load_xyz("test_input.xyz")->get<IntVector>("numbers")(0));
}

TEST_F(FormatsTest, XyzRoundTrip) {
  auto water = testing::create_water();
  dump_xyz(*water, "test_water.xyz");
  auto restored = load_xyz("test_water.xyz");

  EXPECT_EQ("water", restored->get<std::string>("title"));
  EXPECT_TRUE(water->get<IntVector>("numbers") ==
              restored->get<IntVector>("numbers"));
  const Eigen::MatrixXd difference =
      water->get<Eigen::MatrixXd>("coordinates") -
      restored->get<Eigen::MatrixXd>("coordinates");
  EXPECT_LT(difference.cwiseAbs().maxCoeff(), testing::plain_text_tolerance);
}

TEST_F(FormatsTest, DumpXyzDefaultTitle) {
  auto water = testing::create_water();
  water->unset("title");
  dump_xyz(*water, "test_water.xyz");

  std::ifstream file("test_water.xyz");
  std::string count_line, title_line;
  std::getline(file, count_line);
  std::getline(file, title_line);
  EXPECT_EQ("3", count_line);
  EXPECT_EQ("Created with molio", title_line);
}

TEST_F(FormatsTest, DumpXyzRequiresAtoms) {
  MoleculeData no_atoms(AttributeMap{{"energy", -1.0}});
  EXPECT_THROW(dump_xyz(no_atoms, "test_water.xyz"), PrepareDumpError);

  auto water = testing::create_water();
  water->unset("coordinates");
  EXPECT_THROW(dump_one(*water, "test_water.xyz"), PrepareDumpError);
  EXPECT_FALSE(std::filesystem::exists("test_water.xyz"));
}

TEST_F(FormatsTest, LoadOneAndDumpOne) {
  auto molecule = testing::create_restricted_h4();
  for (const std::string filename : {"test_water.json", "test_water.h5"}) {
    dump_one(*molecule, filename);
    auto restored = load_one(filename);
    EXPECT_EQ(molecule->keys(), restored->keys()) << filename;
    EXPECT_TRUE(restored->get_dm_full()->isApprox(*molecule->get_dm_full(),
                                                  1e-10))
        << filename;
  }
}

TEST_F(FormatsTest, UnknownExtension) {
  auto water = testing::create_water();
  EXPECT_THROW(dump_one(*water, "test_water.txt"), UnsupportedFormat);
  EXPECT_FALSE(std::filesystem::exists("test_water.txt"));
  write_file("test_water.txt", "3\n");
  EXPECT_THROW(load_one("test_water.txt"), UnsupportedFormat);
}
