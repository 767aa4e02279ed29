// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <molio/data/cube.hpp>

#include "ut_common.hpp"

using namespace molio::data;

class CubeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    origin = Eigen::VectorXd(3);
    origin << 1.0, 2.0, 3.0;
    axes = Eigen::MatrixXd::Zero(3, 3);
    axes(0, 0) = 0.5;
    axes(1, 0) = 0.1;
    axes(1, 1) = 0.5;
    axes(2, 2) = 0.25;
    grid = RealTensor3(2, 3, 4);
    grid.setZero();
    grid(1, 2, 3) = 0.125;
  }

  Eigen::VectorXd origin;
  Eigen::MatrixXd axes;
  RealTensor3 grid;
};

TEST_F(CubeTest, Accessors) {
  Cube cube(origin, axes, grid);
  const auto shape = cube.get_shape();
  EXPECT_EQ(2, shape[0]);
  EXPECT_EQ(3, shape[1]);
  EXPECT_EQ(4, shape[2]);
  EXPECT_DOUBLE_EQ(0.125, cube.get_data()(1, 2, 3));
  EXPECT_TRUE(origin.isApprox(cube.get_origin()));
  EXPECT_TRUE(axes.isApprox(cube.get_axes()));
}

TEST_F(CubeTest, GridPoints) {
  Cube cube(origin, axes, grid);
  Eigen::Vector3d point = cube.get_point(1, 2, 3);
  EXPECT_NEAR(1.0 + 0.5 + 0.2, point(0), testing::numerical_zero_tolerance);
  EXPECT_NEAR(2.0 + 1.0, point(1), testing::numerical_zero_tolerance);
  EXPECT_NEAR(3.0 + 0.75, point(2), testing::numerical_zero_tolerance);

  EXPECT_TRUE(cube.get_point(0, 0, 0).isApprox(Eigen::Vector3d(1.0, 2.0, 3.0)));
  EXPECT_THROW(cube.get_point(2, 0, 0), std::out_of_range);
  EXPECT_THROW(cube.get_point(0, -1, 0), std::out_of_range);
}

TEST_F(CubeTest, InvalidShapes) {
  Eigen::VectorXd short_origin = Eigen::VectorXd::Zero(2);
  EXPECT_THROW(Cube(short_origin, axes, grid), std::invalid_argument);
  Eigen::MatrixXd flat_axes = Eigen::MatrixXd::Identity(2, 3);
  EXPECT_THROW(Cube(origin, flat_axes, grid), std::invalid_argument);
}
