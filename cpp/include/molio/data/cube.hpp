// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <array>
#include <molio/data/types.hpp>

namespace molio::data {

/**
 * @class Cube
 * @brief Volumetric data on a uniform grid, as found in cube files
 *
 * The grid point (i, j, k) sits at origin + i * axes.row(0) +
 * j * axes.row(1) + k * axes.row(2). All lengths are in Bohr.
 *
 * The class is immutable after construction.
 */
class Cube {
 public:
  /**
   * @brief Construct a cube from its frame and grid values
   * @param origin Vector of length 3 with the origin of the axes frame
   * @param axes (3, 3) matrix whose rows are the spacings between two
   * neighbouring grid points along the first, second and third axis
   * @param data Rank-3 array of grid values
   * @throws std::invalid_argument if origin or axes have the wrong shape
   */
  Cube(const Eigen::VectorXd& origin, const Eigen::MatrixXd& axes,
       const RealTensor3& data);

  Cube(const Cube& other) = default;
  Cube(Cube&& other) noexcept = default;
  Cube& operator=(const Cube& other) = default;
  Cube& operator=(Cube&& other) noexcept = default;

  const Eigen::VectorXd& get_origin() const { return _origin; }
  const Eigen::MatrixXd& get_axes() const { return _axes; }
  const RealTensor3& get_data() const { return _data; }

  /**
   * @brief Shape of the rectangular grid
   */
  std::array<Eigen::Index, 3> get_shape() const;

  /**
   * @brief Cartesian position of a grid point
   */
  Eigen::Vector3d get_point(Eigen::Index i, Eigen::Index j,
                            Eigen::Index k) const;

 private:
  Eigen::VectorXd _origin;
  Eigen::MatrixXd _axes;
  RealTensor3 _data;
};

}  // namespace molio::data
