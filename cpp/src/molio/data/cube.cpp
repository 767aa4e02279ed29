// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <molio/data/cube.hpp>
#include <stdexcept>
#include <string>

namespace molio::data {

Cube::Cube(const Eigen::VectorXd& origin, const Eigen::MatrixXd& axes,
           const RealTensor3& data)
    : _origin(origin), _axes(axes), _data(data) {
  if (_origin.size() != 3) {
    throw std::invalid_argument("Cube origin must have length 3, got " +
                                std::to_string(_origin.size()));
  }
  if (_axes.rows() != 3 || _axes.cols() != 3) {
    throw std::invalid_argument("Cube axes must have shape (3, 3), got (" +
                                std::to_string(_axes.rows()) + ", " +
                                std::to_string(_axes.cols()) + ")");
  }
}

std::array<Eigen::Index, 3> Cube::get_shape() const {
  const auto& dims = _data.dimensions();
  return {dims[0], dims[1], dims[2]};
}

Eigen::Vector3d Cube::get_point(Eigen::Index i, Eigen::Index j,
                                Eigen::Index k) const {
  const auto shape = get_shape();
  if (i < 0 || j < 0 || k < 0 || i >= shape[0] || j >= shape[1] ||
      k >= shape[2]) {
    throw std::out_of_range("Grid point index out of range");
  }
  Eigen::Vector3d point = _origin;
  point += static_cast<double>(i) * _axes.row(0).transpose();
  point += static_cast<double>(j) * _axes.row(1).transpose();
  point += static_cast<double>(k) * _axes.row(2).transpose();
  return point;
}

}  // namespace molio::data
