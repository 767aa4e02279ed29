// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <molio/utils/geometry.hpp>
#include <molio/utils/logger.hpp>
#include <stdexcept>
#include <string>

namespace molio::utils {

double volume(const Eigen::MatrixXd& cellvecs) {
  MOLIO_LOG_TRACE_ENTERING();
  const auto nvecs = cellvecs.rows();
  if (nvecs < 1 || nvecs > 3 || cellvecs.cols() != 3) {
    throw std::invalid_argument(
        "Argument cellvecs should be of shape (x, 3), where x is in {1, 2, "
        "3}. Got (" +
        std::to_string(nvecs) + ", " + std::to_string(cellvecs.cols()) + ")");
  }

  if (nvecs == 1) {
    return cellvecs.row(0).norm();
  }
  if (nvecs == 2) {
    Eigen::Vector3d a = cellvecs.row(0).transpose();
    Eigen::Vector3d b = cellvecs.row(1).transpose();
    return a.cross(b).norm();
  }
  return cellvecs.determinant();
}

void set_four_index_element(Eigen::Tensor<double, 4>& four_index_object,
                            size_t i0, size_t i1, size_t i2, size_t i3,
                            double value) {
  const auto& dims = four_index_object.dimensions();
  for (size_t index : {i0, i1, i2, i3}) {
    for (int axis = 0; axis < 4; ++axis) {
      if (index >= static_cast<size_t>(dims[axis])) {
        throw std::out_of_range("Four-index element index " +
                                std::to_string(index) +
                                " exceeds tensor dimension " +
                                std::to_string(dims[axis]));
      }
    }
  }

  const auto a = static_cast<Eigen::Index>(i0);
  const auto b = static_cast<Eigen::Index>(i1);
  const auto c = static_cast<Eigen::Index>(i2);
  const auto d = static_cast<Eigen::Index>(i3);
  four_index_object(a, b, c, d) = value;
  four_index_object(b, a, d, c) = value;
  four_index_object(c, b, a, d) = value;
  four_index_object(a, d, c, b) = value;
  four_index_object(c, d, a, b) = value;
  four_index_object(d, c, b, a) = value;
  four_index_object(b, c, d, a) = value;
  four_index_object(d, a, b, c) = value;
}

}  // namespace molio::utils
