// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <unsupported/Eigen/CXX11/Tensor>

namespace molio::data {

/// Integer-valued rank-1 array
using IntVector = Eigen::Matrix<int64_t, Eigen::Dynamic, 1>;

/// Integer-valued rank-2 array
using IntMatrix = Eigen::Matrix<int64_t, Eigen::Dynamic, Eigen::Dynamic>;

/// Real-valued rank-3 array (volumetric grid data)
using RealTensor3 = Eigen::Tensor<double, 3>;

}  // namespace molio::data
