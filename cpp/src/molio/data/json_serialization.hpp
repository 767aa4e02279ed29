// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <molio/data/types.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <tuple>

namespace molio::data {

/**
 * @file json_serialization.hpp
 * @brief JSON conversion helpers for Eigen arrays and version checks
 *
 * Matrices are written as arrays of rows; rank-3 tensors as nested arrays
 * indexed [i][j][k].
 */

/**
 * @brief Validate serialization version compatibility
 * @param expected_version The version string this code writes (e.g. "0.1.0")
 * @param found_version The version string found in the serialized data
 * @throws std::runtime_error if major or minor version mismatch
 */
void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version);

/**
 * @brief Parse "major.minor.patch" into its components
 * @throws std::runtime_error if the version string format is invalid
 */
std::tuple<int, int, int> parse_version_string(
    const std::string& version_string);

nlohmann::json matrix_to_json(const Eigen::MatrixXd& matrix);
nlohmann::json matrix_to_json(const IntMatrix& matrix);
nlohmann::json vector_to_json(const Eigen::VectorXd& vector);
nlohmann::json vector_to_json(const IntVector& vector);
nlohmann::json tensor_to_json(const RealTensor3& tensor);

/**
 * @brief Convert an array of equally long rows to a real matrix
 * @throws std::invalid_argument for ragged or non-array input
 */
Eigen::MatrixXd json_to_matrix(const nlohmann::json& j);
IntMatrix json_to_int_matrix(const nlohmann::json& j);
Eigen::VectorXd json_to_vector(const nlohmann::json& j);
IntVector json_to_int_vector(const nlohmann::json& j);

/**
 * @brief Convert a nested [i][j][k] array to a rank-3 tensor
 * @throws std::invalid_argument for ragged or non-array input
 */
RealTensor3 json_to_tensor(const nlohmann::json& j);

}  // namespace molio::data
