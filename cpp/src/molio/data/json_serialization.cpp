// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "json_serialization.hpp"

#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>

namespace molio::data {

namespace {

template <typename Scalar>
Scalar json_to_scalar(const nlohmann::json& j) {
  if constexpr (std::is_integral_v<Scalar>) {
    if (!j.is_number_integer()) {
      throw std::invalid_argument("Expected an integer element, got " +
                                  j.dump());
    }
  }
  return j.get<Scalar>();
}

template <typename Matrix>
nlohmann::json dense_matrix_to_json(const Matrix& matrix) {
  nlohmann::json j = nlohmann::json::array();
  for (Eigen::Index row = 0; row < matrix.rows(); ++row) {
    nlohmann::json row_array = nlohmann::json::array();
    for (Eigen::Index col = 0; col < matrix.cols(); ++col) {
      row_array.push_back(matrix(row, col));
    }
    j.push_back(row_array);
  }
  return j;
}

template <typename Matrix>
Matrix json_to_dense_matrix(const nlohmann::json& j) {
  using Scalar = typename Matrix::Scalar;
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for matrix conversion");
  }
  const Eigen::Index rows = static_cast<Eigen::Index>(j.size());
  const Eigen::Index cols =
      rows > 0 ? static_cast<Eigen::Index>(j[0].size()) : 0;

  Matrix matrix(rows, cols);
  for (Eigen::Index row = 0; row < rows; ++row) {
    if (!j[row].is_array() ||
        static_cast<Eigen::Index>(j[row].size()) != cols) {
      throw std::invalid_argument(
          "All rows must have the same length for matrix conversion");
    }
    for (Eigen::Index col = 0; col < cols; ++col) {
      matrix(row, col) = json_to_scalar<Scalar>(j[row][col]);
    }
  }
  return matrix;
}

template <typename Vector>
Vector json_to_dense_vector(const nlohmann::json& j) {
  using Scalar = typename Vector::Scalar;
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for vector conversion");
  }
  Vector vector(static_cast<Eigen::Index>(j.size()));
  for (Eigen::Index i = 0; i < vector.size(); ++i) {
    vector(i) = json_to_scalar<Scalar>(j[i]);
  }
  return vector;
}

}  // namespace

nlohmann::json matrix_to_json(const Eigen::MatrixXd& matrix) {
  return dense_matrix_to_json(matrix);
}

nlohmann::json matrix_to_json(const IntMatrix& matrix) {
  return dense_matrix_to_json(matrix);
}

nlohmann::json vector_to_json(const Eigen::VectorXd& vector) {
  return nlohmann::json(
      std::vector<double>(vector.data(), vector.data() + vector.size()));
}

nlohmann::json vector_to_json(const IntVector& vector) {
  return nlohmann::json(
      std::vector<int64_t>(vector.data(), vector.data() + vector.size()));
}

nlohmann::json tensor_to_json(const RealTensor3& tensor) {
  const auto& dims = tensor.dimensions();
  nlohmann::json j = nlohmann::json::array();
  for (Eigen::Index i = 0; i < dims[0]; ++i) {
    nlohmann::json plane = nlohmann::json::array();
    for (Eigen::Index k = 0; k < dims[1]; ++k) {
      nlohmann::json line = nlohmann::json::array();
      for (Eigen::Index l = 0; l < dims[2]; ++l) {
        line.push_back(tensor(i, k, l));
      }
      plane.push_back(line);
    }
    j.push_back(plane);
  }
  return j;
}

Eigen::MatrixXd json_to_matrix(const nlohmann::json& j) {
  return json_to_dense_matrix<Eigen::MatrixXd>(j);
}

IntMatrix json_to_int_matrix(const nlohmann::json& j) {
  return json_to_dense_matrix<IntMatrix>(j);
}

Eigen::VectorXd json_to_vector(const nlohmann::json& j) {
  return json_to_dense_vector<Eigen::VectorXd>(j);
}

IntVector json_to_int_vector(const nlohmann::json& j) {
  return json_to_dense_vector<IntVector>(j);
}

RealTensor3 json_to_tensor(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for tensor conversion");
  }
  const Eigen::Index n0 = static_cast<Eigen::Index>(j.size());
  const Eigen::Index n1 = n0 > 0 ? static_cast<Eigen::Index>(j[0].size()) : 0;
  const Eigen::Index n2 =
      n1 > 0 ? static_cast<Eigen::Index>(j[0][0].size()) : 0;

  RealTensor3 tensor(n0, n1, n2);
  for (Eigen::Index i = 0; i < n0; ++i) {
    if (!j[i].is_array() || static_cast<Eigen::Index>(j[i].size()) != n1) {
      throw std::invalid_argument("Ragged array in tensor conversion");
    }
    for (Eigen::Index k = 0; k < n1; ++k) {
      const auto& line = j[i][k];
      if (!line.is_array() || static_cast<Eigen::Index>(line.size()) != n2) {
        throw std::invalid_argument("Ragged array in tensor conversion");
      }
      for (Eigen::Index l = 0; l < n2; ++l) {
        tensor(i, k, l) = line[l].get<double>();
      }
    }
  }
  return tensor;
}

std::tuple<int, int, int> parse_version_string(
    const std::string& version_string) {
  std::size_t first_dot = version_string.find('.');
  std::size_t second_dot = first_dot == std::string::npos
                               ? std::string::npos
                               : version_string.find('.', first_dot + 1);

  if (first_dot == std::string::npos || second_dot == std::string::npos) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }

  try {
    int major = std::stoi(version_string.substr(0, first_dot));
    int minor = std::stoi(
        version_string.substr(first_dot + 1, second_dot - first_dot - 1));
    int patch = std::stoi(version_string.substr(second_dot + 1));
    return std::make_tuple(major, minor, patch);
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }
}

void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version) {
  if (expected_version == found_version) {
    return;
  }

  auto [expected_major, expected_minor, expected_patch] =
      parse_version_string(expected_version);
  auto [found_major, found_minor, found_patch] =
      parse_version_string(found_version);

  if (expected_major != found_major || expected_minor != found_minor) {
    throw std::runtime_error("Serialization version mismatch. Expected: " +
                             expected_version + ", Found: " + found_version +
                             ". Only patch version differences are "
                             "compatible.");
  }
}

}  // namespace molio::data
