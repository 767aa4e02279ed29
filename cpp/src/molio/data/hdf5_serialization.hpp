// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <molio/data/types.hpp>
#include <string>
#include <vector>

namespace molio::data {

/**
 * @file hdf5_serialization.hpp
 * @brief HDF5 group-based serialization helpers
 *
 * Rank-2 and rank-3 datasets are stored in C (row-major) order so that the
 * files read naturally from h5py and other C-ordered consumers.
 */

/**
 * @brief Template struct for mapping C++ types to HDF5 predefined types.
 */
template <typename T>
struct h5_pred_type;

#define DECLARE_H5_PRED_TYPE(type, pred_type) \
  template <>                                 \
  struct h5_pred_type<type> {                 \
    static auto value() { return pred_type; } \
  };

DECLARE_H5_PRED_TYPE(int, H5::PredType::NATIVE_INT)
DECLARE_H5_PRED_TYPE(int64_t, H5::PredType::NATIVE_INT64)
DECLARE_H5_PRED_TYPE(uint64_t, H5::PredType::NATIVE_UINT64)
DECLARE_H5_PRED_TYPE(double, H5::PredType::NATIVE_DOUBLE)

#undef DECLARE_H5_PRED_TYPE

// Eigen array operations with groups
void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXd& matrix);
void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const IntMatrix& matrix);
void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::VectorXd& vector);
void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const IntVector& vector);
void save_tensor_to_group(H5::Group& group, const std::string& dataset_name,
                          const RealTensor3& tensor);
Eigen::MatrixXd load_matrix_from_group(H5::Group& group,
                                       const std::string& dataset_name);
IntMatrix load_int_matrix_from_group(H5::Group& group,
                                     const std::string& dataset_name);
Eigen::VectorXd load_vector_from_group(H5::Group& group,
                                       const std::string& dataset_name);
IntVector load_int_vector_from_group(H5::Group& group,
                                     const std::string& dataset_name);
RealTensor3 load_tensor_from_group(H5::Group& group,
                                   const std::string& dataset_name);

// Scalars and strings, stored as attributes
void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value);
std::string read_string_attribute(const H5::H5Object& object,
                                  const std::string& name);

template <typename T>
void write_scalar_attribute(H5::H5Object& object, const std::string& name,
                            const T& value) {
  H5::DataSpace scalar_space(H5S_SCALAR);
  H5::Attribute attribute =
      object.createAttribute(name, h5_pred_type<T>::value(), scalar_space);
  attribute.write(h5_pred_type<T>::value(), &value);
}

template <typename T>
T read_scalar_attribute(const H5::H5Object& object, const std::string& name) {
  H5::Attribute attribute = object.openAttribute(name);
  T value{};
  attribute.read(h5_pred_type<T>::value(), &value);
  return value;
}

/**
 * @brief Number of dimensions of a dataset
 */
int get_dataset_rank(H5::Group& group, const std::string& dataset_name);

/**
 * @brief Whether the dataset stores integer values
 */
bool dataset_is_integer(H5::Group& group, const std::string& dataset_name);

bool dataset_exists_in_group(H5::Group& group, const std::string& dataset_name);
bool group_exists_in_group(H5::Group& group, const std::string& group_name);

}  // namespace molio::data
