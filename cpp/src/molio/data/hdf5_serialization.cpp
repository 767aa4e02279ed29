// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "hdf5_serialization.hpp"

#include <stdexcept>

namespace molio::data {

namespace {

template <typename Matrix>
void save_dense_matrix(H5::Group& group, const std::string& dataset_name,
                       const Matrix& matrix) {
  using Scalar = typename Matrix::Scalar;
  using RowMajor = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic,
                                 Eigen::RowMajor>;
  const RowMajor row_major = matrix;
  hsize_t dims[2] = {static_cast<hsize_t>(matrix.rows()),
                     static_cast<hsize_t>(matrix.cols())};
  H5::DataSpace dataspace(2, dims);
  H5::DataSet dataset = group.createDataSet(
      dataset_name, h5_pred_type<Scalar>::value(), dataspace);
  if (row_major.size() > 0) {
    dataset.write(row_major.data(), h5_pred_type<Scalar>::value());
  }
}

template <typename Matrix>
Matrix load_dense_matrix(H5::Group& group, const std::string& dataset_name) {
  using Scalar = typename Matrix::Scalar;
  using RowMajor = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic,
                                 Eigen::RowMajor>;
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 2) {
    throw std::runtime_error("Dataset '" + dataset_name +
                             "' is not two-dimensional");
  }
  hsize_t dims[2];
  dataspace.getSimpleExtentDims(dims);
  RowMajor row_major(static_cast<Eigen::Index>(dims[0]),
                     static_cast<Eigen::Index>(dims[1]));
  if (row_major.size() > 0) {
    dataset.read(row_major.data(), h5_pred_type<Scalar>::value());
  }
  return row_major;
}

template <typename Vector>
void save_dense_vector(H5::Group& group, const std::string& dataset_name,
                       const Vector& vector) {
  using Scalar = typename Vector::Scalar;
  hsize_t dims[1] = {static_cast<hsize_t>(vector.size())};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset = group.createDataSet(
      dataset_name, h5_pred_type<Scalar>::value(), dataspace);
  if (vector.size() > 0) {
    dataset.write(vector.data(), h5_pred_type<Scalar>::value());
  }
}

template <typename Vector>
Vector load_dense_vector(H5::Group& group, const std::string& dataset_name) {
  using Scalar = typename Vector::Scalar;
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 1) {
    throw std::runtime_error("Dataset '" + dataset_name +
                             "' is not one-dimensional");
  }
  hsize_t dims[1];
  dataspace.getSimpleExtentDims(dims);
  Vector vector(static_cast<Eigen::Index>(dims[0]));
  if (vector.size() > 0) {
    dataset.read(vector.data(), h5_pred_type<Scalar>::value());
  }
  return vector;
}

}  // namespace

void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXd& matrix) {
  save_dense_matrix(group, dataset_name, matrix);
}

void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const IntMatrix& matrix) {
  save_dense_matrix(group, dataset_name, matrix);
}

void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::VectorXd& vector) {
  save_dense_vector(group, dataset_name, vector);
}

void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const IntVector& vector) {
  save_dense_vector(group, dataset_name, vector);
}

void save_tensor_to_group(H5::Group& group, const std::string& dataset_name,
                          const RealTensor3& tensor) {
  // Eigen tensors are column-major; shuffle to C order before writing
  const auto& dims = tensor.dimensions();
  Eigen::Tensor<double, 3, Eigen::RowMajor> row_major =
      tensor.swap_layout().shuffle(Eigen::array<Eigen::Index, 3>{2, 1, 0});
  hsize_t h5_dims[3] = {static_cast<hsize_t>(dims[0]),
                        static_cast<hsize_t>(dims[1]),
                        static_cast<hsize_t>(dims[2])};
  H5::DataSpace dataspace(3, h5_dims);
  H5::DataSet dataset = group.createDataSet(
      dataset_name, H5::PredType::NATIVE_DOUBLE, dataspace);
  if (row_major.size() > 0) {
    dataset.write(row_major.data(), H5::PredType::NATIVE_DOUBLE);
  }
}

Eigen::MatrixXd load_matrix_from_group(H5::Group& group,
                                       const std::string& dataset_name) {
  return load_dense_matrix<Eigen::MatrixXd>(group, dataset_name);
}

IntMatrix load_int_matrix_from_group(H5::Group& group,
                                     const std::string& dataset_name) {
  return load_dense_matrix<IntMatrix>(group, dataset_name);
}

Eigen::VectorXd load_vector_from_group(H5::Group& group,
                                       const std::string& dataset_name) {
  return load_dense_vector<Eigen::VectorXd>(group, dataset_name);
}

IntVector load_int_vector_from_group(H5::Group& group,
                                     const std::string& dataset_name) {
  return load_dense_vector<IntVector>(group, dataset_name);
}

RealTensor3 load_tensor_from_group(H5::Group& group,
                                   const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 3) {
    throw std::runtime_error("Dataset '" + dataset_name +
                             "' is not three-dimensional");
  }
  hsize_t dims[3];
  dataspace.getSimpleExtentDims(dims);
  Eigen::Tensor<double, 3, Eigen::RowMajor> row_major(
      static_cast<Eigen::Index>(dims[0]), static_cast<Eigen::Index>(dims[1]),
      static_cast<Eigen::Index>(dims[2]));
  if (row_major.size() > 0) {
    dataset.read(row_major.data(), H5::PredType::NATIVE_DOUBLE);
  }
  RealTensor3 tensor =
      row_major.swap_layout().shuffle(Eigen::array<Eigen::Index, 3>{2, 1, 0});
  return tensor;
}

void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value) {
  H5::DataSpace scalar_space(H5S_SCALAR);
  H5::StrType string_type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::Attribute attribute =
      object.createAttribute(name, string_type, scalar_space);
  attribute.write(string_type, value);
}

std::string read_string_attribute(const H5::H5Object& object,
                                  const std::string& name) {
  H5::StrType string_type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::Attribute attribute = object.openAttribute(name);
  std::string value;
  attribute.read(string_type, value);
  return value;
}

int get_dataset_rank(H5::Group& group, const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  return dataset.getSpace().getSimpleExtentNdims();
}

bool dataset_is_integer(H5::Group& group, const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  return dataset.getTypeClass() == H5T_INTEGER;
}

bool dataset_exists_in_group(H5::Group& group,
                             const std::string& dataset_name) {
  return group.nameExists(dataset_name);
}

bool group_exists_in_group(H5::Group& group, const std::string& group_name) {
  return group.nameExists(group_name);
}

}  // namespace molio::data
