// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

namespace H5 {
class Group;
}

#include <concepts>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace molio::data {

/**
 * @brief Base interface for molio data classes
 *
 * Data classes can describe themselves and persist themselves to JSON, HDF5
 * and, where the class supports it, other file formats.
 */
class DataClass {
 public:
  virtual ~DataClass() = default;

  /**
   * @brief Get the data type name for this class
   *
   * Used for file naming conventions ("<stem>.<data_type>.<ext>").
   *
   * @return Data type name (e.g. "molecule_data")
   */
  virtual std::string get_data_type_name() const = 0;

  /**
   * @brief Get a human-readable summary of the object
   */
  virtual std::string get_summary() const = 0;

  /**
   * @brief Save object to file in the specified format
   * @param filename Path to the output file
   * @param type Format type (e.g. "json", "hdf5", "xyz")
   * @throws UnsupportedFormat if the format type is not supported
   * @throws std::runtime_error if an I/O error occurs
   */
  virtual void to_file(const std::string& filename,
                       const std::string& type) const = 0;

  virtual nlohmann::json to_json() const = 0;

  /**
   * @brief Save object to a JSON file
   * @throws std::invalid_argument if the filename lacks the data type suffix
   */
  virtual void to_json_file(const std::string& filename) const = 0;

  virtual void to_hdf5(H5::Group& group) const = 0;

  /**
   * @brief Save object to an HDF5 file
   * @throws std::invalid_argument if the filename lacks the data type suffix
   */
  virtual void to_hdf5_file(const std::string& filename) const = 0;

 protected:
  DataClass() = default;
  DataClass(const DataClass& other) = default;
  DataClass& operator=(const DataClass& other) = default;
  DataClass(DataClass&& other) = default;
  DataClass& operator=(DataClass&& other) = default;
};

/**
 * @brief Concept to enforce inheritance of DataClass and presence of
 * static deserialization methods
 */
template <typename T>
concept DataClassCompliant = std::derived_from<T, DataClass> && requires {
  T::from_file(std::declval<std::string>(), std::declval<std::string>());
} && requires { T::from_json_file(std::declval<std::string>()); } && requires {
  T::from_json(std::declval<nlohmann::json>());
} && requires { T::from_hdf5_file(std::declval<std::string>()); } && requires {
  T::from_hdf5(std::declval<H5::Group&>());
};

}  // namespace molio::data
