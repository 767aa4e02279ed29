// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <stdexcept>
#include <string>

namespace molio::data {

/**
 * @brief Utility for handling data structure type in filenames
 *
 * Data class files are named "<stem>.<data_type>.<extension>", e.g.
 * "water.molecule_data.json".
 */
class DataTypeFilename {
 public:
  /**
   * @brief Validate filename has the correct data type suffix
   * @param filename Filename to validate (e.g. "water.molecule_data.h5")
   * @param data_type Expected data type (e.g. "molecule_data")
   * @return The original filename if valid
   * @throws std::invalid_argument if the data type suffix is missing or wrong
   */
  static std::string validate_suffix(const std::string& filename,
                                     const std::string& data_type) {
    size_t last_dot = filename.find_last_of('.');
    if (last_dot == std::string::npos) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' must have '." + data_type + "' suffix");
    }

    std::string base = filename.substr(0, last_dot);
    size_t second_last_dot = base.find_last_of('.');
    if (second_last_dot == std::string::npos) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' must have '." + data_type +
                                  ".' before the file extension");
    }

    std::string file_data_type = base.substr(second_last_dot + 1);
    if (file_data_type != data_type) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' has wrong data type '" + file_data_type +
                                  "', expected '" + data_type + "'");
    }
    return filename;
  }

  static std::string validate_write_suffix(const std::string& filename,
                                           const std::string& data_type) {
    return validate_suffix(filename, data_type);
  }

  static std::string validate_read_suffix(const std::string& filename,
                                          const std::string& data_type) {
    return validate_suffix(filename, data_type);
  }
};

}  // namespace molio::data
