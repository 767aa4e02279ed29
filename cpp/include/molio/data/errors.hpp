// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace molio::data {

/**
 * @brief Exception thrown when one or more attributes violate their
 * shape, element type or cross-attribute consistency contract
 *
 * The offending attribute keys are available through get_keys().
 */
class TypeMismatch : public std::runtime_error {
 public:
  TypeMismatch(const std::vector<std::string>& keys,
               const std::string& reason)
      : std::runtime_error(_format(keys, reason)),
        _keys(keys),
        _reason(reason) {}

  TypeMismatch(const std::string& key, const std::string& reason)
      : TypeMismatch(std::vector<std::string>{key}, reason) {}

  /**
   * @brief Keys of the attributes that failed validation
   */
  const std::vector<std::string>& get_keys() const noexcept { return _keys; }

  /**
   * @brief Description of the violated contract, without the key prefix
   */
  const std::string& get_reason() const noexcept { return _reason; }

 private:
  std::vector<std::string> _keys;
  std::string _reason;

  static std::string _format(const std::vector<std::string>& keys,
                             const std::string& reason) {
    std::string joined;
    for (const auto& key : keys) {
      if (!joined.empty()) joined += ", ";
      joined += "'" + key + "'";
    }
    return "Type mismatch for attribute(s) " + joined + ": " + reason;
  }
};

/**
 * @brief Exception thrown when an absent attribute is requested
 */
class AttributeNotFound : public std::runtime_error {
 public:
  explicit AttributeNotFound(const std::string& key)
      : std::runtime_error("Attribute not present: " + key) {}
};

/**
 * @brief Exception thrown when a file does not have the expected structure
 *
 * The message is prefixed with "filename:lineno".
 */
class FileFormatError : public std::runtime_error {
 public:
  FileFormatError(const std::string& filename, size_t lineno,
                  const std::string& message)
      : std::runtime_error(filename + ":" + std::to_string(lineno) + " " +
                           message),
        _filename(filename),
        _lineno(lineno) {}

  const std::string& get_filename() const noexcept { return _filename; }
  size_t get_lineno() const noexcept { return _lineno; }

 private:
  std::string _filename;
  size_t _lineno;
};

/**
 * @brief Non-fatal problem encountered (and worked around) while reading a
 * file
 */
struct FileFormatWarning {
  std::string filename;  ///< File being read
  size_t lineno = 0;     ///< Line number at the time of the warning
  std::string message;   ///< Description of the problem

  /**
   * @brief Warning text prefixed with "filename:lineno"
   */
  std::string to_string() const {
    return filename + ":" + std::to_string(lineno) + " " + message;
  }
};

/**
 * @brief Exception thrown when a numeric result lies outside its physically
 * valid range
 */
class ValueRangeError : public std::range_error {
 public:
  explicit ValueRangeError(const std::string& message)
      : std::range_error(message) {}
};

/**
 * @brief Exception thrown when a file type or extension is not recognized
 */
class UnsupportedFormat : public std::invalid_argument {
 public:
  explicit UnsupportedFormat(const std::string& format)
      : std::invalid_argument("Unsupported file format: " + format +
                              ". Supported types are: json, hdf5, xyz") {}
};

/**
 * @brief Exception thrown when a container cannot be written in the
 * requested format
 */
class PrepareDumpError : public std::runtime_error {
 public:
  explicit PrepareDumpError(const std::string& message)
      : std::runtime_error(message) {}
};

}  // namespace molio::data
