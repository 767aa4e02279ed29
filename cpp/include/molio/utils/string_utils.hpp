// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <string>

namespace molio::utils {

/**
 * @brief Convert a PascalCase/camelCase string to snake_case at runtime
 *
 * Examples:
 * - "MoleculeData" -> "molecule_data"
 * - "Cube" -> "cube"
 */
inline std::string to_snake_case(const char* input) {
  std::string result;
  for (std::size_t i = 0; input[i] != '\0'; ++i) {
    char c = input[i];
    if (c >= 'A' && c <= 'Z') {
      if (i > 0) {
        result += '_';
      }
      result += static_cast<char>(c + 32);
    } else {
      result += c;
    }
  }
  return result;
}

/**
 * @brief Lower-case copy of an ASCII string
 */
std::string to_lower(const std::string& input);

/**
 * @brief Interpret a string as a boolean
 *
 * The comparison is case-insensitive. Accepted tokens are
 * y, yes, t, true, on, 1 (true) and n, no, f, false, off, 0 (false).
 *
 * @param value Token to interpret
 * @return The boolean value of the token
 * @throws std::invalid_argument if the token is not recognized
 */
bool strtobool(const std::string& value);

/**
 * @def DATACLASS_TO_SNAKE_CASE
 * @brief Macro to generate snake_case data type name from a class name
 *
 * The conversion happens once per call site due to the static local variable.
 */
#define DATACLASS_TO_SNAKE_CASE(ClassName)        \
  ([]() -> const char* {                          \
    static const std::string result =             \
        molio::utils::to_snake_case(#ClassName);  \
    return result.c_str();                        \
  }())

}  // namespace molio::utils
