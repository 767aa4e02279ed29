// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cctype>
#include <molio/utils/string_utils.hpp>
#include <stdexcept>
#include <unordered_map>

namespace molio::utils {

static const std::unordered_map<std::string, bool> STRTOBOOL = {
    {"y", true},  {"yes", true}, {"t", true},     {"true", true},
    {"on", true}, {"1", true},   {"n", false},    {"no", false},
    {"f", false}, {"false", false}, {"off", false}, {"0", false}};

std::string to_lower(const std::string& input) {
  std::string result(input);
  std::transform(
      result.begin(), result.end(), result.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

bool strtobool(const std::string& value) {
  auto it = STRTOBOOL.find(to_lower(value));
  if (it == STRTOBOOL.end()) {
    throw std::invalid_argument("'" + value +
                                "' cannot be converted to boolean");
  }
  return it->second;
}

}  // namespace molio::utils
