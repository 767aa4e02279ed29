// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <H5Cpp.h>

#include <cstdlib>
#include <molio/utils/logger.hpp>
#include <molio/utils/string_utils.hpp>
#include <stdexcept>
#include <string>

namespace molio::data {

/**
 * @brief Whether the HDF5 error stack should be kept off stderr
 *
 * Controlled by MOLIO_PRINT_VERBOSE_HDF5_ERRORS; an unparsable value is
 * reported and treated as "not verbose".
 */
inline bool hdf5_errors_should_be_suppressed() {
  const char* env_value = std::getenv("MOLIO_PRINT_VERBOSE_HDF5_ERRORS");
  if (!env_value) {
    return true;
  }
  try {
    return !utils::strtobool(env_value);
  } catch (const std::invalid_argument& e) {
    MOLIO_LOGGER().warn("Ignoring MOLIO_PRINT_VERBOSE_HDF5_ERRORS: {}",
                        e.what());
    return true;
  }
}

inline void configure_hdf5_error_printing() {
  if (hdf5_errors_should_be_suppressed()) {
    H5::Exception::dontPrint();
  }
}

}  // namespace molio::data
