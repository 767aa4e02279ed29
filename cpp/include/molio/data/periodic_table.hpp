// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstdint>
#include <string>

namespace molio::data {

/// @brief Largest atomic number known to the periodic table
inline static constexpr int64_t MAX_ATOMIC_NUMBER = 118;

/**
 * @brief Convert an atomic number to its element symbol
 * @param atomic_number Atomic number in [1, 118]
 * @return Element symbol, e.g. "He"
 * @throws std::invalid_argument if the atomic number is out of range
 */
std::string atomic_number_to_symbol(int64_t atomic_number);

/**
 * @brief Convert an element symbol to its atomic number
 *
 * The symbol is case-insensitive ("HE", "he" and "He" are equivalent).
 *
 * @throws std::invalid_argument if the symbol is unknown
 */
int64_t symbol_to_atomic_number(const std::string& symbol);

/**
 * @brief Normalize the capitalization of an element symbol ("cL" -> "Cl")
 */
std::string fix_symbol_capitalization(const std::string& symbol);

}  // namespace molio::data
