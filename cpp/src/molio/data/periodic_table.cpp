// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <array>
#include <cctype>
#include <molio/data/periodic_table.hpp>
#include <molio/utils/string_utils.hpp>
#include <stdexcept>
#include <unordered_map>

namespace molio::data {

namespace {

// Indexed by atomic number; entry 0 is a placeholder
constexpr std::array<const char*, MAX_ATOMIC_NUMBER + 1> SYMBOLS = {
    "",   "H",  "He", "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne", "Na",
    "Mg", "Al", "Si", "P",  "S",  "Cl", "Ar", "K",  "Ca", "Sc", "Ti", "V",
    "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn", "Ga", "Ge", "As", "Se", "Br",
    "Kr", "Rb", "Sr", "Y",  "Zr", "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag",
    "Cd", "In", "Sn", "Sb", "Te", "I",  "Xe", "Cs", "Ba", "La", "Ce", "Pr",
    "Nd", "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb", "Lu",
    "Hf", "Ta", "W",  "Re", "Os", "Ir", "Pt", "Au", "Hg", "Tl", "Pb", "Bi",
    "Po", "At", "Rn", "Fr", "Ra", "Ac", "Th", "Pa", "U",  "Np", "Pu", "Am",
    "Cm", "Bk", "Cf", "Es", "Fm", "Md", "No", "Lr", "Rf", "Db", "Sg", "Bh",
    "Hs", "Mt", "Ds", "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og"};

const std::unordered_map<std::string, int64_t>& symbol_lookup() {
  static const std::unordered_map<std::string, int64_t> lookup = []() {
    std::unordered_map<std::string, int64_t> result;
    for (int64_t z = 1; z <= MAX_ATOMIC_NUMBER; ++z) {
      result.emplace(SYMBOLS[z], z);
    }
    return result;
  }();
  return lookup;
}

}  // namespace

std::string atomic_number_to_symbol(int64_t atomic_number) {
  if (atomic_number < 1 || atomic_number > MAX_ATOMIC_NUMBER) {
    throw std::invalid_argument("Unknown atomic number: " +
                                std::to_string(atomic_number));
  }
  return SYMBOLS[atomic_number];
}

int64_t symbol_to_atomic_number(const std::string& symbol) {
  const auto& lookup = symbol_lookup();
  auto it = lookup.find(fix_symbol_capitalization(symbol));
  if (it == lookup.end()) {
    throw std::invalid_argument("Unknown element symbol: " + symbol);
  }
  return it->second;
}

std::string fix_symbol_capitalization(const std::string& symbol) {
  if (symbol.empty()) {
    return symbol;
  }
  std::string fixed = utils::to_lower(symbol);
  fixed[0] =
      static_cast<char>(std::toupper(static_cast<unsigned char>(fixed[0])));
  return fixed;
}

}  // namespace molio::data
