// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <string>
#include <unordered_map>

// Define CODATA version constants
#define MOLIO_CODATA_2022 2022
#define MOLIO_CODATA_2018 2018
#define MOLIO_CODATA_2014 2014

// Set default CODATA version if not specified
#ifndef MOLIO_CODATA_VERSION
#define MOLIO_CODATA_VERSION MOLIO_CODATA_2018
#endif

/**
 * @file constants.hpp
 * @brief Physical constants and unit conversion factors
 *
 * Physical constants from different CODATA standards are organized in
 * version-specific namespaces. The default namespace (molio::constants) pulls
 * in the version selected by MOLIO_CODATA_VERSION (CODATA 2018 unless
 * overridden) and derives from it the conversion factors between common
 * units and the atomic-unit system used for all data stored in molio.
 *
 * The conversion factors are used as follows:
 * - Conversion to atomic units: `double distance = 5 * angstrom;`
 * - Conversion from atomic units: `double in_angstrom = distance / angstrom;`
 */

namespace molio::constants {

/**
 * @brief Documentation metadata for physical constants
 */
struct ConstantInfo {
  std::string name;
  std::string description;
  std::string units;
  std::string source;
  std::string symbol;
  double value;
};

/**
 * @namespace molio::constants::codata_2022
 * @brief CODATA 2022 recommended values for fundamental physical constants
 */
namespace codata_2022 {

static constexpr double bohr_radius = 0.529177210544e-10;       // m
static constexpr double hartree_energy = 4.3597447222060e-18;   // J
static constexpr double hartree_to_ev = 27.211386245981;        // eV/Eh
static constexpr double atomic_unit_of_time = 2.4188843265864e-17;  // s
static constexpr double electron_mass = 9.1093837139e-31;       // kg
static constexpr double avogadro_constant = 6.02214076e23;      // mol^-1

}  // namespace codata_2022

/**
 * @namespace molio::constants::codata_2018
 * @brief CODATA 2018 recommended values for fundamental physical constants
 */
namespace codata_2018 {

static constexpr double bohr_radius = 0.529177210903e-10;       // m
static constexpr double hartree_energy = 4.3597447222071e-18;   // J
static constexpr double hartree_to_ev = 27.211386245988;        // eV/Eh
static constexpr double atomic_unit_of_time = 2.4188843265857e-17;  // s
static constexpr double electron_mass = 9.1093837015e-31;       // kg
static constexpr double avogadro_constant = 6.02214076e23;      // mol^-1

}  // namespace codata_2018

/**
 * @namespace molio::constants::codata_2014
 * @brief CODATA 2014 recommended values for fundamental physical constants
 */
namespace codata_2014 {

static constexpr double bohr_radius = 0.52917721067e-10;        // m
static constexpr double hartree_energy = 4.359744650e-18;       // J
static constexpr double hartree_to_ev = 27.21138602;            // eV/Eh
static constexpr double atomic_unit_of_time = 2.418884326509e-17;  // s
static constexpr double electron_mass = 9.10938356e-31;         // kg
static constexpr double avogadro_constant = 6.022140857e23;     // mol^-1

}  // namespace codata_2014

// Helper to determine current CODATA version in use
constexpr const char* get_current_codata_version() {
#if MOLIO_CODATA_VERSION == MOLIO_CODATA_2022
  return "CODATA 2022";
#elif MOLIO_CODATA_VERSION == MOLIO_CODATA_2018
  return "CODATA 2018";
#elif MOLIO_CODATA_VERSION == MOLIO_CODATA_2014
  return "CODATA 2014";
#else
  static_assert(MOLIO_CODATA_VERSION == MOLIO_CODATA_2022 ||
                    MOLIO_CODATA_VERSION == MOLIO_CODATA_2018 ||
                    MOLIO_CODATA_VERSION == MOLIO_CODATA_2014,
                "Unsupported MOLIO_CODATA_VERSION. Supported versions: "
                "MOLIO_CODATA_2022, MOLIO_CODATA_2018, MOLIO_CODATA_2014");
#endif
}

#if MOLIO_CODATA_VERSION == MOLIO_CODATA_2022
using namespace codata_2022;
#elif MOLIO_CODATA_VERSION == MOLIO_CODATA_2018
using namespace codata_2018;
#elif MOLIO_CODATA_VERSION == MOLIO_CODATA_2014
using namespace codata_2014;
#endif

/// Thermochemical calorie in Joule (exact by definition)
static constexpr double calorie = 4.184;

// Conversion factors into atomic units

/// One Angstrom in Bohr
static constexpr double angstrom = 1e-10 / bohr_radius;
/// One electron volt in Hartree
static constexpr double electronvolt = 1.0 / hartree_to_ev;
/// One meter in Bohr
static constexpr double meter = 1.0 / bohr_radius;
/// One nanometer in Bohr
static constexpr double nanometer = 1e-9 * meter;
/// One second in atomic units of time
static constexpr double second = 1.0 / atomic_unit_of_time;
/// One picosecond in atomic units of time
static constexpr double picosecond = 1e-12 * second;
/// One unified atomic mass unit (not the atomic unit of mass) in electron
/// masses
static constexpr double amu = 1e-3 / (electron_mass * avogadro_constant);
/// One kcal/mol in Hartree
static constexpr double kcalmol =
    1e3 * calorie / avogadro_constant / hartree_energy;
/// One cal/mol in Hartree
static constexpr double calmol = calorie / avogadro_constant / hartree_energy;
/// One kJ/mol in Hartree
static constexpr double kjmol = 1e3 / avogadro_constant / hartree_energy;

static constexpr double bohr_to_angstrom = 1.0 / angstrom;
static constexpr double angstrom_to_bohr = angstrom;

/**
 * @brief Get documentation information for the unit conversion factors
 * @return Map of constant names to their documentation
 *
 * The values reflect the CODATA version selected at compile time.
 */
inline std::unordered_map<std::string, ConstantInfo> get_constants_info() {
  const char* current_version = get_current_codata_version();

  return {{"angstrom",
           {"angstrom", "Angstrom expressed in atomic units of length",
            "bohr/Å", current_version, "Å", angstrom}},
          {"electronvolt",
           {"electronvolt", "Electron volt expressed in Hartree", "Eₕ/eV",
            current_version, "eV", electronvolt}},
          {"meter",
           {"meter", "Meter expressed in atomic units of length", "bohr/m",
            current_version, "m", meter}},
          {"nanometer",
           {"nanometer", "Nanometer expressed in atomic units of length",
            "bohr/nm", current_version, "nm", nanometer}},
          {"second",
           {"second", "Second expressed in atomic units of time", "ℏ/Eₕ per s",
            current_version, "s", second}},
          {"picosecond",
           {"picosecond", "Picosecond expressed in atomic units of time",
            "ℏ/Eₕ per ps", current_version, "ps", picosecond}},
          {"amu",
           {"amu", "Unified atomic mass unit expressed in electron masses",
            "mₑ/u", current_version, "u", amu}},
          {"kcalmol",
           {"kcalmol", "Kilocalorie per mole expressed in Hartree",
            "Eₕ/(kcal⋅mol⁻¹)", current_version, "", kcalmol}},
          {"calmol",
           {"calmol", "Calorie per mole expressed in Hartree",
            "Eₕ/(cal⋅mol⁻¹)", current_version, "", calmol}},
          {"kjmol",
           {"kjmol", "Kilojoule per mole expressed in Hartree",
            "Eₕ/(kJ⋅mol⁻¹)", current_version, "", kjmol}}};
}

}  // namespace molio::constants
