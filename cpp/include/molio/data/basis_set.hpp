// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

namespace H5 {
class Group;
}

#include <Eigen/Dense>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace molio::data {

/// @brief Maximum angular momentum for basis functions supported by molio
inline static constexpr size_t MAX_ORBITAL_ANGULAR_MOMENTUM =
    6;  // Up to i-orbitals

/**
 * @enum OrbitalType
 * @brief Angular momentum of a shell
 */
enum class OrbitalType {
  S = 0,  ///< l=0
  P = 1,  ///< l=1
  D = 2,  ///< l=2
  F = 3,  ///< l=3
  G = 4,  ///< l=4
  H = 5,  ///< l=5
  I = 6   ///< l=6
};

/**
 * @enum BasisType
 * @brief Basis function types (spherical vs cartesian)
 */
enum class BasisType {
  Spherical,  ///< Spherical harmonics (2l+1 functions per shell)
  Cartesian   ///< Cartesian monomials ((l+1)(l+2)/2 functions per shell)
};

/**
 * @brief Convert an orbital type to its letter ("s", "p", ...)
 */
std::string orbital_type_to_string(OrbitalType orbital_type);

/**
 * @brief Convert a shell letter (case-insensitive) to an orbital type
 * @throws std::invalid_argument for an unknown letter
 */
OrbitalType string_to_orbital_type(const std::string& name);

/**
 * @brief Convert an angular momentum quantum number to an orbital type
 * @throws std::invalid_argument when l is outside [0, 6]
 */
OrbitalType angular_momentum_to_orbital_type(int l);

std::string basis_type_to_string(BasisType basis_type);

/**
 * @throws std::invalid_argument unless the name is "spherical" or "cartesian"
 */
BasisType string_to_basis_type(const std::string& name);

/**
 * @struct Shell
 * @brief Contracted shell of Gaussian basis functions centred on one atom
 *
 * Coefficients are the raw, unnormalized contraction coefficients.
 */
struct Shell {
  size_t atom_index = 0ul;  ///< Index of the atom this shell belongs to
  OrbitalType orbital_type = OrbitalType::S;
  Eigen::VectorXd exponents;     ///< Exponents of the primitive Gaussians
  Eigen::VectorXd coefficients;  ///< Contraction coefficients

  Shell(size_t atom_idx, OrbitalType orb_type, const Eigen::VectorXd& exp,
        const Eigen::VectorXd& coeff)
      : atom_index(atom_idx),
        orbital_type(orb_type),
        exponents(exp),
        coefficients(coeff) {
    if (exponents.size() != coefficients.size()) {
      throw std::invalid_argument(
          "Exponents and coefficients must have the same size");
    }
    if (exponents.size() == 0) {
      throw std::invalid_argument("A shell needs at least one primitive");
    }
  }

  size_t get_num_primitives() const { return exponents.size(); }

  /**
   * @brief Get number of basis functions in this shell
   */
  size_t get_num_basis_functions(
      BasisType basis_type = BasisType::Spherical) const {
    size_t l = static_cast<size_t>(orbital_type);
    if (basis_type == BasisType::Spherical) {
      return 2 * l + 1;
    }
    return (l + 1) * (l + 2) / 2;
  }

  int get_angular_momentum() const { return static_cast<int>(orbital_type); }
};

/**
 * @class BasisSetDescriptor
 * @brief Describes an atomic orbital basis set as a list of shells
 *
 * The descriptor carries enough information to count the basis functions and
 * map them onto atoms. It does not evaluate integrals.
 */
class BasisSetDescriptor {
 public:
  /**
   * @brief Constructor
   * @param name Name of the basis set (e.g. "STO-3G")
   * @param shells Shells in basis function order
   * @param basis_type Spherical or cartesian functions
   */
  BasisSetDescriptor(const std::string& name, const std::vector<Shell>& shells,
                     BasisType basis_type = BasisType::Spherical);

  const std::string& get_name() const { return _name; }
  const std::vector<Shell>& get_shells() const { return _shells; }
  size_t get_num_shells() const { return _shells.size(); }
  BasisType get_basis_type() const { return _basis_type; }

  /**
   * @brief Total number of basis functions over all shells
   */
  size_t get_num_basis_functions() const;

  /**
   * @brief Number of atoms the shells refer to (largest atom index + 1)
   */
  size_t get_num_atoms_referenced() const;

  /**
   * @brief Atom index of every basis function
   */
  std::vector<size_t> get_basis_function_to_atom_map() const;

  nlohmann::json to_json() const;
  static BasisSetDescriptor from_json(const nlohmann::json& j);

  /**
   * @brief Write the shells as flat per-shell and per-primitive datasets
   */
  void to_hdf5(H5::Group& group) const;
  static BasisSetDescriptor from_hdf5(H5::Group& group);

 private:
  std::string _name;
  std::vector<Shell> _shells;
  BasisType _basis_type;
};

}  // namespace molio::data
