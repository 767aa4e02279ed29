// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

namespace H5 {
class Group;
}

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace molio::data {

/**
 * @enum Spin
 * @brief Spin channel an orbital set describes
 */
enum class Spin { Alpha, Beta };

/**
 * @brief Convert a spin label to "alpha" or "beta"
 */
std::string spin_to_string(Spin spin);

/**
 * @brief Parse "alpha" or "beta" (case-insensitive)
 * @throws std::invalid_argument for any other string
 */
Spin string_to_spin(const std::string& name);

/**
 * @class OrbitalSet
 * @brief Molecular orbitals of one spin channel
 *
 * Stores the expansion coefficients of the molecular orbitals in the atomic
 * orbital basis (one column per orbital), the per-spin occupation numbers and
 * optionally the orbital energies.
 *
 * A container that only holds an alpha set describes a restricted
 * closed-shell state: the beta orbitals and occupations are taken to be
 * identical to the alpha ones.
 */
class OrbitalSet {
 public:
  /**
   * @brief Constructor
   * @param coefficients Matrix (n_atomic_orbitals x n_molecular_orbitals)
   * @param occupations Occupation of each molecular orbital for this spin
   * @param spin Spin channel
   * @param energies Orbital energies in Hartree (optional)
   * @throws std::invalid_argument if the sizes are inconsistent
   */
  OrbitalSet(const Eigen::MatrixXd& coefficients,
             const Eigen::VectorXd& occupations, Spin spin = Spin::Alpha,
             const std::optional<Eigen::VectorXd>& energies = std::nullopt);

  OrbitalSet(const OrbitalSet& other) = default;
  OrbitalSet(OrbitalSet&& other) noexcept = default;
  OrbitalSet& operator=(const OrbitalSet& other) = default;
  OrbitalSet& operator=(OrbitalSet&& other) noexcept = default;

  const Eigen::MatrixXd& get_coefficients() const { return _coefficients; }
  const Eigen::VectorXd& get_occupations() const { return _occupations; }
  Spin get_spin() const { return _spin; }

  bool has_energies() const { return _energies.has_value(); }

  /**
   * @throws std::runtime_error if no energies were supplied
   */
  const Eigen::VectorXd& get_energies() const;

  size_t get_num_atomic_orbitals() const {
    return static_cast<size_t>(_coefficients.rows());
  }

  size_t get_num_molecular_orbitals() const {
    return static_cast<size_t>(_coefficients.cols());
  }

  /**
   * @brief Sum of the occupation numbers
   */
  double get_num_electrons() const { return _occupations.sum(); }

  /**
   * @brief Copy of this set relabelled with another spin channel
   */
  OrbitalSet with_spin(Spin spin) const;

  /**
   * @brief AO density matrix of this channel, P = C diag(n) C^T
   */
  Eigen::MatrixXd calculate_density_matrix() const;

  /**
   * @brief Convert to a JSON object with spin, coefficients, occupations and
   * (when present) energies
   */
  nlohmann::json to_json() const;

  /**
   * @throws std::runtime_error if required fields are missing or malformed
   */
  static OrbitalSet from_json(const nlohmann::json& j);

  /**
   * @brief Write the orbital set into an HDF5 group
   * @throws std::runtime_error on HDF5 errors
   */
  void to_hdf5(H5::Group& group) const;

  static OrbitalSet from_hdf5(H5::Group& group);

 private:
  Eigen::MatrixXd _coefficients;
  Eigen::VectorXd _occupations;
  Spin _spin;
  std::optional<Eigen::VectorXd> _energies;
};

}  // namespace molio::data
