// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <H5Cpp.h>

#include <molio/data/orbital_set.hpp>
#include <molio/utils/string_utils.hpp>
#include <stdexcept>

#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace molio::data {

std::string spin_to_string(Spin spin) {
  return spin == Spin::Alpha ? "alpha" : "beta";
}

Spin string_to_spin(const std::string& name) {
  const std::string lowered = utils::to_lower(name);
  if (lowered == "alpha") {
    return Spin::Alpha;
  }
  if (lowered == "beta") {
    return Spin::Beta;
  }
  throw std::invalid_argument("Unknown spin channel: " + name);
}

OrbitalSet::OrbitalSet(const Eigen::MatrixXd& coefficients,
                       const Eigen::VectorXd& occupations, Spin spin,
                       const std::optional<Eigen::VectorXd>& energies)
    : _coefficients(coefficients),
      _occupations(occupations),
      _spin(spin),
      _energies(energies) {
  if (_coefficients.size() == 0) {
    throw std::invalid_argument("Coefficient matrix cannot be empty");
  }
  if (_occupations.size() != _coefficients.cols()) {
    throw std::invalid_argument(
        "Occupation vector size must match number of molecular orbitals");
  }
  if (_energies.has_value() && _energies->size() != _coefficients.cols()) {
    throw std::invalid_argument(
        "Energy vector size must match number of molecular orbitals");
  }
}

const Eigen::VectorXd& OrbitalSet::get_energies() const {
  if (!_energies.has_value()) {
    throw std::runtime_error("Orbital energies not set");
  }
  return *_energies;
}

OrbitalSet OrbitalSet::with_spin(Spin spin) const {
  OrbitalSet copy(*this);
  copy._spin = spin;
  return copy;
}

Eigen::MatrixXd OrbitalSet::calculate_density_matrix() const {
  // P = C * n * C^T, n the diagonal matrix of occupations
  return _coefficients * _occupations.asDiagonal() * _coefficients.transpose();
}

nlohmann::json OrbitalSet::to_json() const {
  nlohmann::json j;
  j["spin"] = spin_to_string(_spin);
  j["coefficients"] = matrix_to_json(_coefficients);
  j["occupations"] = vector_to_json(_occupations);
  if (_energies.has_value()) {
    j["energies"] = vector_to_json(*_energies);
  }
  return j;
}

OrbitalSet OrbitalSet::from_json(const nlohmann::json& j) {
  try {
    if (!j.contains("coefficients") || !j.contains("occupations")) {
      throw std::runtime_error(
          "Orbital set JSON requires 'coefficients' and 'occupations'");
    }
    Spin spin = j.contains("spin")
                    ? string_to_spin(j["spin"].get<std::string>())
                    : Spin::Alpha;
    std::optional<Eigen::VectorXd> energies;
    if (j.contains("energies")) {
      energies = json_to_vector(j["energies"]);
    }
    return OrbitalSet(json_to_matrix(j["coefficients"]),
                      json_to_vector(j["occupations"]), spin, energies);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
  }
}

void OrbitalSet::to_hdf5(H5::Group& group) const {
  try {
    write_string_attribute(group, "spin", spin_to_string(_spin));
    save_matrix_to_group(group, "coefficients", _coefficients);
    save_vector_to_group(group, "occupations", _occupations);
    if (_energies.has_value()) {
      save_vector_to_group(group, "energies", *_energies);
    }
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error while writing orbital set: " +
                             std::string(e.getCDetailMsg()));
  }
}

OrbitalSet OrbitalSet::from_hdf5(H5::Group& group) {
  try {
    Spin spin = group.attrExists("spin")
                    ? string_to_spin(read_string_attribute(group, "spin"))
                    : Spin::Alpha;
    std::optional<Eigen::VectorXd> energies;
    if (dataset_exists_in_group(group, "energies")) {
      energies = load_vector_from_group(group, "energies");
    }
    return OrbitalSet(load_matrix_from_group(group, "coefficients"),
                      load_vector_from_group(group, "occupations"), spin,
                      energies);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error while reading orbital set: " +
                             std::string(e.getCDetailMsg()));
  }
}

}  // namespace molio::data
