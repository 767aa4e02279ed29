// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <H5Cpp.h>

#include <algorithm>
#include <molio/data/basis_set.hpp>
#include <molio/utils/string_utils.hpp>

#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace molio::data {

std::string orbital_type_to_string(OrbitalType orbital_type) {
  switch (orbital_type) {
    case OrbitalType::S:
      return "s";
    case OrbitalType::P:
      return "p";
    case OrbitalType::D:
      return "d";
    case OrbitalType::F:
      return "f";
    case OrbitalType::G:
      return "g";
    case OrbitalType::H:
      return "h";
    case OrbitalType::I:
      return "i";
  }
  throw std::invalid_argument("Unknown orbital type");
}

OrbitalType string_to_orbital_type(const std::string& name) {
  const std::string lowered = utils::to_lower(name);
  for (int l = 0; l <= static_cast<int>(MAX_ORBITAL_ANGULAR_MOMENTUM); ++l) {
    auto orbital_type = static_cast<OrbitalType>(l);
    if (orbital_type_to_string(orbital_type) == lowered) {
      return orbital_type;
    }
  }
  throw std::invalid_argument("Unknown orbital type: " + name);
}

OrbitalType angular_momentum_to_orbital_type(int l) {
  if (l < 0 || l > static_cast<int>(MAX_ORBITAL_ANGULAR_MOMENTUM)) {
    throw std::invalid_argument("Unsupported angular momentum: " +
                                std::to_string(l));
  }
  return static_cast<OrbitalType>(l);
}

std::string basis_type_to_string(BasisType basis_type) {
  return basis_type == BasisType::Spherical ? "spherical" : "cartesian";
}

BasisType string_to_basis_type(const std::string& name) {
  const std::string lowered = utils::to_lower(name);
  if (lowered == "spherical") {
    return BasisType::Spherical;
  }
  if (lowered == "cartesian") {
    return BasisType::Cartesian;
  }
  throw std::invalid_argument("Unknown basis type: " + name);
}

BasisSetDescriptor::BasisSetDescriptor(const std::string& name,
                                       const std::vector<Shell>& shells,
                                       BasisType basis_type)
    : _name(name), _shells(shells), _basis_type(basis_type) {}

size_t BasisSetDescriptor::get_num_basis_functions() const {
  size_t total = 0;
  for (const auto& shell : _shells) {
    total += shell.get_num_basis_functions(_basis_type);
  }
  return total;
}

size_t BasisSetDescriptor::get_num_atoms_referenced() const {
  if (_shells.empty()) {
    return 0;
  }
  auto it = std::max_element(
      _shells.begin(), _shells.end(), [](const Shell& a, const Shell& b) {
        return a.atom_index < b.atom_index;
      });
  return it->atom_index + 1;
}

std::vector<size_t> BasisSetDescriptor::get_basis_function_to_atom_map()
    const {
  std::vector<size_t> mapping;
  mapping.reserve(get_num_basis_functions());
  for (const auto& shell : _shells) {
    mapping.insert(mapping.end(), shell.get_num_basis_functions(_basis_type),
                   shell.atom_index);
  }
  return mapping;
}

nlohmann::json BasisSetDescriptor::to_json() const {
  nlohmann::json j;
  j["name"] = _name;
  j["basis_type"] = basis_type_to_string(_basis_type);
  j["shells"] = nlohmann::json::array();
  for (const auto& shell : _shells) {
    nlohmann::json shell_json;
    shell_json["atom_index"] = shell.atom_index;
    shell_json["orbital_type"] = orbital_type_to_string(shell.orbital_type);
    shell_json["exponents"] = vector_to_json(shell.exponents);
    shell_json["coefficients"] = vector_to_json(shell.coefficients);
    j["shells"].push_back(shell_json);
  }
  return j;
}

BasisSetDescriptor BasisSetDescriptor::from_json(const nlohmann::json& j) {
  try {
    if (!j.contains("shells") || !j["shells"].is_array()) {
      throw std::runtime_error("Basis set JSON requires a 'shells' array");
    }
    std::vector<Shell> shells;
    shells.reserve(j["shells"].size());
    for (const auto& shell_json : j["shells"]) {
      shells.emplace_back(
          shell_json.at("atom_index").get<size_t>(),
          string_to_orbital_type(
              shell_json.at("orbital_type").get<std::string>()),
          json_to_vector(shell_json.at("exponents")),
          json_to_vector(shell_json.at("coefficients")));
    }
    return BasisSetDescriptor(
        j.value("name", std::string()), shells,
        string_to_basis_type(j.value("basis_type", std::string("spherical"))));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
  }
}

void BasisSetDescriptor::to_hdf5(H5::Group& group) const {
  try {
    write_string_attribute(group, "name", _name);
    write_string_attribute(group, "basis_type",
                           basis_type_to_string(_basis_type));

    const Eigen::Index num_shells = static_cast<Eigen::Index>(_shells.size());
    IntVector atom_indices(num_shells);
    IntVector angular_momenta(num_shells);
    IntVector num_primitives(num_shells);
    Eigen::Index total_primitives = 0;
    for (Eigen::Index i = 0; i < num_shells; ++i) {
      const auto& shell = _shells[i];
      atom_indices(i) = static_cast<int64_t>(shell.atom_index);
      angular_momenta(i) = shell.get_angular_momentum();
      num_primitives(i) = static_cast<int64_t>(shell.get_num_primitives());
      total_primitives += num_primitives(i);
    }

    Eigen::VectorXd exponents(total_primitives);
    Eigen::VectorXd coefficients(total_primitives);
    Eigen::Index offset = 0;
    for (const auto& shell : _shells) {
      const Eigen::Index n = shell.exponents.size();
      exponents.segment(offset, n) = shell.exponents;
      coefficients.segment(offset, n) = shell.coefficients;
      offset += n;
    }

    save_vector_to_group(group, "atom_indices", atom_indices);
    save_vector_to_group(group, "angular_momenta", angular_momenta);
    save_vector_to_group(group, "num_primitives", num_primitives);
    save_vector_to_group(group, "exponents", exponents);
    save_vector_to_group(group, "coefficients", coefficients);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error while writing basis set: " +
                             std::string(e.getCDetailMsg()));
  }
}

BasisSetDescriptor BasisSetDescriptor::from_hdf5(H5::Group& group) {
  try {
    const std::string name = read_string_attribute(group, "name");
    const BasisType basis_type =
        string_to_basis_type(read_string_attribute(group, "basis_type"));
    IntVector atom_indices = load_int_vector_from_group(group, "atom_indices");
    IntVector angular_momenta =
        load_int_vector_from_group(group, "angular_momenta");
    IntVector num_primitives =
        load_int_vector_from_group(group, "num_primitives");
    Eigen::VectorXd exponents = load_vector_from_group(group, "exponents");
    Eigen::VectorXd coefficients =
        load_vector_from_group(group, "coefficients");

    if (angular_momenta.size() != atom_indices.size() ||
        num_primitives.size() != atom_indices.size() ||
        num_primitives.sum() != exponents.size() ||
        coefficients.size() != exponents.size()) {
      throw std::runtime_error("Inconsistent shell data in HDF5 basis set");
    }

    std::vector<Shell> shells;
    shells.reserve(atom_indices.size());
    Eigen::Index offset = 0;
    for (Eigen::Index i = 0; i < atom_indices.size(); ++i) {
      const Eigen::Index n = num_primitives(i);
      shells.emplace_back(
          static_cast<size_t>(atom_indices(i)),
          angular_momentum_to_orbital_type(
              static_cast<int>(angular_momenta(i))),
          exponents.segment(offset, n), coefficients.segment(offset, n));
      offset += n;
    }
    return BasisSetDescriptor(name, shells, basis_type);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error while reading basis set: " +
                             std::string(e.getCDetailMsg()));
  }
}

}  // namespace molio::data
