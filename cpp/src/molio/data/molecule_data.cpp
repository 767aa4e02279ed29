// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <H5Cpp.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <molio/data/molecule_data.hpp>
#include <molio/io/xyz.hpp>
#include <molio/utils/density_matrix.hpp>
#include <molio/utils/logger.hpp>
#include <set>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace molio::data {

static_assert(DataClassCompliant<MoleculeData>,
              "MoleculeData must satisfy the DataClass interface");

namespace {

enum class AttributeKind {
  String,
  RealScalar,
  IntVector,
  RealVector,
  RealMatrix,
  RealTensor3,
  Orbitals,
  BasisSet
};

/// Attributes whose leading dimension must agree
enum class ShapeGroup { None, Atoms, Basis };

struct AttributeSpec {
  AttributeKind kind;
  ShapeGroup group = ShapeGroup::None;
  Eigen::Index rows = -1;  ///< required rows (or length), -1 for any
  Eigen::Index cols = -1;  ///< required columns, -1 for any
  Eigen::Index max_rows = -1;
  bool square = false;
};

const std::vector<std::string> DM_FULL_KEYS = {
    "dm_full",    "dm_full_mp2", "dm_full_mp3",
    "dm_full_cc", "dm_full_ci",  "dm_full_scf"};

const std::vector<std::string> DM_SPIN_KEYS = {
    "dm_spin",    "dm_spin_mp2", "dm_spin_mp3",
    "dm_spin_cc", "dm_spin_ci",  "dm_spin_scf"};

const std::map<std::string, AttributeSpec>& attribute_specs() {
  static const std::map<std::string, AttributeSpec> specs = []() {
    std::map<std::string, AttributeSpec> result;
    result["title"] = {AttributeKind::String};
    result["energy"] = {AttributeKind::RealScalar};
    result["charge"] = {AttributeKind::RealScalar};
    result["nelec"] = {AttributeKind::RealScalar};
    result["coordinates"] = {AttributeKind::RealMatrix, ShapeGroup::Atoms, -1,
                             3};
    result["numbers"] = {AttributeKind::IntVector, ShapeGroup::Atoms};
    result["pseudo_numbers"] = {AttributeKind::RealVector, ShapeGroup::Atoms};
    result["masses"] = {AttributeKind::RealVector, ShapeGroup::Atoms};
    result["cellvecs"] = {AttributeKind::RealMatrix, ShapeGroup::None, -1, 3,
                          3};
    result["cube_data"] = {AttributeKind::RealTensor3};
    result["origin"] = {AttributeKind::RealVector, ShapeGroup::None, 3};
    result["axes"] = {AttributeKind::RealMatrix, ShapeGroup::None, 3, 3};
    result["obasis"] = {AttributeKind::BasisSet, ShapeGroup::Basis};
    result["orb_alpha"] = {AttributeKind::Orbitals, ShapeGroup::Basis};
    result["orb_beta"] = {AttributeKind::Orbitals, ShapeGroup::Basis};
    const AttributeSpec ao_matrix = {AttributeKind::RealMatrix,
                                     ShapeGroup::Basis, -1, -1, -1, true};
    result["overlap"] = ao_matrix;
    for (const auto& key : DM_FULL_KEYS) {
      result[key] = ao_matrix;
    }
    for (const auto& key : DM_SPIN_KEYS) {
      result[key] = ao_matrix;
    }
    return result;
  }();
  return specs;
}

const AttributeSpec& get_spec(const std::string& key) {
  const auto& specs = attribute_specs();
  auto it = specs.find(key);
  if (it == specs.end()) {
    throw TypeMismatch(key, "unknown attribute");
  }
  return it->second;
}

/// Human-readable name of the alternative held by a value
std::string describe_type(const AttributeValue& value) {
  static const char* names[] = {
      "integer scalar",       "real scalar",          "string",
      "integer rank-1 array", "real rank-1 array",    "integer rank-2 array",
      "real rank-2 array",    "real rank-3 array",    "orbital set",
      "basis set descriptor"};
  return names[value.index()];
}

std::string shape_string(Eigen::Index rows, Eigen::Index cols) {
  return "(" + std::to_string(rows) + ", " + std::to_string(cols) + ")";
}

[[noreturn]] void reject(const std::string& key, const std::string& expected,
                         const AttributeValue& value) {
  throw TypeMismatch(key,
                     "expected " + expected + ", got " + describe_type(value));
}

double coerce_real_scalar(const std::string& key,
                          const AttributeValue& value) {
  if (const auto* real = std::get_if<double>(&value)) {
    return *real;
  }
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    return static_cast<double>(*integer);
  }
  reject(key, "a real scalar", value);
}

Eigen::VectorXd coerce_real_vector(const std::string& key,
                                   const AttributeValue& value) {
  if (const auto* real = std::get_if<Eigen::VectorXd>(&value)) {
    return *real;
  }
  if (const auto* integer = std::get_if<IntVector>(&value)) {
    return integer->cast<double>();
  }
  reject(key, "a real rank-1 array", value);
}

IntVector coerce_int_vector(const std::string& key,
                            const AttributeValue& value) {
  if (const auto* integer = std::get_if<IntVector>(&value)) {
    return *integer;
  }
  if (const auto* real = std::get_if<Eigen::VectorXd>(&value)) {
    constexpr double limit =
        static_cast<double>(std::numeric_limits<int64_t>::max());
    for (Eigen::Index i = 0; i < real->size(); ++i) {
      const double element = (*real)(i);
      if (!std::isfinite(element) || std::floor(element) != element ||
          std::abs(element) >= limit) {
        throw TypeMismatch(key, "element " + std::to_string(i) + " (" +
                                    std::to_string(element) +
                                    ") is not an integer");
      }
    }
    return real->cast<int64_t>();
  }
  reject(key, "an integer rank-1 array", value);
}

Eigen::MatrixXd coerce_real_matrix(const std::string& key,
                                   const AttributeValue& value) {
  if (const auto* real = std::get_if<Eigen::MatrixXd>(&value)) {
    return *real;
  }
  if (const auto* integer = std::get_if<IntMatrix>(&value)) {
    return integer->cast<double>();
  }
  reject(key, "a real rank-2 array", value);
}

void check_vector_length(const std::string& key, const AttributeSpec& spec,
                         Eigen::Index length) {
  if (spec.rows >= 0 && length != spec.rows) {
    throw TypeMismatch(key, "expected length " + std::to_string(spec.rows) +
                                ", got " + std::to_string(length));
  }
}

void check_matrix_shape(const std::string& key, const AttributeSpec& spec,
                        const Eigen::MatrixXd& matrix) {
  const Eigen::Index rows = matrix.rows();
  const Eigen::Index cols = matrix.cols();
  if ((spec.rows >= 0 && rows != spec.rows) ||
      (spec.cols >= 0 && cols != spec.cols)) {
    throw TypeMismatch(key, "expected shape " +
                                shape_string(spec.rows, spec.cols) +
                                " (-1 for any), got " +
                                shape_string(rows, cols));
  }
  if (spec.max_rows >= 0 && (rows < 1 || rows > spec.max_rows)) {
    throw TypeMismatch(key, "expected between 1 and " +
                                std::to_string(spec.max_rows) +
                                " rows, got " + std::to_string(rows));
  }
  if (spec.square && rows != cols) {
    throw TypeMismatch(key, "expected a square matrix, got shape " +
                                shape_string(rows, cols));
  }
}

/// Leading dimension of an attribute within its shape group
size_t group_extent(const AttributeValue& value) {
  return std::visit(
      [](const auto& typed) -> size_t {
        using ValueType = std::decay_t<decltype(typed)>;
        if constexpr (std::is_same_v<ValueType, OrbitalSet>) {
          return typed.get_num_atomic_orbitals();
        } else if constexpr (std::is_same_v<ValueType, BasisSetDescriptor>) {
          return typed.get_num_basis_functions();
        } else if constexpr (std::is_same_v<ValueType, Eigen::MatrixXd> ||
                             std::is_same_v<ValueType, IntMatrix>) {
          return static_cast<size_t>(typed.rows());
        } else if constexpr (std::is_same_v<ValueType, Eigen::VectorXd> ||
                             std::is_same_v<ValueType, IntVector>) {
          return static_cast<size_t>(typed.size());
        } else {
          return 0;
        }
      },
      value);
}

/// Extents of the present members of a shape group, keyed by attribute
std::map<std::string, size_t> collect_extents(const AttributeMap& attributes,
                                              ShapeGroup group) {
  std::map<std::string, size_t> extents;
  for (const auto& [key, value] : attributes) {
    if (get_spec(key).group == group) {
      extents.emplace(key, group_extent(value));
    }
  }
  return extents;
}

std::string describe_extents(const std::map<std::string, size_t>& extents) {
  std::string joined;
  for (const auto& [key, extent] : extents) {
    if (!joined.empty()) joined += ", ";
    joined += key + "=" + std::to_string(extent);
  }
  return joined;
}

bool extents_agree(const std::map<std::string, size_t>& extents) {
  return std::adjacent_find(extents.begin(), extents.end(),
                            [](const auto& a, const auto& b) {
                              return a.second != b.second;
                            }) == extents.end();
}

bool invalidates_density_caches(const std::string& key) {
  return key.rfind("orb_", 0) == 0 || key.rfind("dm_", 0) == 0;
}

std::string describe_value(const AttributeValue& value) {
  return std::visit(
      [](const auto& typed) -> std::string {
        using ValueType = std::decay_t<decltype(typed)>;
        std::ostringstream oss;
        if constexpr (std::is_same_v<ValueType, std::string>) {
          oss << "\"" << typed << "\"";
        } else if constexpr (std::is_same_v<ValueType, double> ||
                             std::is_same_v<ValueType, int64_t>) {
          oss << std::setprecision(10) << typed;
        } else if constexpr (std::is_same_v<ValueType, Eigen::VectorXd> ||
                             std::is_same_v<ValueType, IntVector>) {
          oss << "array (" << typed.size() << ")";
        } else if constexpr (std::is_same_v<ValueType, Eigen::MatrixXd> ||
                             std::is_same_v<ValueType, IntMatrix>) {
          oss << "array " << shape_string(typed.rows(), typed.cols());
        } else if constexpr (std::is_same_v<ValueType, RealTensor3>) {
          const auto& dims = typed.dimensions();
          oss << "array (" << dims[0] << ", " << dims[1] << ", " << dims[2]
              << ")";
        } else if constexpr (std::is_same_v<ValueType, OrbitalSet>) {
          oss << spin_to_string(typed.get_spin()) << " orbitals ("
              << typed.get_num_atomic_orbitals() << " basis functions, "
              << typed.get_num_molecular_orbitals() << " orbitals, "
              << typed.get_num_electrons() << " electrons)";
        } else if constexpr (std::is_same_v<ValueType, BasisSetDescriptor>) {
          oss << "basis '" << typed.get_name() << "' ("
              << typed.get_num_shells() << " shells, "
              << typed.get_num_basis_functions() << " functions)";
        }
        return oss.str();
      },
      value);
}

/// Type tags used in the JSON representation, indexed like AttributeValue
const std::vector<std::string> JSON_TYPE_TAGS = {
    "int",         "real",       "string",      "int_vector",
    "real_vector", "int_matrix", "real_matrix", "real_tensor3",
    "orbital_set", "basis_set"};

nlohmann::json value_to_json(const AttributeValue& value) {
  return std::visit(
      [](const auto& typed) -> nlohmann::json {
        using ValueType = std::decay_t<decltype(typed)>;
        if constexpr (std::is_same_v<ValueType, RealTensor3>) {
          return tensor_to_json(typed);
        } else if constexpr (std::is_same_v<ValueType, Eigen::MatrixXd> ||
                             std::is_same_v<ValueType, IntMatrix>) {
          return matrix_to_json(typed);
        } else if constexpr (std::is_same_v<ValueType, Eigen::VectorXd> ||
                             std::is_same_v<ValueType, IntVector>) {
          return vector_to_json(typed);
        } else if constexpr (std::is_same_v<ValueType, OrbitalSet> ||
                             std::is_same_v<ValueType, BasisSetDescriptor>) {
          return typed.to_json();
        } else {
          return nlohmann::json(typed);
        }
      },
      value);
}

bool holds_only_integers(const nlohmann::json& j) {
  if (j.is_array()) {
    for (const auto& element : j) {
      if (!holds_only_integers(element)) return false;
    }
    return true;
  }
  return j.is_number_integer();
}

/// Integer tags carrying non-integral numbers decode to the real alternative,
/// leaving the integrality decision to the attribute contract.
AttributeValue value_from_json(const std::string& tag,
                               const nlohmann::json& j) {
  const bool integral = holds_only_integers(j);
  if (tag == "int") {
    if (integral) return j.get<int64_t>();
    return j.get<double>();
  }
  if (tag == "real") return j.get<double>();
  if (tag == "string") return j.get<std::string>();
  if (tag == "int_vector") {
    if (integral) return json_to_int_vector(j);
    return json_to_vector(j);
  }
  if (tag == "real_vector") return json_to_vector(j);
  if (tag == "int_matrix") {
    if (integral) return json_to_int_matrix(j);
    return json_to_matrix(j);
  }
  if (tag == "real_matrix") return json_to_matrix(j);
  if (tag == "real_tensor3") return json_to_tensor(j);
  if (tag == "orbital_set") return OrbitalSet::from_json(j);
  if (tag == "basis_set") return BasisSetDescriptor::from_json(j);
  throw std::runtime_error("Unknown attribute type in JSON: " + tag);
}

void write_hdf5_value(H5::Group& group, const std::string& key,
                      const AttributeValue& value) {
  std::visit(
      [&group, &key](const auto& typed) {
        using ValueType = std::decay_t<decltype(typed)>;
        if constexpr (std::is_same_v<ValueType, std::string>) {
          write_string_attribute(group, key, typed);
        } else if constexpr (std::is_same_v<ValueType, double> ||
                             std::is_same_v<ValueType, int64_t>) {
          write_scalar_attribute(group, key, typed);
        } else if constexpr (std::is_same_v<ValueType, Eigen::VectorXd> ||
                             std::is_same_v<ValueType, IntVector>) {
          save_vector_to_group(group, key, typed);
        } else if constexpr (std::is_same_v<ValueType, Eigen::MatrixXd> ||
                             std::is_same_v<ValueType, IntMatrix>) {
          save_matrix_to_group(group, key, typed);
        } else if constexpr (std::is_same_v<ValueType, RealTensor3>) {
          save_tensor_to_group(group, key, typed);
        } else {
          H5::Group subgroup = group.createGroup(key);
          typed.to_hdf5(subgroup);
        }
      },
      value);
}

/// Read an attribute stored by write_hdf5_value(), if present
std::optional<AttributeValue> read_hdf5_value(H5::Group& group,
                                              const std::string& key,
                                              const AttributeSpec& spec) {
  switch (spec.kind) {
    case AttributeKind::String:
      if (!group.attrExists(key)) return std::nullopt;
      return read_string_attribute(group, key);
    case AttributeKind::RealScalar:
      if (!group.attrExists(key)) return std::nullopt;
      return read_scalar_attribute<double>(group, key);
    default:
      break;
  }

  if (!group.nameExists(key)) {
    return std::nullopt;
  }
  switch (spec.kind) {
    case AttributeKind::IntVector:
      if (dataset_is_integer(group, key)) {
        return load_int_vector_from_group(group, key);
      }
      return load_vector_from_group(group, key);
    case AttributeKind::RealVector:
      return load_vector_from_group(group, key);
    case AttributeKind::RealMatrix:
      return load_matrix_from_group(group, key);
    case AttributeKind::RealTensor3:
      if (get_dataset_rank(group, key) != 3) {
        return load_matrix_from_group(group, key);
      }
      return load_tensor_from_group(group, key);
    case AttributeKind::Orbitals: {
      H5::Group subgroup = group.openGroup(key);
      return OrbitalSet::from_hdf5(subgroup);
    }
    case AttributeKind::BasisSet: {
      H5::Group subgroup = group.openGroup(key);
      return BasisSetDescriptor::from_hdf5(subgroup);
    }
    default:
      return std::nullopt;
  }
}

}  // namespace

MoleculeData::MoleculeData() = default;

MoleculeData::MoleculeData(const AttributeMap& attributes) {
  MOLIO_LOG_TRACE_ENTERING();

  AttributeMap coerced;
  std::vector<std::string> failed_keys;
  std::string reasons;
  for (const auto& [key, value] : attributes) {
    try {
      coerced.emplace(key, _coerce(key, value));
    } catch (const TypeMismatch& e) {
      failed_keys.push_back(key);
      if (!reasons.empty()) reasons += "; ";
      reasons += key + ": " + e.get_reason();
    }
  }
  if (!failed_keys.empty()) {
    throw TypeMismatch(failed_keys, reasons);
  }

  _check_consistency(coerced);
  _attributes = std::move(coerced);
  MOLIO_LOGGER().debug("Created MoleculeData with {} attribute(s)",
                       _attributes.size());
}

const std::vector<std::string>& MoleculeData::get_known_attributes() {
  static const std::vector<std::string> keys = []() {
    std::vector<std::string> result;
    for (const auto& [key, spec] : attribute_specs()) {
      result.push_back(key);
    }
    return result;
  }();
  return keys;
}

bool MoleculeData::is_known_attribute(const std::string& key) {
  return attribute_specs().count(key) > 0;
}

bool MoleculeData::has(const std::string& key) const {
  return _attributes.count(key) > 0;
}

const AttributeValue& MoleculeData::get(const std::string& key) const {
  auto it = _attributes.find(key);
  if (it == _attributes.end()) {
    throw AttributeNotFound(key);
  }
  return it->second;
}

void MoleculeData::set(const std::string& key, const AttributeValue& value) {
  AttributeValue coerced = _coerce(key, value);

  std::optional<AttributeValue> previous;
  auto it = _attributes.find(key);
  if (it != _attributes.end()) {
    previous = it->second;
  }

  _attributes.insert_or_assign(key, std::move(coerced));
  try {
    _check_consistency(_attributes);
  } catch (const TypeMismatch&) {
    if (previous.has_value()) {
      _attributes.insert_or_assign(key, std::move(*previous));
    } else {
      _attributes.erase(key);
    }
    throw;
  }

  if (invalidates_density_caches(key)) {
    _clear_density_caches();
  }
}

bool MoleculeData::unset(const std::string& key) {
  const bool removed = _attributes.erase(key) > 0;
  if (removed && invalidates_density_caches(key)) {
    _clear_density_caches();
  }
  return removed;
}

std::vector<std::string> MoleculeData::keys() const {
  std::vector<std::string> result;
  result.reserve(_attributes.size());
  for (const auto& [key, value] : _attributes) {
    result.push_back(key);
  }
  return result;
}

std::optional<size_t> MoleculeData::get_num_atoms() const {
  auto extents = collect_extents(_attributes, ShapeGroup::Atoms);
  if (extents.empty()) {
    return std::nullopt;
  }
  return extents.begin()->second;
}

std::optional<size_t> MoleculeData::get_num_basis_functions() const {
  auto extents = collect_extents(_attributes, ShapeGroup::Basis);
  if (extents.empty()) {
    return std::nullopt;
  }
  return extents.begin()->second;
}

std::optional<Cube> MoleculeData::get_cube() const {
  if (!has("cube_data") || !has("origin") || !has("axes")) {
    return std::nullopt;
  }
  return Cube(get<Eigen::VectorXd>("origin"), get<Eigen::MatrixXd>("axes"),
              get<RealTensor3>("cube_data"));
}

std::optional<Eigen::MatrixXd> MoleculeData::get_dm_full() const {
  MOLIO_LOG_TRACE_ENTERING();
  if (auto stored = _get_stored_dm(DM_FULL_KEYS)) {
    return stored;
  }
  if (!_dm_full_cache) {
    auto orbital_sets = _get_orbital_sets();
    if (orbital_sets.empty()) {
      return std::nullopt;
    }
    MOLIO_LOGGER().debug("Reconstructing full density matrix from orbitals");
    _dm_full_cache = std::make_shared<Eigen::MatrixXd>(
        utils::compute_density_matrix(orbital_sets, utils::DensityType::Full));
  }
  return *_dm_full_cache;
}

std::optional<Eigen::MatrixXd> MoleculeData::get_dm_spin() const {
  MOLIO_LOG_TRACE_ENTERING();
  if (auto stored = _get_stored_dm(DM_SPIN_KEYS)) {
    return stored;
  }
  if (!_dm_spin_cache) {
    auto orbital_sets = _get_orbital_sets();
    if (orbital_sets.empty()) {
      return std::nullopt;
    }
    MOLIO_LOGGER().debug("Reconstructing spin density matrix from orbitals");
    _dm_spin_cache = std::make_shared<Eigen::MatrixXd>(
        utils::compute_density_matrix(orbital_sets, utils::DensityType::Spin));
  }
  return *_dm_spin_cache;
}

void MoleculeData::_clear_density_caches() const {
  _dm_full_cache = nullptr;
  _dm_spin_cache = nullptr;
}

std::optional<Eigen::MatrixXd> MoleculeData::_get_stored_dm(
    const std::vector<std::string>& keys) const {
  for (const auto& key : keys) {
    auto it = _attributes.find(key);
    if (it != _attributes.end()) {
      return std::get<Eigen::MatrixXd>(it->second);
    }
  }
  return std::nullopt;
}

std::vector<OrbitalSet> MoleculeData::_get_orbital_sets() const {
  std::vector<OrbitalSet> orbital_sets;
  if (!has("orb_alpha")) {
    return orbital_sets;
  }
  orbital_sets.push_back(get<OrbitalSet>("orb_alpha"));
  if (has("orb_beta")) {
    orbital_sets.push_back(get<OrbitalSet>("orb_beta"));
  }
  return orbital_sets;
}

AttributeValue MoleculeData::_coerce(const std::string& key,
                                     const AttributeValue& value) {
  const AttributeSpec& spec = get_spec(key);
  switch (spec.kind) {
    case AttributeKind::String:
      if (!std::holds_alternative<std::string>(value)) {
        reject(key, "a string", value);
      }
      return value;
    case AttributeKind::RealScalar:
      return coerce_real_scalar(key, value);
    case AttributeKind::IntVector: {
      IntVector vector = coerce_int_vector(key, value);
      check_vector_length(key, spec, vector.size());
      return vector;
    }
    case AttributeKind::RealVector: {
      Eigen::VectorXd vector = coerce_real_vector(key, value);
      check_vector_length(key, spec, vector.size());
      return vector;
    }
    case AttributeKind::RealMatrix: {
      Eigen::MatrixXd matrix = coerce_real_matrix(key, value);
      check_matrix_shape(key, spec, matrix);
      return matrix;
    }
    case AttributeKind::RealTensor3:
      if (!std::holds_alternative<RealTensor3>(value)) {
        reject(key, "a real rank-3 array", value);
      }
      return value;
    case AttributeKind::Orbitals: {
      const auto* orbitals = std::get_if<OrbitalSet>(&value);
      if (orbitals == nullptr) {
        reject(key, "an orbital set", value);
      }
      const Spin expected =
          key == "orb_beta" ? Spin::Beta : Spin::Alpha;
      if (orbitals->get_spin() != expected) {
        throw TypeMismatch(key, "expected " + spin_to_string(expected) +
                                    " orbitals, got " +
                                    spin_to_string(orbitals->get_spin()));
      }
      return value;
    }
    case AttributeKind::BasisSet:
      if (!std::holds_alternative<BasisSetDescriptor>(value)) {
        reject(key, "a basis set descriptor", value);
      }
      return value;
  }
  throw TypeMismatch(key, "unsupported attribute kind");
}

void MoleculeData::_check_consistency(const AttributeMap& attributes) {
  std::set<std::string> failed_keys;
  std::vector<std::string> reasons;

  auto atom_extents = collect_extents(attributes, ShapeGroup::Atoms);
  if (!extents_agree(atom_extents)) {
    for (const auto& [key, extent] : atom_extents) failed_keys.insert(key);
    reasons.push_back("inconsistent number of atoms (" +
                      describe_extents(atom_extents) + ")");
  }

  auto basis_extents = collect_extents(attributes, ShapeGroup::Basis);
  if (!extents_agree(basis_extents)) {
    for (const auto& [key, extent] : basis_extents) failed_keys.insert(key);
    reasons.push_back("inconsistent number of basis functions (" +
                      describe_extents(basis_extents) + ")");
  }

  auto obasis = attributes.find("obasis");
  if (obasis != attributes.end() && !atom_extents.empty()) {
    const size_t referenced =
        std::get<BasisSetDescriptor>(obasis->second).get_num_atoms_referenced();
    const size_t num_atoms = atom_extents.begin()->second;
    if (referenced > num_atoms) {
      failed_keys.insert("obasis");
      for (const auto& [key, extent] : atom_extents) failed_keys.insert(key);
      reasons.push_back("basis set refers to atom " +
                        std::to_string(referenced - 1) + " but there are " +
                        std::to_string(num_atoms) + " atoms");
    }
  }

  if (attributes.count("cube_data") > 0 &&
      attributes.count("coordinates") > 0) {
    failed_keys.insert("cube_data");
    failed_keys.insert("coordinates");
    reasons.push_back(
        "cube_data cannot be combined with coordinates in one container");
  }

  if (!failed_keys.empty()) {
    std::string joined;
    for (const auto& reason : reasons) {
      if (!joined.empty()) joined += "; ";
      joined += reason;
    }
    throw TypeMismatch(
        std::vector<std::string>(failed_keys.begin(), failed_keys.end()),
        joined);
  }
}

std::string MoleculeData::get_summary() const {
  std::ostringstream oss;
  oss << "MoleculeData Summary:\n";
  if (has("title")) {
    oss << "  Title: " << get<std::string>("title") << "\n";
  }
  if (auto num_atoms = get_num_atoms()) {
    oss << "  Number of atoms: " << *num_atoms << "\n";
  }
  if (auto num_basis = get_num_basis_functions()) {
    oss << "  Number of basis functions: " << *num_basis << "\n";
  }
  oss << "  Attributes (" << _attributes.size() << "):\n";
  for (const auto& [key, value] : _attributes) {
    oss << "    " << key << ": " << describe_value(value) << "\n";
  }
  return oss.str();
}

void MoleculeData::to_file(const std::string& filename,
                           const std::string& type) const {
  if (type == "json") {
    _to_json_file(filename);
  } else if (type == "hdf5") {
    _to_hdf5_file(filename);
  } else if (type == "xyz") {
    io::dump_xyz(*this, filename);
  } else {
    throw UnsupportedFormat(type);
  }
}

std::shared_ptr<MoleculeData> MoleculeData::from_file(
    const std::string& filename, const std::string& type) {
  if (type == "json") {
    return _from_json_file(filename);
  } else if (type == "hdf5") {
    return _from_hdf5_file(filename);
  } else if (type == "xyz") {
    return io::load_xyz(filename);
  }
  throw UnsupportedFormat(type);
}

nlohmann::json MoleculeData::to_json() const {
  nlohmann::json j;
  j["version"] = SERIALIZATION_VERSION;
  j["attributes"] = nlohmann::json::object();
  for (const auto& [key, value] : _attributes) {
    j["attributes"][key] = {{"type", JSON_TYPE_TAGS[value.index()]},
                            {"value", value_to_json(value)}};
  }
  return j;
}

std::shared_ptr<MoleculeData> MoleculeData::from_json(
    const nlohmann::json& j) {
  try {
    if (j.contains("version")) {
      validate_serialization_version(SERIALIZATION_VERSION,
                                     j["version"].get<std::string>());
    }
    if (!j.contains("attributes") || !j["attributes"].is_object()) {
      throw std::runtime_error("JSON missing 'attributes' object");
    }

    AttributeMap attributes;
    for (const auto& [key, entry] : j["attributes"].items()) {
      if (!entry.contains("type") || !entry.contains("value")) {
        throw std::runtime_error("Attribute '" + key +
                                 "' needs 'type' and 'value' fields");
      }
      attributes.emplace(key, value_from_json(entry["type"].get<std::string>(),
                                              entry["value"]));
    }
    return std::make_shared<MoleculeData>(attributes);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
  }
}

void MoleculeData::to_json_file(const std::string& filename) const {
  _to_json_file(
      DataTypeFilename::validate_write_suffix(filename, get_data_type_name()));
}

std::shared_ptr<MoleculeData> MoleculeData::from_json_file(
    const std::string& filename) {
  return _from_json_file(DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(MoleculeData)));
}

void MoleculeData::_to_json_file(const std::string& filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + filename);
  }
  file << to_json().dump(2);
  if (file.fail()) {
    throw std::runtime_error("Error writing to file: " + filename);
  }
}

std::shared_ptr<MoleculeData> MoleculeData::_from_json_file(
    const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error(
        "Unable to open MoleculeData JSON file '" + filename +
        "'. Please check that the file exists and you have read permissions.");
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("JSON parsing error in '" + filename +
                             "': " + std::string(e.what()));
  }
  return from_json(j);
}

void MoleculeData::to_hdf5(H5::Group& group) const {
  try {
    write_string_attribute(group, "version", SERIALIZATION_VERSION);
    for (const auto& [key, value] : _attributes) {
      write_hdf5_value(group, key, value);
    }
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error while writing molecule data: " +
                             std::string(e.getCDetailMsg()));
  }
}

std::shared_ptr<MoleculeData> MoleculeData::from_hdf5(H5::Group& group) {
  try {
    if (!group.attrExists("version")) {
      throw std::runtime_error(
          "HDF5 group missing required 'version' attribute");
    }
    validate_serialization_version(SERIALIZATION_VERSION,
                                   read_string_attribute(group, "version"));

    AttributeMap attributes;
    for (const auto& [key, spec] : attribute_specs()) {
      if (auto value = read_hdf5_value(group, key, spec)) {
        attributes.emplace(key, std::move(*value));
      }
    }
    return std::make_shared<MoleculeData>(attributes);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error while reading molecule data: " +
                             std::string(e.getCDetailMsg()));
  }
}

void MoleculeData::to_hdf5_file(const std::string& filename) const {
  _to_hdf5_file(
      DataTypeFilename::validate_write_suffix(filename, get_data_type_name()));
}

std::shared_ptr<MoleculeData> MoleculeData::from_hdf5_file(
    const std::string& filename) {
  return _from_hdf5_file(DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(MoleculeData)));
}

void MoleculeData::_to_hdf5_file(const std::string& filename) const {
  configure_hdf5_error_printing();
  try {
    H5::H5File file(filename, H5F_ACC_TRUNC);
    H5::Group group = file.createGroup("/molecule_data");
    to_hdf5(group);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

std::shared_ptr<MoleculeData> MoleculeData::_from_hdf5_file(
    const std::string& filename) {
  configure_hdf5_error_printing();

  H5::H5File file;
  try {
    file.openFile(filename, H5F_ACC_RDONLY);
  } catch (const H5::Exception&) {
    throw std::runtime_error("Unable to open MoleculeData HDF5 file '" +
                             filename +
                             "'. Please check that the file exists, is a "
                             "valid HDF5 file, and you have read permissions.");
  }

  try {
    if (!file.nameExists("molecule_data")) {
      throw std::runtime_error("molecule_data group not found in HDF5 file '" +
                               filename + "'");
    }
    H5::Group group = file.openGroup("/molecule_data");
    return from_hdf5(group);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Unable to read MoleculeData from HDF5 file '" +
                             filename + "'. HDF5 error: " +
                             std::string(e.getCDetailMsg()));
  }
}

}  // namespace molio::data
