// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <memory>
#include <molio/data/basis_set.hpp>
#include <molio/data/cube.hpp>
#include <molio/data/data_class.hpp>
#include <molio/data/errors.hpp>
#include <molio/data/orbital_set.hpp>
#include <molio/data/types.hpp>
#include <molio/utils/string_utils.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace molio::data {

/**
 * @brief Value of a single MoleculeData attribute
 */
using AttributeValue =
    std::variant<int64_t, double, std::string, IntVector, Eigen::VectorXd,
                 IntMatrix, Eigen::MatrixXd, RealTensor3, OrbitalSet,
                 BasisSetDescriptor>;

/**
 * @brief Attribute key to value map accepted by the MoleculeData constructor
 */
using AttributeMap = std::map<std::string, AttributeValue>;

/**
 * @class MoleculeData
 * @brief Validated container of molecular data
 *
 * Holds any subset of a fixed set of named attributes. Every attribute has a
 * contract on its element type and shape; some shapes are tied to each
 * other (all per-atom arrays share the atom count, all AO matrices share the
 * number of basis functions). Contracts are enforced whenever data enters
 * the container, and a violation leaves the container unchanged.
 *
 * Recognized attributes (all quantities in atomic units):
 *
 * | key                    | type               | shape              |
 * |------------------------|--------------------|--------------------|
 * | title                  | string             |                    |
 * | energy, charge, nelec  | real               | scalar             |
 * | coordinates            | real               | (n_atom, 3)        |
 * | numbers                | integer            | (n_atom)           |
 * | pseudo_numbers, masses | real               | (n_atom)           |
 * | cellvecs               | real               | (1-3, 3)           |
 * | cube_data              | real               | rank 3             |
 * | origin                 | real               | (3)                |
 * | axes                   | real               | (3, 3)             |
 * | obasis                 | BasisSetDescriptor | n_basis functions  |
 * | orb_alpha, orb_beta    | OrbitalSet         | (n_basis, n_orb)   |
 * | overlap, dm_full*, dm_spin* | real          | (n_basis, n_basis) |
 *
 * Integer arrays and scalars are promoted to real where a real value is
 * expected. Real values are accepted for `numbers` only when every element
 * is integral.
 */
class MoleculeData : public DataClass {
 public:
  /**
   * @brief Create an empty container
   */
  MoleculeData();

  /**
   * @brief Create a container from a set of attributes
   *
   * All attributes are checked individually and then against each other in
   * one pass.
   *
   * @param attributes Map of attribute key to value
   * @throws TypeMismatch naming every offending key if any attribute is
   * unknown, has the wrong type or shape, or is inconsistent with another
   * supplied attribute
   */
  explicit MoleculeData(const AttributeMap& attributes);

  MoleculeData(const MoleculeData& other) = default;
  MoleculeData(MoleculeData&& other) noexcept = default;
  MoleculeData& operator=(const MoleculeData& other) = default;
  MoleculeData& operator=(MoleculeData&& other) noexcept = default;

  ~MoleculeData() override = default;

  /**
   * @brief All attribute keys the container recognizes
   */
  static const std::vector<std::string>& get_known_attributes();

  static bool is_known_attribute(const std::string& key);

  bool has(const std::string& key) const;

  /**
   * @brief Get the stored value of an attribute
   * @throws AttributeNotFound if the attribute is not present
   */
  const AttributeValue& get(const std::string& key) const;

  /**
   * @brief Get the stored value of an attribute as a concrete type
   *
   * @code
   * const auto& coordinates = data.get<Eigen::MatrixXd>("coordinates");
   * @endcode
   *
   * @throws AttributeNotFound if the attribute is not present
   * @throws TypeMismatch if the attribute holds another type
   */
  template <typename T>
  const T& get(const std::string& key) const {
    const AttributeValue& value = get(key);
    if (const T* typed = std::get_if<T>(&value)) {
      return *typed;
    }
    throw TypeMismatch(key,
                       "stored value has a different type than requested");
  }

  /**
   * @brief Assign an attribute
   *
   * The new value is checked on its own and against the attributes already
   * stored. Assigning an orbital or density matrix attribute invalidates the
   * reconstructed density matrices.
   *
   * @throws TypeMismatch if the value violates its contract; the container is
   * left unchanged
   */
  void set(const std::string& key, const AttributeValue& value);

  /**
   * @brief Remove an attribute
   * @return Whether the attribute was present
   */
  bool unset(const std::string& key);

  /**
   * @brief Keys of the attributes currently present, in sorted order
   */
  std::vector<std::string> keys() const;

  size_t size() const { return _attributes.size(); }
  bool empty() const { return _attributes.empty(); }

  /**
   * @brief Number of atoms implied by the per-atom attributes, if any
   */
  std::optional<size_t> get_num_atoms() const;

  /**
   * @brief Number of basis functions implied by the AO attributes, if any
   */
  std::optional<size_t> get_num_basis_functions() const;

  /**
   * @brief Volumetric data, when cube_data, origin and axes are all present
   */
  std::optional<Cube> get_cube() const;

  /**
   * @brief Spin-summed density matrix
   *
   * A stored matrix is returned first, taken from the first present key of
   * dm_full, dm_full_mp2, dm_full_mp3, dm_full_cc, dm_full_ci, dm_full_scf.
   * Otherwise the matrix is reconstructed from orb_alpha (and orb_beta) and
   * cached until an orbital or density matrix attribute changes.
   *
   * @return The density matrix, or std::nullopt when neither a stored matrix
   * nor alpha orbitals are available
   */
  std::optional<Eigen::MatrixXd> get_dm_full() const;

  /**
   * @brief Spin density matrix (alpha minus beta)
   *
   * Same lookup and reconstruction rules as get_dm_full(), using the dm_spin
   * keys. A restricted closed-shell description gives a zero matrix.
   */
  std::optional<Eigen::MatrixXd> get_dm_spin() const;

  std::string get_data_type_name() const override {
    return DATACLASS_TO_SNAKE_CASE(MoleculeData);
  }

  std::string get_summary() const override;

  /**
   * @brief Save to file in the given format
   * @param filename Output path; no suffix convention is imposed
   * @param type One of "json", "hdf5", "xyz"
   * @throws UnsupportedFormat for any other type
   */
  void to_file(const std::string& filename,
               const std::string& type) const override;

  /**
   * @brief Load from file in the given format
   * @throws UnsupportedFormat if type is not one of "json", "hdf5", "xyz"
   */
  static std::shared_ptr<MoleculeData> from_file(const std::string& filename,
                                                 const std::string& type);

  nlohmann::json to_json() const override;

  /**
   * @throws std::runtime_error for malformed documents or incompatible
   * versions
   * @throws TypeMismatch if the stored attributes violate their contracts
   */
  static std::shared_ptr<MoleculeData> from_json(const nlohmann::json& j);

  void to_json_file(const std::string& filename) const override;
  static std::shared_ptr<MoleculeData> from_json_file(
      const std::string& filename);

  void to_hdf5(H5::Group& group) const override;
  static std::shared_ptr<MoleculeData> from_hdf5(H5::Group& group);

  void to_hdf5_file(const std::string& filename) const override;
  static std::shared_ptr<MoleculeData> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  AttributeMap _attributes;

  /// Density matrices reconstructed from the orbitals
  mutable std::shared_ptr<Eigen::MatrixXd> _dm_full_cache = nullptr;
  mutable std::shared_ptr<Eigen::MatrixXd> _dm_spin_cache = nullptr;

  void _clear_density_caches() const;

  /// Coerce one attribute to its canonical type; throws TypeMismatch
  static AttributeValue _coerce(const std::string& key,
                                const AttributeValue& value);

  /// Cross-attribute rules over a complete attribute set; throws TypeMismatch
  static void _check_consistency(const AttributeMap& attributes);

  std::optional<Eigen::MatrixXd> _get_stored_dm(
      const std::vector<std::string>& keys) const;

  std::vector<OrbitalSet> _get_orbital_sets() const;

  void _to_json_file(const std::string& filename) const;
  static std::shared_ptr<MoleculeData> _from_json_file(
      const std::string& filename);
  void _to_hdf5_file(const std::string& filename) const;
  static std::shared_ptr<MoleculeData> _from_hdf5_file(
      const std::string& filename);
};

}  // namespace molio::data
