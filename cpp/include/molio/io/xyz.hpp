// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <memory>
#include <molio/data/molecule_data.hpp>
#include <string>

namespace molio::io {

/**
 * @brief Load a single geometry from an XYZ file
 *
 * The first line holds the number of atoms, the second a title, followed by
 * one line per atom with an element symbol (or atomic number) and Cartesian
 * coordinates in Angstrom. The result has `title`, `numbers` and
 * `coordinates` (in Bohr). Non-empty content after the last atom is ignored
 * with a warning.
 *
 * @throws data::FileFormatError if the file does not follow the format
 */
std::shared_ptr<data::MoleculeData> load_xyz(const std::string& filename);

/**
 * @brief Write the geometry of a container to an XYZ file
 *
 * @throws data::PrepareDumpError if `numbers` or `coordinates` is missing
 * @throws std::runtime_error if the file cannot be written
 */
void dump_xyz(const data::MoleculeData& molecule,
              const std::string& filename);

}  // namespace molio::io
