// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <memory>
#include <molio/data/molecule_data.hpp>
#include <string>

namespace molio::io {

/**
 * @brief Determine the file type from the extension of a filename
 *
 * The extension is compared case-insensitively: ".json" gives "json",
 * ".h5" and ".hdf5" give "hdf5", ".xyz" gives "xyz".
 *
 * @throws data::UnsupportedFormat for any other extension
 */
std::string guess_format(const std::string& filename);

/**
 * @brief Load a container from a file, choosing the reader by extension
 * @throws data::UnsupportedFormat if the extension is not recognized
 */
std::shared_ptr<data::MoleculeData> load_one(const std::string& filename);

/**
 * @brief Write a container to a file, choosing the writer by extension
 * @throws data::UnsupportedFormat if the extension is not recognized
 * @throws data::PrepareDumpError if the container lacks data the format needs
 */
void dump_one(const data::MoleculeData& molecule, const std::string& filename);

}  // namespace molio::io
