// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

/**
 * @file inspect.cpp
 * @brief Load a molecular data file, report on it and optionally convert it
 *
 * This example demonstrates a typical molio workflow:
 * 1. Loading a container with the format chosen from the file extension
 * 2. Inspecting its attributes
 * 3. Obtaining the density matrix (stored or reconstructed from orbitals)
 *    and checking its natural occupations against the overlap matrix
 * 4. Writing the container to another format
 *
 * Usage:
 *   ./inspect water.xyz                    # Print a summary
 *   ./inspect water.molecule_data.h5 out.json  # Summary, then convert
 *
 * Set MOLIO_LOG_LEVEL=debug to see what the library does along the way.
 */

// One can also include <molio.hpp> to get all molio components
#include <molio/data/errors.hpp>
#include <molio/io/formats.hpp>
#include <molio/utils/natural_orbitals.hpp>

// Standard Library Header Files
#include <iomanip>   // for std::setprecision
#include <iostream>  // for std::cout, std::cerr

namespace data = molio::data;
namespace io = molio::io;
namespace utils = molio::utils;

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "Usage: " << argv[0] << " <input> [output]" << std::endl;
    std::cout << "Example: " << argv[0] << " water.xyz water.molecule_data.h5"
              << std::endl;
    return 1;
  }

  std::shared_ptr<data::MoleculeData> molecule;
  try {
    molecule = io::load_one(argv[1]);
  } catch (const data::UnsupportedFormat& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const data::FileFormatError& e) {
    std::cerr << "Malformed input: " << e.what() << std::endl;
    return 1;
  }

  std::cout << molecule->get_summary() << "\n";

  // The full density matrix is either stored in the file or rebuilt from the
  // orbitals; it is absent when neither is available.
  auto dm_full = molecule->get_dm_full();
  if (dm_full && molecule->has("overlap")) {
    const auto& overlap = molecule->get<Eigen::MatrixXd>("overlap");
    std::cout << "Electrons from Tr(S D): " << std::fixed
              << std::setprecision(6) << (overlap * *dm_full).trace() << "\n";
    try {
      // Spin-summed occupations lie between 0 and 2
      utils::check_dm(*dm_full, overlap, 1e-4, 2.0);
      std::cout << "Natural occupations are within bounds\n";
    } catch (const data::ValueRangeError& e) {
      std::cout << "Density matrix check failed: " << e.what() << "\n";
    }
  }

  if (argc > 2) {
    try {
      io::dump_one(*molecule, argv[2]);
    } catch (const data::PrepareDumpError& e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
    std::cout << "Wrote " << argv[2] << "\n";
  }
  return 0;
}
