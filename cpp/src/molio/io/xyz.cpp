// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cctype>
#include <fstream>
#include <iomanip>
#include <molio/constants.hpp>
#include <molio/data/periodic_table.hpp>
#include <molio/io/line_iterator.hpp>
#include <molio/io/xyz.hpp>
#include <molio/utils/logger.hpp>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace molio::io {

namespace {

bool is_blank(const std::string& line) {
  for (unsigned char c : line) {
    if (!std::isspace(c)) return false;
  }
  return true;
}

int64_t parse_atom_label(LineIterator& lit, const std::string& label) {
  if (!label.empty() && std::isdigit(static_cast<unsigned char>(label[0]))) {
    size_t pos = 0;
    int64_t number = 0;
    try {
      number = std::stoll(label, &pos);
    } catch (const std::logic_error&) {
      lit.error("Invalid atomic number '" + label + "'");
    }
    if (pos != label.size()) {
      lit.error("Invalid atomic number '" + label + "'");
    }
    return number;
  }
  try {
    return data::symbol_to_atomic_number(label);
  } catch (const std::invalid_argument&) {
    lit.error("Unknown element symbol '" + label + "'");
  }
}

}  // namespace

std::shared_ptr<data::MoleculeData> load_xyz(const std::string& filename) {
  MOLIO_LOG_TRACE_ENTERING();
  LineIterator lit(filename);

  auto count_line = lit.next();
  if (!count_line) {
    lit.error("Empty file, expected the number of atoms");
  }
  long long num_atoms = -1;
  {
    std::istringstream iss(*count_line);
    std::string rest;
    if (!(iss >> num_atoms) || num_atoms < 0 || (iss >> rest)) {
      lit.error("Expected the number of atoms, got '" + *count_line + "'");
    }
  }

  auto title_line = lit.next();
  if (!title_line) {
    lit.error("Missing title line");
  }

  // The declared count is untrusted; atoms are collected as they are read
  std::vector<int64_t> numbers;
  std::vector<Eigen::Vector3d> positions;
  for (long long i = 0; i < num_atoms; ++i) {
    auto line = lit.next();
    if (!line) {
      lit.error("Expected " + std::to_string(num_atoms) + " atoms, found " +
                std::to_string(i));
    }
    std::istringstream iss(*line);
    std::string label;
    double x = 0.0, y = 0.0, z = 0.0;
    if (!(iss >> label >> x >> y >> z)) {
      lit.error("Expected an element and three coordinates, got '" + *line +
                "'");
    }
    numbers.push_back(parse_atom_label(lit, label));
    positions.emplace_back(x, y, z);
  }

  data::IntVector atom_numbers(static_cast<Eigen::Index>(numbers.size()));
  Eigen::MatrixXd coordinates(atom_numbers.size(), 3);
  for (size_t i = 0; i < numbers.size(); ++i) {
    atom_numbers(i) = numbers[i];
    coordinates.row(i) = positions[i].transpose() * constants::angstrom;
  }

  while (auto line = lit.next()) {
    if (!is_blank(*line)) {
      lit.warn("Ignoring content after the last atom");
      break;
    }
  }

  std::string title = *title_line;
  while (!title.empty() &&
         std::isspace(static_cast<unsigned char>(title.back()))) {
    title.pop_back();
  }

  return std::make_shared<data::MoleculeData>(
      data::AttributeMap{{"title", title},
                         {"numbers", atom_numbers},
                         {"coordinates", coordinates}});
}

void dump_xyz(const data::MoleculeData& molecule,
              const std::string& filename) {
  MOLIO_LOG_TRACE_ENTERING();
  if (!molecule.has("numbers") || !molecule.has("coordinates")) {
    throw data::PrepareDumpError(
        "Cannot write XYZ file '" + filename +
        "': numbers and coordinates are both required");
  }
  const auto& numbers = molecule.get<data::IntVector>("numbers");
  const auto& coordinates = molecule.get<Eigen::MatrixXd>("coordinates");

  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + filename);
  }

  file << numbers.size() << "\n";
  file << (molecule.has("title") ? molecule.get<std::string>("title")
                             : std::string("Created with molio"))
       << "\n";
  file << std::fixed << std::setprecision(10);
  for (Eigen::Index i = 0; i < numbers.size(); ++i) {
    file << std::setw(2) << std::left
         << data::atomic_number_to_symbol(numbers(i)) << std::right;
    for (Eigen::Index k = 0; k < 3; ++k) {
      file << " " << std::setw(16)
           << coordinates(i, k) * constants::bohr_to_angstrom;
    }
    file << "\n";
  }

  if (file.fail()) {
    throw std::runtime_error("Error writing to file: " + filename);
  }
}

}  // namespace molio::io
