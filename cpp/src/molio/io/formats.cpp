// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <map>
#include <molio/io/formats.hpp>
#include <molio/utils/logger.hpp>
#include <molio/utils/string_utils.hpp>

namespace molio::io {

namespace {

const std::map<std::string, std::string> EXTENSION_TO_FORMAT = {
    {".json", "json"}, {".h5", "hdf5"}, {".hdf5", "hdf5"}, {".xyz", "xyz"}};

}  // namespace

std::string guess_format(const std::string& filename) {
  const size_t last_dot = filename.find_last_of('.');
  const size_t last_slash = filename.find_last_of("/\\");
  if (last_dot == std::string::npos ||
      (last_slash != std::string::npos && last_dot < last_slash)) {
    throw data::UnsupportedFormat(filename);
  }
  const std::string extension = utils::to_lower(filename.substr(last_dot));
  auto it = EXTENSION_TO_FORMAT.find(extension);
  if (it == EXTENSION_TO_FORMAT.end()) {
    throw data::UnsupportedFormat(filename.substr(last_dot));
  }
  return it->second;
}

std::shared_ptr<data::MoleculeData> load_one(const std::string& filename) {
  const std::string format = guess_format(filename);
  MOLIO_LOGGER().info("Loading {} as {}", filename, format);
  return data::MoleculeData::from_file(filename, format);
}

void dump_one(const data::MoleculeData& molecule,
              const std::string& filename) {
  const std::string format = guess_format(filename);
  MOLIO_LOGGER().info("Writing {} as {}", filename, format);
  molecule.to_file(filename, format);
}

}  // namespace molio::io
