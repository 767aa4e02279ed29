// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <molio/io/line_iterator.hpp>
#include <molio/utils/logger.hpp>
#include <stdexcept>

namespace molio::io {

LineIterator::LineIterator(const std::string& filename)
    : _filename(filename), _file(filename) {
  if (!_file.is_open()) {
    throw std::runtime_error("Unable to open file '" + filename +
                             "' for reading");
  }
  MOLIO_LOGGER().debug("Opened {} for reading", filename);
}

std::optional<std::string> LineIterator::next() {
  if (!_stack.empty()) {
    std::string line = std::move(_stack.back());
    _stack.pop_back();
    ++_lineno;
    return line;
  }

  std::string line;
  if (!std::getline(_file, line)) {
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  ++_lineno;
  return line;
}

void LineIterator::back(const std::string& line) {
  if (_lineno == 0) {
    throw std::logic_error("Cannot push back a line into " + _filename +
                           " before reading one");
  }
  _stack.push_back(line);
  --_lineno;
}

void LineIterator::error(const std::string& message) const {
  throw data::FileFormatError(_filename, _lineno, message);
}

void LineIterator::warn(const std::string& message) {
  data::FileFormatWarning warning{_filename, _lineno, message};
  MOLIO_LOGGER().warn("{}", warning.to_string());
  _warnings.push_back(std::move(warning));
}

}  // namespace molio::io
