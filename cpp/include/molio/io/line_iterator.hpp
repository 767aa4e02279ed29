// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <fstream>
#include <molio/data/errors.hpp>
#include <optional>
#include <string>
#include <vector>

namespace molio::io {

/**
 * @class LineIterator
 * @brief Line-by-line file reader that keeps track of the line number
 *
 * The file is opened by the constructor and closed by the destructor, so a
 * LineIterator is typically a local variable of a format reader:
 *
 * @code
 * LineIterator lit(filename);
 * while (auto line = lit.next()) {
 *   if (line->empty()) lit.error("Unexpected empty line");
 *   ...
 * }
 * @endcode
 *
 * Lines are returned without the trailing newline (and without a trailing
 * carriage return).
 */
class LineIterator {
 public:
  /**
   * @brief Open a file for reading
   * @throws std::runtime_error if the file cannot be opened
   */
  explicit LineIterator(const std::string& filename);

  LineIterator(const LineIterator&) = delete;
  LineIterator& operator=(const LineIterator&) = delete;

  /**
   * @brief Return the next line and increase the line number by one
   *
   * Lines pushed back with back() are returned first, most recent first.
   *
   * @return The line, or std::nullopt at the end of the file (the line
   * number is then left unchanged)
   */
  std::optional<std::string> next();

  /**
   * @brief Push a line back and decrease the line number by one
   * @throws std::logic_error If no line has been read yet
   */
  void back(const std::string& line);

  /**
   * @brief Raise a fatal error tagged with the current file and line number
   * @throws data::FileFormatError always
   */
  [[noreturn]] void error(const std::string& message) const;

  /**
   * @brief Report a non-fatal problem tagged with the current file and line
   * number
   *
   * The warning is logged and recorded; reading continues.
   */
  void warn(const std::string& message);

  /**
   * @brief Warnings recorded by warn(), in order
   */
  const std::vector<data::FileFormatWarning>& warnings() const {
    return _warnings;
  }

  const std::string& get_filename() const { return _filename; }
  size_t get_lineno() const { return _lineno; }

 private:
  std::string _filename;
  std::ifstream _file;
  size_t _lineno = 0;
  std::vector<std::string> _stack;
  std::vector<data::FileFormatWarning> _warnings;
};

}  // namespace molio::io
