/**
 * @file error.hxx
 * @brief Exceptions thrown by tatar.
 *
 * Filesystem failures are not wrapped: they surface as
 * std::filesystem::filesystem_error (or std::system_error for raw POSIX
 * calls) carrying the offending path.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tatar {

/// Base class of every error raised by tatar itself.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief A codec could not be selected or failed to process its stream.
 *
 * Raised for unknown compression tags, out of range compression levels and
 * malformed compressed input.
 */
class CompressionError : public Error {
public:
  using Error::Error;
};

/**
 * @brief The tar stream is malformed or a member cannot be represented.
 */
class FormatError : public Error {
public:
  using Error::Error;
};

} // namespace tatar
