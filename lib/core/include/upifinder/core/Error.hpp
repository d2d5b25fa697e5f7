#ifndef UPIFINDER_CORE_ERROR_HPP
#define UPIFINDER_CORE_ERROR_HPP

#include <optional>
#include <string>
#include <variant>

namespace UPIFINDER {

/**
 * @brief Failure reported by archive, audit and report operations
 *
 * A system failure appends the errno text to the message and keeps the
 * raw value in system_errno.
 */
struct Error {
  enum Code {
    SUCCESS = 0,     // Operation successful
    DECODE_ERROR,    // Malformed source, sequence or timestamp field
    SYSTEM_ERROR,    // Platform-specific system call failed
    ARCHIVE_ERROR,   // Tar header is malformed or truncated
    INVALID_CONFIG,  // Configuration parameters are invalid
    INVALID_FORMAT,  // Unsupported output format or date format
    NOT_FOUND,       // Requested path or key does not exist
  };

  Code code;
  std::string message;
  std::optional<int> system_errno;

  Error(Code c, const std::string &msg, int errno_val = 0);
};

/**
 * @brief Convert an error code to its name for logging
 */
std::string ErrorCodeToString(Error::Code code);

/**
 * @brief Result type for error handling without exceptions
 *
 * Contains either a successful result of type T or an Error.
 */
template <typename T>
using Result = std::variant<T, Error>;

/**
 * @brief Helper type for void returns that can fail
 */
using Status = Result<std::monostate>;

template <typename T>
bool isOk(const Result<T> &result) {
  return std::holds_alternative<T>(result);
}

/**
 * @warning Only call if isOk(result) returns true
 */
template <typename T>
const T &getValue(const Result<T> &result) {
  return std::get<T>(result);
}

template <typename T>
T &getValue(Result<T> &result) {
  return std::get<T>(result);
}

/**
 * @warning Only call if isOk(result) returns false
 */
template <typename T>
const Error &getError(const Result<T> &result) {
  return std::get<Error>(result);
}

template <typename T>
Result<T> Ok(T &&value) {
  return Result<T>{std::forward<T>(value)};
}

inline Status Ok() { return Status{std::monostate{}}; }

template <typename T>
Result<T> Err(Error &&error) {
  return Result<T>{std::forward<Error>(error)};
}

}  // namespace UPIFINDER

#endif  // UPIFINDER_CORE_ERROR_HPP
