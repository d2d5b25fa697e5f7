/**
 * @file Error.cpp
 * @brief Error construction and code names
 */

#include "upifinder/core/Error.hpp"

#include <cstring>

namespace UPIFINDER {

Error::Error(Code c, const std::string &msg, int errno_val)
    : code(c), message(msg) {
  if (errno_val != 0) {
    system_errno = errno_val;
    message += " (errno " + std::to_string(errno_val) + ": " +
               std::strerror(errno_val) + ")";
  }
}

std::string ErrorCodeToString(Error::Code code) {
  switch (code) {
  case Error::SUCCESS:
    return "Success";
  case Error::DECODE_ERROR:
    return "DecodeError";
  case Error::SYSTEM_ERROR:
    return "SystemError";
  case Error::ARCHIVE_ERROR:
    return "ArchiveError";
  case Error::INVALID_CONFIG:
    return "InvalidConfig";
  case Error::INVALID_FORMAT:
    return "InvalidFormat";
  case Error::NOT_FOUND:
    return "NotFound";
  default:
    return "Unknown";
  }
}

}  // namespace UPIFINDER
