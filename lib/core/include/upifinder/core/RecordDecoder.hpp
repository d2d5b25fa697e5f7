#ifndef UPIFINDER_CORE_RECORD_DECODER_HPP
#define UPIFINDER_CORE_RECORD_DECODER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "upifinder/core/Error.hpp"
#include "upifinder/core/Record.hpp"

namespace UPIFINDER {

/**
 * @brief Origin codes accepted for image products (file type 1 or 2)
 */
extern const std::vector<int> kImageOrigins;

/**
 * @brief Origin codes accepted for science products (file type 3)
 */
extern const std::vector<int> kScienceOrigins;

/**
 * @brief Decodes archive file names into Records
 *
 * Name layout:
 *   <source>_<upi...>_<type>_<sequence>_<YYYYMMDD>_<hhmmss>_<offset>.<ext>
 *
 * Three outcomes:
 * - a Record
 * - nullopt: the name is not ours (bad characters, ".xml", unknown origin),
 *   silently skipped
 * - Error::DECODE_ERROR: the name is ours but a field is malformed
 */
class RecordDecoder {
public:
  /**
   * @param upi_filter When non-empty every decoded record gets this UPI
   */
  explicit RecordDecoder(std::string upi_filter = "");

  Result<std::optional<Record>> Decode(const std::string &path,
                                       uint64_t size) const;

  const std::string &GetUPIFilter() const { return fUPIFilter; }

  /**
   * @brief Cheap filename filter applied before decoding
   * @return true when no filter is set or the base name contains it
   */
  bool MatchesFilter(const std::string &base_name) const;

  /**
   * @brief True when every byte is in [A-Za-z0-9._-]
   */
  static bool HasAllowedCharacters(const std::string &name);

  /**
   * @brief Whether the origin code is part of the sorted set
   */
  static bool AcceptOrigin(int origin, const std::vector<int> &origins);

private:
  std::string fUPIFilter;
};

/**
 * @brief Final path component ("a/b/c.dat" -> "c.dat")
 */
std::string BaseName(const std::string &path);

/**
 * @brief Extension of the final path component, dot included ("" if none)
 */
std::string Extension(const std::string &path);

}  // namespace UPIFINDER

#endif  // UPIFINDER_CORE_RECORD_DECODER_HPP
