#ifndef UPIFINDER_ARCHIVE_TAR_READER_HPP
#define UPIFINDER_ARCHIVE_TAR_READER_HPP

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

#include "upifinder/core/Error.hpp"

namespace UPIFINDER {
namespace Archive {

static constexpr uint32_t kTarBlock = 512;

// basic ustar header (512 bytes)
struct TarHeader {
  char name[100];      // 0
  char mode[8];        // 100
  char uid[8];         // 108
  char gid[8];         // 116
  char size[12];       // 124
  char mtime[12];      // 136
  char chksum[8];      // 148
  char typeflag;       // 156
  char linkname[100];  // 157
  char magic[6];       // 257
  char version[2];     // 263
  char uname[32];      // 265
  char gname[32];      // 297
  char devmajor[8];    // 329
  char devminor[8];    // 337
  char prefix[155];    // 345
  char pad[12];        // 500
};
static_assert(sizeof(TarHeader) == kTarBlock, "TarHeader must be 512 bytes");

// Largest GNU long-name or pax payload read into memory
static constexpr uint64_t kTarMaxExtendedHeader = 1 << 20;

/**
 * @brief One member of a tar archive
 */
struct TarEntry {
  std::string name;   ///< Member path, long-name and pax path applied
  uint64_t size = 0;  ///< Declared (uncompressed) size
  char type = '0';    ///< ustar typeflag

  bool IsRegular() const { return type == '0' || type == '\0' || type == '7'; }
};

/**
 * @brief Sequential reader over the member headers of an uncompressed tar
 *
 * Understands ustar (name prefix), GNU long names ('L'), pax extended
 * headers ('x', path and size keys) and base-256 sizes. Member data is
 * skipped, never read. A size reaching past the end of the file, or an
 * extended header above kTarMaxExtendedHeader, is an archive error.
 *
 * Usage:
 *   TarReader reader;
 *   if (!isOk(reader.Open(path))) ...
 *   while (true) {
 *       auto next = reader.Next();
 *       if (!isOk(next)) break;            // malformed archive
 *       auto &entry = getValue(next);
 *       if (!entry) break;                 // end of archive
 *   }
 */
class TarReader {
public:
  TarReader() = default;
  ~TarReader() = default;

  TarReader(const TarReader &) = delete;
  TarReader &operator=(const TarReader &) = delete;

  Status Open(const std::string &path);
  void Close();
  bool IsOpen() const { return fFile.is_open(); }

  /**
   * @brief Advance to the next member
   * @return nullopt at the end of the archive
   */
  Result<std::optional<TarEntry>> Next();

  // --- header helpers, public for testing ---

  /**
   * @brief Numeric header field: octal text or GNU base-256
   */
  static std::optional<uint64_t> ParseNumeric(const char *field, size_t width);

  /**
   * @brief Sum of all header bytes with the checksum field read as spaces
   */
  static uint32_t Checksum(const TarHeader &header);

private:
  Status ReadBlock(TarHeader &header);
  Result<std::string> ReadData(uint64_t size);
  Status Skip(uint64_t size);
  uint64_t Remaining();

  std::ifstream fFile;
  std::string fPath;
  uint64_t fSize = 0;
  bool fEnd = false;
};

}  // namespace Archive
}  // namespace UPIFINDER

#endif  // UPIFINDER_ARCHIVE_TAR_READER_HPP
