/**
 * @file test_helpers.hpp
 * @brief Archive fixtures shared by unit and integration tests
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "TarReader.hpp"
#include "upifinder/core/Record.hpp"
#include "upifinder/core/TimeUtils.hpp"

namespace UPIFINDER {
namespace test {

/**
 * @brief Archive file name following the Hadock naming convention
 *
 * MakeName("38", "XYZ", 2, 10, "20180601", "120000")
 *   -> "38_XYZ_2_0000010_20180601_120000_00.dat"
 */
inline std::string MakeName(const std::string &source, const std::string &upi,
                            int type, uint32_t sequence,
                            const std::string &date = "20180601",
                            const std::string &time = "120000",
                            const std::string &ext = ".dat") {
  char seq[16];
  std::snprintf(seq, sizeof(seq), "%07u", sequence);
  return source + "_" + upi + "_" + std::to_string(type) + "_" + seq + "_" +
         date + "_" + time + "_00" + ext;
}

/**
 * @brief "hhmmss" for a number of seconds after midnight
 */
inline std::string TimeOfDay(unsigned seconds) {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "%02u%02u%02u", seconds / 3600,
                (seconds / 60) % 60, seconds % 60);
  return buffer;
}

inline TimePoint At(int year, unsigned month, unsigned day, unsigned hour = 0,
                    unsigned minute = 0, unsigned second = 0) {
  CivilTime t;
  t.year = year;
  t.month = month;
  t.day = day;
  t.hour = hour;
  t.minute = minute;
  t.second = second;
  return ToTimePoint(t);
}

inline Record MakeRecord(const std::string &source, const std::string &upi,
                         uint32_t sequence, TimePoint acquired,
                         bool valid = true, uint64_t size = 1024) {
  Record r;
  r.source = source;
  r.upi = upi;
  r.sequence = sequence;
  r.acq_time = acquired;
  r.size = size;
  r.path = source + "_" + upi + "_" + std::to_string(sequence) +
           (valid ? ".dat" : ".bad");
  return r;
}

/**
 * @brief Temporary directory removed with its content on destruction
 */
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    auto base = std::filesystem::temp_directory_path();
    do {
      fPath = base / ("upifinder_test_" + std::to_string(rd()));
    } while (std::filesystem::exists(fPath));
    std::filesystem::create_directories(fPath);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(fPath, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &Path() const { return fPath; }

  /**
   * @brief Create a file (and its parent directories) holding size bytes
   */
  std::string WriteFile(const std::string &relative, size_t size = 0) const {
    return WriteText(relative, std::string(size, 'x'));
  }

  std::string WriteText(const std::string &relative,
                        const std::string &content) const {
    auto path = fPath / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path.string();
  }

private:
  std::filesystem::path fPath;
};

/**
 * @brief Builds an uncompressed tar image in memory
 */
class TarBuilder {
public:
  // Regular member with size bytes of data
  TarBuilder &Add(const std::string &name, size_t size, char type = '0') {
    Archive::TarHeader header = MakeHeader(name, size, type);
    Append(header, std::string(size, 'd'));
    return *this;
  }

  // Member whose name sits in the ustar prefix field
  TarBuilder &AddWithPrefix(const std::string &prefix, const std::string &name,
                            size_t size) {
    Archive::TarHeader header = MakeHeader(name, size, '0');
    std::strncpy(header.prefix, prefix.c_str(), sizeof(header.prefix));
    Seal(header);
    Append(header, std::string(size, 'd'));
    return *this;
  }

  // GNU long name record followed by the member
  TarBuilder &AddLongName(const std::string &name, size_t size) {
    Archive::TarHeader longHeader =
        MakeHeader("././@LongLink", name.size() + 1, 'L');
    Append(longHeader, name + '\0');
    return Add(name.substr(0, 99), size);
  }

  // pax extended header carrying the path
  TarBuilder &AddPaxPath(const std::string &name, size_t size) {
    std::string record = " path=" + name + "\n";
    size_t length = record.size();
    length += std::to_string(length).size();
    if (std::to_string(length).size() + record.size() != length) {
      ++length;
    }
    record = std::to_string(length) + record;
    Archive::TarHeader paxHeader = MakeHeader("PaxHeader", record.size(), 'x');
    Append(paxHeader, record);
    return Add("short-name", size);
  }

  // Header only, with the raw bytes of its size field and no data
  TarBuilder &AddSizeField(const std::string &name, char type,
                           const std::string &sizeField) {
    Archive::TarHeader header = MakeHeader(name, 0, type);
    std::memset(header.size, 0, sizeof(header.size));
    std::memcpy(header.size, sizeField.data(),
                std::min(sizeField.size(), sizeof(header.size)));
    Seal(header);
    fData.append(reinterpret_cast<const char *>(&header), sizeof(header));
    return *this;
  }

  // Header whose checksum does not match
  TarBuilder &AddCorrupted(const std::string &name) {
    Archive::TarHeader header = MakeHeader(name, 0, '0');
    header.chksum[0] = '7';
    header.chksum[1] = '7';
    fData.append(reinterpret_cast<const char *>(&header), sizeof(header));
    return *this;
  }

  std::string Build(bool terminate = true) const {
    std::string out = fData;
    if (terminate) {
      out.append(2 * Archive::kTarBlock, '\0');
    }
    return out;
  }

  std::string WriteTo(const TempDir &dir, const std::string &relative,
                      bool terminate = true) const {
    return dir.WriteText(relative, Build(terminate));
  }

private:
  static Archive::TarHeader MakeHeader(const std::string &name, size_t size,
                                       char type) {
    Archive::TarHeader header;
    std::memset(&header, 0, sizeof(header));
    std::strncpy(header.name, name.c_str(), sizeof(header.name));
    std::snprintf(header.mode, sizeof(header.mode), "%07o", 0644);
    std::snprintf(header.uid, sizeof(header.uid), "%07o", 0);
    std::snprintf(header.gid, sizeof(header.gid), "%07o", 0);
    std::snprintf(header.size, sizeof(header.size), "%011llo",
                  static_cast<unsigned long long>(size));
    std::snprintf(header.mtime, sizeof(header.mtime), "%011o", 0);
    header.typeflag = type;
    std::memcpy(header.magic, "ustar", 6);
    std::memcpy(header.version, "00", 2);
    Seal(header);
    return header;
  }

  static void Seal(Archive::TarHeader &header) {
    std::memset(header.chksum, ' ', sizeof(header.chksum));
    uint32_t sum = Archive::TarReader::Checksum(header);
    std::snprintf(header.chksum, sizeof(header.chksum), "%06o", sum);
    header.chksum[7] = ' ';
  }

  void Append(const Archive::TarHeader &header, const std::string &data) {
    fData.append(reinterpret_cast<const char *>(&header), sizeof(header));
    fData += data;
    size_t rest = data.size() % Archive::kTarBlock;
    if (rest != 0) {
      fData.append(Archive::kTarBlock - rest, '\0');
    }
  }

  std::string fData;
};

}  // namespace test
}  // namespace UPIFINDER
