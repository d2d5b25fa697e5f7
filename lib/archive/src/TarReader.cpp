#include "TarReader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>

namespace UPIFINDER {
namespace Archive {

namespace {

// Saturates instead of wrapping; callers compare against the bytes left
uint64_t Padded(uint64_t size) {
  if (size > UINT64_MAX - (kTarBlock - 1)) {
    return UINT64_MAX;
  }
  return (size + kTarBlock - 1) / kTarBlock * kTarBlock;
}

std::string FieldString(const char *field, size_t width) {
  size_t len = 0;
  while (len < width && field[len] != '\0') {
    ++len;
  }
  return std::string(field, len);
}

bool IsZeroBlock(const TarHeader &header) {
  const char *p = reinterpret_cast<const char *>(&header);
  return std::all_of(p, p + kTarBlock, [](char c) { return c == '\0'; });
}

// pax records: "<len> <key>=<value>\n"
void ApplyPaxRecords(const std::string &data, std::optional<std::string> &path,
                     std::optional<uint64_t> &size) {
  size_t pos = 0;
  while (pos < data.size()) {
    size_t space = data.find(' ', pos);
    if (space == std::string::npos) {
      return;
    }
    uint64_t len = 0;
    for (size_t i = pos; i < space; ++i) {
      if (data[i] < '0' || data[i] > '9') {
        return;
      }
      len = len * 10 + static_cast<uint64_t>(data[i] - '0');
    }
    if (len == 0 || pos + len > data.size()) {
      return;
    }
    std::string record = data.substr(space + 1, pos + len - space - 1);
    if (!record.empty() && record.back() == '\n') {
      record.pop_back();
    }
    size_t eq = record.find('=');
    if (eq != std::string::npos) {
      std::string key = record.substr(0, eq);
      std::string value = record.substr(eq + 1);
      if (key == "path") {
        path = value;
      } else if (key == "size") {
        uint64_t v = 0;
        bool digits = !value.empty();
        for (char c : value) {
          if (c < '0' || c > '9') {
            digits = false;
            break;
          }
          v = v * 10 + static_cast<uint64_t>(c - '0');
        }
        if (digits) {
          size = v;
        }
      }
    }
    pos += len;
  }
}

}  // namespace

Status TarReader::Open(const std::string &path) {
  Close();
  fFile.open(path, std::ios::binary);
  if (!fFile.is_open()) {
    return Err<std::monostate>(
        Error(Error::SYSTEM_ERROR, "cannot open archive " + path, errno));
  }
  std::error_code ec;
  fSize = std::filesystem::file_size(path, ec);
  if (ec) {
    fFile.close();
    return Err<std::monostate>(Error(Error::SYSTEM_ERROR,
                                     "cannot stat archive " + path + ": " +
                                         ec.message()));
  }
  fPath = path;
  fEnd = false;
  return Ok();
}

void TarReader::Close() {
  if (fFile.is_open()) {
    fFile.close();
  }
  fFile.clear();
  fSize = 0;
  fEnd = true;
}

uint64_t TarReader::Remaining() {
  const std::streamoff pos = fFile.tellg();
  if (pos < 0 || static_cast<uint64_t>(pos) >= fSize) {
    return 0;
  }
  return fSize - static_cast<uint64_t>(pos);
}

std::optional<uint64_t> TarReader::ParseNumeric(const char *field,
                                                size_t width) {
  const auto *bytes = reinterpret_cast<const unsigned char *>(field);
  if (width > 0 && (bytes[0] & 0x80) != 0) {
    // base-256, big endian, first byte carries the marker bit
    uint64_t value = bytes[0] & 0x7f;
    for (size_t i = 1; i < width; ++i) {
      if (value > (UINT64_MAX >> 8)) {
        return std::nullopt;
      }
      value = (value << 8) | bytes[i];
    }
    return value;
  }

  size_t i = 0;
  while (i < width && (field[i] == ' ' || field[i] == '\0')) {
    if (field[i] == '\0') {
      return 0;
    }
    ++i;
  }
  uint64_t value = 0;
  bool any = false;
  for (; i < width; ++i) {
    char c = field[i];
    if (c == ' ' || c == '\0') {
      break;
    }
    if (c < '0' || c > '7') {
      return std::nullopt;
    }
    value = (value << 3) | static_cast<uint64_t>(c - '0');
    any = true;
  }
  if (!any) {
    return 0;
  }
  return value;
}

uint32_t TarReader::Checksum(const TarHeader &header) {
  const auto *p = reinterpret_cast<const unsigned char *>(&header);
  uint32_t sum = 0;
  for (size_t i = 0; i < kTarBlock; ++i) {
    bool in_chksum = i >= offsetof(TarHeader, chksum) &&
                     i < offsetof(TarHeader, chksum) + sizeof(header.chksum);
    sum += in_chksum ? static_cast<unsigned char>(' ') : p[i];
  }
  return sum;
}

Status TarReader::ReadBlock(TarHeader &header) {
  fFile.read(reinterpret_cast<char *>(&header), kTarBlock);
  if (fFile.gcount() != static_cast<std::streamsize>(kTarBlock)) {
    return Err<std::monostate>(
        Error(Error::ARCHIVE_ERROR, "truncated tar header in " + fPath));
  }
  return Ok();
}

Result<std::string> TarReader::ReadData(uint64_t size) {
  if (size > kTarMaxExtendedHeader) {
    return Err<std::string>(Error(
        Error::ARCHIVE_ERROR,
        "oversized tar extended header (" + std::to_string(size) +
            " bytes) in " + fPath));
  }
  if (Padded(size) > Remaining()) {
    return Err<std::string>(
        Error(Error::ARCHIVE_ERROR, "truncated tar member in " + fPath));
  }
  std::string data(size, '\0');
  if (size > 0) {
    fFile.read(&data[0], static_cast<std::streamsize>(size));
    if (fFile.gcount() != static_cast<std::streamsize>(size)) {
      return Err<std::string>(
          Error(Error::ARCHIVE_ERROR, "truncated tar member in " + fPath));
    }
  }
  auto status = Skip(Padded(size) - size);
  if (!isOk(status)) {
    return Err<std::string>(Error(getError(status)));
  }
  return Ok(std::move(data));
}

Status TarReader::Skip(uint64_t size) {
  if (size == 0) {
    return Ok();
  }
  if (size > Remaining()) {
    return Err<std::monostate>(
        Error(Error::ARCHIVE_ERROR, "truncated tar member in " + fPath));
  }
  fFile.seekg(static_cast<std::streamoff>(size), std::ios::cur);
  if (!fFile) {
    return Err<std::monostate>(
        Error(Error::ARCHIVE_ERROR, "cannot skip tar member in " + fPath));
  }
  return Ok();
}

Result<std::optional<TarEntry>> TarReader::Next() {
  using Entry = std::optional<TarEntry>;

  if (!fFile.is_open() || fEnd) {
    return Ok(Entry{});
  }

  std::optional<std::string> long_name;
  std::optional<uint64_t> pax_size;

  while (true) {
    TarHeader header;
    if (fFile.peek() == std::char_traits<char>::eof()) {
      // Archive without end-of-archive blocks
      fEnd = true;
      return Ok(Entry{});
    }
    auto status = ReadBlock(header);
    if (!isOk(status)) {
      return Err<Entry>(Error(getError(status)));
    }
    if (IsZeroBlock(header)) {
      fEnd = true;
      return Ok(Entry{});
    }

    auto expected = ParseNumeric(header.chksum, sizeof(header.chksum));
    if (!expected || *expected != Checksum(header)) {
      return Err<Entry>(
          Error(Error::ARCHIVE_ERROR, "tar header checksum mismatch in " + fPath));
    }
    auto size = ParseNumeric(header.size, sizeof(header.size));
    if (!size) {
      return Err<Entry>(
          Error(Error::ARCHIVE_ERROR, "invalid tar member size in " + fPath));
    }

    switch (header.typeflag) {
    case 'L': {
      auto data = ReadData(*size);
      if (!isOk(data)) {
        return Err<Entry>(Error(getError(data)));
      }
      long_name = FieldString(getValue(data).c_str(), getValue(data).size());
      continue;
    }
    case 'x': {
      auto data = ReadData(*size);
      if (!isOk(data)) {
        return Err<Entry>(Error(getError(data)));
      }
      ApplyPaxRecords(getValue(data), long_name, pax_size);
      continue;
    }
    case 'g':
    case 'K': {
      auto skipped = Skip(Padded(*size));
      if (!isOk(skipped)) {
        return Err<Entry>(Error(getError(skipped)));
      }
      continue;
    }
    default:
      break;
    }

    TarEntry entry;
    entry.type = header.typeflag;
    entry.size = pax_size ? *pax_size : *size;
    if (long_name) {
      entry.name = *long_name;
    } else {
      entry.name = FieldString(header.name, sizeof(header.name));
      std::string prefix = FieldString(header.prefix, sizeof(header.prefix));
      if (std::memcmp(header.magic, "ustar", 5) == 0 && !prefix.empty()) {
        entry.name = prefix + "/" + entry.name;
      }
    }

    // Links, devices, directories and fifos carry no data blocks
    const bool has_data = entry.type < '1' || entry.type > '6';
    uint64_t data_size = has_data ? entry.size : 0;
    auto skipped = Skip(Padded(data_size));
    if (!isOk(skipped)) {
      return Err<Entry>(Error(getError(skipped)));
    }
    return Ok(Entry{std::move(entry)});
  }
}

}  // namespace Archive
}  // namespace UPIFINDER
