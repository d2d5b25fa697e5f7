#include "upifinder/core/RecordDecoder.hpp"

#include <algorithm>
#include <limits>

namespace UPIFINDER {

const std::vector<int> kImageOrigins = {0x33, 0x34, 0x37, 0x38, 0x42,
                                        0x43, 0x44, 0x45, 0x46, 0x47};
const std::vector<int> kScienceOrigins = {0x35, 0x36, 0x39, 0x40, 0x41, 0x51};

namespace {

constexpr size_t kMinFields = 6;

std::vector<std::string> Split(const std::string &text, char sep) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = text.find(sep, start);
    if (pos == std::string::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// Source codes are signed 8-bit hexadecimal values
Result<int> ParseSource(const std::string &text) {
  if (text.empty()) {
    return Err<int>(Error(Error::DECODE_ERROR, "empty source field"));
  }
  int value = 0;
  for (char c : text) {
    int digit = HexValue(c);
    if (digit < 0) {
      return Err<int>(
          Error(Error::DECODE_ERROR, "invalid source field: " + text));
    }
    value = value * 16 + digit;
    if (value > std::numeric_limits<int8_t>::max()) {
      return Err<int>(
          Error(Error::DECODE_ERROR, "source out of range: " + text));
    }
  }
  return Ok(std::move(value));
}

Result<uint32_t> ParseSequence(const std::string &text) {
  if (text.empty()) {
    return Err<uint32_t>(Error(Error::DECODE_ERROR, "empty sequence field"));
  }
  uint64_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return Err<uint32_t>(
          Error(Error::DECODE_ERROR, "invalid sequence field: " + text));
    }
    value = value * 10 + static_cast<uint64_t>(c - '0');
    if (value > std::numeric_limits<uint32_t>::max()) {
      return Err<uint32_t>(
          Error(Error::DECODE_ERROR, "sequence out of range: " + text));
    }
  }
  uint32_t sequence = static_cast<uint32_t>(value);
  return Ok(std::move(sequence));
}

}  // namespace

std::string BaseName(const std::string &path) {
  size_t end = path.find_last_not_of('/');
  if (end == std::string::npos) {
    return path.empty() ? path : "/";
  }
  size_t start = path.find_last_of('/', end);
  start = (start == std::string::npos) ? 0 : start + 1;
  return path.substr(start, end - start + 1);
}

std::string Extension(const std::string &path) {
  for (size_t i = path.size(); i > 0; --i) {
    char c = path[i - 1];
    if (c == '/') {
      break;
    }
    if (c == '.') {
      return path.substr(i - 1);
    }
  }
  return "";
}

bool Record::IsValid() const { return Extension(path) != ".bad"; }

RecordDecoder::RecordDecoder(std::string upi_filter)
    : fUPIFilter(std::move(upi_filter)) {}

bool RecordDecoder::HasAllowedCharacters(const std::string &name) {
  return std::all_of(name.begin(), name.end(), [](char b) {
    return ('A' <= b && b <= 'Z') || ('a' <= b && b <= 'z') ||
           ('0' <= b && b <= '9') || b == '-' || b == '_' || b == '.';
  });
}

bool RecordDecoder::AcceptOrigin(int origin, const std::vector<int> &origins) {
  return std::binary_search(origins.begin(), origins.end(), origin);
}

bool RecordDecoder::MatchesFilter(const std::string &base_name) const {
  return fUPIFilter.empty() || base_name.find(fUPIFilter) != std::string::npos;
}

Result<std::optional<Record>> RecordDecoder::Decode(const std::string &path,
                                                    uint64_t size) const {
  using Decoded = std::optional<Record>;

  const std::string base = BaseName(path);
  if (!HasAllowedCharacters(base) || Extension(path) == ".xml") {
    return Ok(Decoded{});
  }
  std::vector<std::string> fields = Split(base, '_');
  const size_t n = fields.size();
  if (n < kMinFields) {
    return Ok(Decoded{});
  }

  Record record;
  record.path = path;
  record.size = size;
  size_t first = fields[0].find_first_not_of('0');
  record.source = (first == std::string::npos) ? "" : fields[0].substr(first);

  auto origin = ParseSource(record.source);
  if (!isOk(origin)) {
    Error error = getError(origin);
    error.message += " in " + path;
    return Err<Decoded>(std::move(error));
  }

  const std::string &type = fields[n - 5];
  const std::vector<int> *origins = nullptr;
  if (type == "1" || type == "2") {
    origins = &kImageOrigins;
  } else if (type == "3") {
    origins = &kScienceOrigins;
  }
  if (!origins || !AcceptOrigin(getValue(origin), *origins)) {
    return Ok(Decoded{});
  }

  if (fUPIFilter.empty()) {
    std::string upi;
    for (size_t i = 1; i < n - 5; ++i) {
      if (i > 1) {
        upi += '_';
      }
      upi += fields[i];
    }
    record.upi = std::move(upi);
  } else {
    record.upi = fUPIFilter;
  }

  auto sequence = ParseSequence(fields[n - 4]);
  if (!isOk(sequence)) {
    Error error = getError(sequence);
    error.message += " in " + path;
    return Err<Decoded>(std::move(error));
  }
  record.sequence = getValue(sequence);

  auto acquired = ParseCompactTimestamp(fields[n - 3] + fields[n - 2]);
  if (!acquired) {
    return Err<Decoded>(Error(Error::DECODE_ERROR,
                              "invalid timestamp " + fields[n - 3] + "_" +
                                  fields[n - 2] + " in " + path));
  }
  record.acq_time = *acquired;

  return Ok(Decoded{std::move(record)});
}

}  // namespace UPIFINDER
