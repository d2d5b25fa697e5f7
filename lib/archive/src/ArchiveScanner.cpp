#include "ArchiveScanner.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <functional>

#include "TarReader.hpp"

namespace fs = std::filesystem;

namespace UPIFINDER {
namespace Archive {

ArchiveScanner::ArchiveScanner(ScanOptions options)
    : fOptions(std::move(options)), fDecoder(fOptions.upi),
      fLogger(Logger::GetLogger("scanner")) {
  if (fOptions.concurrency == 0) {
    fOptions.concurrency = 1;
  }
}

ArchiveScanner::~ArchiveScanner() {
  if (fDispatchThread && fDispatchThread->joinable()) {
    fDispatchThread->join();
  }
}

std::shared_ptr<RecordQueue> ArchiveScanner::Start(
    const std::vector<std::string> &roots) {
  // A previous run must be finished before the counters are reused
  if (fDispatchThread && fDispatchThread->joinable()) {
    fDispatchThread->join();
  }
  {
    std::lock_guard<std::mutex> lock(fErrorMutex);
    fErrors.clear();
  }
  fRecordCount = 0;
  fRootCount = 0;
  fWorkerCount = 0;

  auto queue = std::make_shared<RecordQueue>(fOptions.queue_capacity);
  fLogger->Debug("scanning %zu path(s) with %u worker(s)", roots.size(),
                fOptions.concurrency);
  fDispatchThread = std::make_unique<std::thread>(
      &ArchiveScanner::DispatchLoop, this, roots, queue);
  return queue;
}

Status ArchiveScanner::Wait() {
  if (fDispatchThread && fDispatchThread->joinable()) {
    fDispatchThread->join();
  }

  std::lock_guard<std::mutex> lock(fErrorMutex);
  if (!fErrors.empty()) {
    return Err<std::monostate>(Error(fErrors.front()));
  }
  return Ok();
}

std::vector<Error> ArchiveScanner::GetErrors() const {
  std::lock_guard<std::mutex> lock(fErrorMutex);
  return fErrors;
}

void ArchiveScanner::DispatchLoop(std::vector<std::string> roots,
                                  std::shared_ptr<RecordQueue> queue) {
  // Fixed pool: every worker pulls the next unclaimed root until none is left
  std::atomic<size_t> next{0};
  const size_t count =
      std::min<size_t>(fOptions.concurrency, roots.size());
  fWorkerCount = static_cast<uint32_t>(count);

  std::vector<std::thread> workers;
  workers.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    workers.emplace_back(&ArchiveScanner::RootWorker, this, std::cref(roots),
                         std::ref(next), queue);
  }
  for (auto &worker : workers) {
    worker.join();
  }

  queue->Close();
  fLogger->Debug("scan finished: %llu record(s) from %llu root(s)",
                 static_cast<unsigned long long>(fRecordCount.load()),
                 static_cast<unsigned long long>(fRootCount.load()));
}

void ArchiveScanner::RootWorker(const std::vector<std::string> &roots,
                                std::atomic<size_t> &next,
                                std::shared_ptr<RecordQueue> queue) {
  for (size_t i = next++; i < roots.size(); i = next++) {
    auto status = ScanRoot(roots[i], *queue);
    if (!isOk(status)) {
      RecordError(getError(status));
    }
  }
}

void ArchiveScanner::RecordError(const Error &error) {
  fLogger->Warning(error.message);
  std::lock_guard<std::mutex> lock(fErrorMutex);
  fErrors.push_back(error);
}

void ArchiveScanner::Emit(Record &&record, RecordQueue &queue) {
  if (queue.Push(std::move(record))) {
    ++fRecordCount;
  }
}

Status ArchiveScanner::ScanRoot(const std::string &root, RecordQueue &queue) {
  std::error_code ec;
  fs::file_status status = fs::status(root, ec);
  if (status.type() == fs::file_type::not_found) {
    fLogger->Debug("skipping missing path %s", root.c_str());
    return Ok();
  }
  if (ec) {
    return Err<std::monostate>(
        Error(Error::SYSTEM_ERROR, "cannot stat " + root, ec.value()));
  }

  ++fRootCount;
  fLogger->Debug("walking %s", root.c_str());

  if (fs::is_regular_file(status)) {
    uint64_t size = fs::file_size(root, ec);
    if (ec) {
      return Err<std::monostate>(
          Error(Error::SYSTEM_ERROR, "cannot stat " + root, ec.value()));
    }
    return ScanFile(root, size, queue);
  }
  if (!fs::is_directory(status)) {
    return Ok();
  }

  fs::recursive_directory_iterator it(root, ec);
  if (ec) {
    return Err<std::monostate>(
        Error(Error::SYSTEM_ERROR, "cannot walk " + root, ec.value()));
  }
  const fs::recursive_directory_iterator end;
  while (it != end) {
    if (queue.IsClosed()) {
      return Ok();
    }
    const fs::directory_entry &entry = *it;
    std::error_code entry_ec;
    if (!entry.is_directory(entry_ec) && entry.is_regular_file(entry_ec)) {
      uint64_t size = entry.file_size(entry_ec);
      if (entry_ec) {
        return Err<std::monostate>(Error(Error::SYSTEM_ERROR,
                                         "cannot stat " + entry.path().string(),
                                         entry_ec.value()));
      }
      auto scanned = ScanFile(entry.path().string(), size, queue);
      if (!isOk(scanned)) {
        return scanned;
      }
    }

    it.increment(ec);
    if (ec) {
      return Err<std::monostate>(
          Error(Error::SYSTEM_ERROR, "cannot walk " + root, ec.value()));
    }
  }
  return Ok();
}

Status ArchiveScanner::ScanFile(const std::string &path, uint64_t size,
                                RecordQueue &queue) {
  const std::string ext = Extension(path);
  if (ext == ".xml" || ext == ".zip") {
    return Ok();
  }
  if (ext == ".tar") {
    return ScanTar(path, queue);
  }
  if (ext == ".lst") {
    return ScanList(path, queue);
  }

  if (!fDecoder.MatchesFilter(BaseName(path))) {
    return Ok();
  }
  auto decoded = fDecoder.Decode(path, size);
  if (!isOk(decoded)) {
    return Err<std::monostate>(Error(getError(decoded)));
  }
  if (getValue(decoded)) {
    Emit(std::move(*getValue(decoded)), queue);
  }
  return Ok();
}

Status ArchiveScanner::ScanTar(const std::string &path, RecordQueue &queue) {
  TarReader reader;
  auto opened = reader.Open(path);
  if (!isOk(opened)) {
    return opened;
  }

  while (!queue.IsClosed()) {
    auto next = reader.Next();
    if (!isOk(next)) {
      RecordError(getError(next));
      break;
    }
    const auto &entry = getValue(next);
    if (!entry) {
      break;
    }
    if (!entry->IsRegular() || Extension(entry->name) == ".xml") {
      continue;
    }
    if (!fDecoder.MatchesFilter(BaseName(entry->name))) {
      continue;
    }

    auto decoded = fDecoder.Decode(entry->name, entry->size);
    if (!isOk(decoded)) {
      Error error = getError(decoded);
      error.message += " (archive " + path + ")";
      RecordError(error);
      break;
    }
    if (getValue(decoded)) {
      Emit(std::move(*getValue(decoded)), queue);
    }
  }
  return Ok();
}

Status ArchiveScanner::ScanList(const std::string &path, RecordQueue &queue) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return Err<std::monostate>(
        Error(Error::SYSTEM_ERROR, "cannot open list " + path, errno));
  }

  std::string line;
  while (std::getline(in, line)) {
    if (queue.IsClosed()) {
      return Ok();
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || Extension(line) == ".xml") {
      continue;
    }
    if (!fDecoder.MatchesFilter(BaseName(line))) {
      continue;
    }
    auto decoded = fDecoder.Decode(line, 0);
    if (!isOk(decoded)) {
      fLogger->Debug("skipping entry of %s: %s", path.c_str(),
                     getError(decoded).message.c_str());
      continue;
    }
    if (getValue(decoded)) {
      Emit(std::move(*getValue(decoded)), queue);
    }
  }
  if (in.bad()) {
    return Err<std::monostate>(
        Error(Error::SYSTEM_ERROR, "cannot read list " + path, errno));
  }
  return Ok();
}

}  // namespace Archive
}  // namespace UPIFINDER
