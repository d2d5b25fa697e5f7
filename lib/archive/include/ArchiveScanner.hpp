/**
 * @file ArchiveScanner.hpp
 * @brief Concurrent enumeration of archive roots into one record stream
 */

#ifndef UPIFINDER_ARCHIVE_ARCHIVE_SCANNER_HPP
#define UPIFINDER_ARCHIVE_ARCHIVE_SCANNER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "BlockingQueue.hpp"
#include "upifinder/core/Error.hpp"
#include "upifinder/core/Logger.hpp"
#include "upifinder/core/Record.hpp"
#include "upifinder/core/RecordDecoder.hpp"

namespace UPIFINDER {
namespace Archive {

using RecordQueue = BlockingQueue<Record>;

struct ScanOptions {
  std::string upi;           ///< UPI filter, empty for all
  uint32_t concurrency = 8;  ///< Roots traversed at the same time
  size_t queue_capacity = RecordQueue::kDefaultCapacity;
};

/**
 * @brief Walks archive roots with a bounded pool of workers
 *
 * Architecture:
 *   1 DispatchThread -> min(N, roots) RootWorkers -> RecordQueue -> 1 consumer
 *
 * The dispatcher starts a fixed set of workers, each taking the next
 * unclaimed root until none is left, so at most `concurrency` roots are
 * open and `concurrency` threads exist at once. Every file is handled by its
 * extension:
 *   .xml  ignored, .zip likewise
 *   .tar  members decoded by base name with their declared size
 *   .lst  one path per line, size 0, undecodable lines skipped
 *   other decoded with the filesystem size
 *
 * A failure stops the root it happened in (a malformed tar only stops
 * that archive). Other roots run to completion. The queue is closed once
 * every worker has finished, and Wait() then reports the first error.
 *
 * Usage:
 *   ArchiveScanner scanner(options);
 *   auto queue = scanner.Start(roots);
 *   while (auto record = queue->Pop()) { ... }
 *   Status status = scanner.Wait();
 */
class ArchiveScanner {
public:
  explicit ArchiveScanner(ScanOptions options = ScanOptions{});
  ~ArchiveScanner();

  // Disable copy
  ArchiveScanner(const ArchiveScanner &) = delete;
  ArchiveScanner &operator=(const ArchiveScanner &) = delete;

  /**
   * @brief Start traversing the roots in the background
   * @return The output stream, closed after the last worker finishes
   */
  std::shared_ptr<RecordQueue> Start(const std::vector<std::string> &roots);

  /**
   * @brief Block until every worker finished
   * @return First error recorded, or success
   */
  Status Wait();

  /**
   * @brief Traverse one root on the calling thread
   */
  Status ScanRoot(const std::string &root, RecordQueue &queue);

  /**
   * @brief Decode the members of a tar archive
   *
   * Fails only when the archive cannot be opened; a malformed header or a
   * member that cannot be decoded ends the archive and is recorded.
   */
  Status ScanTar(const std::string &path, RecordQueue &queue);

  /**
   * @brief Decode each line of a list file
   */
  Status ScanList(const std::string &path, RecordQueue &queue);

  std::vector<Error> GetErrors() const;
  uint64_t GetRecordCount() const { return fRecordCount.load(); }
  uint64_t GetRootCount() const { return fRootCount.load(); }
  /// Worker threads spawned by the last Start, at most the concurrency
  uint32_t GetWorkerCount() const { return fWorkerCount.load(); }
  const ScanOptions &GetOptions() const { return fOptions; }

private:
  void DispatchLoop(std::vector<std::string> roots,
                    std::shared_ptr<RecordQueue> queue);
  void RootWorker(const std::vector<std::string> &roots,
                  std::atomic<size_t> &next,
                  std::shared_ptr<RecordQueue> queue);

  Status ScanFile(const std::string &path, uint64_t size, RecordQueue &queue);
  void Emit(Record &&record, RecordQueue &queue);
  void RecordError(const Error &error);

  ScanOptions fOptions;
  RecordDecoder fDecoder;
  std::shared_ptr<Logger> fLogger;

  // === Worker pool ===
  std::unique_ptr<std::thread> fDispatchThread;
  std::atomic<uint32_t> fWorkerCount{0};

  // === Results ===
  mutable std::mutex fErrorMutex;
  std::vector<Error> fErrors;
  std::atomic<uint64_t> fRecordCount{0};
  std::atomic<uint64_t> fRootCount{0};
};

}  // namespace Archive
}  // namespace UPIFINDER

#endif  // UPIFINDER_ARCHIVE_ARCHIVE_SCANNER_HPP
