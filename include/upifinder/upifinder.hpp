#ifndef UPIFINDER_HPP
#define UPIFINDER_HPP

/**
 * @file upifinder.hpp
 * @brief Main umbrella header for the upifinder archive auditor
 *
 * Usage:
 *   #include <upifinder/upifinder.hpp>
 *
 * For selective inclusion, use individual headers:
 * - For records and decoding: #include "upifinder/core/RecordDecoder.hpp"
 * - For scanning only: #include "ArchiveScanner.hpp"
 * - For gap detection only: #include "GapDetector.hpp"
 */

// ============================================================================
// CORE LIBRARY HEADERS
// ============================================================================

#include "upifinder/core/AuditConfig.hpp"
#include "upifinder/core/Error.hpp"
#include "upifinder/core/Logger.hpp"
#include "upifinder/core/RangeSet.hpp"
#include "upifinder/core/Record.hpp"
#include "upifinder/core/RecordDecoder.hpp"
#include "upifinder/core/TimeUtils.hpp"

// ============================================================================
// ARCHIVE LIBRARY HEADERS
// ============================================================================

#include "ArchiveScanner.hpp"
#include "BlockingQueue.hpp"
#include "DateWindow.hpp"
#include "TarReader.hpp"

// ============================================================================
// AUDIT LIBRARY HEADERS
// ============================================================================

#include "Aggregator.hpp"
#include "GapDetector.hpp"

// ============================================================================
// REPORT LIBRARY HEADERS
// ============================================================================

#include "ReportWriter.hpp"
#include "TableWriter.hpp"

#endif  // UPIFINDER_HPP
