#ifndef DCARCHIVE_COMMON_CONSTANTS_H
#define DCARCHIVE_COMMON_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace dcarchive::constants {

// India Standard Time, the zone the portal and the archive timestamps use.
static constexpr int IST_OFFSET_MINUTES = 5 * 60 + 30;

namespace archive {
static constexpr const char *DEFAULT_LOCAL_DIR = "./local_dc_judgments_data";
static constexpr const char *METADATA_ARCHIVE = "metadata";
static constexpr const char *DOCUMENT_ARCHIVE = "orders";
static constexpr const char *METADATA_ROOT = "metadata";
static constexpr const char *DOCUMENT_ROOT = "data";
static constexpr const char *CONTAINER_DIR = "tar";
static constexpr const char *PART_SUFFIX = ".tar";
static constexpr const char *INDEX_SUFFIX = ".index.json";
}  // namespace archive

namespace tar {
static constexpr std::size_t BLOCK_SIZE = 512;
static constexpr std::size_t RECORD_SIZE = 20 * BLOCK_SIZE;  // 10KB
}  // namespace tar

namespace ledger {
static constexpr const char *DEFAULT_LEDGER_FILE = "./dc_completed_tasks.json";
}  // namespace ledger

namespace backfill {
static constexpr const char *DEFAULT_TRACKING_FILE = "./dc_fill_track.json";
static constexpr int DEFAULT_EPOCH_YEAR = 1950;
static constexpr int DEFAULT_CHUNK_YEARS = 5;
static constexpr double DEFAULT_TIMEOUT_HOURS = 5.5;
}  // namespace backfill

namespace runner {
// Districts have no pagination and roughly five years of data per query.
static constexpr int DEFAULT_DAY_STEP = 2100;
// Kept low to stay under the portal's rate limiting.
static constexpr std::size_t DEFAULT_MAX_WORKERS = 2;
static constexpr int DEFAULT_MAX_RETRIES = 3;
static constexpr double DEFAULT_BASE_DELAY_SECONDS = 1.0;
static constexpr double DEFAULT_MAX_DELAY_SECONDS = 30.0;
static constexpr int DEFAULT_SOLVER_ATTEMPTS = 11;
static constexpr int DEFAULT_SEARCH_ATTEMPTS = 4;
}  // namespace runner

}  // namespace dcarchive::constants

#endif  // DCARCHIVE_COMMON_CONSTANTS_H
