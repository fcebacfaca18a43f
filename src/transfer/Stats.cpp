#include "transfer/Stats.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace usync::transfer;
using namespace usync::logging;
using namespace usync::util;

void CopyStats::recordCopy(const uint64_t bytes) {
    if (isMinimal()) return;
    ++files_copied;
    bytes_copied += bytes;
}

void CopyStats::recordSkip() {
    if (isMinimal()) return;
    ++files_skipped;
}

void CopyStats::merge(const CopyStats& other) {
    if (isMinimal()) return;
    files_copied += other.files_copied;
    files_skipped += other.files_skipped;
    bytes_copied += other.bytes_copied;
}

std::chrono::duration<double> CopyStats::elapsed() const {
    if (!start_time) return std::chrono::duration<double>::zero();
    return Clock::now() - *start_time;
}

double CopyStats::throughputBytesPerSec() const {
    const auto secs = elapsed().count();
    if (secs <= 0.0) return 0.0;
    return static_cast<double>(bytes_copied) / secs;
}

void CopyStats::logSummary() const {
    if (isMinimal()) return;
    LogRegistry::usync()->info("Copied {} file(s), {} in {:.2f}s ({}/s), {} skipped",
                               files_copied, bytesToSize(bytes_copied), elapsed().count(),
                               bytesToSize(static_cast<uintmax_t>(throughputBytesPerSec())), files_skipped);
}

void SyncStats::logSummary() const {
    LogRegistry::usync()->info("Sync complete: {} file(s) copied ({}), {} deleted",
                               files_copied, bytesToSize(bytes_copied), files_deleted);
}

namespace usync::transfer {

void to_json(nlohmann::json& j, const CopyStats& stats) {
    j = {
        {"files_copied", stats.files_copied},
        {"files_skipped", stats.files_skipped},
        {"bytes_copied", stats.bytes_copied},
        {"elapsed_seconds", stats.elapsed().count()}
    };
}

void to_json(nlohmann::json& j, const SyncStats& stats) {
    j = {
        {"files_copied", stats.files_copied},
        {"bytes_copied", stats.bytes_copied},
        {"files_deleted", stats.files_deleted}
    };
}

}
