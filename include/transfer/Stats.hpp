#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace usync::transfer {

struct CopyStats {
    using Clock = std::chrono::steady_clock;

    uint64_t files_copied{0};
    uint64_t files_skipped{0};
    uint64_t bytes_copied{0};
    std::optional<Clock::time_point> start_time{};

    // Counters stay at zero; used when nobody will read a summary
    static CopyStats newMinimal() { return {}; }

    // Counting accumulator, clock started now
    static CopyStats start() {
        CopyStats s;
        s.start_time = Clock::now();
        return s;
    }

    [[nodiscard]] bool isMinimal() const { return !start_time.has_value(); }

    void recordCopy(uint64_t bytes);
    void recordSkip();

    // Order-independent: sums only. A minimal accumulator ignores merges.
    void merge(const CopyStats& other);

    [[nodiscard]] std::chrono::duration<double> elapsed() const;
    [[nodiscard]] double throughputBytesPerSec() const;

    void logSummary() const;
};

struct SyncStats {
    uint64_t files_copied{0};
    uint64_t bytes_copied{0};
    uint64_t files_deleted{0};

    void logSummary() const;
};

void to_json(nlohmann::json& j, const CopyStats& stats);
void to_json(nlohmann::json& j, const SyncStats& stats);

}
