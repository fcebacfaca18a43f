#pragma once

#include "transfer/Options.hpp"
#include "transfer/Settings.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace usync::transfer {

// 64 KiB buffers for sources above 1 MiB, 8 KiB otherwise
size_t bufferSizeFor(uint64_t fileSize);

// Every strategy creates missing destination parents and returns the bytes it wrote.

// Adaptive buffered read/write loop. With resumeFrom > 0 both cursors start at the
// offset and the destination is written in place instead of truncated; a destination
// shorter than the offset restarts the copy from zero.
uint64_t copyBuffered(const std::filesystem::path& src, const std::filesystem::path& dst,
                      uint64_t resumeFrom = 0);

// Whole file through one in-memory buffer. Warns above warnThreshold, never fails for size.
uint64_t copyViaRam(const std::filesystem::path& src, const std::filesystem::path& dst,
                    uint64_t warnThreshold);

#ifdef __linux__
// In-kernel sendfile(2) loop
uint64_t copySendfile(const std::filesystem::path& src, const std::filesystem::path& dst);
#endif

#ifdef __APPLE__
// copyfile(3); the result is only trusted when the destination size matches
uint64_t copyWholeFile(const std::filesystem::path& src, const std::filesystem::path& dst);
#endif

struct StrategyContext {
    const CopyOptions& opts;
    const TransferSettings& settings;
    uint64_t fileSize{0};
};

struct Strategy {
    using Predicate = std::function<bool(const StrategyContext&)>;
    using TransferFn = std::function<uint64_t(const std::filesystem::path&, const std::filesystem::path&,
                                              const StrategyContext&)>;

    std::string name;
    Predicate applies;
    TransferFn run;
    bool fallbackOnError{false}; // retry with buffered when run throws
};

// Ordered (predicate, transfer) list evaluated top to bottom.
// Buffered is always the last entry and matches everything.
class StrategyRegistry {
public:
    StrategyRegistry();

    // use_ram first, then whatever kernel primitive this platform has
    static StrategyRegistry platformDefault();

    // Inserted ahead of the buffered fallback, after earlier additions
    void add(Strategy strategy);

    [[nodiscard]] const Strategy& select(const StrategyContext& ctx) const;

    uint64_t copy(const std::filesystem::path& src, const std::filesystem::path& dst,
                  const StrategyContext& ctx) const;

    [[nodiscard]] const std::vector<Strategy>& strategies() const { return strategies_; }

private:
    std::vector<Strategy> strategies_;
};

}
