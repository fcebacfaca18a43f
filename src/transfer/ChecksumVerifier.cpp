#include "transfer/ChecksumVerifier.hpp"
#include "storage/Backend.hpp"
#include "storage/List.hpp"
#include "filters/Chain.hpp"
#include "util/fsPath.hpp"
#include "logging/LogRegistry.hpp"

using namespace usync::transfer;
using namespace usync::storage;
using namespace usync::util;
using namespace usync::logging;

std::optional<ChecksumMismatch> ChecksumVerifier::compare(const Backend& srcBackend, const std::string& src,
                                                          const Backend& dstBackend, const std::string& dst) const {
    const auto expected = srcBackend.checksum(src, algo_);
    const auto actual = dstBackend.checksum(dst, algo_);

    LogRegistry::crypto()->debug("[ChecksumVerifier] {} {} = {}, {} = {}", to_string(algo_), src, expected, dst, actual);

    if (expected == actual) return std::nullopt;
    return ChecksumMismatch{src, dst, expected, actual};
}

void ChecksumVerifier::verifyFile(const Backend& srcBackend, const std::string& src,
                                  const Backend& dstBackend, const std::string& dst) const {
    if (auto mismatch = compare(srcBackend, src, dstBackend, dst)) {
        LogRegistry::crypto()->error("[ChecksumVerifier] Mismatch for {}: expected {}, got {}",
                                     dst, mismatch->expected, mismatch->actual);
        throw ChecksumMismatchError(std::vector{std::move(*mismatch)});
    }
}

void ChecksumVerifier::verifyDirectory(const Backend& srcBackend, const std::string& srcRoot,
                                       const Backend& dstBackend, const std::string& dstRoot,
                                       const filters::Chain* filter) const {
    std::vector<ChecksumMismatch> mismatches;
    size_t checked = 0;

    for (const auto& entry : listRecursive(srcBackend, srcRoot)) {
        if (entry.is_dir) continue;
        if (filter && !filter->matches(entry)) continue;

        const auto rel = relativeTo(srcRoot, entry.path);
        if (!rel) throw BackendError::invalidPath(entry.path, "Listed entry is outside of " + srcRoot);

        const auto dst = joinUnder(dstRoot, *rel);
        if (auto mismatch = compare(srcBackend, entry.path, dstBackend, dst)) mismatches.push_back(std::move(*mismatch));
        ++checked;
    }

    if (!mismatches.empty()) {
        LogRegistry::crypto()->error("[ChecksumVerifier] {} of {} files failed verification", mismatches.size(), checked);
        throw ChecksumMismatchError(std::move(mismatches));
    }

    LogRegistry::crypto()->info("[ChecksumVerifier] {} files verified with {}", checked, to_string(algo_));
}
