#include "transfer/CopyEngine.hpp"
#include "transfer/ChecksumVerifier.hpp"
#include "transfer/Error.hpp"
#include "storage/Backend.hpp"
#include "storage/LocalBackend.hpp"
#include "util/fsPath.hpp"
#include "logging/LogRegistry.hpp"

using namespace usync::transfer;
using namespace usync::storage;
using namespace usync::util;
using namespace usync::logging;

CopyEngine::CopyEngine(std::shared_ptr<Backend> source, std::shared_ptr<Backend> destination, CopyOptions opts)
    : source_(std::move(source)), destination_(std::move(destination)), opts_(std::move(opts)) {
    if (!source_ || !destination_) throw std::invalid_argument("CopyEngine requires two backends");
}

const Backend& CopyEngine::transferBackend() const {
    return source_->isRemote() ? *source_ : *destination_;
}

bool CopyEngine::isDirectory(const std::string& src) const {
    std::vector<fs::model::Entry> entries;
    try {
        entries = source_->list(src);
    } catch (const BackendError& e) {
        // Endpoints that cannot list only ever serve single files
        if (e.kind() != BackendError::Kind::UnsupportedOperation) throw;
        return false;
    }

    if (entries.size() == 1 && !entries.front().is_dir && trimTrailingSlash(entries.front().path) == trimTrailingSlash(src))
        return false;
    return true;
}

uint64_t CopyEngine::copyFile(const std::string& src, const std::string& dst) const {
    const auto bytes = transferBackend().copyFile(src, dst, opts_);

    if (opts_.checksum && !opts_.dry_run) ChecksumVerifier(*opts_.checksum).verifyFile(*source_, src, *destination_, dst);

    return bytes;
}

CopyStats CopyEngine::copyDirectory(const std::string& src, const std::string& dst) const {
    auto stats = transferBackend().copyDirectory(src, dst, opts_);

    if (opts_.checksum && !opts_.dry_run)
        ChecksumVerifier(*opts_.checksum).verifyDirectory(*source_, src, *destination_, dst, opts_.filters.get());

    return stats;
}

CopyStats CopyEngine::copy(const std::string& src, const std::string& dst) const {
    if (isDirectory(src)) return copyDirectory(src, dst);

    auto stats = opts_.wantsSummary() ? CopyStats::start() : CopyStats::newMinimal();
    const auto bytes = copyFile(src, dst);
    if (!opts_.dry_run) stats.recordCopy(bytes);
    return stats;
}

CopyStats CopyEngine::move(const std::string& src, const std::string& dst) const {
    if (opts_.dry_run) {
        LogRegistry::transfer()->info("[dry-run] Would move {} -> {}", src, dst);
        return opts_.wantsSummary() ? CopyStats::start() : CopyStats::newMinimal();
    }

    const bool dir = isDirectory(src);
    if (dir && opts_.filters)
        throw BackendError::unsupported("Moving a directory with filters would delete the files they leave behind");

    auto stats = dir ? copyDirectory(src, dst) : CopyStats{};
    if (!dir) {
        stats = opts_.wantsSummary() ? CopyStats::start() : CopyStats::newMinimal();
        stats.recordCopy(copyFile(src, dst));
    }
    source_->remove(src);

    if (opts_.verbose) LogRegistry::transfer()->info("Moved {} -> {}", src, dst);
    return stats;
}

uint64_t CopyEngine::copyFileResuming(const std::string& src, const std::string& dst, const uint64_t offset) const {
    const auto* local = dynamic_cast<const LocalBackend*>(&transferBackend());
    if (!local || source_->isRemote() || destination_->isRemote())
        throw BackendError::unsupported("Resume is only supported between local paths");

    const auto bytes = local->copyFileResuming(src, dst, offset, opts_);

    if (opts_.checksum && !opts_.dry_run) ChecksumVerifier(*opts_.checksum).verifyFile(*source_, src, *destination_, dst);

    return bytes;
}
