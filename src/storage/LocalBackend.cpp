#include "storage/LocalBackend.hpp"
#include "storage/tasks/CopyFile.hpp"
#include "concurrency/ThreadPool.hpp"
#include "crypto/Digest.hpp"
#include "filters/Chain.hpp"
#include "transfer/Error.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <future>
#include <mutex>
#include <optional>
#include <fcntl.h>
#include <sys/stat.h>

using namespace usync::storage;
using namespace usync::transfer;
using namespace usync::concurrency;
using namespace usync::logging;
using namespace usync::fs::model;

namespace stdfs = std::filesystem;

struct LocalBackend::DirectoryCopy {
    const CopyOptions& opts;
    CopyStats& stats;
    std::mutex statsMutex;                // guards the single per-level merge
    std::unique_ptr<ThreadPool> pool;     // null when copying sequentially
};

namespace {

Entry entryFor(const stdfs::path& p, const struct stat& st) {
    const bool isDir = S_ISDIR(st.st_mode);
    return {
        p.string(),
        S_ISREG(st.st_mode) ? static_cast<uint64_t>(st.st_size) : 0,
        isDir,
        static_cast<uint64_t>(st.st_mtim.tv_sec)
    };
}

struct stat statOrThrow(const stdfs::path& p) {
    struct stat st{};
    if (::stat(p.c_str(), &st) == 0) return st;
    if (errno == ENOENT && ::lstat(p.c_str(), &st) == 0) return st; // dangling symlink
    if (errno == ENOENT) throw BackendError::notFound(p.string());
    throw BackendError::ioErrno("Failed to read metadata", p.string(), errno);
}

// Directory children are never followed through symlinks
struct stat lstatOrThrow(const stdfs::path& p) {
    struct stat st{};
    if (::lstat(p.c_str(), &st) == 0) return st;
    if (errno == ENOENT) throw BackendError::notFound(p.string());
    throw BackendError::ioErrno("Failed to read metadata", p.string(), errno);
}

// Carries the source mtime over so an unchanged file compares equal on the next sync
void preserveTimes(const stdfs::path& src, const stdfs::path& dst) {
    struct stat st{};
    if (::stat(src.c_str(), &st) == -1) throw BackendError::ioErrno("Failed to stat", src.string(), errno);

    const struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, dst.c_str(), times, 0) == -1)
        throw BackendError::ioErrno("Failed to set times on", dst.string(), errno);
}

void createDirectory(const stdfs::path& dir, const CopyOptions& opts) {
    std::error_code ec;
    if (stdfs::is_directory(dir, ec)) return;

    if (opts.verbose) LogRegistry::transfer()->info("Creating directory: {}", dir.string());
    stdfs::create_directories(dir, ec);
    if (ec) throw BackendError::io("Failed to create directory", dir, ec);
}

}

LocalBackend::LocalBackend(TransferSettings settings, StrategyRegistry strategies)
    : settings_(std::move(settings)), strategies_(std::move(strategies)) {}

void LocalBackend::requireFile(const stdfs::path& src) {
    std::error_code ec;
    const auto status = stdfs::status(src, ec);
    if (!stdfs::exists(status)) throw BackendError::notFound(src.string());
    if (!stdfs::is_regular_file(status)) throw BackendError::invalidPath(src.string(), "Source is not a file");
}

uint64_t LocalBackend::transferOne(const stdfs::path& src, const stdfs::path& dst,
                                   const uint64_t size, const CopyOptions& opts) const {
    if (opts.progress) LogRegistry::transfer()->info("Copying {} ({} bytes)", src.string(), size);

    const StrategyContext ctx{opts, settings_, size};
    const auto bytes = strategies_.copy(src, dst, ctx);
    preserveTimes(src, dst);

    if (opts.verbose) LogRegistry::transfer()->info("Copied {} bytes from {} to {}", bytes, src.string(), dst.string());
    return bytes;
}

uint64_t LocalBackend::copyFile(const std::string& src, const std::string& dst, const CopyOptions& opts) const {
    const stdfs::path srcPath(src), dstPath(dst);
    requireFile(srcPath);

    if (opts.dry_run) {
        LogRegistry::transfer()->info("[dry-run] Would copy {} -> {}", src, dst);
        return 0;
    }

    std::error_code ec;
    const auto size = stdfs::file_size(srcPath, ec);
    if (ec) throw BackendError::io("Failed to read metadata", srcPath, ec);

    return transferOne(srcPath, dstPath, size, opts);
}

uint64_t LocalBackend::copyFileResuming(const std::string& src, const std::string& dst,
                                        const uint64_t offset, const CopyOptions& opts) const {
    requireFile(src);

    if (opts.dry_run) {
        LogRegistry::transfer()->info("[dry-run] Would resume {} -> {} at offset {}", src, dst, offset);
        return 0;
    }

    const auto bytes = copyBuffered(src, dst, offset);
    preserveTimes(src, dst);
    if (opts.verbose) LogRegistry::transfer()->info("Resumed {} at {}: {} bytes written", dst, offset, bytes);
    return bytes;
}

CopyStats LocalBackend::copyDirectory(const std::string& src, const std::string& dst, const CopyOptions& opts) const {
    const stdfs::path srcPath(src), dstPath(dst);

    if (!opts.recursive) throw BackendError::unsupported("Directory copy requires the recursive option: " + src);

    std::error_code ec;
    const auto status = stdfs::status(srcPath, ec);
    if (!stdfs::exists(status)) throw BackendError::notFound(src);
    if (!stdfs::is_directory(status)) throw BackendError::invalidPath(src, "Source is not a directory");

    auto stats = opts.wantsSummary() ? CopyStats::start() : CopyStats::newMinimal();

    if (opts.dry_run) {
        LogRegistry::transfer()->info("[dry-run] Would copy directory {} -> {}", src, dst);
        return stats;
    }

    DirectoryCopy job{opts, stats, {}, nullptr};
    if (settings_.parallel) job.pool = std::make_unique<ThreadPool>(settings_.maxWorkers);

    createDirectory(dstPath, opts);
    copyLevel(srcPath, dstPath, job);

    return stats;
}

void LocalBackend::copyLevel(const stdfs::path& src, const stdfs::path& dst, DirectoryCopy& job) const {
    struct PendingFile { stdfs::path src, dst; uint64_t size; };

    std::vector<PendingFile> files;
    std::vector<stdfs::path> subdirs;
    auto levelStats = job.stats.isMinimal() ? CopyStats::newMinimal() : CopyStats::start();

    std::error_code ec;
    stdfs::directory_iterator it(src, ec), end;
    if (ec) throw BackendError::io("Failed to read directory", src, ec);

    for (; it != end; it.increment(ec)) {
        if (ec) throw BackendError::io("Failed to read directory entry in", src, ec);

        const auto& entryPath = it->path();
        const auto st = lstatOrThrow(entryPath);

        if (S_ISDIR(st.st_mode)) {
            subdirs.push_back(entryPath);
            continue;
        }

        if (!S_ISREG(st.st_mode)) {
            LogRegistry::storage()->debug("[LocalBackend] Skipping {} {}",
                                          S_ISLNK(st.st_mode) ? "symlink" : "special file", entryPath.string());
            continue;
        }

        if (job.opts.filters && !job.opts.filters->matches(entryFor(entryPath, st))) {
            if (job.opts.verbose) LogRegistry::transfer()->info("Filtered out: {}", entryPath.string());
            levelStats.recordSkip();
            continue;
        }

        files.push_back({entryPath, dst / entryPath.filename(), static_cast<uint64_t>(st.st_size)});
    }

    if (job.pool && files.size() > 1) {
        std::vector<std::future<concurrency::ExpectedFuture>> futures;
        futures.reserve(files.size());

        for (const auto& f : files) {
            auto task = std::make_shared<tasks::CopyFile>(*this, f.src, f.dst, f.size, job.opts);
            futures.push_back(task->getFuture());
            job.pool->submit(task);
        }

        // Every sibling must settle before the level is merged or the first failure rethrown
        std::exception_ptr firstError;
        for (auto& fut : futures) {
            try {
                levelStats.recordCopy(fut.get());
            } catch (const std::exception&) {
                if (!firstError) firstError = std::current_exception();
            }
        }
        if (firstError) std::rethrow_exception(firstError);
    } else {
        for (const auto& f : files) levelStats.recordCopy(transferOne(f.src, f.dst, f.size, job.opts));
    }

    {
        std::scoped_lock lock(job.statsMutex);
        job.stats.merge(levelStats);
    }

    std::ranges::sort(subdirs);
    for (const auto& sub : subdirs) {
        const auto dstSub = dst / sub.filename();
        if (job.opts.progress) LogRegistry::transfer()->info("Copying directory: {} -> {}", sub.string(), dstSub.string());
        createDirectory(dstSub, job.opts);
        copyLevel(sub, dstSub, job);
    }
}

std::vector<Entry> LocalBackend::list(const std::string& path) const {
    const stdfs::path p(path);
    const auto st = statOrThrow(p);

    if (!S_ISDIR(st.st_mode)) return {entryFor(p, st)};

    std::vector<Entry> entries;
    std::error_code ec;
    stdfs::directory_iterator it(p, ec), end;
    if (ec) throw BackendError::io("Failed to read directory", p, ec);

    for (; it != end; it.increment(ec)) {
        if (ec) throw BackendError::io("Failed to read directory entry in", p, ec);
        entries.push_back(entryFor(it->path(), lstatOrThrow(it->path())));
    }

    std::ranges::sort(entries, {}, &Entry::path);
    return entries;
}

void LocalBackend::remove(const std::string& path) const {
    const stdfs::path p(path);
    std::error_code ec;
    const auto status = stdfs::symlink_status(p, ec);
    if (!stdfs::exists(status)) throw BackendError::notFound(path);

    if (stdfs::is_directory(status)) {
        stdfs::remove_all(p, ec);
        if (ec) throw BackendError::io("Failed to delete directory", p, ec);
    } else {
        stdfs::remove(p, ec);
        if (ec) throw BackendError::io("Failed to delete file", p, ec);
    }

    LogRegistry::storage()->debug("[LocalBackend] Deleted {}", path);
}

std::string LocalBackend::checksum(const std::string& path, const ChecksumAlgorithm algo) const {
    std::error_code ec;
    const auto status = stdfs::status(path, ec);
    if (!stdfs::exists(status)) throw BackendError::notFound(path);
    if (!stdfs::is_regular_file(status)) throw BackendError::invalidPath(path, "Not a regular file");
    return crypto::digestFile(path, algo);
}
