#include "transfer/Strategy.hpp"
#include "transfer/Error.hpp"
#include "util/FileDescriptor.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>
#include <fmt/format.h>

#ifdef __linux__
#include <sys/sendfile.h>
#endif

#ifdef __APPLE__
#include <copyfile.h>
#endif

using namespace usync::transfer;
using namespace usync::util;
using namespace usync::logging;

namespace stdfs = std::filesystem;

namespace {

constexpr uint64_t SMALL_FILE_LIMIT = 1024 * 1024;
constexpr size_t LARGE_BUFFER = 64 * 1024;
constexpr size_t SMALL_BUFFER = 8 * 1024;

void prepareParent(const stdfs::path& dst) {
    try {
        ensureParentDirs(dst);
    } catch (const stdfs::filesystem_error& e) {
        throw BackendError::io("Failed to create directory", dst.parent_path().string(), e.code().message());
    }
}

FileDescriptor openSource(const stdfs::path& src, struct stat& st) {
    FileDescriptor fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        if (errno == ENOENT) throw BackendError::notFound(src.string());
        throw BackendError::ioErrno("Failed to open source", src.string(), errno);
    }
    if (::fstat(fd.get(), &st) == -1) throw BackendError::ioErrno("Failed to stat source", src.string(), errno);
    return fd;
}

FileDescriptor openDestination(const stdfs::path& dst, const int flags, const mode_t mode) {
    FileDescriptor fd(::open(dst.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC | flags, mode & 07777));
    if (!fd.valid()) throw BackendError::ioErrno("Failed to open destination", dst.string(), errno);
    return fd;
}

void writeAll(const int fd, const char* data, size_t len, const stdfs::path& dst) {
    while (len > 0) {
        const ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw BackendError::ioErrno("Failed to write", dst.string(), errno);
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
}

uint64_t fileSizeOf(const stdfs::path& p) {
    std::error_code ec;
    const auto size = stdfs::file_size(p, ec);
    return ec ? 0 : size;
}

}

size_t usync::transfer::bufferSizeFor(const uint64_t fileSize) {
    return fileSize > SMALL_FILE_LIMIT ? LARGE_BUFFER : SMALL_BUFFER;
}

uint64_t usync::transfer::copyBuffered(const stdfs::path& src, const stdfs::path& dst, uint64_t resumeFrom) {
    prepareParent(dst);

    struct stat st{};
    const auto in = openSource(src, st);
    const auto srcSize = static_cast<uint64_t>(st.st_size);

    if (resumeFrom > srcSize)
        throw BackendError(BackendError::Kind::InvalidPath,
                           fmt::format("Resume offset {} is past the end of {} ({} bytes)", resumeFrom, src.string(), srcSize),
                           src.string());

    if (resumeFrom > 0 && fileSizeOf(dst) < resumeFrom) {
        LogRegistry::transfer()->debug("[copyBuffered] {} shorter than resume offset {}, restarting", dst.string(), resumeFrom);
        resumeFrom = 0;
    }

    const auto out = openDestination(dst, resumeFrom > 0 ? 0 : O_TRUNC, st.st_mode);

    if (resumeFrom > 0) {
        const auto off = static_cast<off_t>(resumeFrom);
        if (::lseek(in.get(), off, SEEK_SET) == -1) throw BackendError::ioErrno("Failed to seek", src.string(), errno);
        if (::lseek(out.get(), off, SEEK_SET) == -1) throw BackendError::ioErrno("Failed to seek", dst.string(), errno);
    }

    std::vector<char> buffer(bufferSizeFor(srcSize));
    uint64_t written = 0;

    while (true) {
        const ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw BackendError::ioErrno("Failed to read", src.string(), errno);
        }
        if (n == 0) break;
        writeAll(out.get(), buffer.data(), static_cast<size_t>(n), dst);
        written += static_cast<uint64_t>(n);
    }

    // Drop any tail left over from a longer previous destination
    if (resumeFrom > 0 && ::ftruncate(out.get(), static_cast<off_t>(resumeFrom + written)) == -1)
        throw BackendError::ioErrno("Failed to truncate", dst.string(), errno);

    if (::fsync(out.get()) == -1 && errno != EINVAL)
        throw BackendError::ioErrno("Failed to flush", dst.string(), errno);

    return written;
}

uint64_t usync::transfer::copyViaRam(const stdfs::path& src, const stdfs::path& dst, const uint64_t warnThreshold) {
    prepareParent(dst);

    const auto size = fileSizeOf(src);
    if (size > warnThreshold)
        LogRegistry::transfer()->warn("[copyViaRam] Loading {} ({}) fully into memory",
                                      src.string(), bytesToSize(size));

    std::vector<uint8_t> data;
    try {
        data = readFileToVector(src);
    } catch (const std::runtime_error& e) {
        throw BackendError::io("Failed to read file via RAM", src.string(), e.what());
    }

    try {
        writeFile(dst, data);
    } catch (const std::runtime_error& e) {
        throw BackendError::io("Failed to write file via RAM", dst.string(), e.what());
    }

    return data.size();
}

#ifdef __linux__
uint64_t usync::transfer::copySendfile(const stdfs::path& src, const stdfs::path& dst) {
    prepareParent(dst);

    struct stat st{};
    const auto in = openSource(src, st);
    const auto out = openDestination(dst, O_TRUNC, st.st_mode);

    const auto total = static_cast<uint64_t>(st.st_size);
    ::posix_fadvise(in.get(), 0, st.st_size, POSIX_FADV_SEQUENTIAL);

    off_t offset = 0;
    uint64_t remaining = total;
    while (remaining > 0) {
        const ssize_t n = ::sendfile(out.get(), in.get(), &offset, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw BackendError::ioErrno("sendfile failed", src.string(), errno);
        }
        if (n == 0) break; // source shrank underneath us
        remaining -= static_cast<uint64_t>(n);
    }

    return total - remaining;
}
#endif

#ifdef __APPLE__
uint64_t usync::transfer::copyWholeFile(const stdfs::path& src, const stdfs::path& dst) {
    prepareParent(dst);

    const auto size = fileSizeOf(src);
    if (::copyfile(src.c_str(), dst.c_str(), nullptr, COPYFILE_DATA) != 0)
        throw BackendError::ioErrno("copyfile failed", src.string(), errno);

    if (fileSizeOf(dst) != size)
        throw BackendError::io("copyfile size mismatch for", dst.string(), fmt::format("expected {} bytes", size));

    return size;
}
#endif

StrategyRegistry::StrategyRegistry() {
    strategies_.push_back({
        "buffered",
        [](const StrategyContext&) { return true; },
        [](const stdfs::path& src, const stdfs::path& dst, const StrategyContext&) { return copyBuffered(src, dst); },
        false
    });
}

StrategyRegistry StrategyRegistry::platformDefault() {
    StrategyRegistry reg;

    reg.add({
        "ram",
        [](const StrategyContext& ctx) { return ctx.opts.use_ram; },
        [](const stdfs::path& src, const stdfs::path& dst, const StrategyContext& ctx) {
            return copyViaRam(src, dst, ctx.settings.ramWarnThreshold);
        },
        false
    });

#ifdef __linux__
    reg.add({
        "sendfile",
        [](const StrategyContext& ctx) { return ctx.fileSize > ctx.settings.zeroCopyThreshold; },
        [](const stdfs::path& src, const stdfs::path& dst, const StrategyContext&) { return copySendfile(src, dst); },
        true
    });
#endif

#ifdef __APPLE__
    reg.add({
        "copyfile",
        [](const StrategyContext& ctx) { return ctx.fileSize > ctx.settings.zeroCopyThreshold; },
        [](const stdfs::path& src, const stdfs::path& dst, const StrategyContext&) { return copyWholeFile(src, dst); },
        true
    });
#endif

    return reg;
}

void StrategyRegistry::add(Strategy strategy) {
    strategies_.insert(strategies_.end() - 1, std::move(strategy));
}

const Strategy& StrategyRegistry::select(const StrategyContext& ctx) const {
    for (const auto& s : strategies_)
        if (s.applies(ctx)) return s;
    return strategies_.back();
}

uint64_t StrategyRegistry::copy(const stdfs::path& src, const stdfs::path& dst, const StrategyContext& ctx) const {
    const auto& strategy = select(ctx);
    LogRegistry::transfer()->debug("[StrategyRegistry] {} -> {} via {}", src.string(), dst.string(), strategy.name);

    if (!strategy.fallbackOnError) return strategy.run(src, dst, ctx);

    try {
        return strategy.run(src, dst, ctx);
    } catch (const BackendError& e) {
        if (e.kind() == BackendError::Kind::NotFound) throw;
        LogRegistry::transfer()->warn("[StrategyRegistry] {} failed for {}, falling back to buffered: {}",
                                      strategy.name, src.string(), e.what());
    }

    return strategies_.back().run(src, dst, ctx);
}
