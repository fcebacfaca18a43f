#include "storage/remote/RemoteBackend.hpp"
#include "transfer/Error.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace usync::storage::remote;
using namespace usync::storage;
using namespace usync::transfer;
using namespace usync::util;
using namespace usync::logging;

namespace stdfs = std::filesystem;

namespace {

std::string trimmed(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}

RemoteBackend::RemoteBackend(Location location, TransferSettings settings)
    : location_(std::move(location)), settings_(std::move(settings)) {}

bool RemoteBackend::owns(const std::string& path) const {
    return path.starts_with(location_.prefix());
}

ProcessResult RemoteBackend::run(const std::vector<std::string>& argv, const std::string& what,
                                 const std::string& subject) const {
    LogRegistry::remote()->debug("[{}] Executing: {}", name(), joinArgs(argv));

    ProcessResult res;
    try {
        res = runProcess(argv);
    } catch (const std::runtime_error& e) {
        throw BackendError::connection(fmt::format("Failed to execute {}", argv.front()), e.what());
    }

    if (res.ok()) return res;

    const auto err = trimmed(res.err);
    LogRegistry::remote()->warn("[{}] {} failed (exit {}): {}", name(), what, res.exitCode, err);

    if (res.exitCode == EXEC_FAILED)
        throw BackendError::connection(fmt::format("{} failed: {} not found or not executable", what, argv.front()), err);

    if (!subject.empty() && (err.find("No such file") != std::string::npos || err.find("Not Found") != std::string::npos
                             || err.find("(404)") != std::string::npos))
        throw BackendError::notFound(subject);

    throw BackendError(BackendError::Kind::IoError, fmt::format("{} failed", what), subject,
                       err.empty() ? fmt::format("Exit code: {}", res.exitCode) : err);
}

void RemoteBackend::prepareLocalParent(const std::string& localPath) {
    try {
        ensureParentDirs(localPath);
    } catch (const stdfs::filesystem_error& e) {
        throw BackendError::io("Failed to create directory", stdfs::path(localPath).parent_path().string(), e.code().message());
    }
}

uint64_t RemoteBackend::localSize(const std::string& localPath) {
    std::error_code ec;
    const auto size = stdfs::file_size(localPath, ec);
    return ec ? 0 : size;
}

RemoteBackend::Direction RemoteBackend::directionOf(const std::string& src, const std::string& dst) const {
    const bool srcRemote = owns(src), dstRemote = owns(dst);

    if (srcRemote && !dstRemote) return {false, dst, location_.remotePathOf(src)};
    if (dstRemote && !srcRemote) return {true, src, location_.remotePathOf(dst)};
    if (srcRemote && dstRemote)
        throw BackendError::unsupported(fmt::format("{} to {} transfer is not supported", name(), name()));
    throw BackendError::invalidPath(fmt::format("{} -> {}", src, dst),
                                    fmt::format("Neither side belongs to {}", location_.prefix()));
}
