#include "storage/tasks/CopyFile.hpp"
#include "storage/LocalBackend.hpp"
#include "logging/LogRegistry.hpp"

using namespace usync::storage::tasks;
using namespace usync::logging;

CopyFile::CopyFile(const LocalBackend& backend, std::filesystem::path src, std::filesystem::path dst,
                   const uint64_t size, const transfer::CopyOptions& opts)
    : backend(backend), src(std::move(src)), dst(std::move(dst)), size(size), opts(opts) {}

void CopyFile::operator()() {
    try {
        promise.set_value(backend.transferOne(src, dst, size, opts));
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[CopyFileTask] Failed to copy {} -> {}: {}", src.string(), dst.string(), e.what());
        promise.set_exception(std::current_exception());
    }
}
