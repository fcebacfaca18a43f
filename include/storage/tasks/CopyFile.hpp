#pragma once

#include "concurrency/Task.hpp"
#include "transfer/Options.hpp"

#include <filesystem>

namespace usync::storage {
class LocalBackend;
}

namespace usync::storage::tasks {

// One file of a parallel directory level; the promise carries the bytes written
struct CopyFile final : concurrency::PromisedTask {
    const LocalBackend& backend;
    std::filesystem::path src, dst;
    uint64_t size;
    const transfer::CopyOptions& opts;

    CopyFile(const LocalBackend& backend, std::filesystem::path src, std::filesystem::path dst,
             uint64_t size, const transfer::CopyOptions& opts);

    void operator()() override;
};

}
