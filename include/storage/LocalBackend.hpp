#pragma once

#include "storage/Backend.hpp"
#include "transfer/Settings.hpp"
#include "transfer/Strategy.hpp"

#include <filesystem>

namespace usync::concurrency { class ThreadPool; }

namespace usync::storage {

class LocalBackend final : public Backend {
public:
    explicit LocalBackend(transfer::TransferSettings settings = {},
                          transfer::StrategyRegistry strategies = transfer::StrategyRegistry::platformDefault());

    [[nodiscard]] std::string name() const override { return "local"; }

    uint64_t copyFile(const std::string& src, const std::string& dst,
                      const transfer::CopyOptions& opts) const override;

    transfer::CopyStats copyDirectory(const std::string& src, const std::string& dst,
                                      const transfer::CopyOptions& opts) const override;

    [[nodiscard]] std::vector<fs::model::Entry> list(const std::string& path) const override;

    void remove(const std::string& path) const override;

    [[nodiscard]] std::string checksum(const std::string& path, transfer::ChecksumAlgorithm algo) const override;

    // Buffered copy continuing at offset; returns the bytes written by this call
    uint64_t copyFileResuming(const std::string& src, const std::string& dst, uint64_t offset,
                              const transfer::CopyOptions& opts) const;

    // Strategy dispatch only; callers have already validated both paths
    uint64_t transferOne(const std::filesystem::path& src, const std::filesystem::path& dst,
                         uint64_t size, const transfer::CopyOptions& opts) const;

    [[nodiscard]] const transfer::TransferSettings& settings() const { return settings_; }
    [[nodiscard]] const transfer::StrategyRegistry& strategies() const { return strategies_; }

private:
    struct DirectoryCopy;

    static void requireFile(const std::filesystem::path& src);

    void copyLevel(const std::filesystem::path& src, const std::filesystem::path& dst,
                   DirectoryCopy& job) const;

    transfer::TransferSettings settings_;
    transfer::StrategyRegistry strategies_;
};

}
