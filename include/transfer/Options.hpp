#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace usync::filters { class Chain; }
namespace usync::config { struct DefaultsConfig; }

namespace usync::transfer {

enum class ChecksumAlgorithm { Md5, Sha1, Sha256 };

std::string to_string(ChecksumAlgorithm algo);
ChecksumAlgorithm checksumAlgorithmFromString(const std::string& name);

// Hex digest length for the algorithm
size_t digestHexLength(ChecksumAlgorithm algo);

enum class SyncMode { OneWay, TwoWay, CopyOnly };

std::string to_string(SyncMode mode);
SyncMode syncModeFromString(const std::string& name);

struct CopyOptions {
    bool verbose{false};
    bool progress{false};
    bool use_ram{false};
    bool recursive{false};
    bool dry_run{false};
    std::vector<std::string> ssh_opts{};
    std::shared_ptr<const filters::Chain> filters{};
    std::optional<ChecksumAlgorithm> checksum{};

    // Stats are only worth keeping when someone will print them
    [[nodiscard]] bool wantsSummary() const { return verbose || progress; }

    // From the config `defaults` section, filters compiled
    static CopyOptions fromDefaults(const config::DefaultsConfig& defaults);
};

}
