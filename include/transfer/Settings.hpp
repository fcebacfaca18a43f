#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace usync::transfer {

// Numeric and tool knobs that used to be process-wide; threaded explicitly into backends
struct TransferSettings {
    uint64_t zeroCopyThreshold{1024 * 1024};
    uint64_t ramWarnThreshold{100 * 1024 * 1024};
    bool parallel{true};
    unsigned int maxWorkers{0}; // 0: hardware concurrency

    std::string scpBin{"scp"};
    std::string sshBin{"ssh"};
    std::string awsBin{"aws"};
    std::optional<std::string> s3EndpointUrl{};

    // Snapshot of the registry's transfer/remote sections
    static TransferSettings fromConfig();
};

}
