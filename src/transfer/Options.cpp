#include "transfer/Options.hpp"
#include "transfer/Error.hpp"
#include "filters/Chain.hpp"
#include "config/Config.hpp"

#include <algorithm>
#include <cctype>

namespace usync::transfer {

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

}

std::string to_string(const ChecksumAlgorithm algo) {
    switch (algo) {
        case ChecksumAlgorithm::Md5: return "md5";
        case ChecksumAlgorithm::Sha1: return "sha1";
        case ChecksumAlgorithm::Sha256: return "sha256";
    }
    return "unknown";
}

ChecksumAlgorithm checksumAlgorithmFromString(const std::string& name) {
    const auto n = lower(name);
    if (n == "md5") return ChecksumAlgorithm::Md5;
    if (n == "sha1" || n == "sha-1") return ChecksumAlgorithm::Sha1;
    if (n == "sha256" || n == "sha-256") return ChecksumAlgorithm::Sha256;
    throw BackendError(BackendError::Kind::Other, "Unsupported checksum algorithm: " + name);
}

size_t digestHexLength(const ChecksumAlgorithm algo) {
    switch (algo) {
        case ChecksumAlgorithm::Md5: return 32;
        case ChecksumAlgorithm::Sha1: return 40;
        case ChecksumAlgorithm::Sha256: return 64;
    }
    return 0;
}

std::string to_string(const SyncMode mode) {
    switch (mode) {
        case SyncMode::OneWay: return "one_way";
        case SyncMode::TwoWay: return "two_way";
        case SyncMode::CopyOnly: return "copy_only";
    }
    return "unknown";
}

SyncMode syncModeFromString(const std::string& name) {
    const auto n = lower(name);
    if (n == "one_way" || n == "oneway") return SyncMode::OneWay;
    if (n == "two_way" || n == "twoway") return SyncMode::TwoWay;
    if (n == "copy_only" || n == "copyonly") return SyncMode::CopyOnly;
    throw BackendError(BackendError::Kind::Other, "Unknown sync mode: " + name);
}

CopyOptions CopyOptions::fromDefaults(const config::DefaultsConfig& defaults) {
    CopyOptions opts;
    opts.verbose = defaults.verbose;
    opts.progress = defaults.progress;
    opts.use_ram = defaults.use_ram;
    opts.recursive = defaults.recursive;
    opts.dry_run = defaults.dry_run;
    opts.ssh_opts = defaults.ssh_opts;
    opts.filters = filters::Chain::fromConfig(defaults.filters);
    if (defaults.checksum) opts.checksum = checksumAlgorithmFromString(*defaults.checksum);
    return opts;
}

}
