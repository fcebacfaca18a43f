#include "transfer/Error.hpp"

#include <cstring>
#include <fmt/format.h>

using namespace usync::transfer;

namespace {

std::string render(const BackendError::Kind kind, const std::string& message, const std::string& cause) {
    if (cause.empty()) return fmt::format("{}: {}", to_string(kind), message);
    return fmt::format("{}: {} ({})", to_string(kind), message, cause);
}

std::string describe(const std::vector<ChecksumMismatch>& mismatches) {
    if (mismatches.size() == 1) {
        const auto& m = mismatches.front();
        return fmt::format("expected {}, got {} for {}", m.expected, m.actual, m.destination);
    }

    std::string out = fmt::format("{} files failed verification:", mismatches.size());
    for (const auto& m : mismatches)
        out += fmt::format(" [{} -> {}: expected {}, got {}]", m.source, m.destination, m.expected, m.actual);
    return out;
}

}

namespace usync::transfer {

std::string to_string(const BackendError::Kind kind) {
    switch (kind) {
        case BackendError::Kind::NotFound: return "NotFound";
        case BackendError::Kind::InvalidPath: return "InvalidPath";
        case BackendError::Kind::UnsupportedOperation: return "UnsupportedOperation";
        case BackendError::Kind::ConnectionError: return "ConnectionError";
        case BackendError::Kind::ChecksumMismatch: return "ChecksumMismatch";
        case BackendError::Kind::IoError: return "IoError";
        case BackendError::Kind::Other: return "Other";
    }
    return "Unknown";
}

}

BackendError::BackendError(const Kind kind, std::string message, std::string path, std::string cause)
    : std::runtime_error(render(kind, message, cause)),
      kind_(kind), message_(std::move(message)), path_(std::move(path)), cause_(std::move(cause)) {}

BackendError BackendError::notFound(const std::string& path) {
    return {Kind::NotFound, fmt::format("Path not found: {}", path), path};
}

BackendError BackendError::invalidPath(const std::string& path, const std::string& why) {
    return {Kind::InvalidPath, fmt::format("{}: {}", why, path), path};
}

BackendError BackendError::unsupported(const std::string& what) {
    return {Kind::UnsupportedOperation, what};
}

BackendError BackendError::connection(const std::string& what, const std::string& cause) {
    return {Kind::ConnectionError, what, {}, cause};
}

BackendError BackendError::io(const std::string& what, const std::string& path, const std::string& cause) {
    return {Kind::IoError, fmt::format("{} {}", what, path), path, cause};
}

BackendError BackendError::io(const std::string& what, const std::filesystem::path& path, const std::error_code& ec) {
    return io(what, path.string(), ec.message());
}

BackendError BackendError::ioErrno(const std::string& what, const std::string& path, const int err) {
    return io(what, path, std::strerror(err));
}

ChecksumMismatchError::ChecksumMismatchError(const std::string& source, const std::string& destination,
                                             std::string expected, std::string actual)
    : ChecksumMismatchError(std::vector<ChecksumMismatch>{{source, destination, std::move(expected), std::move(actual)}}) {}

ChecksumMismatchError::ChecksumMismatchError(std::vector<ChecksumMismatch> mismatches)
    : BackendError(Kind::ChecksumMismatch,
                   mismatches.empty() ? std::string("checksum mismatch") : describe(mismatches),
                   mismatches.empty() ? std::string() : mismatches.front().destination),
      mismatches_(std::move(mismatches)) {
    if (mismatches_.empty()) throw std::invalid_argument("ChecksumMismatchError requires at least one mismatch");
}
