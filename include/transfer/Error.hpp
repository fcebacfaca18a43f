#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace usync::transfer {

class BackendError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        InvalidPath,
        UnsupportedOperation,
        ConnectionError,
        ChecksumMismatch,
        IoError,
        Other
    };

    BackendError(Kind kind, std::string message, std::string path = {}, std::string cause = {});

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::string& cause() const { return cause_; }

    // Helpers for the kinds raised all over the backends
    static BackendError notFound(const std::string& path);
    static BackendError invalidPath(const std::string& path, const std::string& why);
    static BackendError unsupported(const std::string& what);
    static BackendError connection(const std::string& what, const std::string& cause = {});
    static BackendError io(const std::string& what, const std::string& path, const std::string& cause);
    static BackendError io(const std::string& what, const std::filesystem::path& path, const std::error_code& ec);
    static BackendError ioErrno(const std::string& what, const std::string& path, int err);

private:
    Kind kind_;
    std::string message_, path_, cause_;
};

struct ChecksumMismatch {
    std::string source, destination;
    std::string expected, actual;
};

class ChecksumMismatchError : public BackendError {
public:
    ChecksumMismatchError(const std::string& source, const std::string& destination,
                          std::string expected, std::string actual);

    // Directory verification: every mismatch found in the tree
    explicit ChecksumMismatchError(std::vector<ChecksumMismatch> mismatches);

    [[nodiscard]] const std::string& expected() const { return mismatches_.front().expected; }
    [[nodiscard]] const std::string& actual() const { return mismatches_.front().actual; }
    [[nodiscard]] const std::vector<ChecksumMismatch>& mismatches() const { return mismatches_; }

private:
    std::vector<ChecksumMismatch> mismatches_;
};

using CopyError = BackendError;

std::string to_string(BackendError::Kind kind);

}
