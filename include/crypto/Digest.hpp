#pragma once

#include "transfer/Options.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

struct evp_md_ctx_st;

namespace usync::crypto {

// Incremental OpenSSL EVP digest; produces lowercase hex
class Hasher {
public:
    explicit Hasher(transfer::ChecksumAlgorithm algo);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    void update(const void* data, size_t len);

    // Finalizes the context; further updates are an error
    std::string finalHex();

private:
    evp_md_ctx_st* ctx_{nullptr};
    bool finalized_{false};
};

std::string toHex(const unsigned char* data, size_t len);

// Streams the file through the digest in fixed-size chunks
std::string digestFile(const std::filesystem::path& path, transfer::ChecksumAlgorithm algo);

std::string digestString(const std::string& data, transfer::ChecksumAlgorithm algo);

}
