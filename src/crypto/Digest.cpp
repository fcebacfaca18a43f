#include "crypto/Digest.hpp"
#include "transfer/Error.hpp"
#include "logging/LogRegistry.hpp"

#include <array>
#include <cerrno>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <openssl/evp.h>

using namespace usync::crypto;
using namespace usync::transfer;
using namespace usync::logging;

namespace {

constexpr size_t DIGEST_CHUNK = 64 * 1024;

const EVP_MD* mdFor(const ChecksumAlgorithm algo) {
    switch (algo) {
        case ChecksumAlgorithm::Md5: return EVP_md5();
        case ChecksumAlgorithm::Sha1: return EVP_sha1();
        case ChecksumAlgorithm::Sha256: return EVP_sha256();
    }
    return nullptr;
}

}

Hasher::Hasher(const ChecksumAlgorithm algo) : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_, mdFor(algo), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed for " + to_string(algo));
    }
}

Hasher::~Hasher() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Hasher::update(const void* data, const size_t len) {
    if (finalized_) throw std::logic_error("Hasher::update after finalHex");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string Hasher::finalHex() {
    if (finalized_) throw std::logic_error("Hasher::finalHex called twice");

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, md.data(), &len) != 1) throw std::runtime_error("EVP_DigestFinal_ex failed");
    finalized_ = true;
    return toHex(md.data(), len);
}

std::string usync::crypto::toHex(const unsigned char* data, const size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return oss.str();
}

std::string usync::crypto::digestFile(const std::filesystem::path& path, const ChecksumAlgorithm algo) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw BackendError::ioErrno("Failed to open for checksum", path.string(), errno);

    Hasher hasher(algo);
    std::vector<char> buf(DIGEST_CHUNK);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        if (const auto got = in.gcount(); got > 0) hasher.update(buf.data(), static_cast<size_t>(got));
    }
    if (in.bad()) throw BackendError::io("Failed to read for checksum", path.string(), "stream error");

    auto hex = hasher.finalHex();
    LogRegistry::crypto()->debug("[digestFile] {} {} = {}", to_string(algo), path.string(), hex);
    return hex;
}

std::string usync::crypto::digestString(const std::string& data, const ChecksumAlgorithm algo) {
    Hasher hasher(algo);
    hasher.update(data.data(), data.size());
    return hasher.finalHex();
}
