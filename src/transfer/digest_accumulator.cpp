#include "transfer/digest_accumulator.hpp"
#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

DigestAccumulator::DigestAccumulator(DigestAlgorithm algorithm)
    : algorithm_(algorithm) {
    if (algorithm_ == DigestAlgorithm::None) {
        return;
    }

    const EVP_MD* md = algorithm_ == DigestAlgorithm::MD5 ? EVP_md5() : EVP_sha256();

    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error("Failed to create OpenSSL digest context");
    }

    if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("Failed to initialize " + digestAlgorithmToString(algorithm_) + " digest");
    }
}

DigestAccumulator::~DigestAccumulator() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

void DigestAccumulator::update(const uint8_t* data, size_t size) {
    if (!ctx_) {
        return;
    }
    if (finalized_) {
        throw std::logic_error("Digest updated after finalization");
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
    bytesHashed_ += size;
}

std::string DigestAccumulator::finalizeHex() {
    if (!ctx_) {
        return "";
    }
    if (finalized_) {
        throw std::logic_error("Digest finalized twice");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &hashLen) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }
    finalized_ = true;

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
