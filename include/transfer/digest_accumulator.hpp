#pragma once

#include "common/transfer_status.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

// Streaming digest over the bytes committed to a sink, in commit order.
// With DigestAlgorithm::None every call is a no-op and finalizeHex() returns
// an empty string.
class DigestAccumulator {
public:
    explicit DigestAccumulator(DigestAlgorithm algorithm);
    ~DigestAccumulator();

    DigestAccumulator(const DigestAccumulator&) = delete;
    DigestAccumulator& operator=(const DigestAccumulator&) = delete;

    void update(const uint8_t* data, size_t size);

    // Lowercase hex digest. May be called once; later updates or a second
    // finalize throw std::logic_error.
    std::string finalizeHex();

    bool isEnabled() const { return algorithm_ != DigestAlgorithm::None; }
    bool isFinalized() const { return finalized_; }
    DigestAlgorithm algorithm() const { return algorithm_; }
    uint64_t bytesHashed() const { return bytesHashed_; }

private:
    DigestAlgorithm algorithm_;
    EVP_MD_CTX* ctx_{nullptr};
    bool finalized_{false};
    uint64_t bytesHashed_{0};
};
