#pragma once

#include "transfer/sidecar.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct VerificationResult {
    bool success{false};
    std::string errorMessage;
    uint64_t bytesChecked{0};
    std::string expectedDigest;
    std::string actualDigest;
};

// Recomputes the digest of an image (inflating .gz images) and compares it
// with the sidecar written at backup time.
class ImageVerifier {
public:
    using ProgressCallback = std::function<void(double)>;

    explicit ImageVerifier(const std::string& imagePath);
    ~ImageVerifier();

    bool initialize();
    bool verify();
    void setProgressCallback(ProgressCallback callback);
    VerificationResult getResult() const;

private:
    std::string imagePath_;
    std::optional<SidecarRecord> sidecar_;
    ProgressCallback progressCallback_;
    VerificationResult result_;
};
