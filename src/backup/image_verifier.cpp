#include "backup/image_verifier.hpp"
#include "common/logger.hpp"
#include "transfer/compression.hpp"
#include "transfer/digest_accumulator.hpp"
#include "transfer/stream.hpp"
#include "transfer/transfer_error.hpp"
#include <filesystem>
#include <memory>
#include <vector>

ImageVerifier::ImageVerifier(const std::string& imagePath)
    : imagePath_(imagePath) {
}

ImageVerifier::~ImageVerifier() = default;

bool ImageVerifier::initialize() {
    if (!std::filesystem::exists(imagePath_)) {
        result_.errorMessage = "Image does not exist: " + imagePath_;
        return false;
    }

    sidecar_ = readSidecar(sidecarPathFor(imagePath_));
    if (!sidecar_) {
        result_.errorMessage = "No digest sidecar for " + imagePath_;
        return false;
    }
    if (sidecar_->algorithm == DigestAlgorithm::None) {
        result_.errorMessage = "Sidecar for " + imagePath_ + " carries no digest";
        return false;
    }

    result_.expectedDigest = sidecar_->hexDigest;
    return true;
}

bool ImageVerifier::verify() {
    if (!sidecar_ && !initialize()) {
        return false;
    }

    try {
        std::unique_ptr<FileSource> file = FileSource::open(imagePath_);
        std::unique_ptr<GzipSource> gzip;
        if (isCompressedImagePath(imagePath_)) {
            gzip = std::make_unique<GzipSource>(*file);
        }
        ByteSource& source = gzip ? static_cast<ByteSource&>(*gzip) : static_cast<ByteSource&>(*file);

        DigestAccumulator digest(sidecar_->algorithm);
        const size_t blockSize = 1024 * 1024;  // 1MB blocks
        std::vector<uint8_t> buffer(blockSize);
        uint64_t totalBytes = 0;

        for (;;) {
            size_t n = readFully(source, buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            digest.update(buffer.data(), n);
            totalBytes += n;
            if (progressCallback_ && sidecar_->bytes > 0) {
                progressCallback_(static_cast<double>(totalBytes) / sidecar_->bytes);
            }
        }

        result_.bytesChecked = totalBytes;
        result_.actualDigest = digest.finalizeHex();
    } catch (const TransferError& e) {
        result_.errorMessage = std::string("Verification failed: ") + e.what();
        Logger::error(result_.errorMessage);
        return false;
    }

    if (result_.bytesChecked != sidecar_->bytes) {
        result_.errorMessage = "Image holds " + std::to_string(result_.bytesChecked) +
                               " bytes, sidecar expects " + std::to_string(sidecar_->bytes);
        Logger::error(result_.errorMessage);
        return false;
    }
    if (result_.actualDigest != result_.expectedDigest) {
        result_.errorMessage = "Digest mismatch: expected " + result_.expectedDigest +
                               ", got " + result_.actualDigest;
        Logger::error(result_.errorMessage);
        return false;
    }

    Logger::info("Image " + imagePath_ + " verified");
    result_.success = true;
    return true;
}

void ImageVerifier::setProgressCallback(ProgressCallback callback) {
    progressCallback_ = std::move(callback);
}

VerificationResult ImageVerifier::getResult() const {
    return result_;
}
