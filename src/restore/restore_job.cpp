#include "restore/restore_job.hpp"
#include "common/logger.hpp"
#include "transfer/compression.hpp"
#include "transfer/digest_accumulator.hpp"
#include "transfer/rate_estimator.hpp"
#include "transfer/transfer_error.hpp"
#include <filesystem>
#include <vector>

RestoreJob::RestoreJob(std::shared_ptr<DeviceIo> deviceIo, const TransferJobConfig& config)
    : Job(Direction::Restore)
    , deviceIo_(std::move(deviceIo))
    , config_(config) {
}

RestoreJob::~RestoreJob() = default;

uint64_t RestoreJob::expectedBytes(const std::optional<SidecarRecord>& sidecar, bool compressed) const {
    if (sidecar) {
        return sidecar->bytes;
    }
    if (!compressed) {
        std::error_code ec;
        uintmax_t size = std::filesystem::file_size(config_.imagePath, ec);
        if (!ec) {
            return size;
        }
    }
    return config_.device.sizeBytes;
}

RunOutcome RestoreJob::execute() {
    const TransferSettings& settings = config_.settings;
    const DeviceDescriptor& device = config_.device;
    const bool compressed = isCompressedImagePath(config_.imagePath);

    std::optional<SidecarRecord> sidecar;
    if (settings.verifyAfterRestore) {
        sidecar = readSidecar(sidecarPathFor(config_.imagePath));
        if (!sidecar) {
            Logger::info("No digest sidecar for " + config_.imagePath + ", restore will not be verified");
        }
    }

    uint64_t total = expectedBytes(sidecar, compressed);
    if (total > device.sizeBytes) {
        return RunOutcome::failed(ErrorKind::CapacityExceeded,
                                  "Image larger than target device (" + std::to_string(total) + " > " +
                                  std::to_string(device.sizeBytes) + " bytes)",
                                  0, false);
    }

    Logger::info("Restoring " + config_.imagePath + (compressed ? " (gzip)" : "") + " to " + device.path);

    std::unique_ptr<FileSource> file = FileSource::open(config_.imagePath);
    std::unique_ptr<GzipSource> gzip;
    if (compressed) {
        gzip = std::make_unique<GzipSource>(*file);
    }
    ByteSource& source = gzip ? static_cast<ByteSource&>(*gzip) : static_cast<ByteSource&>(*file);

    DigestAccumulator digest(sidecar ? sidecar->algorithm : settings.digest);
    RateEstimator estimator(total, settings.progressInterval);
    std::vector<uint8_t> buffer(settings.chunkSize);
    uint64_t written = 0;

    std::unique_ptr<ByteSink> sink;
    try {
        sink = deviceIo_->openDeviceForWrite(device);

        for (;;) {
            if (token().isCancelled()) {
                return RunOutcome::cancelled(written, true);
            }

            size_t n = readFully(source, buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (written + n > device.sizeBytes) {
                throw TransferError(ErrorKind::CapacityExceeded,
                                    "Image larger than target device (" +
                                    std::to_string(device.sizeBytes) + " bytes)");
            }

            digest.update(buffer.data(), n);
            sink->write(buffer.data(), n);
            written += n;

            if (settings.progressInterval.count() == 0 || estimator.due()) {
                sink.reset();
    reportProgress(estimator.sample(written));
            }
        }

        sink->flush();
    } catch (const TransferError& e) {
        Logger::error("Restore stopped after " + std::to_string(written) + " bytes: " + e.what());
        return RunOutcome::failed(e.kind(), e.what(), written, sink != nullptr);
    }

    sink.reset();
    reportProgress(estimator.sample(written));

    std::string hexDigest = digest.finalizeHex();
    if (sidecar) {
        if (written != sidecar->bytes) {
            return RunOutcome::failed(ErrorKind::VerificationFailed,
                                      "Restored " + std::to_string(written) + " bytes, image digest covers " +
                                      std::to_string(sidecar->bytes),
                                      written, true);
        }
        if (hexDigest != sidecar->hexDigest) {
            return RunOutcome::failed(ErrorKind::VerificationFailed,
                                      "Digest mismatch: expected " + sidecar->hexDigest + ", got " + hexDigest,
                                      written, true);
        }
        Logger::info("Restore verified against " + sidecarPathFor(config_.imagePath));
    }

    if (!deviceIo_->rescanPartitions(device)) {
        Logger::warning("Partition rescan failed: " + deviceIo_->getLastError());
    }

    return RunOutcome::completed(written, hexDigest);
}
