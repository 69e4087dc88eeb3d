#include "backup/backup_job.hpp"
#include "common/logger.hpp"
#include "transfer/atomic_sink.hpp"
#include "transfer/compression.hpp"
#include "transfer/digest_accumulator.hpp"
#include "transfer/sidecar.hpp"
#include "transfer/transfer_error.hpp"
#include <chrono>
#include <cstdio>
#include <memory>

BackupJob::BackupJob(std::shared_ptr<DeviceIo> deviceIo, const TransferJobConfig& config)
    : Job(Direction::Backup)
    , deviceIo_(std::move(deviceIo))
    , config_(config) {
}

BackupJob::~BackupJob() = default;

RunOutcome BackupJob::execute() {
    const TransferSettings& settings = config_.settings;
    const DeviceDescriptor& device = config_.device;

    Logger::info("Backing up " + device.path + " (" + std::to_string(device.sizeBytes) +
                 " bytes) to " + config_.imagePath);

    std::unique_ptr<ByteSource> source = deviceIo_->openDeviceForRead(device);

    AtomicFileSink file(config_.imagePath);
    std::unique_ptr<GzipSink> gzip;
    if (settings.compress) {
        gzip = std::make_unique<GzipSink>(file, settings.compressionLevel);
    }
    ByteSink& sink = gzip ? static_cast<ByteSink&>(*gzip) : static_cast<ByteSink&>(file);

    DigestAccumulator digest(settings.digest);
    auto copier = std::make_shared<StreamCopier>(settings.chunkSize, settings.queueCapacity,
                                                 settings.progressInterval);

    setInterruptHandler([copier]() { copier->abort(); });
    CopyResult result = copier->run(*source, sink, device.sizeBytes, token(), &digest, progressCallback());
    clearInterruptHandler();
    peakQueuedChunks_ = result.peakQueuedChunks;

    if (!result.succeeded() || token().isCancelled()) {
        gzip.reset();
        file.discard();
        Logger::info("Rolled back " + file.temporaryPath() + "; " + config_.imagePath + " left untouched");
        if (result.error != ErrorKind::None) {
            return RunOutcome::failed(result.error, result.errorMessage, result.bytesCopied, false);
        }
        return RunOutcome::cancelled(result.bytesCopied, false);
    }

    try {
        if (gzip) {
            gzip->finish();
        }
        file.commit();
    } catch (const TransferError& e) {
        gzip.reset();
        file.discard();
        return RunOutcome::failed(e.kind(), e.what(), result.bytesCopied, false);
    }

    std::string hexDigest = digest.finalizeHex();
    RunOutcome outcome = RunOutcome::completed(result.bytesCopied, hexDigest);
    outcome.message = writeArtifacts(hexDigest);
    return outcome;
}

std::string BackupJob::writeArtifacts(const std::string& hexDigest) {
    const TransferSettings& settings = config_.settings;
    std::string sidecarPath = sidecarPathFor(config_.imagePath);

    try {
        if (settings.digest != DigestAlgorithm::None) {
            SidecarRecord record;
            record.algorithm = settings.digest;
            record.bytes = config_.device.sizeBytes;
            record.hexDigest = hexDigest;
            writeSidecar(sidecarPath, record);
        } else if (std::remove(sidecarPath.c_str()) == 0) {
            // A digest from an earlier image at this path would no longer match.
            Logger::info("Removed stale digest sidecar " + sidecarPath);
        }

        BackupManifest manifest;
        manifest.imagePath = config_.imagePath;
        manifest.devicePath = config_.device.path;
        manifest.deviceLabel = config_.device.label;
        manifest.deviceBytes = config_.device.sizeBytes;
        manifest.compressed = settings.compress;
        manifest.chunkSize = settings.chunkSize;
        manifest.algorithm = settings.digest;
        manifest.hexDigest = hexDigest;
        manifest.createdAt = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        writeManifest(manifestPathFor(config_.imagePath), manifest);
    } catch (const TransferError& e) {
        // The image itself is committed and complete at this point.
        Logger::error("Image written but metadata failed: " + std::string(e.what()));
        return std::string("Image written but metadata failed: ") + e.what();
    }
    return "";
}
