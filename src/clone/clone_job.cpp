#include "clone/clone_job.hpp"
#include "common/logger.hpp"
#include "transfer/digest_accumulator.hpp"
#include "transfer/stream_copier.hpp"
#include "transfer/transfer_error.hpp"
#include <memory>

CloneJob::CloneJob(std::shared_ptr<DeviceIo> deviceIo, const TransferJobConfig& config)
    : Job(Direction::Clone)
    , deviceIo_(std::move(deviceIo))
    , config_(config) {
}

CloneJob::~CloneJob() = default;

RunOutcome CloneJob::execute() {
    const TransferSettings& settings = config_.settings;
    const DeviceDescriptor& source = config_.device;
    const DeviceDescriptor& target = config_.targetDevice;

    if (target.sizeBytes < source.sizeBytes) {
        return RunOutcome::failed(ErrorKind::CapacityExceeded,
                                  "Target device " + target.path + " is smaller than " + source.path +
                                  " (" + std::to_string(target.sizeBytes) + " < " +
                                  std::to_string(source.sizeBytes) + " bytes)",
                                  0, false);
    }

    Logger::info("Cloning " + source.path + " to " + target.path);

    std::unique_ptr<ByteSource> reader = deviceIo_->openDeviceForRead(source);
    std::unique_ptr<ByteSink> writer = deviceIo_->openDeviceForWrite(target);

    DigestAccumulator digest(settings.digest);
    auto copier = std::make_shared<StreamCopier>(settings.chunkSize, settings.queueCapacity,
                                                 settings.progressInterval);

    setInterruptHandler([copier]() { copier->abort(); });
    CopyResult result = copier->run(*reader, *writer, source.sizeBytes, token(), &digest, progressCallback());
    clearInterruptHandler();
    peakQueuedChunks_ = result.peakQueuedChunks;

    if (result.error != ErrorKind::None) {
        return RunOutcome::failed(result.error, result.errorMessage, result.bytesCopied, true);
    }
    if (result.cancelled) {
        return RunOutcome::cancelled(result.bytesCopied, true);
    }

    try {
        writer->flush();
    } catch (const TransferError& e) {
        return RunOutcome::failed(e.kind(), e.what(), result.bytesCopied, true);
    }
    writer.reset();

    if (!deviceIo_->rescanPartitions(target)) {
        Logger::warning("Partition rescan failed: " + deviceIo_->getLastError());
    }

    return RunOutcome::completed(result.bytesCopied, digest.finalizeHex());
}
