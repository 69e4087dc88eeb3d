#pragma once

#include "common/job.hpp"
#include "common/transfer_config.hpp"
#include "device/device_io.hpp"
#include "transfer/stream_copier.hpp"
#include <memory>
#include <string>

// Device -> image file. The image only appears at its final path once the
// whole device has been read, the data is on disk and the digest is known.
class BackupJob : public Job {
public:
    BackupJob(std::shared_ptr<DeviceIo> deviceIo, const TransferJobConfig& config);
    ~BackupJob() override;

    const TransferJobConfig& getConfig() const { return config_; }
    // Available once the job has finished.
    size_t getPeakQueuedChunks() const { return peakQueuedChunks_; }

protected:
    RunOutcome execute() override;

private:
    std::string writeArtifacts(const std::string& hexDigest);

    std::shared_ptr<DeviceIo> deviceIo_;
    TransferJobConfig config_;
    size_t peakQueuedChunks_{0};
};
