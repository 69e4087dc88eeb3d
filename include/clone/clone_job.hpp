#pragma once

#include "common/job.hpp"
#include "common/transfer_config.hpp"
#include "device/device_io.hpp"
#include <memory>

// Device -> device through the queued copy engine. The target is written in
// place, so an interrupted clone leaves it indeterminate like a restore.
class CloneJob : public Job {
public:
    CloneJob(std::shared_ptr<DeviceIo> deviceIo, const TransferJobConfig& config);
    ~CloneJob() override;

    const TransferJobConfig& getConfig() const { return config_; }
    size_t getPeakQueuedChunks() const { return peakQueuedChunks_; }

protected:
    RunOutcome execute() override;

private:
    std::shared_ptr<DeviceIo> deviceIo_;
    TransferJobConfig config_;
    size_t peakQueuedChunks_{0};
};
