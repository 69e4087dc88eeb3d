#pragma once

#include "common/job.hpp"
#include "common/transfer_config.hpp"
#include "device/device_io.hpp"
#include "transfer/sidecar.hpp"
#include <memory>
#include <optional>
#include <string>

// Image file -> device, on the job's worker thread alone. A device cannot be
// rolled back, so every run that stops after the first write reports the
// device as possibly partially written.
class RestoreJob : public Job {
public:
    RestoreJob(std::shared_ptr<DeviceIo> deviceIo, const TransferJobConfig& config);
    ~RestoreJob() override;

    const TransferJobConfig& getConfig() const { return config_; }

protected:
    RunOutcome execute() override;

private:
    uint64_t expectedBytes(const std::optional<SidecarRecord>& sidecar, bool compressed) const;

    std::shared_ptr<DeviceIo> deviceIo_;
    TransferJobConfig config_;
};
