#pragma once

#include "common/job.hpp"
#include "common/transfer_config.hpp"
#include "device/device_io.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Entry point for running transfers. At most one job runs at a time; a new
// submission is rejected until the running job has reported its outcome.
class TransferPipeline {
public:
    explicit TransferPipeline(std::shared_ptr<DeviceIo> deviceIo);
    ~TransferPipeline();

    TransferPipeline(const TransferPipeline&) = delete;
    TransferPipeline& operator=(const TransferPipeline&) = delete;

    // Validates and starts a job. Returns nullptr (see getLastError()) when the
    // configuration is invalid or another job is still running.
    std::shared_ptr<Job> submit(const TransferJobConfig& config);

    // True only for the call that actually requested cancellation.
    bool cancel();
    // Blocks until the active job has reported; returns the last outcome.
    RunOutcome wait();

    bool isIdle() const;
    std::optional<RunOutcome> getLastOutcome() const;
    std::shared_ptr<Job> getActiveJob() const;

    // Delivered on worker threads. Set before submit().
    void setProgressCallback(ProgressCallback callback);
    void setOutcomeCallback(OutcomeCallback callback);

    std::shared_ptr<DeviceIo> getDeviceIo() const { return deviceIo_; }

    // Error handling
    std::string getLastError() const;
    void clearLastError();

private:
    std::shared_ptr<Job> createJob(const TransferJobConfig& config);
    void handleOutcome(const RunOutcome& outcome);

    std::shared_ptr<DeviceIo> deviceIo_;
    std::shared_ptr<Job> activeJob_;
    std::optional<RunOutcome> lastOutcome_;
    ProgressCallback progressCallback_;
    OutcomeCallback outcomeCallback_;
    std::string lastError_;
    mutable std::mutex mutex_;
};
