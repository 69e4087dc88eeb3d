#include "transfer/transfer_pipeline.hpp"
#include "backup/backup_job.hpp"
#include "clone/clone_job.hpp"
#include "common/logger.hpp"
#include "restore/restore_job.hpp"

TransferPipeline::TransferPipeline(std::shared_ptr<DeviceIo> deviceIo)
    : deviceIo_(std::move(deviceIo)) {
}

TransferPipeline::~TransferPipeline() {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = activeJob_;
    }
    if (job && !job->isFinished()) {
        Logger::warning("Pipeline shutting down, cancelling job " + job->getId());
        job->cancel();
        job->wait();
    }
}

std::shared_ptr<Job> TransferPipeline::createJob(const TransferJobConfig& config) {
    switch (config.direction) {
        case Direction::Backup:
            return std::make_shared<BackupJob>(deviceIo_, config);
        case Direction::Restore:
            return std::make_shared<RestoreJob>(deviceIo_, config);
        case Direction::Clone:
            return std::make_shared<CloneJob>(deviceIo_, config);
    }
    return nullptr;
}

std::shared_ptr<Job> TransferPipeline::submit(const TransferJobConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!deviceIo_) {
        lastError_ = "No device I/O available";
        Logger::error(lastError_);
        return nullptr;
    }

    // The previous job counts as running until its outcome has been delivered.
    if (activeJob_ && !activeJob_->isFinished()) {
        lastError_ = "A transfer is already running";
        Logger::warning("Rejected " + directionToString(config.direction) + " submission: " + lastError_);
        return nullptr;
    }

    std::string error;
    if (!validateJobConfig(config, error)) {
        lastError_ = "Invalid job configuration: " + error;
        Logger::error(lastError_);
        return nullptr;
    }

    std::shared_ptr<Job> job = createJob(config);
    if (!job) {
        lastError_ = "Unknown transfer direction";
        return nullptr;
    }

    job->setProgressCallback(progressCallback_);
    job->setOutcomeCallback([this](const RunOutcome& outcome) { handleOutcome(outcome); });

    // The old job's thread has finished its callback; joining it here is quick.
    activeJob_ = job;
    lastOutcome_.reset();

    if (!job->start()) {
        lastError_ = "Failed to start job: " + job->getError();
        Logger::error(lastError_);
        return nullptr;
    }

    Logger::info("Submitted " + directionToString(config.direction) + " job " + job->getId());
    return job;
}

void TransferPipeline::handleOutcome(const RunOutcome& outcome) {
    OutcomeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastOutcome_ = outcome;
        callback = outcomeCallback_;
    }
    if (callback) {
        callback(outcome);
    }
}

bool TransferPipeline::cancel() {
    std::shared_ptr<Job> job = getActiveJob();
    if (!job) {
        return false;
    }
    return job->cancel();
}

RunOutcome TransferPipeline::wait() {
    std::shared_ptr<Job> job = getActiveJob();
    if (!job) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastOutcome_.value_or(RunOutcome());
    }
    return job->wait();
}

bool TransferPipeline::isIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !activeJob_ || activeJob_->isFinished();
}

std::optional<RunOutcome> TransferPipeline::getLastOutcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastOutcome_;
}

std::shared_ptr<Job> TransferPipeline::getActiveJob() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeJob_;
}

void TransferPipeline::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    progressCallback_ = std::move(callback);
}

void TransferPipeline::setOutcomeCallback(OutcomeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomeCallback_ = std::move(callback);
}

std::string TransferPipeline::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void TransferPipeline::clearLastError() {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_.clear();
}
