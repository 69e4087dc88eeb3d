#include "common/job.hpp"
#include "common/logger.hpp"
#include "transfer/transfer_error.hpp"
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

Job::Job(Direction direction)
    : direction_(direction)
    , id_(generateId()) {
}

Job::~Job() {
    if (worker_.joinable()) {
        cancel();
        worker_.join();
    }
}

bool Job::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::PENDING) {
        error_ = "Cannot start job in current state";
        return false;
    }
    state_ = State::RUNNING;
    Logger::info("Starting " + directionToString(direction_) + " job " + id_);
    worker_ = std::thread(&Job::run, this);
    return true;
}

bool Job::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::RUNNING) {
            return false;
        }
        if (!token_.cancel()) {
            return false;
        }
    }

    Logger::info("Cancellation requested for job " + id_);
    std::lock_guard<std::mutex> handlerLock(handlerMutex_);
    if (interruptHandler_) {
        interruptHandler_();
    }
    return true;
}

RunOutcome Job::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    finishedCv_.wait(lock, [this] { return finished_ || state_ == State::PENDING; });
    return outcome_;
}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Job::isFinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

std::string Job::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void Job::reportProgress(const ProgressSample& sample) {
    if (progressCallback_) {
        progressCallback_(sample);
    }
}

void Job::setInterruptHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    interruptHandler_ = std::move(handler);
    // A cancel that arrived before the handler existed still has to land.
    if (token_.isCancelled() && interruptHandler_) {
        interruptHandler_();
    }
}

void Job::clearInterruptHandler() {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    interruptHandler_ = nullptr;
}

void Job::run() {
    RunOutcome outcome;
    try {
        outcome = execute();
    } catch (const TransferError& e) {
        // Thrown before any byte reached the target; jobs flag partial writes themselves.
        outcome = RunOutcome::failed(e.kind(), e.what(), 0, false);
    } catch (const std::exception& e) {
        outcome = RunOutcome::failed(ErrorKind::InvalidJob, std::string("Internal error: ") + e.what(), 0, false);
    }
    clearInterruptHandler();
    finish(outcome);
}

void Job::finish(const RunOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_ = outcome;
        if (outcome.isCompleted()) {
            state_ = State::COMPLETED;
        } else if (outcome.isCancelled()) {
            state_ = State::CANCELLED;
        } else {
            state_ = State::FAILED;
            error_ = outcome.message;
        }
    }

    if (outcome.isFailed()) {
        Logger::error("Job " + id_ + " " + outcome.describe());
    } else if (outcome.isCancelled()) {
        Logger::warning("Job " + id_ + " " + outcome.describe());
    } else {
        Logger::info("Job " + id_ + " completed, " + std::to_string(outcome.bytesTransferred) + " bytes");
    }

    if (outcomeCallback_) {
        outcomeCallback_(outcome);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    finishedCv_.notify_all();
}

std::string Job::generateId() const {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}
