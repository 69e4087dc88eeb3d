#pragma once

#include "common/cancellation_token.hpp"
#include "common/transfer_status.hpp"
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Callback type definitions
using ProgressCallback = std::function<void(const ProgressSample& sample)>;
using OutcomeCallback = std::function<void(const RunOutcome& outcome)>;

// One run on its own worker thread. Subclasses implement execute(); the base
// turns whatever it returns (or throws) into a single reported outcome.
class Job {
public:
    enum class State {
        PENDING,
        RUNNING,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    explicit Job(Direction direction);
    virtual ~Job();

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    // Job control
    bool start();
    // Returns true only for the call that requested cancellation.
    bool cancel();
    // Blocks until the outcome has been reported.
    RunOutcome wait();

    // Status queries
    State getState() const;
    bool isRunning() const { return getState() == State::RUNNING; }
    bool isFinished() const;
    bool isCancellationRequested() const { return token_.isCancelled(); }
    std::string getId() const { return id_; }
    std::string getError() const;
    Direction getDirection() const { return direction_; }

    // Callbacks; set before start(). Both fire on the worker thread.
    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }
    void setOutcomeCallback(OutcomeCallback callback) { outcomeCallback_ = std::move(callback); }

protected:
    virtual RunOutcome execute() = 0;

    const CancellationToken& token() const { return token_; }
    void reportProgress(const ProgressSample& sample);
    const ProgressCallback& progressCallback() const { return progressCallback_; }

    // Invoked from cancel() to unblock stages waiting on each other. Once
    // clearInterruptHandler() returns, the handler is not running and will
    // not run again, so it may capture locals of execute().
    void setInterruptHandler(std::function<void()> handler);
    void clearInterruptHandler();

    std::string generateId() const;

private:
    void run();
    void finish(const RunOutcome& outcome);

    Direction direction_;
    std::string id_;
    State state_{State::PENDING};
    std::string error_;
    RunOutcome outcome_;
    bool finished_{false};
    CancellationToken token_;
    std::function<void()> interruptHandler_;
    std::mutex handlerMutex_;
    ProgressCallback progressCallback_;
    OutcomeCallback outcomeCallback_;
    std::thread worker_;
    mutable std::mutex mutex_;
    std::condition_variable finishedCv_;
};
