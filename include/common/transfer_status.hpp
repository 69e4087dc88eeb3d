#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

enum class Direction {
    Backup,
    Restore,
    Clone
};

enum class DigestAlgorithm {
    None,
    SHA256,
    MD5
};

enum class ErrorKind {
    None,
    SourceRead,
    SinkWrite,
    DeviceVanished,
    CapacityExceeded,
    VerificationFailed,
    InvalidJob
};

std::string directionToString(Direction direction);
std::string digestAlgorithmToString(DigestAlgorithm algorithm);
bool parseDigestAlgorithm(const std::string& name, DigestAlgorithm& algorithm);
std::string errorKindToString(ErrorKind kind);

// One progress event. etaSeconds stays empty until a rate is established.
struct ProgressSample {
    uint64_t bytesDone{0};
    uint64_t bytesTotal{0};
    std::chrono::system_clock::time_point timestamp;
    double throughputBytesPerSec{0.0};
    std::optional<double> etaSeconds;
};

struct RunOutcome {
    enum class Kind {
        Completed,
        Cancelled,
        Failed
    };

    Kind kind{Kind::Failed};
    ErrorKind error{ErrorKind::None};
    std::string message;
    uint64_t bytesTransferred{0};
    std::string digestHex;
    // Set when the target is a device that may hold a partial write.
    bool deviceIndeterminate{false};

    static RunOutcome completed(uint64_t bytes, const std::string& digestHex = "");
    static RunOutcome cancelled(uint64_t bytes, bool deviceIndeterminate);
    static RunOutcome failed(ErrorKind error, const std::string& message,
                             uint64_t bytes, bool deviceIndeterminate);

    bool isCompleted() const { return kind == Kind::Completed; }
    bool isCancelled() const { return kind == Kind::Cancelled; }
    bool isFailed() const { return kind == Kind::Failed; }

    std::string describe() const;
};
