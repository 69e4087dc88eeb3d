#include "common/transfer_status.hpp"
#include <algorithm>
#include <cctype>

std::string directionToString(Direction direction) {
    switch (direction) {
        case Direction::Backup:  return "backup";
        case Direction::Restore: return "restore";
        case Direction::Clone:   return "clone";
        default:                 return "unknown";
    }
}

std::string digestAlgorithmToString(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::SHA256: return "sha256";
        case DigestAlgorithm::MD5:    return "md5";
        case DigestAlgorithm::None:   return "none";
        default:                      return "none";
    }
}

bool parseDigestAlgorithm(const std::string& name, DigestAlgorithm& algorithm) {
    std::string lower;
    for (char c : name) {
        if (c != '-') {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    if (lower == "sha256") {
        algorithm = DigestAlgorithm::SHA256;
    } else if (lower == "md5") {
        algorithm = DigestAlgorithm::MD5;
    } else if (lower == "none" || lower.empty()) {
        algorithm = DigestAlgorithm::None;
    } else {
        return false;
    }
    return true;
}

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "None";
        case ErrorKind::SourceRead:         return "SourceReadError";
        case ErrorKind::SinkWrite:          return "SinkWriteError";
        case ErrorKind::DeviceVanished:     return "DeviceVanished";
        case ErrorKind::CapacityExceeded:   return "CapacityExceeded";
        case ErrorKind::VerificationFailed: return "VerificationFailed";
        case ErrorKind::InvalidJob:         return "InvalidJob";
        default:                            return "Unknown";
    }
}

RunOutcome RunOutcome::completed(uint64_t bytes, const std::string& digestHex) {
    RunOutcome outcome;
    outcome.kind = Kind::Completed;
    outcome.bytesTransferred = bytes;
    outcome.digestHex = digestHex;
    return outcome;
}

RunOutcome RunOutcome::cancelled(uint64_t bytes, bool deviceIndeterminate) {
    RunOutcome outcome;
    outcome.kind = Kind::Cancelled;
    outcome.bytesTransferred = bytes;
    outcome.deviceIndeterminate = deviceIndeterminate;
    outcome.message = deviceIndeterminate ? "Cancelled: device may be partially written"
                                          : "Cancelled";
    return outcome;
}

RunOutcome RunOutcome::failed(ErrorKind error, const std::string& message,
                              uint64_t bytes, bool deviceIndeterminate) {
    RunOutcome outcome;
    outcome.kind = Kind::Failed;
    outcome.error = error;
    outcome.message = message;
    outcome.bytesTransferred = bytes;
    outcome.deviceIndeterminate = deviceIndeterminate;
    return outcome;
}

std::string RunOutcome::describe() const {
    switch (kind) {
        case Kind::Completed:
            return "Completed";
        case Kind::Cancelled:
            return message.empty() ? "Cancelled" : message;
        case Kind::Failed: {
            std::string text = "Failed(" + errorKindToString(error) + "): " + message;
            if (deviceIndeterminate) {
                text += " (device may be partially written)";
            }
            return text;
        }
    }
    return "Unknown";
}
