#pragma once

#include "common/transfer_status.hpp"
#include <cstdint>
#include <optional>
#include <string>

// "<algo> <bytes> <hex>" line stored next to an image.
struct SidecarRecord {
    DigestAlgorithm algorithm{DigestAlgorithm::None};
    uint64_t bytes{0};
    std::string hexDigest;
};

// Descriptive record of a completed backup, kept as JSON next to the image.
struct BackupManifest {
    std::string imagePath;
    std::string devicePath;
    std::string deviceLabel;
    uint64_t deviceBytes{0};
    bool compressed{false};
    size_t chunkSize{0};
    DigestAlgorithm algorithm{DigestAlgorithm::None};
    std::string hexDigest;
    int64_t createdAt{0};  // seconds since epoch
};

std::string sidecarPathFor(const std::string& imagePath);
std::string manifestPathFor(const std::string& imagePath);

// Both writers go through a temporary file and a rename; failures throw
// TransferError(SinkWrite).
void writeSidecar(const std::string& path, const SidecarRecord& record);
void writeManifest(const std::string& path, const BackupManifest& manifest);

// Empty when the file is absent or malformed.
std::optional<SidecarRecord> readSidecar(const std::string& path);
std::optional<BackupManifest> readManifest(const std::string& path);
