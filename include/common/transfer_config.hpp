#pragma once

#include "common/logger.hpp"
#include "common/transfer_status.hpp"
#include "device/device_descriptor.hpp"
#include <chrono>
#include <cstddef>
#include <string>

// Tunables shared by every transfer. Loaded from a JSON file and/or the
// command line.
struct TransferSettings {
    size_t chunkSize = 8 * 1024 * 1024;
    size_t queueCapacity = 16;
    DigestAlgorithm digest = DigestAlgorithm::SHA256;
    bool compress = false;
    int compressionLevel = 1;
    std::chrono::milliseconds progressInterval{200};
    bool verifyAfterRestore = true;
    std::string logPath = "/tmp/diskimager.log";
    LogLevel logLevel = LogLevel::INFO;
};

// One user-initiated run. Immutable once submitted.
struct TransferJobConfig {
    Direction direction = Direction::Backup;
    DeviceDescriptor device;        // backup source, restore target, clone source
    DeviceDescriptor targetDevice;  // clone target only
    std::string imagePath;          // backup destination, restore source
    TransferSettings settings;
};

bool validateSettings(const TransferSettings& settings, std::string& error);
bool validateJobConfig(const TransferJobConfig& config, std::string& error);

// Reads camelCase keys matching TransferSettings from a JSON object. Keys that
// are absent keep their current value.
bool loadSettingsFile(const std::string& path, TransferSettings& settings, std::string& error);
bool loadSettingsJson(const std::string& text, TransferSettings& settings, std::string& error);
