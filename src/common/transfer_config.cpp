#include "common/transfer_config.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace {

const size_t kMaxChunkSize = 1024 * 1024 * 1024;
const size_t kMaxQueueCapacity = 1024;

} // namespace

bool validateSettings(const TransferSettings& settings, std::string& error) {
    if (settings.chunkSize == 0 || settings.chunkSize % 512 != 0) {
        error = "Chunk size must be a positive multiple of 512 bytes";
        return false;
    }
    if (settings.chunkSize > kMaxChunkSize) {
        error = "Chunk size cannot exceed 1 GiB";
        return false;
    }
    if (settings.queueCapacity == 0 || settings.queueCapacity > kMaxQueueCapacity) {
        error = "Queue capacity must be between 1 and " + std::to_string(kMaxQueueCapacity);
        return false;
    }
    if (settings.compressionLevel < 1 || settings.compressionLevel > 9) {
        error = "Compression level must be between 1 and 9";
        return false;
    }
    if (settings.progressInterval.count() < 0) {
        error = "Progress interval cannot be negative";
        return false;
    }
    return true;
}

bool validateJobConfig(const TransferJobConfig& config, std::string& error) {
    if (!validateSettings(config.settings, error)) {
        return false;
    }
    if (config.device.path.empty()) {
        error = "Device path is required";
        return false;
    }

    switch (config.direction) {
        case Direction::Backup:
        case Direction::Restore:
            if (config.imagePath.empty()) {
                error = "Image path is required";
                return false;
            }
            break;
        case Direction::Clone:
            if (config.targetDevice.path.empty()) {
                error = "Target device path is required";
                return false;
            }
            if (config.targetDevice.path == config.device.path) {
                error = "Source and target device are the same";
                return false;
            }
            break;
    }
    return true;
}

bool loadSettingsJson(const std::string& text, TransferSettings& settings, std::string& error) {
    TransferSettings loaded = settings;

    try {
        json doc = json::parse(text);
        if (!doc.is_object()) {
            error = "Configuration must be a JSON object";
            return false;
        }

        if (doc.contains("chunkSize")) {
            loaded.chunkSize = doc.at("chunkSize").get<size_t>();
        }
        if (doc.contains("queueCapacity")) {
            loaded.queueCapacity = doc.at("queueCapacity").get<size_t>();
        }
        if (doc.contains("digest")) {
            std::string name = doc.at("digest").get<std::string>();
            if (!parseDigestAlgorithm(name, loaded.digest)) {
                error = "Unknown digest algorithm: " + name;
                return false;
            }
        }
        if (doc.contains("compress")) {
            loaded.compress = doc.at("compress").get<bool>();
        }
        if (doc.contains("compressionLevel")) {
            loaded.compressionLevel = doc.at("compressionLevel").get<int>();
        }
        if (doc.contains("progressIntervalMs")) {
            loaded.progressInterval = std::chrono::milliseconds(doc.at("progressIntervalMs").get<int64_t>());
        }
        if (doc.contains("verifyAfterRestore")) {
            loaded.verifyAfterRestore = doc.at("verifyAfterRestore").get<bool>();
        }
        if (doc.contains("logPath")) {
            loaded.logPath = doc.at("logPath").get<std::string>();
        }
        if (doc.contains("logLevel")) {
            std::string name = doc.at("logLevel").get<std::string>();
            if (!parseLogLevel(name, loaded.logLevel)) {
                error = "Unknown log level: " + name;
                return false;
            }
        }
    } catch (const json::exception& e) {
        error = std::string("Invalid configuration: ") + e.what();
        return false;
    }

    if (!validateSettings(loaded, error)) {
        return false;
    }
    settings = loaded;
    return true;
}

bool loadSettingsFile(const std::string& path, TransferSettings& settings, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open configuration file: " + path;
        return false;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    if (!loadSettingsJson(ss.str(), settings, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}
