#include "transfer/sidecar.hpp"
#include "common/logger.hpp"
#include "transfer/transfer_error.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

void replaceFileContents(const std::string& path, const std::string& contents) {
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw TransferError(ErrorKind::SinkWrite, "Cannot open " + tmpPath + " for writing");
        }
        file << contents;
        file.flush();
        if (!file) {
            file.close();
            std::remove(tmpPath.c_str());
            throw TransferError(ErrorKind::SinkWrite, "Failed to write " + tmpPath);
        }
    }
    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        int err = errno;
        std::remove(tmpPath.c_str());
        throw TransferError::fromErrno(ErrorKind::SinkWrite, "Cannot rename " + tmpPath + " to " + path, err);
    }
}

bool isHexDigest(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) || (c >= 'a' && c <= 'f');
    });
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::string sidecarPathFor(const std::string& imagePath) {
    return imagePath + ".hash.txt";
}

std::string manifestPathFor(const std::string& imagePath) {
    return imagePath + ".json";
}

void writeSidecar(const std::string& path, const SidecarRecord& record) {
    std::stringstream ss;
    ss << digestAlgorithmToString(record.algorithm) << " " << record.bytes << " "
       << toLower(record.hexDigest) << "\n";
    replaceFileContents(path, ss.str());
    Logger::info("Wrote digest sidecar " + path);
}

std::optional<SidecarRecord> readSidecar(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string line;
    std::getline(file, line);
    std::istringstream fields(line);
    std::string algo, bytes, hex, extra;
    if (!(fields >> algo >> bytes >> hex) || (fields >> extra)) {
        Logger::warning("Ignoring malformed digest sidecar " + path);
        return std::nullopt;
    }

    SidecarRecord record;
    if (!parseDigestAlgorithm(algo, record.algorithm) || record.algorithm == DigestAlgorithm::None) {
        Logger::warning("Unknown digest algorithm in " + path + ": " + algo);
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        record.bytes = std::stoull(bytes, &consumed);
        if (consumed != bytes.size()) {
            throw std::invalid_argument(bytes);
        }
    } catch (const std::exception&) {
        Logger::warning("Invalid byte count in " + path + ": " + bytes);
        return std::nullopt;
    }
    record.hexDigest = toLower(hex);
    if (!isHexDigest(record.hexDigest)) {
        Logger::warning("Invalid digest in " + path);
        return std::nullopt;
    }
    return record;
}

void writeManifest(const std::string& path, const BackupManifest& manifest) {
    json doc;
    doc["image"] = manifest.imagePath;
    doc["device"] = {
        {"path", manifest.devicePath},
        {"label", manifest.deviceLabel},
        {"bytes", manifest.deviceBytes}
    };
    doc["compressed"] = manifest.compressed;
    doc["chunkSize"] = manifest.chunkSize;
    doc["digest"] = {
        {"algorithm", digestAlgorithmToString(manifest.algorithm)},
        {"value", manifest.hexDigest}
    };
    doc["createdAt"] = manifest.createdAt;

    replaceFileContents(path, doc.dump(4) + "\n");
    Logger::info("Wrote backup manifest " + path);
}

std::optional<BackupManifest> readManifest(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json doc;
        file >> doc;

        BackupManifest manifest;
        manifest.imagePath = doc.at("image").get<std::string>();
        manifest.devicePath = doc.at("device").at("path").get<std::string>();
        manifest.deviceLabel = doc.at("device").at("label").get<std::string>();
        manifest.deviceBytes = doc.at("device").at("bytes").get<uint64_t>();
        manifest.compressed = doc.at("compressed").get<bool>();
        manifest.chunkSize = doc.at("chunkSize").get<size_t>();
        if (!parseDigestAlgorithm(doc.at("digest").at("algorithm").get<std::string>(), manifest.algorithm)) {
            return std::nullopt;
        }
        manifest.hexDigest = doc.at("digest").at("value").get<std::string>();
        manifest.createdAt = doc.at("createdAt").get<int64_t>();
        return manifest;
    } catch (const json::exception& e) {
        Logger::warning("Failed to read backup manifest " + path + ": " + e.what());
        return std::nullopt;
    }
}
