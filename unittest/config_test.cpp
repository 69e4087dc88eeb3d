#include <gtest/gtest.h>
#include "common/transfer_config.hpp"
#include "common/utils.hpp"
#include "transfer/transfer_error.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <unistd.h>

TEST(TransferConfigTest, DefaultsAreValid) {
    TransferSettings settings;
    std::string error;
    EXPECT_TRUE(validateSettings(settings, error)) << error;
    EXPECT_EQ(settings.chunkSize, 8u * 1024 * 1024);
    EXPECT_EQ(settings.queueCapacity, 16u);
    EXPECT_EQ(settings.digest, DigestAlgorithm::SHA256);
    EXPECT_FALSE(settings.compress);
}

TEST(TransferConfigTest, RejectsBadSettings) {
    std::string error;
    TransferSettings settings;
    settings.chunkSize = 1000;
    EXPECT_FALSE(validateSettings(settings, error));

    settings = TransferSettings();
    settings.queueCapacity = 0;
    EXPECT_FALSE(validateSettings(settings, error));

    settings = TransferSettings();
    settings.compressionLevel = 10;
    EXPECT_FALSE(validateSettings(settings, error));
}

TEST(TransferConfigTest, ValidatesJobShape) {
    std::string error;
    TransferJobConfig config;
    config.direction = Direction::Backup;
    config.device.path = "/dev/sdb";
    EXPECT_FALSE(validateJobConfig(config, error));
    config.imagePath = "/tmp/sdb.img";
    EXPECT_TRUE(validateJobConfig(config, error)) << error;

    config.direction = Direction::Clone;
    EXPECT_FALSE(validateJobConfig(config, error));
    config.targetDevice.path = "/dev/sdb";
    EXPECT_FALSE(validateJobConfig(config, error));
    config.targetDevice.path = "/dev/sdc";
    EXPECT_TRUE(validateJobConfig(config, error)) << error;
}

TEST(TransferConfigTest, LoadsJson) {
    TransferSettings settings;
    std::string error;
    ASSERT_TRUE(loadSettingsJson(R"({
        "chunkSize": 1048576,
        "queueCapacity": 4,
        "digest": "md5",
        "compress": true,
        "compressionLevel": 9,
        "progressIntervalMs": 0,
        "verifyAfterRestore": false,
        "logLevel": "debug",
        "unknownKey": 1
    })", settings, error)) << error;

    EXPECT_EQ(settings.chunkSize, 1048576u);
    EXPECT_EQ(settings.queueCapacity, 4u);
    EXPECT_EQ(settings.digest, DigestAlgorithm::MD5);
    EXPECT_TRUE(settings.compress);
    EXPECT_EQ(settings.compressionLevel, 9);
    EXPECT_EQ(settings.progressInterval.count(), 0);
    EXPECT_FALSE(settings.verifyAfterRestore);
    EXPECT_EQ(settings.logLevel, LogLevel::DEBUG);
    EXPECT_EQ(settings.logPath, "/tmp/diskimager.log");
}

TEST(TransferConfigTest, InvalidJsonLeavesSettingsUntouched) {
    TransferSettings settings;
    std::string error;
    EXPECT_FALSE(loadSettingsJson("{ not json", settings, error));
    EXPECT_FALSE(error.empty());

    EXPECT_FALSE(loadSettingsJson(R"({"chunkSize": "big"})", settings, error));
    EXPECT_FALSE(loadSettingsJson(R"({"digest": "crc32"})", settings, error));
    EXPECT_FALSE(loadSettingsJson(R"({"chunkSize": 4096, "queueCapacity": 0})", settings, error));
    EXPECT_FALSE(loadSettingsJson("[1, 2]", settings, error));

    EXPECT_EQ(settings.chunkSize, TransferSettings().chunkSize);
    EXPECT_EQ(settings.queueCapacity, TransferSettings().queueCapacity);
}

TEST(TransferConfigTest, LoadsFile) {
    std::string path = (std::filesystem::temp_directory_path() /
                        ("diskimager_config_" + std::to_string(::getpid()) + ".json")).string();
    {
        std::ofstream file(path);
        file << R"({"queueCapacity": 8})";
    }
    TransferSettings settings;
    std::string error;
    EXPECT_TRUE(loadSettingsFile(path, settings, error)) << error;
    EXPECT_EQ(settings.queueCapacity, 8u);
    std::filesystem::remove(path);

    EXPECT_FALSE(loadSettingsFile(path, settings, error));
}

TEST(TransferStatusTest, ParsesNames) {
    DigestAlgorithm algorithm = DigestAlgorithm::None;
    EXPECT_TRUE(parseDigestAlgorithm("SHA-256", algorithm));
    EXPECT_EQ(algorithm, DigestAlgorithm::SHA256);
    EXPECT_TRUE(parseDigestAlgorithm("md5", algorithm));
    EXPECT_EQ(algorithm, DigestAlgorithm::MD5);
    EXPECT_FALSE(parseDigestAlgorithm("crc32", algorithm));

    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_FALSE(parseLogLevel("verbose", level));
}

TEST(TransferStatusTest, DescribesOutcomes) {
    EXPECT_EQ(RunOutcome::completed(10).describe(), "Completed");
    EXPECT_EQ(RunOutcome::cancelled(10, false).describe(), "Cancelled");
    EXPECT_EQ(RunOutcome::cancelled(10, true).describe(), "Cancelled: device may be partially written");
    EXPECT_EQ(RunOutcome::failed(ErrorKind::SinkWrite, "disk full", 10, false).describe(),
              "Failed(SinkWriteError): disk full");
}

TEST(TransferErrorTest, MapsErrno) {
    EXPECT_EQ(TransferError::fromErrno(ErrorKind::SourceRead, "write", ENOSPC).kind(), ErrorKind::SinkWrite);
    EXPECT_EQ(TransferError::fromErrno(ErrorKind::SourceRead, "read", ENODEV).kind(), ErrorKind::DeviceVanished);
    EXPECT_EQ(TransferError::fromErrno(ErrorKind::SourceRead, "read", ENOMEDIUM).kind(), ErrorKind::DeviceVanished);

    TransferError io = TransferError::fromErrno(ErrorKind::SourceRead, "read", EIO);
    EXPECT_EQ(io.kind(), ErrorKind::SourceRead);
    EXPECT_NE(std::string(io.what()).find("bad sectors"), std::string::npos);

    TransferError denied = TransferError::fromErrno(ErrorKind::SinkWrite, "open", EACCES);
    EXPECT_EQ(denied.kind(), ErrorKind::SinkWrite);
    EXPECT_NE(std::string(denied.what()).find("permission denied"), std::string::npos);

    TransferError busy = TransferError::fromErrno(ErrorKind::SinkWrite, "open", EBUSY);
    EXPECT_EQ(busy.kind(), ErrorKind::SinkWrite);
    EXPECT_NE(std::string(busy.what()).find("unmount"), std::string::npos);
}

TEST(UtilsTest, FormatBytes) {
    EXPECT_EQ(utils::formatBytes(0), "0.00 B");
    EXPECT_EQ(utils::formatBytes(1536), "1.50 KB");
    EXPECT_EQ(utils::formatBytes(64ull * 1024 * 1024), "64.00 MB");
    EXPECT_EQ(utils::formatBytes(3ull * 1024 * 1024 * 1024 * 1024), "3.00 TB");
}

TEST(UtilsTest, FormatEta) {
    EXPECT_EQ(utils::formatEta(std::nullopt), "ETA ...");
    EXPECT_EQ(utils::formatEta(0.0), "ETA -");
    EXPECT_EQ(utils::formatEta(9.0), "ETA 9s");
    EXPECT_EQ(utils::formatEta(184.0), "ETA 3m 04s");
    EXPECT_EQ(utils::formatEta(3720.0), "ETA 1h 02m");
}
