#include <gtest/gtest.h>
#include "backup/image_verifier.hpp"
#include "transfer/atomic_sink.hpp"
#include "transfer/compression.hpp"
#include "transfer/digest_accumulator.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class ImageVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("diskimager_verify_" + std::to_string(::getpid()));
        fs::remove_all(testDir_);
        fs::create_directories(testDir_);

        data_.resize(3 * 1024 * 1024 + 17);
        for (size_t i = 0; i < data_.size(); ++i) {
            data_[i] = static_cast<uint8_t>((i * 31) ^ (i >> 9));
        }
        DigestAccumulator digest(DigestAlgorithm::SHA256);
        digest.update(data_.data(), data_.size());
        hex_ = digest.finalizeHex();
    }

    void TearDown() override {
        fs::remove_all(testDir_);
    }

    std::string writeImage(const std::string& name, bool compress) {
        std::string path = (testDir_ / name).string();
        AtomicFileSink file(path);
        if (compress) {
            GzipSink gzip(file, 1);
            gzip.write(data_.data(), data_.size());
            gzip.finish();
        } else {
            file.write(data_.data(), data_.size());
        }
        file.commit();

        SidecarRecord record;
        record.algorithm = DigestAlgorithm::SHA256;
        record.bytes = data_.size();
        record.hexDigest = hex_;
        writeSidecar(sidecarPathFor(path), record);
        return path;
    }

    fs::path testDir_;
    std::vector<uint8_t> data_;
    std::string hex_;
};

TEST_F(ImageVerifierTest, AcceptsIntactImage) {
    ImageVerifier verifier(writeImage("plain.img", false));
    double lastProgress = 0.0;
    verifier.setProgressCallback([&lastProgress](double progress) { lastProgress = progress; });

    ASSERT_TRUE(verifier.initialize());
    EXPECT_TRUE(verifier.verify()) << verifier.getResult().errorMessage;
    EXPECT_EQ(verifier.getResult().actualDigest, hex_);
    EXPECT_EQ(verifier.getResult().bytesChecked, data_.size());
    EXPECT_DOUBLE_EQ(lastProgress, 1.0);
}

TEST_F(ImageVerifierTest, AcceptsCompressedImage) {
    ImageVerifier verifier(writeImage("packed.img.gz", true));
    EXPECT_TRUE(verifier.verify()) << verifier.getResult().errorMessage;
    EXPECT_EQ(verifier.getResult().bytesChecked, data_.size());
}

TEST_F(ImageVerifierTest, DetectsCorruption) {
    std::string path = writeImage("corrupt.img", false);
    {
        std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
        file.seekp(1000);
        file.put(static_cast<char>(data_[1000] ^ 0xff));
    }

    ImageVerifier verifier(path);
    EXPECT_FALSE(verifier.verify());
    EXPECT_NE(verifier.getResult().errorMessage.find("mismatch"), std::string::npos);
}

TEST_F(ImageVerifierTest, RequiresSidecar) {
    std::string path = writeImage("lonely.img", false);
    fs::remove(sidecarPathFor(path));

    ImageVerifier verifier(path);
    EXPECT_FALSE(verifier.initialize());
    EXPECT_NE(verifier.getResult().errorMessage.find("sidecar"), std::string::npos);
}
