#include <gtest/gtest.h>
#include "device/device_io.hpp"
#include "transfer/transfer_error.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class PosixDeviceIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("diskimager_devio_" + std::to_string(::getpid()));
        fs::remove_all(testDir_);
        sysBlock_ = testDir_ / "sys" / "block";
        fs::create_directories(sysBlock_);
    }

    void TearDown() override {
        fs::remove_all(testDir_);
    }

    void addBlockDevice(const std::string& name, const std::string& removable, const std::string& sectors,
                        const std::string& vendor = "", const std::string& model = "") {
        fs::path dir = sysBlock_ / name;
        fs::create_directories(dir / "device");
        put(dir / "removable", removable + "\n");
        put(dir / "size", sectors + "\n");
        if (!vendor.empty()) {
            put(dir / "device" / "vendor", vendor + "   \n");
        }
        if (!model.empty()) {
            put(dir / "device" / "model", model + "\n");
        }
    }

    static void put(const fs::path& path, const std::string& text) {
        std::ofstream file(path);
        file << text;
    }

    fs::path testDir_;
    fs::path sysBlock_;
};

TEST_F(PosixDeviceIoTest, EnumeratesRemovableMediaOnly) {
    addBlockDevice("sdb", "1", "2048", "Kingston", "DataTraveler");
    addBlockDevice("sda", "0", "1000000", "ATA", "SSD");
    addBlockDevice("sdc", "1", "0", "Generic", "Card Reader");
    addBlockDevice("loop0", "1", "2048");
    addBlockDevice("mmcblk0", "1", "4096");

    PosixDeviceIo deviceIo(sysBlock_.string());
    auto devices = deviceIo.enumerateRemovableDevices();

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].path, "/dev/mmcblk0");
    EXPECT_EQ(devices[0].sizeBytes, 4096u * 512);
    EXPECT_EQ(devices[0].label, "USB device");
    EXPECT_EQ(devices[1].path, "/dev/sdb");
    EXPECT_EQ(devices[1].sizeBytes, 2048u * 512);
    EXPECT_EQ(devices[1].label, "Kingston DataTraveler");
}

TEST_F(PosixDeviceIoTest, MissingSysfsYieldsNoDevices) {
    PosixDeviceIo deviceIo((testDir_ / "nowhere").string());
    EXPECT_TRUE(deviceIo.enumerateRemovableDevices().empty());
    EXPECT_FALSE(deviceIo.getLastError().empty());
}

TEST_F(PosixDeviceIoTest, DescribesAndCopiesRegularFile) {
    fs::path image = testDir_ / "disk.bin";
    put(image, std::string(4096, 'a'));

    PosixDeviceIo deviceIo(sysBlock_.string());
    DeviceDescriptor device;
    ASSERT_TRUE(deviceIo.describeDevice(image.string(), device)) << deviceIo.getLastError();
    EXPECT_EQ(device.sizeBytes, 4096u);
    EXPECT_EQ(device.label, "disk.bin");

    auto source = deviceIo.openDeviceForRead(device);
    std::vector<uint8_t> buffer(8192);
    EXPECT_EQ(readFully(*source, buffer.data(), buffer.size()), 4096u);

    auto sink = deviceIo.openDeviceForWrite(device);
    std::string text = "bbbb";
    sink->write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    sink->flush();
    sink.reset();

    std::ifstream file(image);
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents.size(), 4096u);
    EXPECT_EQ(contents.substr(0, 5), "bbbba");
}

TEST_F(PosixDeviceIoTest, RescanSkipsRegularFiles) {
    PosixDeviceIo deviceIo(sysBlock_.string());
    std::string imagePath = (testDir_ / "stand-in.img").string();
    put(imagePath, "data");

    DeviceDescriptor device;
    ASSERT_TRUE(deviceIo.describeDevice(imagePath, device));
    EXPECT_TRUE(deviceIo.rescanPartitions(device));

    device.path = (testDir_ / "missing").string();
    EXPECT_FALSE(deviceIo.rescanPartitions(device));
    EXPECT_NE(deviceIo.getLastError().find("Cannot stat"), std::string::npos);
}

TEST_F(PosixDeviceIoTest, MissingDeviceReportsVanished) {
    PosixDeviceIo deviceIo(sysBlock_.string());
    DeviceDescriptor device;
    EXPECT_FALSE(deviceIo.describeDevice((testDir_ / "missing").string(), device));

    device.path = (testDir_ / "missing").string();
    try {
        deviceIo.openDeviceForRead(device);
        FAIL() << "opened a missing device";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DeviceVanished);
    }
}

TEST_F(PosixDeviceIoTest, DirectoryIsNotADevice) {
    PosixDeviceIo deviceIo(sysBlock_.string());
    DeviceDescriptor device;
    EXPECT_FALSE(deviceIo.describeDevice(testDir_.string(), device));
    EXPECT_NE(deviceIo.getLastError().find("neither"), std::string::npos);
}
