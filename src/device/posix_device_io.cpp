#include "device/device_io.hpp"
#include "common/logger.hpp"
#include "transfer/transfer_error.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

int openDevice(const DeviceDescriptor& device, int flags, ErrorKind kind) {
    int fd = ::open(device.path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT) {
            throw TransferError(ErrorKind::DeviceVanished, "Device " + device.path + " not found");
        }
        throw TransferError::fromErrno(kind, "Cannot open " + device.path, err);
    }
    return fd;
}

} // namespace

PosixDeviceIo::PosixDeviceIo(const std::string& sysBlockPath)
    : sysBlockPath_(sysBlockPath) {
}

std::unique_ptr<ByteSource> PosixDeviceIo::openDeviceForRead(const DeviceDescriptor& device) {
    int fd = openDevice(device, O_RDONLY, ErrorKind::SourceRead);
    Logger::debug("Opened " + device.path + " for reading");
    return std::make_unique<FileSource>(fd, device.path);
}

std::unique_ptr<ByteSink> PosixDeviceIo::openDeviceForWrite(const DeviceDescriptor& device) {
    int flags = O_WRONLY;
    struct stat st;
    if (::stat(device.path.c_str(), &st) == 0 && S_ISBLK(st.st_mode)) {
        flags |= O_EXCL;
    }
    int fd = openDevice(device, flags, ErrorKind::SinkWrite);
    Logger::debug("Opened " + device.path + " for writing");
    return std::make_unique<FileSink>(fd, device.path);
}

std::string PosixDeviceIo::readSysAttribute(const std::string& device, const std::string& attribute) const {
    std::ifstream file(sysBlockPath_ + "/" + device + "/" + attribute);
    std::string value;
    if (file.is_open()) {
        std::getline(file, value);
    }
    return trim(value);
}

std::string PosixDeviceIo::labelFor(const std::string& deviceName) const {
    std::string vendor = readSysAttribute(deviceName, "device/vendor");
    std::string model = readSysAttribute(deviceName, "device/model");
    std::string label = trim(vendor + " " + model);
    return label.empty() ? "USB device" : label;
}

std::vector<DeviceDescriptor> PosixDeviceIo::enumerateRemovableDevices() {
    std::vector<DeviceDescriptor> devices;

    std::error_code ec;
    std::filesystem::directory_iterator it(sysBlockPath_, ec);
    if (ec) {
        lastError_ = "Cannot list " + sysBlockPath_ + ": " + ec.message();
        Logger::error(lastError_);
        return devices;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.rfind("loop", 0) == 0 || name.rfind("ram", 0) == 0 || name.rfind("zram", 0) == 0) {
            continue;
        }
        if (readSysAttribute(name, "removable") != "1") {
            continue;
        }

        uint64_t sectors = 0;
        try {
            sectors = std::stoull(readSysAttribute(name, "size"));
        } catch (const std::exception&) {
            Logger::warning("Skipping " + name + ": unreadable size");
            continue;
        }
        // Card readers without media report zero sectors.
        if (sectors == 0) {
            continue;
        }

        DeviceDescriptor device;
        device.path = "/dev/" + name;
        device.sizeBytes = sectors * 512;
        device.label = labelFor(name);
        devices.push_back(device);
    }

    std::sort(devices.begin(), devices.end(),
              [](const DeviceDescriptor& a, const DeviceDescriptor& b) { return a.path < b.path; });
    return devices;
}

bool PosixDeviceIo::rescanPartitions(const DeviceDescriptor& device) {
    struct stat st;
    if (::stat(device.path.c_str(), &st) != 0) {
        lastError_ = "Cannot stat " + device.path + ": " + std::strerror(errno);
        return false;
    }
    if (!S_ISBLK(st.st_mode)) {
        return true;
    }

    int fd = ::open(device.path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        lastError_ = "Cannot open " + device.path + ": " + std::strerror(errno);
        return false;
    }
    int rc = ::ioctl(fd, BLKRRPART);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        lastError_ = "Cannot re-read partition table of " + device.path + ": " + std::strerror(err);
        return false;
    }

    Logger::info("Re-read partition table of " + device.path);
    return true;
}

bool PosixDeviceIo::describeDevice(const std::string& path, DeviceDescriptor& device) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        lastError_ = "Cannot stat " + path + ": " + std::strerror(errno);
        return false;
    }

    device.path = path;

    if (S_ISREG(st.st_mode)) {
        device.sizeBytes = static_cast<uint64_t>(st.st_size);
        device.label = std::filesystem::path(path).filename().string();
        return true;
    }

    if (!S_ISBLK(st.st_mode)) {
        lastError_ = path + " is neither a block device nor a regular file";
        return false;
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        lastError_ = "Cannot open " + path + ": " + std::strerror(errno);
        return false;
    }
    uint64_t size = 0;
    int rc = ::ioctl(fd, BLKGETSIZE64, &size);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        lastError_ = "Cannot read size of " + path + ": " + std::strerror(err);
        return false;
    }

    device.sizeBytes = size;
    device.label = labelFor(std::filesystem::path(path).filename().string());
    return true;
}
