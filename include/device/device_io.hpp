#pragma once

#include "device/device_descriptor.hpp"
#include "transfer/stream.hpp"
#include <memory>
#include <string>
#include <vector>

// Platform capability for raw device access. The transfer jobs never open a
// device themselves; they go through the instance they were given.
class DeviceIo {
public:
    virtual ~DeviceIo() = default;

    // Both throw TransferError when the device cannot be opened.
    virtual std::unique_ptr<ByteSource> openDeviceForRead(const DeviceDescriptor& device) = 0;
    virtual std::unique_ptr<ByteSink> openDeviceForWrite(const DeviceDescriptor& device) = 0;

    virtual std::vector<DeviceDescriptor> enumerateRemovableDevices() = 0;

    // Asks the kernel to re-read the partition table of a rewritten device.
    // Image files and other non-block targets succeed without doing anything.
    virtual bool rescanPartitions(const DeviceDescriptor& device) = 0;

    // Fills size and label for a device node or image-backed stand-in.
    virtual bool describeDevice(const std::string& path, DeviceDescriptor& device) = 0;

    virtual std::string getLastError() const = 0;
};

// Linux implementation: sysfs for enumeration, BLKGETSIZE64 for sizes.
// Block devices are opened for writing with O_EXCL, which the kernel refuses
// with EBUSY while any partition of the device is mounted.
class PosixDeviceIo : public DeviceIo {
public:
    explicit PosixDeviceIo(const std::string& sysBlockPath = "/sys/block");
    ~PosixDeviceIo() override = default;

    std::unique_ptr<ByteSource> openDeviceForRead(const DeviceDescriptor& device) override;
    std::unique_ptr<ByteSink> openDeviceForWrite(const DeviceDescriptor& device) override;
    std::vector<DeviceDescriptor> enumerateRemovableDevices() override;
    bool rescanPartitions(const DeviceDescriptor& device) override;
    bool describeDevice(const std::string& path, DeviceDescriptor& device) override;
    std::string getLastError() const override { return lastError_; }

private:
    std::string readSysAttribute(const std::string& device, const std::string& attribute) const;
    std::string labelFor(const std::string& deviceName) const;

    std::string sysBlockPath_;
    std::string lastError_;
};
