#pragma once

#include "device/device_io.hpp"
#include "transfer/transfer_error.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

// In-memory stand-in for the platform device layer.
class MemoryDeviceIo : public DeviceIo {
public:
    struct Device {
        DeviceDescriptor descriptor;
        std::vector<uint8_t> data;
        // Reads at or past this offset throw failKind.
        uint64_t failReadAt{std::numeric_limits<uint64_t>::max()};
        ErrorKind failKind{ErrorKind::SourceRead};
        // Called with the read offset before every read.
        std::function<void(uint64_t)> beforeRead;
        // Opening for write fails as it does for a mounted device.
        bool mounted{false};
        int rescans{0};
    };

    // Byte at offset i differs between chunks, so reordering shows up.
    static uint8_t patternByte(uint64_t i) {
        return static_cast<uint8_t>((i * 7) ^ (i >> 12) ^ (i >> 20));
    }

    std::shared_ptr<Device> addDevice(const std::string& path, uint64_t size,
                                      const std::string& label = "Memory device", bool fill = true) {
        auto device = std::make_shared<Device>();
        device->descriptor.path = path;
        device->descriptor.sizeBytes = size;
        device->descriptor.label = label;
        device->data.resize(size);
        if (fill) {
            for (uint64_t i = 0; i < size; ++i) {
                device->data[i] = patternByte(i);
            }
        }
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[path] = device;
        return device;
    }

    std::unique_ptr<ByteSource> openDeviceForRead(const DeviceDescriptor& descriptor) override {
        return std::make_unique<Source>(find(descriptor.path));
    }

    std::unique_ptr<ByteSink> openDeviceForWrite(const DeviceDescriptor& descriptor) override {
        auto device = find(descriptor.path);
        if (device->mounted) {
            throw TransferError::fromErrno(ErrorKind::SinkWrite, "Cannot open " + descriptor.path, EBUSY);
        }
        return std::make_unique<Sink>(device);
    }

    bool rescanPartitions(const DeviceDescriptor& descriptor) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(descriptor.path);
        if (it == devices_.end()) {
            lastError_ = "No such device: " + descriptor.path;
            return false;
        }
        it->second->rescans++;
        return true;
    }

    std::vector<DeviceDescriptor> enumerateRemovableDevices() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DeviceDescriptor> result;
        for (const auto& entry : devices_) {
            result.push_back(entry.second->descriptor);
        }
        return result;
    }

    bool describeDevice(const std::string& path, DeviceDescriptor& descriptor) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(path);
        if (it == devices_.end()) {
            lastError_ = "No such device: " + path;
            return false;
        }
        descriptor = it->second->descriptor;
        return true;
    }

    std::string getLastError() const override { return lastError_; }

private:
    class Source : public ByteSource {
    public:
        explicit Source(std::shared_ptr<Device> device) : device_(std::move(device)) {}

        size_t read(uint8_t* buffer, size_t size) override {
            if (device_->beforeRead) {
                device_->beforeRead(offset_);
            }
            if (offset_ >= device_->failReadAt) {
                throw TransferError(device_->failKind,
                                    "Read error at byte " + std::to_string(offset_) + " of " +
                                    device_->descriptor.path);
            }
            uint64_t limit = std::min<uint64_t>(device_->data.size(), device_->failReadAt);
            size_t n = static_cast<size_t>(std::min<uint64_t>(size, limit - offset_));
            std::memcpy(buffer, device_->data.data() + offset_, n);
            offset_ += n;
            return n;
        }

    private:
        std::shared_ptr<Device> device_;
        uint64_t offset_{0};
    };

    class Sink : public ByteSink {
    public:
        explicit Sink(std::shared_ptr<Device> device) : device_(std::move(device)) {}

        void write(const uint8_t* data, size_t size) override {
            if (offset_ + size > device_->data.size()) {
                throw TransferError(ErrorKind::SinkWrite, "No space left on " + device_->descriptor.path);
            }
            std::memcpy(device_->data.data() + offset_, data, size);
            offset_ += size;
        }

        void flush() override {}

    private:
        std::shared_ptr<Device> device_;
        uint64_t offset_{0};
    };

    std::shared_ptr<Device> find(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(path);
        if (it == devices_.end()) {
            throw TransferError(ErrorKind::DeviceVanished, "Device " + path + " not found");
        }
        return it->second;
    }

    std::map<std::string, std::shared_ptr<Device>> devices_;
    std::string lastError_;
    std::mutex mutex_;
};
